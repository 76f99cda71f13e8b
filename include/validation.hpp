#ifndef VALIDATION_H
#define VALIDATION_H

#include "errors.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace model::validation
{
    // rejects empty names and the epsilon spellings, drops repeats keeping the first
    [[nodiscard]]
    auto unique_declarations(
        const std::vector<std::string> &names,
        std::string_view field
    ) -> Expected<std::vector<std::string>>;

    [[nodiscard]]
    auto require_declared(
        const std::vector<std::string> &declared,
        std::string_view name,
        std::string_view field,
        std::string_view what
    ) -> Expected<void>;

    [[nodiscard]]
    auto require_all_declared(
        const std::vector<std::string> &declared,
        const std::vector<std::string> &names,
        std::string_view field,
        std::string_view what
    ) -> Expected<void>;
}

#endif
