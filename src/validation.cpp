#include "../include/validation.hpp"
#include "../include/automaton_elements.hpp"

#include <algorithm>

#include <fmt/format.h>

namespace model
{
    namespace validation
    {
        auto unique_declarations(
            const std::vector<std::string> &names,
            std::string_view field
        ) -> Expected<std::vector<std::string>>
        {
            std::vector<std::string> unique;
            for (const auto &name : names)
            {
                if (name.empty())
                {
                    return make_error(ErrorKind::MalformedInput, field, "empty name in declaration list");
                }
                if (is_epsilon_token(name))
                {
                    return make_error(ErrorKind::MalformedInput, field,
                                      fmt::format("'{}' is reserved for the empty word", name));
                }
                if (std::find(unique.begin(), unique.end(), name) == unique.end())
                {
                    unique.push_back(name);
                }
            }
            return unique;
        }

        auto require_declared(
            const std::vector<std::string> &declared,
            std::string_view name,
            std::string_view field,
            std::string_view what
        ) -> Expected<void>
        {
            if (std::find(declared.begin(), declared.end(), name) == declared.end())
            {
                return make_error(ErrorKind::UndeclaredReference, field,
                                  fmt::format("{} '{}' is not declared", what, name));
            }
            return {};
        }

        auto require_all_declared(
            const std::vector<std::string> &declared,
            const std::vector<std::string> &names,
            std::string_view field,
            std::string_view what
        ) -> Expected<void>
        {
            for (const auto &name : names)
            {
                if (auto ok = require_declared(declared, name, field, what); !ok)
                {
                    return ok;
                }
            }
            return {};
        }
    }
}
