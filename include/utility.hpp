#ifndef UTILITY_H
#define UTILITY_H

#include <string>
#include <string_view>
#include <vector>
#include <ranges>

#include <fmt/format.h>

namespace utility
{
    namespace ranges = std::ranges;
    namespace views = std::views;

    auto join_non_empty_strings(auto&& container, std::string_view delim) -> std::string
    {
        return fmt::format("{}", fmt::join(
                container | views::filter([](std::string_view s){ return !s.empty(); }), //filter the length zero elements
                delim
            )
        );
    }

    [[nodiscard]]
    auto trim(std::string_view str) -> std::string;

    // splits on delim and trims each piece, empty pieces are kept
    [[nodiscard]]
    auto split(std::string_view str, char delim) -> std::vector<std::string>;

    // splits on any of delims, trims, and drops empty pieces
    [[nodiscard]]
    auto split_any(std::string_view str, std::string_view delims) -> std::vector<std::string>;

    /*
    Cuts text into symbols of the given vocabulary:
        (1) "a, b" or "a b"  -> split on commas / whitespace
        (2) "abba"           -> longest vocabulary match first
    Text matching no symbol becomes a single UTF-8 code point.
    */
    [[nodiscard]]
    auto tokenize(std::string_view text, const std::vector<std::string> &vocabulary) -> std::vector<std::string>;
}

#endif
