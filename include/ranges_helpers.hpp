#ifndef RANGES_HELPERS_H
#define RANGES_HELPERS_H

#include <ranges>
#include <vector>
#include <iterator>
#include <algorithm>

#include "tl/expected.hpp"

namespace utility
{
    namespace ranges = std::ranges;
    namespace views = std::views;

    template<class>
    constexpr bool is_expected = false;

    template<class T, class E>
    constexpr bool is_expected<tl::expected<T, E>> = true;

    // collects a range of expected values, stopping at the first error
    template<ranges::input_range R>
    requires is_expected<ranges::range_value_t<R>>
    auto to_expected(R& r) {
        using expected_type = ranges::range_value_t<R>;
        using value_type = expected_type::value_type;
        using error_type = expected_type::error_type;
        using return_type = tl::expected<std::vector<value_type>, error_type>;

        auto values = r
            | views::take_while([](const auto& e) { return e.has_value(); })
            | views::transform([](const auto& e) { return e.value(); });

        std::vector<value_type> v;
        auto [it, out] = ranges::copy(values, std::back_inserter(v));
        if (it.base() == ranges::end(r)) // all success
            return return_type(std::move(v));
        // return the first error
        return return_type(tl::unexpect, (*it.base()).error());
    };
}

#endif
