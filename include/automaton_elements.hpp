#ifndef AUTOMATON_ELEMENTS_H
#define AUTOMATON_ELEMENTS_H

#include <set>
#include <string>
#include <string_view>
#include <optional>
#include <vector>
#include <compare>

namespace model
{
    // reserved spellings for the empty word in input records, and the glyph it is drawn with
    inline constexpr std::string_view epsilon_sentinel = "λ";
    inline constexpr std::string_view epsilon_alias    = "ε";
    inline constexpr std::string_view epsilon_glyph    = "ε";

    inline auto is_epsilon_token(std::string_view token) -> bool
    {
        return token == epsilon_sentinel || token == epsilon_alias;
    }

    using State    = std::string;
    using StateSet = std::set<State>;

    struct Symbol
    {
        // a default constructed symbol is epsilon
        Symbol() = default;
        explicit Symbol(std::string_view label)
            : m_label{std::string(label)} {}

        static auto epsilon() -> Symbol { return Symbol{}; }

        auto is_epsilon() const -> bool { return !m_label.has_value(); }

        // the sentinel spelling for epsilon, otherwise the label itself
        auto label() const -> std::string
        {
            return m_label.value_or(std::string(epsilon_sentinel));
        }

        auto display() const -> std::string
        {
            return m_label.value_or(std::string(epsilon_glyph));
        }

        auto operator<=>(const Symbol &) const = default;

        std::optional<std::string> m_label;
    };

    using Alphabet = std::vector<std::string>;

    // right hand side of a right-linear production: ε, t, or t V
    struct ProductionBody
    {
        ProductionBody() = default;
        explicit ProductionBody(std::string_view terminal)
            : m_terminal{std::string(terminal)},
              m_variable{std::nullopt} {}
        ProductionBody(
            std::string_view terminal,
            std::string_view variable
        )
            : m_terminal{std::string(terminal)},
              m_variable{std::string(variable)} {}

        static auto epsilon() -> ProductionBody { return ProductionBody{}; }

        auto is_epsilon() const -> bool { return !m_terminal.has_value(); }

        auto operator<=>(const ProductionBody &) const = default;

        std::optional<std::string> m_terminal;
        std::optional<std::string> m_variable;
    };

    struct PDAMove
    {
        PDAMove() = default;
        PDAMove(
            std::string_view target,
            const std::vector<std::string> &push
        )
            : m_target{target},
              m_push{push} {}

        auto operator<=>(const PDAMove &) const = default;

        State m_target;
        // top of stack first, empty means pop only
        std::vector<std::string> m_push;
    };
}

#endif
