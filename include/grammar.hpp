#ifndef GRAMMAR_H
#define GRAMMAR_H

#include "automaton_elements.hpp"
#include "errors.hpp"

#include <map>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace model
{
    // one `variable,body1,body2,...` entry of an input record, bodies still as text
    struct ProductionSpec
    {
        ProductionSpec() = default;
        ProductionSpec(
            std::string_view context,
            std::string_view variable,
            const std::vector<std::string> &bodies
        )
            : m_context{context},
              m_variable{variable},
              m_bodies{bodies} {}

        std::string m_context;
        std::string m_variable;
        std::vector<std::string> m_bodies;
    };

    class RegularGrammar
    {
    public:
        // bodies per variable, in the order they were entered
        using Productions = std::map<std::string, std::vector<ProductionBody>>;

        [[nodiscard]]
        static auto create(
            const std::vector<std::string> &variables,
            const std::vector<std::string> &terminals,
            const Productions &productions,
            std::string_view start
        ) -> Expected<RegularGrammar>;

        [[nodiscard]]
        static auto from_specs(
            const std::vector<std::string> &variables,
            const std::vector<std::string> &terminals,
            const std::vector<ProductionSpec> &productions,
            std::string_view start
        ) -> Expected<RegularGrammar>;

        auto variables() const -> const std::vector<std::string> & { return m_variables; }
        auto terminals() const -> const std::vector<std::string> & { return m_terminals; }
        auto productions() const -> const Productions & { return m_productions; }
        auto start() const -> const std::string & { return m_start; }

        // empty when the variable has no productions
        auto productions_of(const std::string &variable) const -> const std::vector<ProductionBody> &;

    private:
        RegularGrammar(
            std::vector<std::string> variables,
            std::vector<std::string> terminals,
            Productions productions,
            std::string start
        )
            : m_variables{std::move(variables)},
              m_terminals{std::move(terminals)},
              m_productions{std::move(productions)},
              m_start{std::move(start)} {}

        std::vector<std::string> m_variables;
        std::vector<std::string> m_terminals;
        Productions m_productions;
        std::string m_start;
    };

    /*
    Splits a production body written as text into terminal and variable.
    Accepted forms are
        (1) λ (or ε)
        (2) t      a declared terminal
        (3) tV     longest declared terminal prefix followed by a declared variable
        (4) t V    space separated
    */
    [[nodiscard]]
    auto parse_body(
        std::string_view text,
        const std::vector<std::string> &variables,
        const std::vector<std::string> &terminals,
        std::string_view context
    ) -> Expected<ProductionBody>;

    // S → a S | b S | ε, one line per variable, start variable first
    [[nodiscard]]
    auto format_grammar(const RegularGrammar &grammar) -> std::string;
}

#endif
