#ifndef MODEL_H
#define MODEL_H

#include "automaton.hpp"
#include "grammar.hpp"
#include "pushdown_automaton.hpp"

#include <string_view>
#include <variant>

namespace model
{
    enum class ModelKind
    {
        Dfa,
        Nfa,
        EpsilonNfa,
        Grammar,
        Pda
    };

    // the closed set of models an input record can describe
    using Model = std::variant<Dfa, Nfa, EpsilonNfa, RegularGrammar, PushdownAutomaton>;

    [[nodiscard]]
    auto kind_of(const Model &model) -> ModelKind;

    [[nodiscard]]
    auto to_string(ModelKind kind) -> std::string_view;

    // dfa, nfa, enfa, grammar, pda
    [[nodiscard]]
    auto parse_model_kind(std::string_view name) -> Expected<ModelKind>;
}

#endif
