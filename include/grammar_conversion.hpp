#ifndef GRAMMAR_CONVERSION_H
#define GRAMMAR_CONVERSION_H

#include "automaton.hpp"
#include "grammar.hpp"

namespace model
{
    // F, then F', F'', ... until it names no variable of the grammar
    [[nodiscard]]
    auto final_state_name(const RegularGrammar &grammar) -> State;

    /*
    Each variable reachable from the start variable becomes a state:
        V → t V'   gives (V, t) → V'
        V → t      gives (V, t) → F, F being one synthesized accepting state
        V → ε      marks V accepting
    The result is partial, no dead state is added. Fails with
    NonDeterministicGrammar when a variable has two bodies led by the same terminal.
    */
    [[nodiscard]]
    auto grammar_to_dfa(const RegularGrammar &grammar) -> Expected<Dfa>;

    // (S, a) → S' gives S → a S', and accepting S gets S → ε
    [[nodiscard]]
    auto dfa_to_grammar(const Dfa &dfa) -> Expected<RegularGrammar>;
}

#endif
