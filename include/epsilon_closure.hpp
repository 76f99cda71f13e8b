#ifndef EPSILON_CLOSURE_H
#define EPSILON_CLOSURE_H

#include "automaton.hpp"

#include <map>

namespace model
{
    using ClosureMap = std::map<State, StateSet>;

    // states reachable from each state using only ε-transitions, the state itself included
    [[nodiscard]]
    auto epsilon_closures(const EpsilonNfa &nfa) -> ClosureMap;

    // union of the closures of every state in states
    [[nodiscard]]
    auto epsilon_closure(const EpsilonNfa &nfa, const StateSet &states) -> StateSet;
}

#endif
