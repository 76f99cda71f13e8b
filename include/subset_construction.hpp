#ifndef SUBSET_CONSTRUCTION_H
#define SUBSET_CONSTRUCTION_H

#include "automaton.hpp"

#include <string>
#include <utility>
#include <vector>

namespace model
{
    struct SubsetConstruction
    {
        // total over the alphabet; the empty composite state, if reached, loops on every symbol
        Dfa m_dfa;
        // canonical label and the composite state it stands for, in discovery order
        std::vector<std::pair<State, StateSet>> m_composites;

        auto composite_of(const State &label) const -> const StateSet &;
    };

    /*
    Powerset construction over a FIFO worklist. Composite states are labelled
    D0, D1, ... in the order they are first discovered, so repeated runs over the
    same automaton give identical labels and tables.
    */
    [[nodiscard]]
    auto determinize(const Nfa &nfa) -> Expected<SubsetConstruction>;

    // as above, with the ε-closure taken of the start state and after every step
    [[nodiscard]]
    auto determinize(const EpsilonNfa &nfa) -> Expected<SubsetConstruction>;

    // {q0,q1}, or ∅ for the dead state
    [[nodiscard]]
    auto composite_label(const StateSet &composite) -> std::string;
}

#endif
