#ifndef SIMULATOR_H
#define SIMULATOR_H

#include "automaton.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace model
{
    struct SimulationResult
    {
        bool m_accepted{false};
        // start state first, one more entry per consumed symbol
        std::vector<State> m_path;
        std::size_t m_consumed{0};
        // set when the run stopped on an undefined transition
        std::optional<Error> m_halt;
    };

    struct Step
    {
        auto operator<=>(const Step &) const = default;

        State m_from;
        std::string m_symbol;
        State m_to;
    };

    /*
    Runs the DFA without backtracking. An undefined transition (a symbol
    outside the alphabet included) stops the run at the last defined state and
    rejects, whatever input is left. No dead state is synthesized here.
    */
    [[nodiscard]]
    auto simulate(const Dfa &dfa, const std::vector<std::string> &input) -> SimulationResult;

    // zips the traced path against the consumed prefix of input
    [[nodiscard]]
    auto path_steps(const SimulationResult &result, const std::vector<std::string> &input) -> std::vector<Step>;

    // true when some run ends in an accepting state
    [[nodiscard]]
    auto accepts(const Nfa &nfa, const std::vector<std::string> &input) -> bool;

    [[nodiscard]]
    auto accepts(const EpsilonNfa &nfa, const std::vector<std::string> &input) -> bool;
}

#endif
