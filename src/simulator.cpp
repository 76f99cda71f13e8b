#include "../include/simulator.hpp"
#include "../include/epsilon_closure.hpp"

#include <algorithm>

#include <fmt/format.h>

namespace model
{
    namespace helpers
    {
        template <typename Automaton, typename Closure>
        static auto run_sets(const Automaton &nfa, const std::vector<std::string> &input, Closure close) -> bool
        {
            StateSet current = close(StateSet{nfa.start()});
            for (const auto &symbol : input)
            {
                StateSet next;
                for (const auto &state : current)
                {
                    const auto &image = nfa.image(state, Symbol(symbol));
                    next.insert(image.begin(), image.end());
                }
                current = close(next);
                if (current.empty())
                {
                    return false;
                }
            }
            return std::any_of(current.begin(), current.end(), [&](const State &s) { return nfa.is_accepting(s); });
        }
    }

    auto simulate(const Dfa &dfa, const std::vector<std::string> &input) -> SimulationResult
    {
        SimulationResult result;
        State current = dfa.start();
        result.m_path.push_back(current);

        for (const auto &symbol : input)
        {
            auto next = dfa.next(current, symbol);
            if (!next)
            {
                result.m_halt = Error(
                    ErrorKind::UndefinedTransition,
                    fmt::format("input[{}]", result.m_consumed),
                    fmt::format("no transition from '{}' on '{}'", current, symbol));
                return result;
            }
            current = *next;
            result.m_path.push_back(current);
            ++result.m_consumed;
        }

        result.m_accepted = dfa.is_accepting(current);
        return result;
    }

    auto path_steps(const SimulationResult &result, const std::vector<std::string> &input) -> std::vector<Step>
    {
        std::vector<Step> steps;
        for (std::size_t i = 0; i < result.m_consumed && i + 1 < result.m_path.size() && i < input.size(); ++i)
        {
            steps.push_back(Step{result.m_path[i], input[i], result.m_path[i + 1]});
        }
        return steps;
    }

    auto accepts(const Nfa &nfa, const std::vector<std::string> &input) -> bool
    {
        return helpers::run_sets(nfa, input, [](StateSet states) { return states; });
    }

    auto accepts(const EpsilonNfa &nfa, const std::vector<std::string> &input) -> bool
    {
        return helpers::run_sets(nfa, input, [&nfa](const StateSet &states) { return epsilon_closure(nfa, states); });
    }
}
