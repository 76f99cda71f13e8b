#include "../include/subset_construction.hpp"
#include "../include/epsilon_closure.hpp"

#include <algorithm>
#include <map>
#include <queue>
#include <stdexcept>

#include <fmt/format.h>

namespace model
{
    namespace helpers
    {
        template <typename Automaton, typename Closure>
        static auto construct(const Automaton &nfa, Closure close) -> Expected<SubsetConstruction>
        {
            // all build state is local to this call
            std::map<StateSet, State> labels;
            std::vector<std::pair<State, StateSet>> composites;
            std::queue<StateSet> worklist;
            Dfa::Transitions transitions;
            std::vector<State> accepting;

            auto intern = [&](const StateSet &composite) -> State
            {
                if (auto it = labels.find(composite); it != labels.end())
                {
                    return it->second;
                }
                State label = fmt::format("D{}", composites.size());
                labels.emplace(composite, label);
                composites.emplace_back(label, composite);
                worklist.push(composite);
                return label;
            };

            const State start = intern(close(StateSet{nfa.start()}));

            while (!worklist.empty())
            {
                StateSet current = std::move(worklist.front());
                worklist.pop();
                const State from = labels.at(current);

                if (std::any_of(current.begin(), current.end(), [&](const State &s) { return nfa.is_accepting(s); }))
                {
                    accepting.push_back(from);
                }

                for (const auto &symbol : nfa.alphabet())
                {
                    StateSet moved;
                    for (const auto &state : current)
                    {
                        const auto &image = nfa.image(state, Symbol(symbol));
                        moved.insert(image.begin(), image.end());
                    }
                    transitions[{from, symbol}] = intern(close(moved));
                }
            }

            std::vector<State> states;
            for (const auto &[label, composite] : composites)
            {
                states.push_back(label);
            }

            return Dfa::create(states, nfa.alphabet(), transitions, start, accepting)
                .map([&](Dfa &&dfa) {
                    return SubsetConstruction{std::move(dfa), std::move(composites)};
                });
        }
    }

    auto SubsetConstruction::composite_of(const State &label) const -> const StateSet &
    {
        auto it = std::find_if(m_composites.begin(), m_composites.end(),
                               [&](const auto &entry) { return entry.first == label; });
        if (it == m_composites.end())
        {
            throw std::out_of_range(fmt::format("'{}' is not a label of this construction", label));
        }
        return it->second;
    }

    auto determinize(const Nfa &nfa) -> Expected<SubsetConstruction>
    {
        return helpers::construct(nfa, [](StateSet states) { return states; });
    }

    auto determinize(const EpsilonNfa &nfa) -> Expected<SubsetConstruction>
    {
        return helpers::construct(nfa, [&nfa](const StateSet &states) { return epsilon_closure(nfa, states); });
    }

    auto composite_label(const StateSet &composite) -> std::string
    {
        if (composite.empty())
        {
            return "∅";
        }
        return fmt::format("{{{}}}", fmt::join(composite, ","));
    }
}
