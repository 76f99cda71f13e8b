#include "../include/epsilon_closure.hpp"

#include <stack>

namespace model
{
    auto epsilon_closure(const EpsilonNfa &nfa, const StateSet &states) -> StateSet
    {
        // the closure doubles as the visited set, so ε-cycles terminate
        StateSet closure{states};
        std::stack<State> pending;
        for (const auto &state : states)
        {
            pending.push(state);
        }

        while (!pending.empty())
        {
            State current = pending.top();
            pending.pop();
            for (const auto &target : nfa.image(current, Symbol::epsilon()))
            {
                if (closure.insert(target).second)
                {
                    pending.push(target);
                }
            }
        }
        return closure;
    }

    auto epsilon_closures(const EpsilonNfa &nfa) -> ClosureMap
    {
        ClosureMap closures;
        for (const auto &state : nfa.states())
        {
            closures.emplace(state, epsilon_closure(nfa, StateSet{state}));
        }
        return closures;
    }
}
