#include "../include/grammar_conversion.hpp"

#include <algorithm>
#include <map>
#include <queue>
#include <set>

#include <fmt/format.h>

namespace model
{
    namespace helpers
    {
        static auto check_deterministic(const RegularGrammar &grammar) -> Expected<void>
        {
            for (const auto &variable : grammar.variables())
            {
                std::set<std::string> seen;
                for (const auto &body : grammar.productions_of(variable))
                {
                    if (body.is_epsilon())
                    {
                        continue;
                    }
                    if (!seen.insert(*body.m_terminal).second)
                    {
                        return make_error(ErrorKind::NonDeterministicGrammar,
                                          fmt::format("productions ({})", variable),
                                          fmt::format("two productions start with terminal '{}'", *body.m_terminal));
                    }
                }
            }
            return {};
        }
    }

    auto final_state_name(const RegularGrammar &grammar) -> State
    {
        const auto &variables = grammar.variables();
        State name = "F";
        while (std::find(variables.begin(), variables.end(), name) != variables.end())
        {
            name += "'";
        }
        return name;
    }

    auto grammar_to_dfa(const RegularGrammar &grammar) -> Expected<Dfa>
    {
        if (auto ok = helpers::check_deterministic(grammar); !ok)
        {
            return tl::unexpected<Error>(ok.error());
        }

        const State final_state = final_state_name(grammar);
        bool final_used = false;

        std::vector<State> states;
        std::vector<State> accepting;
        Dfa::Transitions transitions;

        std::set<std::string> seen{grammar.start()};
        std::queue<std::string> worklist;
        worklist.push(grammar.start());

        while (!worklist.empty())
        {
            std::string variable = worklist.front();
            worklist.pop();
            states.push_back(variable);

            for (const auto &body : grammar.productions_of(variable))
            {
                if (body.is_epsilon())
                {
                    if (std::find(accepting.begin(), accepting.end(), variable) == accepting.end())
                    {
                        accepting.push_back(variable);
                    }
                    continue;
                }

                if (body.m_variable)
                {
                    transitions[{variable, *body.m_terminal}] = *body.m_variable;
                    if (seen.insert(*body.m_variable).second)
                    {
                        worklist.push(*body.m_variable);
                    }
                }
                else
                {
                    transitions[{variable, *body.m_terminal}] = final_state;
                    final_used = true;
                }
            }
        }

        if (final_used)
        {
            states.push_back(final_state);
            accepting.push_back(final_state);
        }

        return Dfa::create(states, grammar.terminals(), transitions, grammar.start(), accepting);
    }

    auto dfa_to_grammar(const Dfa &dfa) -> Expected<RegularGrammar>
    {
        RegularGrammar::Productions productions;
        for (const auto &state : dfa.states())
        {
            auto &bodies = productions[state];
            // alphabet order keeps the production list stable
            for (const auto &symbol : dfa.alphabet())
            {
                if (auto target = dfa.next(state, symbol))
                {
                    bodies.emplace_back(symbol, *target);
                }
            }
            if (dfa.is_accepting(state))
            {
                bodies.push_back(ProductionBody::epsilon());
            }
        }
        return RegularGrammar::create(dfa.states(), dfa.alphabet(), productions, dfa.start());
    }
}
