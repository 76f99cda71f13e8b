#ifndef PUSHDOWN_AUTOMATON_H
#define PUSHDOWN_AUTOMATON_H

#include "automaton_elements.hpp"
#include "errors.hpp"

#include <map>
#include <set>
#include <string>
#include <string_view>
#include <tuple>
#include <utility>
#include <vector>

namespace model
{
    // one `from,input-symbol,stack-top,to,stack-push` entry of an input record
    struct PDATransitionSpec
    {
        PDATransitionSpec() = default;
        PDATransitionSpec(
            std::string_view context,
            std::string_view from,
            std::string_view input,
            std::string_view stack_top,
            std::string_view to,
            std::string_view push
        )
            : m_context{context},
              m_from{from},
              m_input{input},
              m_stack_top{stack_top},
              m_to{to},
              m_push{push} {}

        std::string m_context;
        State m_from;
        std::string m_input;
        std::string m_stack_top;
        State m_to;
        // λ, or stack symbols written together or space separated
        std::string m_push;
    };

    // only structure is modeled, there is no execution
    class PushdownAutomaton
    {
    public:
        using TransitionKey = std::tuple<State, Symbol, std::string>;
        using Transitions   = std::map<TransitionKey, std::set<PDAMove>>;

        [[nodiscard]]
        static auto create(
            const std::vector<State> &states,
            const Alphabet &input_alphabet,
            const Alphabet &stack_alphabet,
            const Transitions &transitions,
            std::string_view start,
            std::string_view initial_stack,
            const std::vector<State> &accepting
        ) -> Expected<PushdownAutomaton>;

        [[nodiscard]]
        static auto from_specs(
            const std::vector<State> &states,
            const Alphabet &input_alphabet,
            const Alphabet &stack_alphabet,
            const std::vector<PDATransitionSpec> &transitions,
            std::string_view start,
            std::string_view initial_stack,
            const std::vector<State> &accepting
        ) -> Expected<PushdownAutomaton>;

        auto states() const -> const std::vector<State> & { return m_states; }
        auto input_alphabet() const -> const Alphabet & { return m_input_alphabet; }
        auto stack_alphabet() const -> const Alphabet & { return m_stack_alphabet; }
        auto transitions() const -> const Transitions & { return m_transitions; }
        auto start() const -> const State & { return m_start; }
        auto initial_stack() const -> const std::string & { return m_initial_stack; }
        auto accepting() const -> const StateSet & { return m_accepting; }

        auto is_accepting(const State &state) const -> bool { return m_accepting.contains(state); }

    private:
        PushdownAutomaton(
            std::vector<State> states,
            Alphabet input_alphabet,
            Alphabet stack_alphabet,
            Transitions transitions,
            State start,
            std::string initial_stack,
            StateSet accepting
        )
            : m_states{std::move(states)},
              m_input_alphabet{std::move(input_alphabet)},
              m_stack_alphabet{std::move(stack_alphabet)},
              m_transitions{std::move(transitions)},
              m_start{std::move(start)},
              m_initial_stack{std::move(initial_stack)},
              m_accepting{std::move(accepting)} {}

        std::vector<State> m_states;
        Alphabet m_input_alphabet;
        Alphabet m_stack_alphabet;
        Transitions m_transitions;
        State m_start;
        std::string m_initial_stack;
        StateSet m_accepting;
    };
}

#endif
