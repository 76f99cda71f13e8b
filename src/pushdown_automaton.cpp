#include "../include/pushdown_automaton.hpp"
#include "../include/validation.hpp"
#include "../include/utility.hpp"

#include <fmt/format.h>

namespace model
{
    namespace helpers
    {
        struct Declarations
        {
            std::vector<State> m_states;
            Alphabet m_input_alphabet;
            Alphabet m_stack_alphabet;
        };

        static auto declarations(
            const std::vector<State> &states,
            const Alphabet &input_alphabet,
            const Alphabet &stack_alphabet
        ) -> Expected<Declarations>
        {
            auto declared_states = validation::unique_declarations(states, "states");
            if (!declared_states)
            {
                return tl::unexpected<Error>(declared_states.error());
            }
            auto declared_input = validation::unique_declarations(input_alphabet, "input_alphabet");
            if (!declared_input)
            {
                return tl::unexpected<Error>(declared_input.error());
            }
            auto declared_stack = validation::unique_declarations(stack_alphabet, "stack_alphabet");
            if (!declared_stack)
            {
                return tl::unexpected<Error>(declared_stack.error());
            }
            return Declarations{*declared_states, *declared_input, *declared_stack};
        }

        static auto check_move(
            const Declarations &declared,
            const State &from,
            const Symbol &input,
            const std::string &stack_top,
            const PDAMove &move,
            std::string_view context
        ) -> Expected<void>
        {
            if (auto ok = validation::require_declared(declared.m_states, from, context, "state"); !ok)
            {
                return ok;
            }
            if (!input.is_epsilon())
            {
                if (auto ok = validation::require_declared(declared.m_input_alphabet, *input.m_label, context, "input symbol"); !ok)
                {
                    return ok;
                }
            }
            if (is_epsilon_token(stack_top))
            {
                return make_error(ErrorKind::MalformedInput, context, "the popped stack symbol cannot be ε");
            }
            if (auto ok = validation::require_declared(declared.m_stack_alphabet, stack_top, context, "stack symbol"); !ok)
            {
                return ok;
            }
            if (auto ok = validation::require_declared(declared.m_states, move.m_target, context, "state"); !ok)
            {
                return ok;
            }
            return validation::require_all_declared(declared.m_stack_alphabet, move.m_push, context, "stack symbol");
        }
    }

    auto PushdownAutomaton::create(
        const std::vector<State> &states,
        const Alphabet &input_alphabet,
        const Alphabet &stack_alphabet,
        const Transitions &transitions,
        std::string_view start,
        std::string_view initial_stack,
        const std::vector<State> &accepting
    ) -> Expected<PushdownAutomaton>
    {
        auto declared = helpers::declarations(states, input_alphabet, stack_alphabet);
        if (!declared)
        {
            return tl::unexpected<Error>(declared.error());
        }

        for (const auto &[key, moves] : transitions)
        {
            const auto &[from, input, stack_top] = key;
            auto context = fmt::format("transitions ({}, {}, {})", from, input.label(), stack_top);
            for (const auto &move : moves)
            {
                if (auto ok = helpers::check_move(*declared, from, input, stack_top, move, context); !ok)
                {
                    return tl::unexpected<Error>(ok.error());
                }
            }
        }

        if (auto ok = validation::require_declared(declared->m_states, start, "start", "state"); !ok)
        {
            return tl::unexpected<Error>(ok.error());
        }
        if (auto ok = validation::require_declared(declared->m_stack_alphabet, initial_stack, "initial_stack", "stack symbol"); !ok)
        {
            return tl::unexpected<Error>(ok.error());
        }
        if (auto ok = validation::require_all_declared(declared->m_states, accepting, "accepting", "state"); !ok)
        {
            return tl::unexpected<Error>(ok.error());
        }

        return PushdownAutomaton(
            std::move(declared->m_states),
            std::move(declared->m_input_alphabet),
            std::move(declared->m_stack_alphabet),
            transitions,
            State(start),
            std::string(initial_stack),
            StateSet(accepting.begin(), accepting.end())
        );
    }

    auto PushdownAutomaton::from_specs(
        const std::vector<State> &states,
        const Alphabet &input_alphabet,
        const Alphabet &stack_alphabet,
        const std::vector<PDATransitionSpec> &specs,
        std::string_view start,
        std::string_view initial_stack,
        const std::vector<State> &accepting
    ) -> Expected<PushdownAutomaton>
    {
        auto declared = helpers::declarations(states, input_alphabet, stack_alphabet);
        if (!declared)
        {
            return tl::unexpected<Error>(declared.error());
        }

        Transitions transitions;
        for (const auto &spec : specs)
        {
            Symbol input = is_epsilon_token(spec.m_input) ? Symbol::epsilon() : Symbol(spec.m_input);

            std::vector<std::string> push;
            if (!is_epsilon_token(utility::trim(spec.m_push)))
            {
                push = utility::tokenize(spec.m_push, declared->m_stack_alphabet);
            }

            PDAMove move(spec.m_to, push);
            if (auto ok = helpers::check_move(*declared, spec.m_from, input, spec.m_stack_top, move, spec.m_context); !ok)
            {
                return tl::unexpected<Error>(ok.error());
            }
            transitions[{spec.m_from, input, spec.m_stack_top}].insert(move);
        }

        return create(
            declared->m_states, declared->m_input_alphabet, declared->m_stack_alphabet,
            transitions, start, initial_stack, accepting
        );
    }
}
