#include "../include/automaton.hpp"

#include <fmt/format.h>

namespace model
{
    auto Dfa::create(
        const std::vector<State> &states,
        const Alphabet &alphabet,
        const Transitions &transitions,
        std::string_view start,
        const std::vector<State> &accepting
    ) -> Expected<Dfa>
    {
        auto declared_states = validation::unique_declarations(states, "states");
        if (!declared_states)
        {
            return tl::unexpected<Error>(declared_states.error());
        }
        auto declared_alphabet = validation::unique_declarations(alphabet, "alphabet");
        if (!declared_alphabet)
        {
            return tl::unexpected<Error>(declared_alphabet.error());
        }

        for (const auto &[key, target] : transitions)
        {
            const auto &[from, symbol] = key;
            auto context = fmt::format("transitions ({}, {})", from, symbol);

            if (is_epsilon_token(symbol))
            {
                return make_error(ErrorKind::MalformedInput, context,
                                  "ε-transitions are only allowed in an ε-NFA");
            }
            if (auto ok = validation::require_declared(*declared_states, from, context, "state"); !ok)
            {
                return tl::unexpected<Error>(ok.error());
            }
            if (auto ok = validation::require_declared(*declared_alphabet, symbol, context, "symbol"); !ok)
            {
                return tl::unexpected<Error>(ok.error());
            }
            if (auto ok = validation::require_declared(*declared_states, target, context, "state"); !ok)
            {
                return tl::unexpected<Error>(ok.error());
            }
        }

        if (auto ok = validation::require_declared(*declared_states, start, "start", "state"); !ok)
        {
            return tl::unexpected<Error>(ok.error());
        }
        if (auto ok = validation::require_all_declared(*declared_states, accepting, "accepting", "state"); !ok)
        {
            return tl::unexpected<Error>(ok.error());
        }

        return Dfa(
            std::move(*declared_states),
            std::move(*declared_alphabet),
            transitions,
            State(start),
            StateSet(accepting.begin(), accepting.end())
        );
    }

    auto Dfa::from_specs(
        const std::vector<State> &states,
        const Alphabet &alphabet,
        const std::vector<TransitionSpec> &specs,
        std::string_view start,
        const std::vector<State> &accepting
    ) -> Expected<Dfa>
    {
        auto declared_states = validation::unique_declarations(states, "states");
        if (!declared_states)
        {
            return tl::unexpected<Error>(declared_states.error());
        }
        auto declared_alphabet = validation::unique_declarations(alphabet, "alphabet");
        if (!declared_alphabet)
        {
            return tl::unexpected<Error>(declared_alphabet.error());
        }

        Transitions transitions;
        for (const auto &spec : specs)
        {
            if (is_epsilon_token(spec.m_symbol))
            {
                return make_error(ErrorKind::MalformedInput, spec.m_context,
                                  "ε-transitions are only allowed in an ε-NFA");
            }
            if (spec.m_targets.size() != 1)
            {
                return make_error(ErrorKind::MalformedInput, spec.m_context,
                                  fmt::format("a DFA transition has exactly one target, got {}", spec.m_targets.size()));
            }
            if (auto ok = validation::require_declared(*declared_states, spec.m_from, spec.m_context, "state"); !ok)
            {
                return tl::unexpected<Error>(ok.error());
            }
            if (auto ok = validation::require_declared(*declared_alphabet, spec.m_symbol, spec.m_context, "symbol"); !ok)
            {
                return tl::unexpected<Error>(ok.error());
            }
            const auto &target = spec.m_targets.front();
            if (auto ok = validation::require_declared(*declared_states, target, spec.m_context, "state"); !ok)
            {
                return tl::unexpected<Error>(ok.error());
            }

            auto [it, inserted] = transitions.emplace(TransitionKey{spec.m_from, spec.m_symbol}, target);
            if (!inserted && it->second != target)
            {
                return make_error(ErrorKind::MalformedInput, spec.m_context,
                                  fmt::format("({}, {}) already goes to '{}'", spec.m_from, spec.m_symbol, it->second));
            }
        }

        return create(*declared_states, *declared_alphabet, transitions, start, accepting);
    }

    auto Dfa::is_accepting(const State &state) const -> bool
    {
        return m_accepting.contains(state);
    }

    auto Dfa::next(const State &state, std::string_view symbol) const -> std::optional<State>
    {
        if (auto it = m_transitions.find({state, std::string(symbol)}); it != m_transitions.end())
        {
            return it->second;
        }
        return std::nullopt;
    }
}
