#ifndef AUTOMATON_H
#define AUTOMATON_H

#include "automaton_elements.hpp"
#include "errors.hpp"
#include "validation.hpp"

#include <map>
#include <set>
#include <string>
#include <string_view>
#include <optional>
#include <utility>
#include <vector>

#include <fmt/format.h>

namespace model
{
    // one `from,symbol,to1,to2,...` entry of an input record, as tokens
    struct TransitionSpec
    {
        TransitionSpec() = default;
        TransitionSpec(
            std::string_view context,
            std::string_view from,
            std::string_view symbol,
            const std::vector<State> &targets
        )
            : m_context{context},
              m_from{from},
              m_symbol{symbol},
              m_targets{targets} {}

        std::string m_context;
        State m_from;
        std::string m_symbol;
        std::vector<State> m_targets;
    };

    class Dfa
    {
    public:
        using TransitionKey = std::pair<State, std::string>;
        using Transitions   = std::map<TransitionKey, State>;

        [[nodiscard]]
        static auto create(
            const std::vector<State> &states,
            const Alphabet &alphabet,
            const Transitions &transitions,
            std::string_view start,
            const std::vector<State> &accepting
        ) -> Expected<Dfa>;

        [[nodiscard]]
        static auto from_specs(
            const std::vector<State> &states,
            const Alphabet &alphabet,
            const std::vector<TransitionSpec> &transitions,
            std::string_view start,
            const std::vector<State> &accepting
        ) -> Expected<Dfa>;

        auto states() const -> const std::vector<State> & { return m_states; }
        auto alphabet() const -> const Alphabet & { return m_alphabet; }
        auto transitions() const -> const Transitions & { return m_transitions; }
        auto start() const -> const State & { return m_start; }
        auto accepting() const -> const StateSet & { return m_accepting; }

        auto is_accepting(const State &state) const -> bool;

        // nullopt when the (partial) transition function is undefined
        auto next(const State &state, std::string_view symbol) const -> std::optional<State>;

    private:
        Dfa(
            std::vector<State> states,
            Alphabet alphabet,
            Transitions transitions,
            State start,
            StateSet accepting
        )
            : m_states{std::move(states)},
              m_alphabet{std::move(alphabet)},
              m_transitions{std::move(transitions)},
              m_start{std::move(start)},
              m_accepting{std::move(accepting)} {}

        std::vector<State> m_states;
        Alphabet m_alphabet;
        Transitions m_transitions;
        State m_start;
        StateSet m_accepting;
    };

    // NFA when AllowEpsilon is false, ε-NFA otherwise
    template <bool AllowEpsilon>
    class BasicNfa
    {
    public:
        using TransitionKey = std::pair<State, Symbol>;
        using Transitions   = std::map<TransitionKey, StateSet>;

        static constexpr bool allows_epsilon = AllowEpsilon;

        [[nodiscard]]
        static auto create(
            const std::vector<State> &states,
            const Alphabet &alphabet,
            const Transitions &transitions,
            std::string_view start,
            const std::vector<State> &accepting
        ) -> Expected<BasicNfa>
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

            for (const auto &[key, targets] : transitions)
            {
                const auto &[from, symbol] = key;
                auto context = fmt::format("transitions ({}, {})", from, symbol.label());

                if (symbol.is_epsilon() && !AllowEpsilon)
                {
                    return make_error(ErrorKind::MalformedInput, context,
                                      "ε-transitions are only allowed in an ε-NFA");
                }
                if (auto ok = validation::require_declared(*declared_states, from, context, "state"); !ok)
                {
                    return tl::unexpected<Error>(ok.error());
                }
                if (!symbol.is_epsilon())
                {
                    if (auto ok = validation::require_declared(*declared_alphabet, *symbol.m_label, context, "symbol"); !ok)
                    {
                        return tl::unexpected<Error>(ok.error());
                    }
                }
                for (const auto &target : targets)
                {
                    if (auto ok = validation::require_declared(*declared_states, target, context, "state"); !ok)
                    {
                        return tl::unexpected<Error>(ok.error());
                    }
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

            return BasicNfa(
                std::move(*declared_states),
                std::move(*declared_alphabet),
                transitions,
                State(start),
                StateSet(accepting.begin(), accepting.end())
            );
        }

        [[nodiscard]]
        static auto from_specs(
            const std::vector<State> &states,
            const Alphabet &alphabet,
            const std::vector<TransitionSpec> &specs,
            std::string_view start,
            const std::vector<State> &accepting
        ) -> Expected<BasicNfa>
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

            // check every entry here so errors carry the record line
            Transitions transitions;
            for (const auto &spec : specs)
            {
                const bool epsilon = is_epsilon_token(spec.m_symbol);
                if (epsilon && !AllowEpsilon)
                {
                    return make_error(ErrorKind::MalformedInput, spec.m_context,
                                      "ε-transitions are only allowed in an ε-NFA");
                }
                if (auto ok = validation::require_declared(*declared_states, spec.m_from, spec.m_context, "state"); !ok)
                {
                    return tl::unexpected<Error>(ok.error());
                }
                if (!epsilon)
                {
                    if (auto ok = validation::require_declared(*declared_alphabet, spec.m_symbol, spec.m_context, "symbol"); !ok)
                    {
                        return tl::unexpected<Error>(ok.error());
                    }
                }
                if (auto ok = validation::require_all_declared(*declared_states, spec.m_targets, spec.m_context, "state"); !ok)
                {
                    return tl::unexpected<Error>(ok.error());
                }

                Symbol symbol = epsilon ? Symbol::epsilon() : Symbol(spec.m_symbol);
                // repeated entries for one key accumulate
                auto &image = transitions[{spec.m_from, symbol}];
                image.insert(spec.m_targets.begin(), spec.m_targets.end());
            }

            return create(*declared_states, *declared_alphabet, transitions, start, accepting);
        }

        auto states() const -> const std::vector<State> & { return m_states; }
        auto alphabet() const -> const Alphabet & { return m_alphabet; }
        auto transitions() const -> const Transitions & { return m_transitions; }
        auto start() const -> const State & { return m_start; }
        auto accepting() const -> const StateSet & { return m_accepting; }

        auto is_accepting(const State &state) const -> bool
        {
            return m_accepting.contains(state);
        }

        // the (possibly empty) set of successors of state on symbol
        auto image(const State &state, const Symbol &symbol) const -> const StateSet &
        {
            static const StateSet empty{};
            if (auto it = m_transitions.find({state, symbol}); it != m_transitions.end())
            {
                return it->second;
            }
            return empty;
        }

    private:
        BasicNfa(
            std::vector<State> states,
            Alphabet alphabet,
            Transitions transitions,
            State start,
            StateSet accepting
        )
            : m_states{std::move(states)},
              m_alphabet{std::move(alphabet)},
              m_transitions{std::move(transitions)},
              m_start{std::move(start)},
              m_accepting{std::move(accepting)} {}

        std::vector<State> m_states;
        Alphabet m_alphabet;
        Transitions m_transitions;
        State m_start;
        StateSet m_accepting;
    };

    using Nfa        = BasicNfa<false>;
    using EpsilonNfa = BasicNfa<true>;
}

#endif
