#include "../include/grammar.hpp"
#include "../include/validation.hpp"
#include "../include/utility.hpp"

#include <algorithm>
#include <optional>

#include <fmt/format.h>

namespace model
{
    namespace helpers
    {
        static auto contains(const std::vector<std::string> &names, std::string_view name) -> bool
        {
            return std::find(names.begin(), names.end(), name) != names.end();
        }

        static auto body_to_string(const ProductionBody &body) -> std::string
        {
            if (body.is_epsilon())
            {
                return std::string(epsilon_glyph);
            }
            if (body.m_variable)
            {
                return fmt::format("{} {}", *body.m_terminal, *body.m_variable);
            }
            return *body.m_terminal;
        }
    }

    auto parse_body(
        std::string_view text,
        const std::vector<std::string> &variables,
        const std::vector<std::string> &terminals,
        std::string_view context
    ) -> Expected<ProductionBody>
    {
        auto is_variable = [&](std::string_view s) { return helpers::contains(variables, s); };
        auto is_terminal = [&](std::string_view s) { return helpers::contains(terminals, s); };

        const std::string body = utility::trim(text);
        if (body.empty())
        {
            return make_error(ErrorKind::MalformedInput, context, "empty production body");
        }
        if (is_epsilon_token(body))
        {
            return ProductionBody::epsilon();
        }

        auto pieces = utility::split_any(body, " \t");
        if (pieces.size() > 2)
        {
            return make_error(ErrorKind::MalformedInput, context,
                              fmt::format("'{}' is not right-linear: expected a terminal and at most one variable", body));
        }
        if (pieces.size() == 2)
        {
            if (!is_terminal(pieces[0]))
            {
                if (is_variable(pieces[0]))
                {
                    return make_error(ErrorKind::MalformedInput, context,
                                      fmt::format("'{}' is not right-linear: it starts with a variable", body));
                }
                return make_error(ErrorKind::UndeclaredReference, context,
                                  fmt::format("terminal '{}' is not declared", pieces[0]));
            }
            if (!is_variable(pieces[1]))
            {
                if (is_terminal(pieces[1]))
                {
                    return make_error(ErrorKind::MalformedInput, context,
                                      fmt::format("'{}' is not right-linear: only one terminal is allowed", body));
                }
                return make_error(ErrorKind::UndeclaredReference, context,
                                  fmt::format("variable '{}' is not declared", pieces[1]));
            }
            return ProductionBody(pieces[0], pieces[1]);
        }

        // written together, prefer the longest terminal that leaves a valid remainder
        std::optional<ProductionBody> best;
        std::size_t best_length = 0;
        for (const auto &terminal : terminals)
        {
            if (terminal.size() <= best_length || !body.starts_with(terminal))
            {
                continue;
            }
            std::string_view rest = std::string_view(body).substr(terminal.size());
            if (rest.empty())
            {
                best = ProductionBody(terminal);
            }
            else if (is_variable(rest))
            {
                best = ProductionBody(terminal, rest);
            }
            else
            {
                continue;
            }
            best_length = terminal.size();
        }
        if (best)
        {
            return *best;
        }

        for (const auto &variable : variables)
        {
            if (body.starts_with(variable))
            {
                return make_error(ErrorKind::MalformedInput, context,
                                  fmt::format("'{}' is not right-linear: it starts with a variable", body));
            }
        }
        for (const auto &terminal : terminals)
        {
            if (body.starts_with(terminal))
            {
                return make_error(ErrorKind::UndeclaredReference, context,
                                  fmt::format("variable '{}' is not declared", body.substr(terminal.size())));
            }
        }
        return make_error(ErrorKind::UndeclaredReference, context,
                          fmt::format("'{}' does not start with a declared terminal", body));
    }

    auto RegularGrammar::create(
        const std::vector<std::string> &variables,
        const std::vector<std::string> &terminals,
        const Productions &productions,
        std::string_view start
    ) -> Expected<RegularGrammar>
    {
        auto declared_variables = validation::unique_declarations(variables, "variables");
        if (!declared_variables)
        {
            return tl::unexpected<Error>(declared_variables.error());
        }
        auto declared_terminals = validation::unique_declarations(terminals, "terminals");
        if (!declared_terminals)
        {
            return tl::unexpected<Error>(declared_terminals.error());
        }

        Productions checked;
        for (const auto &[variable, bodies] : productions)
        {
            auto context = fmt::format("productions ({})", variable);
            if (auto ok = validation::require_declared(*declared_variables, variable, context, "variable"); !ok)
            {
                return tl::unexpected<Error>(ok.error());
            }

            auto &list = checked[variable];
            for (const auto &body : bodies)
            {
                if (!body.m_terminal && body.m_variable)
                {
                    return make_error(ErrorKind::MalformedInput, context,
                                      fmt::format("'{}' is not right-linear: a variable needs a leading terminal", *body.m_variable));
                }
                if (body.m_terminal)
                {
                    if (auto ok = validation::require_declared(*declared_terminals, *body.m_terminal, context, "terminal"); !ok)
                    {
                        return tl::unexpected<Error>(ok.error());
                    }
                }
                if (body.m_variable)
                {
                    if (auto ok = validation::require_declared(*declared_variables, *body.m_variable, context, "variable"); !ok)
                    {
                        return tl::unexpected<Error>(ok.error());
                    }
                }
                if (std::find(list.begin(), list.end(), body) == list.end())
                {
                    list.push_back(body);
                }
            }
        }

        if (auto ok = validation::require_declared(*declared_variables, start, "start", "variable"); !ok)
        {
            return tl::unexpected<Error>(ok.error());
        }

        return RegularGrammar(
            std::move(*declared_variables),
            std::move(*declared_terminals),
            std::move(checked),
            std::string(start)
        );
    }

    auto RegularGrammar::from_specs(
        const std::vector<std::string> &variables,
        const std::vector<std::string> &terminals,
        const std::vector<ProductionSpec> &specs,
        std::string_view start
    ) -> Expected<RegularGrammar>
    {
        auto declared_variables = validation::unique_declarations(variables, "variables");
        if (!declared_variables)
        {
            return tl::unexpected<Error>(declared_variables.error());
        }
        auto declared_terminals = validation::unique_declarations(terminals, "terminals");
        if (!declared_terminals)
        {
            return tl::unexpected<Error>(declared_terminals.error());
        }

        Productions productions;
        for (const auto &spec : specs)
        {
            if (auto ok = validation::require_declared(*declared_variables, spec.m_variable, spec.m_context, "variable"); !ok)
            {
                return tl::unexpected<Error>(ok.error());
            }
            if (spec.m_bodies.empty())
            {
                return make_error(ErrorKind::MalformedInput, spec.m_context,
                                  "a production line needs at least one body");
            }
            for (const auto &text : spec.m_bodies)
            {
                auto body = parse_body(text, *declared_variables, *declared_terminals, spec.m_context);
                if (!body)
                {
                    return tl::unexpected<Error>(body.error());
                }
                productions[spec.m_variable].push_back(*body);
            }
        }

        return create(*declared_variables, *declared_terminals, productions, start);
    }

    auto RegularGrammar::productions_of(const std::string &variable) const -> const std::vector<ProductionBody> &
    {
        static const std::vector<ProductionBody> none{};
        if (auto it = m_productions.find(variable); it != m_productions.end())
        {
            return it->second;
        }
        return none;
    }

    auto format_grammar(const RegularGrammar &grammar) -> std::string
    {
        std::vector<std::string> order{grammar.start()};
        for (const auto &variable : grammar.variables())
        {
            if (variable != grammar.start())
            {
                order.push_back(variable);
            }
        }

        std::vector<std::string> lines;
        for (const auto &variable : order)
        {
            const auto &bodies = grammar.productions_of(variable);
            if (bodies.empty())
            {
                continue;
            }
            std::vector<std::string> alternatives;
            for (const auto &body : bodies)
            {
                alternatives.push_back(helpers::body_to_string(body));
            }
            lines.push_back(fmt::format("{} → {}", variable, fmt::join(alternatives, " | ")));
        }
        return fmt::format("{}", fmt::join(lines, "\n"));
    }
}
