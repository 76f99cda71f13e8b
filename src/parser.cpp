#include "../include/parser.hpp"
#include "../include/utility.hpp"
#include "../include/ranges_helpers.hpp"

#include <algorithm>
#include <initializer_list>
#include <ranges>

#include <tinyxml2.h>
#include <fmt/format.h>

namespace parser
{
    // namespaces aliases
    using namespace tinyxml2;
    namespace views = std::views;
    namespace ranges = std::ranges;

    // helper functions
    namespace helpers
    {
        struct Entry
        {
            std::string m_context;
            std::vector<std::string> m_tokens;
        };

        // semicolon separated entries split on commas, blank entries are skipped
        static auto entries(std::string_view text, std::string_view field) -> std::vector<Entry>
        {
            std::vector<Entry> out;
            auto pieces = utility::split(text, ';');
            for (std::size_t i = 0; i < pieces.size(); ++i)
            {
                if (pieces[i].empty())
                {
                    continue;
                }
                out.push_back(Entry{fmt::format("{}[{}]", field, i), utility::split(pieces[i], ',')});
            }
            return out;
        }

        static auto has_empty_token(const Entry &entry) -> bool
        {
            return ranges::any_of(entry.m_tokens, [](const std::string &token) { return token.empty(); });
        }

        // values of the named fields, in the order asked for
        static auto fields(
            const InputRecord &record,
            std::initializer_list<std::string_view> names
        ) -> Expected<std::vector<std::string>>
        {
            std::vector<std::string> values;
            for (auto name : names)
            {
                auto value = field(record, name);
                if (!value)
                {
                    return tl::unexpected<Error>(value.error());
                }
                values.push_back(std::move(*value));
            }
            return values;
        }

        static auto record_from_xml(XMLDocument &doc) -> Expected<InputRecord>
        {
            XMLElement *pRoot = doc.RootElement();
            if (pRoot == nullptr || std::string_view{pRoot->Name()} != "automaton")
            {
                return make_error(ErrorKind::InvalidRecordFile, "", "the root element must be <automaton>");
            }

            const char *pKind = pRoot->Attribute("kind");
            if (pKind == nullptr)
            {
                return make_error(ErrorKind::MissingField, "kind", "the <automaton> element needs a kind attribute");
            }
            auto kind = model::parse_model_kind(utility::trim(pKind));
            if (!kind)
            {
                return tl::unexpected<Error>(kind.error());
            }

            InputRecord record;
            record.m_kind = *kind;
            if (const char *pOperation = pRoot->Attribute("operation"); pOperation != nullptr)
            {
                record.m_operation = utility::trim(pOperation);
            }

            for (XMLElement *pField = pRoot->FirstChildElement(); pField != nullptr; pField = pField->NextSiblingElement())
            {
                const char *text = pField->GetText();
                record.m_fields[pField->Name()] = utility::trim(text != nullptr ? text : "");
            }
            return record;
        }
    }

    auto read_record(const std::filesystem::path &path) -> Expected<InputRecord>
    {
        if (path.empty())
        {
            return make_error(ErrorKind::EmptyPath, "", "you provided an empty path to the input record");
        }

        XMLDocument doc;
        doc.LoadFile(path.c_str());
        if (doc.ErrorID() != XML_SUCCESS)
        {
            return make_error(ErrorKind::InvalidRecordFile, path.string(), doc.ErrorStr());
        }
        return helpers::record_from_xml(doc);
    }

    auto parse_record(std::string_view xml) -> Expected<InputRecord>
    {
        XMLDocument doc;
        doc.Parse(xml.data(), xml.size());
        if (doc.ErrorID() != XML_SUCCESS)
        {
            return make_error(ErrorKind::InvalidRecordFile, "", doc.ErrorStr());
        }
        return helpers::record_from_xml(doc);
    }

    auto field(const InputRecord &record, std::string_view name) -> Expected<std::string>
    {
        if (auto it = record.m_fields.find(std::string(name)); it != record.m_fields.end())
        {
            return it->second;
        }
        return make_error(ErrorKind::MissingField, name,
                          fmt::format("a {} record needs a <{}> field", model::to_string(record.m_kind), name));
    }

    auto optional_field(const InputRecord &record, std::string_view name) -> std::optional<std::string>
    {
        if (auto it = record.m_fields.find(std::string(name)); it != record.m_fields.end())
        {
            return it->second;
        }
        return std::nullopt;
    }

    auto parse_list(std::string_view text) -> std::vector<std::string>
    {
        return utility::split_any(text, ",");
    }

    auto parse_transitions(
        std::string_view text,
        std::size_t min_targets,
        std::optional<std::size_t> max_targets
    ) -> Expected<std::vector<model::TransitionSpec>>
    {
        const std::string shape = max_targets == std::size_t{1} && min_targets == 1
            ? "from,symbol,to"
            : "from,symbol,to1,to2,...";

        auto lines = helpers::entries(text, "transitions");
        auto to_spec = [&](const helpers::Entry &entry) -> Expected<model::TransitionSpec>
        {
            const auto &toks = entry.m_tokens;
            const std::size_t targets = toks.size() < 2 ? 0 : toks.size() - 2;
            if (helpers::has_empty_token(entry) || toks.size() < 2 || targets < min_targets
                || (max_targets.has_value() && targets > *max_targets))
            {
                return make_error(ErrorKind::MalformedInput, entry.m_context,
                                  fmt::format("expected '{}', got '{}'", shape, fmt::join(toks, ",")));
            }
            return model::TransitionSpec(
                entry.m_context, toks[0], toks[1],
                std::vector<std::string>(toks.begin() + 2, toks.end())
            );
        };

        auto specs = lines | views::transform(to_spec);
        return utility::to_expected(specs);
    }

    auto parse_productions(std::string_view text) -> Expected<std::vector<model::ProductionSpec>>
    {
        auto lines = helpers::entries(text, "productions");
        auto to_spec = [](const helpers::Entry &entry) -> Expected<model::ProductionSpec>
        {
            const auto &toks = entry.m_tokens;
            if (helpers::has_empty_token(entry) || toks.size() < 2)
            {
                return make_error(ErrorKind::MalformedInput, entry.m_context,
                                  fmt::format("expected 'variable,body1,body2,...', got '{}'", fmt::join(toks, ",")));
            }
            return model::ProductionSpec(
                entry.m_context, toks[0],
                std::vector<std::string>(toks.begin() + 1, toks.end())
            );
        };

        auto specs = lines | views::transform(to_spec);
        return utility::to_expected(specs);
    }

    auto parse_pda_transitions(std::string_view text) -> Expected<std::vector<model::PDATransitionSpec>>
    {
        auto lines = helpers::entries(text, "transitions");
        auto to_spec = [](const helpers::Entry &entry) -> Expected<model::PDATransitionSpec>
        {
            const auto &toks = entry.m_tokens;
            if (helpers::has_empty_token(entry) || toks.size() != 5)
            {
                return make_error(ErrorKind::MalformedInput, entry.m_context,
                                  fmt::format("expected 'from,input,stack-top,to,stack-push', got '{}'", fmt::join(toks, ",")));
            }
            return model::PDATransitionSpec(entry.m_context, toks[0], toks[1], toks[2], toks[3], toks[4]);
        };

        auto specs = lines | views::transform(to_spec);
        return utility::to_expected(specs);
    }

    auto to_dfa(const InputRecord &record) -> Expected<model::Dfa>
    {
        return helpers::fields(record, {"states", "alphabet", "transitions", "start", "accepting"})
            .and_then([](const std::vector<std::string> &f) -> Expected<model::Dfa>
            {
                auto transitions = parse_transitions(f[2], 1, 1);
                if (!transitions)
                {
                    return tl::unexpected<Error>(transitions.error());
                }
                return model::Dfa::from_specs(parse_list(f[0]), parse_list(f[1]), *transitions, f[3], parse_list(f[4]));
            });
    }

    auto to_nfa(const InputRecord &record) -> Expected<model::Nfa>
    {
        return helpers::fields(record, {"states", "alphabet", "transitions", "start", "accepting"})
            .and_then([](const std::vector<std::string> &f) -> Expected<model::Nfa>
            {
                auto transitions = parse_transitions(f[2], 0, std::nullopt);
                if (!transitions)
                {
                    return tl::unexpected<Error>(transitions.error());
                }
                return model::Nfa::from_specs(parse_list(f[0]), parse_list(f[1]), *transitions, f[3], parse_list(f[4]));
            });
    }

    auto to_epsilon_nfa(const InputRecord &record) -> Expected<model::EpsilonNfa>
    {
        return helpers::fields(record, {"states", "alphabet", "transitions", "start", "accepting"})
            .and_then([](const std::vector<std::string> &f) -> Expected<model::EpsilonNfa>
            {
                auto transitions = parse_transitions(f[2], 0, std::nullopt);
                if (!transitions)
                {
                    return tl::unexpected<Error>(transitions.error());
                }
                return model::EpsilonNfa::from_specs(parse_list(f[0]), parse_list(f[1]), *transitions, f[3], parse_list(f[4]));
            });
    }

    auto to_grammar(const InputRecord &record) -> Expected<model::RegularGrammar>
    {
        return helpers::fields(record, {"variables", "terminals", "productions", "start"})
            .and_then([](const std::vector<std::string> &f) -> Expected<model::RegularGrammar>
            {
                auto productions = parse_productions(f[2]);
                if (!productions)
                {
                    return tl::unexpected<Error>(productions.error());
                }
                return model::RegularGrammar::from_specs(parse_list(f[0]), parse_list(f[1]), *productions, f[3]);
            });
    }

    auto to_pda(const InputRecord &record) -> Expected<model::PushdownAutomaton>
    {
        return helpers::fields(record, {"states", "input_alphabet", "stack_alphabet", "transitions", "start", "initial_stack", "accepting"})
            .and_then([](const std::vector<std::string> &f) -> Expected<model::PushdownAutomaton>
            {
                auto transitions = parse_pda_transitions(f[3]);
                if (!transitions)
                {
                    return tl::unexpected<Error>(transitions.error());
                }
                return model::PushdownAutomaton::from_specs(
                    parse_list(f[0]), parse_list(f[1]), parse_list(f[2]),
                    *transitions, f[4], f[5], parse_list(f[6])
                );
            });
    }

    auto to_model(const InputRecord &record) -> Expected<model::Model>
    {
        auto wrap = [](auto &&m) { return model::Model{std::move(m)}; };

        switch (record.m_kind)
        {
        case model::ModelKind::Dfa:
            return to_dfa(record).map(wrap);
        case model::ModelKind::Nfa:
            return to_nfa(record).map(wrap);
        case model::ModelKind::EpsilonNfa:
            return to_epsilon_nfa(record).map(wrap);
        case model::ModelKind::Grammar:
            return to_grammar(record).map(wrap);
        case model::ModelKind::Pda:
            return to_pda(record).map(wrap);
        }
        return make_error(ErrorKind::UnknownModelKind, "kind", "unhandled model kind");
    }
}
