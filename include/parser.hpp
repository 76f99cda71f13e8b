#ifndef PARSER_H
#define PARSER_H

#include "errors.hpp"
#include "model.hpp"

#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace parser
{
    // the trimmed text fields of one <automaton> record
    struct InputRecord
    {
        model::ModelKind m_kind{model::ModelKind::Dfa};
        std::optional<std::string> m_operation;
        std::map<std::string, std::string> m_fields;
    };

    [[nodiscard]]
    auto read_record(const std::filesystem::path &path) -> Expected<InputRecord>;

    [[nodiscard]]
    auto parse_record(std::string_view xml) -> Expected<InputRecord>;

    [[nodiscard]]
    auto field(const InputRecord &record, std::string_view name) -> Expected<std::string>;

    [[nodiscard]]
    auto optional_field(const InputRecord &record, std::string_view name) -> std::optional<std::string>;

    // comma list, trimmed, empty items dropped
    [[nodiscard]]
    auto parse_list(std::string_view text) -> std::vector<std::string>;

    // semicolon list of `from,symbol,to...`; min_targets/max_targets bound the destinations
    [[nodiscard]]
    auto parse_transitions(
        std::string_view text,
        std::size_t min_targets,
        std::optional<std::size_t> max_targets
    ) -> Expected<std::vector<model::TransitionSpec>>;

    [[nodiscard]]
    auto parse_productions(std::string_view text) -> Expected<std::vector<model::ProductionSpec>>;

    [[nodiscard]]
    auto parse_pda_transitions(std::string_view text) -> Expected<std::vector<model::PDATransitionSpec>>;

    [[nodiscard]]
    auto to_dfa(const InputRecord &record) -> Expected<model::Dfa>;

    [[nodiscard]]
    auto to_nfa(const InputRecord &record) -> Expected<model::Nfa>;

    [[nodiscard]]
    auto to_epsilon_nfa(const InputRecord &record) -> Expected<model::EpsilonNfa>;

    [[nodiscard]]
    auto to_grammar(const InputRecord &record) -> Expected<model::RegularGrammar>;

    [[nodiscard]]
    auto to_pda(const InputRecord &record) -> Expected<model::PushdownAutomaton>;

    // validates the record into the model its kind names
    [[nodiscard]]
    auto to_model(const InputRecord &record) -> Expected<model::Model>;
}

#endif
