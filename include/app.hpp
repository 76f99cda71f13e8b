#ifndef APP_H
#define APP_H

#include "errors.hpp"
#include "graph_builder.hpp"
#include "parser.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace app
{
    enum class Operation
    {
        Render,
        Simulate,
        Determinize,
        Closure,
        GrammarToDfa,
        DfaToGrammar
    };

    struct Options
    {
        std::optional<std::filesystem::path> out_file;
        graph::Format format{graph::Format::Dot};
        // overrides the record's operation attribute
        std::optional<Operation> operation;
        // overrides the record's <input> field
        std::optional<std::string> input_string;
        bool verbose{false};
    };

    // one graph to hand to the renderer, named after what it shows
    struct Artifact
    {
        std::string m_name;
        graph::GraphDescription m_graph;
    };

    struct Report
    {
        Operation m_operation{Operation::Render};
        std::vector<Artifact> m_artifacts;
        // results that are text rather than graphs (closures, the grammar, the verdict)
        std::vector<std::string> m_notes;
    };

    [[nodiscard]]
    auto parse_operation(std::string_view name) -> Expected<Operation>;

    [[nodiscard]]
    auto to_string(Operation operation) -> std::string_view;

    // dfa: simulate when there is an input string, else render; nfa: determinize;
    // enfa: closure; grammar: grammar-to-dfa; pda: render
    [[nodiscard]]
    auto default_operation(const parser::InputRecord &record, const Options &options) -> Operation;

    [[nodiscard]]
    auto execute(const parser::InputRecord &record, const Options &options) -> Expected<Report>;

    auto run(const std::filesystem::path &path, Options options) -> void;
}

#endif
