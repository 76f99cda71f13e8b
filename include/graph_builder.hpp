#ifndef GRAPH_BUILDER_H
#define GRAPH_BUILDER_H

#include "errors.hpp"
#include "model.hpp"
#include "simulator.hpp"
#include "subset_construction.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace graph
{
    struct Node
    {
        std::string m_id;
        bool m_is_accepting{false};
        bool m_is_start{false};
        // extra text under the id, e.g. the composite set behind a subset construction label
        std::optional<std::string> m_caption;
        bool m_on_path{false};
    };

    struct Edge
    {
        std::string m_from;
        std::string m_to;
        std::string m_label;
        bool m_on_path{false};
    };

    struct Trace
    {
        std::vector<std::string> m_path;
        std::vector<std::string> m_consumed;
        bool m_accepted{false};
    };

    // what the rendering service draws, independent of any drawing backend
    struct GraphDescription
    {
        auto node(std::string_view id) const -> const Node *;
        auto edge(std::string_view from, std::string_view to) const -> const Edge *;

        std::string m_title;
        std::vector<Node> m_nodes;
        std::vector<Edge> m_edges;
        std::optional<Trace> m_trace;
    };

    // edges between the same pair of states are merged, their labels joined with ", "
    [[nodiscard]] auto describe(const model::Dfa &dfa) -> GraphDescription;
    [[nodiscard]] auto describe(const model::Nfa &nfa) -> GraphDescription;
    [[nodiscard]] auto describe(const model::EpsilonNfa &nfa) -> GraphDescription;
    [[nodiscard]] auto describe(const model::RegularGrammar &grammar) -> GraphDescription;
    [[nodiscard]] auto describe(const model::PushdownAutomaton &pda) -> GraphDescription;
    [[nodiscard]] auto describe(const model::SubsetConstruction &construction) -> GraphDescription;
    [[nodiscard]] auto describe(const model::Model &model) -> GraphDescription;

    // the DFA with the traced path highlighted
    [[nodiscard]]
    auto describe(
        const model::Dfa &dfa,
        const model::SimulationResult &result,
        const std::vector<std::string> &input
    ) -> GraphDescription;

    enum class Format
    {
        Dot,
        Xml
    };

    [[nodiscard]]
    auto parse_format(std::string_view name) -> Expected<Format>;

    [[nodiscard]]
    auto extension(Format format) -> std::string_view;

    class GraphBuilder
    {
    public:
        GraphBuilder(const GraphDescription &graph, Format format);

        // serialises the graph description in the chosen format
        auto build() -> void;

        auto write() const -> const std::string &;

    private:
        auto write_dot() const -> std::string;
        auto write_dot_node(const Node &node) const -> std::string;
        auto write_dot_edge(const Edge &edge) const -> std::string;

        auto write_xml() const -> std::string;

        GraphDescription m_graph;
        Format m_format;

        // the serialised version of m_graph
        std::string m_output;
    };
}

#endif
