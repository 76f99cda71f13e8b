#include "../include/graph_builder.hpp"
#include "../include/grammar_conversion.hpp"
#include "../include/utility.hpp"

#include <algorithm>
#include <map>
#include <ranges>
#include <set>
#include <utility>
#include <variant>

#include <fmt/format.h>
#include <fmt/ranges.h>
#include <tinyxml2.h>

namespace graph
{
    namespace views = std::views;

    namespace helpers
    {
        // collects labelled transitions into one edge per (from, to), first seen first
        class EdgeAccumulator
        {
        public:
            auto add(const std::string &from, const std::string &to, const std::string &label, bool on_path = false) -> void
            {
                auto key = std::make_pair(from, to);
                auto it = m_index.find(key);
                if (it == m_index.end())
                {
                    it = m_index.emplace(key, m_pending.size()).first;
                    m_pending.push_back(Pending{from, to, {}, false});
                }
                auto &pending = m_pending[it->second];
                if (std::find(pending.m_labels.begin(), pending.m_labels.end(), label) == pending.m_labels.end())
                {
                    pending.m_labels.push_back(label);
                }
                pending.m_on_path = pending.m_on_path || on_path;
            }

            auto edges() const -> std::vector<Edge>
            {
                std::vector<Edge> edges;
                for (const auto &pending : m_pending)
                {
                    edges.push_back(Edge{
                        pending.m_from,
                        pending.m_to,
                        utility::join_non_empty_strings(pending.m_labels, ", "),
                        pending.m_on_path});
                }
                return edges;
            }

        private:
            struct Pending
            {
                std::string m_from;
                std::string m_to;
                std::vector<std::string> m_labels;
                bool m_on_path;
            };

            std::map<std::pair<std::string, std::string>, std::size_t> m_index;
            std::vector<Pending> m_pending;
        };

        template <typename Automaton>
        static auto state_nodes(const Automaton &automaton) -> std::vector<Node>
        {
            std::vector<Node> nodes;
            for (const auto &state : automaton.states())
            {
                nodes.push_back(Node{state, automaton.is_accepting(state), state == automaton.start(), std::nullopt, false});
            }
            return nodes;
        }

        template <bool AllowEpsilon>
        static auto describe_nfa(const model::BasicNfa<AllowEpsilon> &nfa, std::string_view title) -> GraphDescription
        {
            std::vector<model::Symbol> symbols;
            if constexpr (AllowEpsilon)
            {
                symbols.push_back(model::Symbol::epsilon());
            }
            for (const auto &symbol : nfa.alphabet())
            {
                symbols.emplace_back(symbol);
            }

            EdgeAccumulator edges;
            for (const auto &state : nfa.states())
            {
                for (const auto &symbol : symbols)
                {
                    for (const auto &target : nfa.image(state, symbol))
                    {
                        edges.add(state, target, symbol.display());
                    }
                }
            }
            return GraphDescription{std::string(title), state_nodes(nfa), edges.edges(), std::nullopt};
        }

        static auto quote(std::string_view str) -> std::string
        {
            std::string quoted{"\""};
            for (char c : str)
            {
                if (c == '\n')
                {
                    quoted += "\\n";
                    continue;
                }
                if (c == '"' || c == '\\')
                {
                    quoted.push_back('\\');
                }
                quoted.push_back(c);
            }
            quoted.push_back('"');
            return quoted;
        }

        static auto indent(std::string_view multi_line_str, unsigned indent_level) -> std::string
        {
            std::string indent(indent_level * 2, ' ');
            return fmt::format(
                "{}{}",
                indent,
                fmt::join(
                    multi_line_str
                        | views::split('\n')
                        | views::transform([](auto r) {
                            return std::string_view(r.begin(), r.end());
                        }),
                    "\n" + indent
                )
            );
        }
    }

    auto GraphDescription::node(std::string_view id) const -> const Node *
    {
        auto it = std::find_if(m_nodes.begin(), m_nodes.end(), [&](const Node &n) { return n.m_id == id; });
        return it == m_nodes.end() ? nullptr : &*it;
    }

    auto GraphDescription::edge(std::string_view from, std::string_view to) const -> const Edge *
    {
        auto it = std::find_if(m_edges.begin(), m_edges.end(),
                               [&](const Edge &e) { return e.m_from == from && e.m_to == to; });
        return it == m_edges.end() ? nullptr : &*it;
    }

    auto describe(const model::Dfa &dfa) -> GraphDescription
    {
        helpers::EdgeAccumulator edges;
        for (const auto &state : dfa.states())
        {
            for (const auto &symbol : dfa.alphabet())
            {
                if (auto target = dfa.next(state, symbol))
                {
                    edges.add(state, *target, symbol);
                }
            }
        }
        return GraphDescription{"DFA", helpers::state_nodes(dfa), edges.edges(), std::nullopt};
    }

    auto describe(const model::Nfa &nfa) -> GraphDescription
    {
        return helpers::describe_nfa(nfa, "NFA");
    }

    auto describe(const model::EpsilonNfa &nfa) -> GraphDescription
    {
        return helpers::describe_nfa(nfa, "e-NFA");
    }

    auto describe(const model::RegularGrammar &grammar) -> GraphDescription
    {
        const std::string final_node = model::final_state_name(grammar);
        bool final_used = false;

        GraphDescription graph;
        graph.m_title = "Regular grammar";

        helpers::EdgeAccumulator edges;
        for (const auto &variable : grammar.variables())
        {
            bool accepting = false;
            for (const auto &body : grammar.productions_of(variable))
            {
                if (body.is_epsilon())
                {
                    accepting = true;
                }
                else if (body.m_variable)
                {
                    edges.add(variable, *body.m_variable, *body.m_terminal);
                }
                else
                {
                    edges.add(variable, final_node, *body.m_terminal);
                    final_used = true;
                }
            }
            graph.m_nodes.push_back(Node{variable, accepting, variable == grammar.start(), std::nullopt, false});
        }
        if (final_used)
        {
            graph.m_nodes.push_back(Node{final_node, true, false, std::nullopt, false});
        }
        graph.m_edges = edges.edges();
        return graph;
    }

    auto describe(const model::PushdownAutomaton &pda) -> GraphDescription
    {
        helpers::EdgeAccumulator edges;
        for (const auto &[key, moves] : pda.transitions())
        {
            const auto &[from, input, stack_top] = key;
            for (const auto &move : moves)
            {
                std::string push = move.m_push.empty()
                    ? std::string(model::epsilon_glyph)
                    : fmt::format("{}", fmt::join(move.m_push, ""));
                edges.add(from, move.m_target, fmt::format("{}, {} / {}", input.display(), stack_top, push));
            }
        }
        return GraphDescription{"PDA", helpers::state_nodes(pda), edges.edges(), std::nullopt};
    }

    auto describe(const model::SubsetConstruction &construction) -> GraphDescription
    {
        auto graph = describe(construction.m_dfa);
        graph.m_title = "Subset construction";
        for (auto &node : graph.m_nodes)
        {
            node.m_caption = model::composite_label(construction.composite_of(node.m_id));
        }
        return graph;
    }

    auto describe(const model::Model &model) -> GraphDescription
    {
        return std::visit([](const auto &m) { return describe(m); }, model);
    }

    auto describe(
        const model::Dfa &dfa,
        const model::SimulationResult &result,
        const std::vector<std::string> &input
    ) -> GraphDescription
    {
        const auto steps = model::path_steps(result, input);
        const std::set<std::string> visited(result.m_path.begin(), result.m_path.end());

        helpers::EdgeAccumulator edges;
        for (const auto &state : dfa.states())
        {
            for (const auto &symbol : dfa.alphabet())
            {
                if (auto target = dfa.next(state, symbol))
                {
                    const model::Step step{state, symbol, *target};
                    const bool on_path = std::find(steps.begin(), steps.end(), step) != steps.end();
                    edges.add(state, *target, symbol, on_path);
                }
            }
        }

        GraphDescription graph{"DFA path", helpers::state_nodes(dfa), edges.edges(), std::nullopt};
        for (auto &node : graph.m_nodes)
        {
            node.m_on_path = visited.contains(node.m_id);
        }

        Trace trace;
        trace.m_path = result.m_path;
        trace.m_consumed.assign(input.begin(), input.begin() + static_cast<std::ptrdiff_t>(std::min(result.m_consumed, input.size())));
        trace.m_accepted = result.m_accepted;
        graph.m_trace = std::move(trace);
        return graph;
    }

    auto parse_format(std::string_view name) -> Expected<Format>
    {
        if (name == "dot")
        {
            return Format::Dot;
        }
        if (name == "xml")
        {
            return Format::Xml;
        }
        return make_error(ErrorKind::UnsupportedOperation, "format",
                          fmt::format("'{}' is not one of dot, xml", name));
    }

    auto extension(Format format) -> std::string_view
    {
        return format == Format::Dot ? ".dot" : ".xml";
    }

    GraphBuilder::GraphBuilder(const GraphDescription &graph, Format format)
        : m_graph{graph},
          m_format{format}
    {
        build();
    }

    auto GraphBuilder::write() const -> const std::string &
    {
        return m_output;
    }

    auto GraphBuilder::build() -> void
    {
        m_output = m_format == Format::Dot ? write_dot() : write_xml();
    }

    auto GraphBuilder::write_dot_node(const Node &node) const -> std::string
    {
        std::vector<std::string> attributes;
        attributes.push_back(node.m_is_accepting ? "shape=doublecircle" : "shape=circle");

        std::string label = node.m_caption ? fmt::format("{}\n{}", node.m_id, *node.m_caption) : node.m_id;
        attributes.push_back(fmt::format("label={}", helpers::quote(label)));

        if (node.m_is_start)
        {
            attributes.push_back("style=filled");
            attributes.push_back("fillcolor=lightblue");
        }
        if (node.m_on_path)
        {
            attributes.push_back("color=red");
            attributes.push_back("penwidth=2");
        }
        return fmt::format("{} [{}];", helpers::quote(node.m_id), fmt::join(attributes, ", "));
    }

    auto GraphBuilder::write_dot_edge(const Edge &edge) const -> std::string
    {
        std::string attributes = fmt::format("label={}", helpers::quote(edge.m_label));
        if (edge.m_on_path)
        {
            attributes += ", color=red, penwidth=2";
        }
        return fmt::format("{} -> {} [{}];", helpers::quote(edge.m_from), helpers::quote(edge.m_to), attributes);
    }

    auto GraphBuilder::write_dot() const -> std::string
    {
        std::vector<std::string> lines{"rankdir=LR;"};
        if (m_graph.m_trace)
        {
            const auto &trace = *m_graph.m_trace;
            lines.push_back(fmt::format(
                "label={};",
                helpers::quote(fmt::format(
                    "{} | path: {}",
                    trace.m_accepted ? "accepted" : "rejected",
                    fmt::join(trace.m_path, " → ")))));
        }
        for (const auto &node : m_graph.m_nodes)
        {
            lines.push_back(write_dot_node(node));
        }
        for (const auto &edge : m_graph.m_edges)
        {
            lines.push_back(write_dot_edge(edge));
        }

        return fmt::format(
            "digraph {} {{\n{}\n}}\n",
            helpers::quote(m_graph.m_title),
            helpers::indent(fmt::format("{}", fmt::join(lines, "\n")), 1)
        );
    }

    auto GraphBuilder::write_xml() const -> std::string
    {
        tinyxml2::XMLPrinter printer;
        printer.PushHeader(false, true);
        printer.OpenElement("graph");
        printer.PushAttribute("title", m_graph.m_title.c_str());

        for (const auto &node : m_graph.m_nodes)
        {
            printer.OpenElement("node");
            printer.PushAttribute("id", node.m_id.c_str());
            printer.PushAttribute("isStart", node.m_is_start);
            printer.PushAttribute("isAccepting", node.m_is_accepting);
            if (node.m_caption)
            {
                printer.PushAttribute("caption", node.m_caption->c_str());
            }
            if (m_graph.m_trace)
            {
                printer.PushAttribute("onPath", node.m_on_path);
            }
            printer.CloseElement();
        }

        for (const auto &edge : m_graph.m_edges)
        {
            printer.OpenElement("edge");
            printer.PushAttribute("from", edge.m_from.c_str());
            printer.PushAttribute("to", edge.m_to.c_str());
            printer.PushAttribute("label", edge.m_label.c_str());
            if (m_graph.m_trace)
            {
                printer.PushAttribute("onPath", edge.m_on_path);
            }
            printer.CloseElement();
        }

        if (m_graph.m_trace)
        {
            const auto &trace = *m_graph.m_trace;
            printer.OpenElement("trace");
            printer.PushAttribute("accepted", trace.m_accepted);
            for (const auto &state : trace.m_path)
            {
                printer.OpenElement("state");
                printer.PushText(state.c_str());
                printer.CloseElement();
            }
            for (const auto &symbol : trace.m_consumed)
            {
                printer.OpenElement("symbol");
                printer.PushText(symbol.c_str());
                printer.CloseElement();
            }
            printer.CloseElement();
        }

        printer.CloseElement();
        return std::string(printer.CStr());
    }
}
