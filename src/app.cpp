#include "../include/app.hpp"

#include "../include/epsilon_closure.hpp"
#include "../include/grammar_conversion.hpp"
#include "../include/logging.hpp"
#include "../include/simulator.hpp"
#include "../include/subset_construction.hpp"
#include "../include/utility.hpp"

#include <fmt/format.h>

#include <array>
#include <fstream>
#include <utility>

namespace app
{
    namespace helpers
    {
        constexpr std::array operations{
            std::pair{Operation::Render, std::string_view{"render"}},
            std::pair{Operation::Simulate, std::string_view{"simulate"}},
            std::pair{Operation::Determinize, std::string_view{"determinize"}},
            std::pair{Operation::Closure, std::string_view{"closure"}},
            std::pair{Operation::GrammarToDfa, std::string_view{"grammar-to-dfa"}},
            std::pair{Operation::DfaToGrammar, std::string_view{"dfa-to-grammar"}},
        };

        static auto unsupported(Operation operation, model::ModelKind kind) -> tl::unexpected<Error>
        {
            return make_error(ErrorKind::UnsupportedOperation, "operation",
                              fmt::format("'{}' cannot run on a {} record", to_string(operation), model::to_string(kind)));
        }

        static auto input_string(const parser::InputRecord &record, const Options &options) -> std::optional<std::string>
        {
            if (options.input_string)
            {
                return options.input_string;
            }
            return parser::optional_field(record, "input");
        }

        static auto resolve_operation(const parser::InputRecord &record, const Options &options) -> Expected<Operation>
        {
            if (options.operation)
            {
                return *options.operation;
            }
            if (record.m_operation)
            {
                return parse_operation(*record.m_operation);
            }
            return default_operation(record, options);
        }

        static auto simulate(const model::Dfa &dfa, const std::string &input, Report &report) -> void
        {
            auto symbols = utility::tokenize(input, dfa.alphabet());
            auto result = model::simulate(dfa, symbols);

            report.m_artifacts.push_back(Artifact{"dfa", graph::describe(dfa)});
            report.m_artifacts.push_back(Artifact{"path", graph::describe(dfa, result, symbols)});
            report.m_notes.push_back(fmt::format(
                "String: {}, Accepted: {}, Path: {}",
                input, result.m_accepted, fmt::join(result.m_path, " → ")));
            if (result.m_halt)
            {
                report.m_notes.push_back(describe(*result.m_halt));
            }
        }

        static auto determinize(
            const model::SubsetConstruction &construction,
            graph::GraphDescription source,
            Report &report
        ) -> void
        {
            report.m_artifacts.push_back(Artifact{"source", std::move(source)});
            report.m_artifacts.push_back(Artifact{"dfa", graph::describe(construction)});
            for (const auto &[label, composite] : construction.m_composites)
            {
                report.m_notes.push_back(fmt::format("{} = {}", label, model::composite_label(composite)));
            }
        }
    }

    auto parse_operation(std::string_view name) -> Expected<Operation>
    {
        for (const auto &[operation, operation_name] : helpers::operations)
        {
            if (operation_name == name)
            {
                return operation;
            }
        }
        return make_error(ErrorKind::UnsupportedOperation, "operation",
                          fmt::format("'{}' is not a known operation", name));
    }

    auto to_string(Operation operation) -> std::string_view
    {
        for (const auto &[candidate, name] : helpers::operations)
        {
            if (candidate == operation)
            {
                return name;
            }
        }
        return "unknown";
    }

    auto default_operation(const parser::InputRecord &record, const Options &options) -> Operation
    {
        switch (record.m_kind)
        {
        case model::ModelKind::Dfa:
            return helpers::input_string(record, options) ? Operation::Simulate : Operation::Render;
        case model::ModelKind::Nfa:
            return Operation::Determinize;
        case model::ModelKind::EpsilonNfa:
            return Operation::Closure;
        case model::ModelKind::Grammar:
            return Operation::GrammarToDfa;
        case model::ModelKind::Pda:
            return Operation::Render;
        }
        return Operation::Render;
    }

    auto execute(const parser::InputRecord &record, const Options &options) -> Expected<Report>
    {
        auto operation = helpers::resolve_operation(record, options);
        if (!operation)
        {
            return tl::unexpected<Error>(operation.error());
        }
        auto parsed = parser::to_model(record);
        if (!parsed)
        {
            return tl::unexpected<Error>(parsed.error());
        }

        Report report;
        report.m_operation = *operation;

        switch (*operation)
        {
        case Operation::Render:
        {
            report.m_artifacts.push_back(Artifact{std::string(model::to_string(record.m_kind)), graph::describe(*parsed)});
            return report;
        }
        case Operation::Simulate:
        {
            const auto *dfa = std::get_if<model::Dfa>(&*parsed);
            if (dfa == nullptr)
            {
                return helpers::unsupported(*operation, record.m_kind);
            }
            auto input = helpers::input_string(record, options);
            if (!input)
            {
                return make_error(ErrorKind::MissingField, "input", "simulation needs an input string");
            }
            helpers::simulate(*dfa, *input, report);
            return report;
        }
        case Operation::Determinize:
        {
            if (const auto *nfa = std::get_if<model::Nfa>(&*parsed))
            {
                auto construction = model::determinize(*nfa);
                if (!construction)
                {
                    return tl::unexpected<Error>(construction.error());
                }
                helpers::determinize(*construction, graph::describe(*nfa), report);
                return report;
            }
            if (const auto *nfa = std::get_if<model::EpsilonNfa>(&*parsed))
            {
                auto construction = model::determinize(*nfa);
                if (!construction)
                {
                    return tl::unexpected<Error>(construction.error());
                }
                helpers::determinize(*construction, graph::describe(*nfa), report);
                return report;
            }
            return helpers::unsupported(*operation, record.m_kind);
        }
        case Operation::Closure:
        {
            const auto *nfa = std::get_if<model::EpsilonNfa>(&*parsed);
            if (nfa == nullptr)
            {
                return helpers::unsupported(*operation, record.m_kind);
            }
            report.m_artifacts.push_back(Artifact{"enfa", graph::describe(*nfa)});
            for (const auto &[state, closure] : model::epsilon_closures(*nfa))
            {
                report.m_notes.push_back(fmt::format("ε-closure({}) = {}", state, model::composite_label(closure)));
            }
            return report;
        }
        case Operation::GrammarToDfa:
        {
            const auto *grammar = std::get_if<model::RegularGrammar>(&*parsed);
            if (grammar == nullptr)
            {
                return helpers::unsupported(*operation, record.m_kind);
            }
            return model::grammar_to_dfa(*grammar)
                .map([&](const model::Dfa &dfa) {
                    report.m_artifacts.push_back(Artifact{"grammar", graph::describe(*grammar)});
                    report.m_artifacts.push_back(Artifact{"dfa", graph::describe(dfa)});
                    return std::move(report);
                });
        }
        case Operation::DfaToGrammar:
        {
            const auto *dfa = std::get_if<model::Dfa>(&*parsed);
            if (dfa == nullptr)
            {
                return helpers::unsupported(*operation, record.m_kind);
            }
            return model::dfa_to_grammar(*dfa)
                .map([&](const model::RegularGrammar &grammar) {
                    report.m_artifacts.push_back(Artifact{"dfa", graph::describe(*dfa)});
                    report.m_artifacts.push_back(Artifact{"grammar", graph::describe(grammar)});
                    report.m_notes.push_back(model::format_grammar(grammar));
                    return std::move(report);
                });
        }
        }
        return helpers::unsupported(*operation, record.m_kind);
    }

    auto run(const std::filesystem::path &path, Options options) -> void
    {
        utility::Logger logger{options.verbose};

        auto report = parser::read_record(path)
            .and_then([&](const parser::InputRecord &record) {
                logger.info("read a {} record from {}", model::to_string(record.m_kind), path.string());
                return execute(record, options);
            })
            .or_else(HandleError);

        logger.info("ran '{}', {} graph(s) to write", to_string(report->m_operation), report->m_artifacts.size());
        for (const auto &note : report->m_notes)
        {
            logger.note("{}", note);
        }

        if (options.out_file && options.out_file->has_extension()
            && options.out_file->extension().string() != graph::extension(options.format))
        {
            logger.warn("{} does not end in {}, writing {} output anyway",
                        options.out_file->string(), graph::extension(options.format), graph::extension(options.format).substr(1));
        }

        const bool single = report->m_artifacts.size() == 1;
        for (const auto &artifact : report->m_artifacts)
        {
            graph::GraphBuilder builder(artifact.m_graph, options.format);

            // write the result
            if (options.out_file.has_value())
            {
                std::filesystem::path out = options.out_file.value();
                if (!single)
                {
                    auto extension = out.has_extension() ? out.extension().string() : std::string(graph::extension(options.format));
                    out.replace_filename(fmt::format("{}_{}{}", out.stem().string(), artifact.m_name, extension));
                }
                else if (!out.has_extension())
                {
                    out.replace_extension(graph::extension(options.format));
                }

                std::ofstream output_file;
                output_file.open(out, std::ios::out | std::ios::trunc);
                if (!output_file.is_open())
                {
                    HandleError(Error(ErrorKind::OutputFileError, out.string(), "cannot open the output file"));
                }
                output_file << builder.write();
                output_file.close();
                logger.info("wrote {}", out.string());
            }
            else
            {
                fmt::print("{}", builder.write());
            }
        }
    }
}
