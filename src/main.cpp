#include "../include/app.hpp"

#include <argparse/argparse.hpp>
#include <fmt/format.h>

#include <cstdlib>
#include <exception>
#include <iostream>

auto main(const int argc, char const * const * const argv) -> int
{
    argparse::ArgumentParser program("automata.io");

    program.add_argument("-i", "--input")
        .required()
        .help("Specify the <automaton> record file describing the DFA, NFA, e-NFA, grammar or PDA.");
    program.add_argument("-o", "--outfile")
        .help("Specify the file you wish to write the graph description(s) to (optional)");
    program.add_argument("-f", "--format")
        .default_value(std::string{"dot"})
        .help("Output format of the graph description: dot or xml");
    program.add_argument("-p", "--operation")
        .help("render, simulate, determinize, closure, grammar-to-dfa or dfa-to-grammar (defaults by record kind)");
    program.add_argument("-s", "--string")
        .help("Input string to simulate, overriding the record's <input> field");
    program.add_argument("-v", "--verbose")
        .default_value(false)
        .implicit_value(true)
        .help("Log progress to stderr");

    try {
        program.parse_args(argc, argv);
    }
    catch (const std::runtime_error& err) {
        std::cerr << err.what() << std::endl;
        std::cerr << program;
        std::exit(1);
    }

    try {
        // set up the optional arguments
        app::Options options;
        if (auto o = program.present("-o"))
        {
            options.out_file = std::filesystem::path{*o};
        }
        if (auto p = program.present("-p"))
        {
            options.operation = app::parse_operation(*p).or_else(HandleError).value();
        }
        if (auto s = program.present("-s"))
        {
            options.input_string = *s;
        }
        options.format = graph::parse_format(program.get<std::string>("-f")).or_else(HandleError).value();
        options.verbose = program.get<bool>("-v");

        // run with the options and the required arguments
        const std::filesystem::path infile{program.get<std::string>("-i")};
        app::run(infile, options);
    }
    catch (const std::exception& err) {
        fmt::print(stderr, "{}\n", err.what());
        return 1;
    }
    return 0;
}
