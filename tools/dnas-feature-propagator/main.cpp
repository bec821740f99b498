/**
 * @file main.cpp
 * @brief DNAS feature propagator - Main entry point
 *
 * Annotates a traced network graph (.json) with the number of features
 * flowing through every node.
 *
 * Usage:
 *   dnas-feature-propagator input.json [-o report.json] [options]
 *
 * Options:
 *   -o, --output FILE      Write the JSON report to FILE
 *   -a, --allow-list FILE  Allow-list configuration (.json)
 *   --dump                 Dump the parsed graph
 *   -v, --verbose          Verbose output
 *   -h, --help             Show help message
 */

#include <dnas/graph/allow_list_loader.hpp>
#include <dnas/graph/annotation_report.hpp>
#include <dnas/graph/feature_propagator.hpp>
#include <dnas/graph/graph_loader.hpp>

#include <iostream>
#include <string>

// Simple command-line argument parsing
struct CommandLineArgs {
    std::string input_file;
    std::string output_file;
    std::string allow_list_file;
    bool dump_graph = false;
    bool verbose = false;
    bool help = false;
    bool error = false;
    std::string error_message;
};

void print_usage(const char* program_name) {
    std::cout << "DNAS Feature Propagator - Computes per-node feature counts of a traced network\n\n";
    std::cout << "Usage: " << program_name << " INPUT.json [options]\n\n";
    std::cout << "Options:\n";
    std::cout << "  -o, --output FILE       Write the JSON report to FILE\n";
    std::cout << "  -a, --allow-list FILE   Allow-list configuration (.json)\n";
    std::cout << "  --dump                  Dump parsed graph information\n";
    std::cout << "  -v, --verbose           Verbose output\n";
    std::cout << "  -h, --help              Show this help message\n";
    std::cout << "\nExamples:\n";
    std::cout << "  " << program_name << " resnet8.json\n";
    std::cout << "  " << program_name << " resnet8.json -a pit_layers.json -o resnet8_features.json\n";
}

CommandLineArgs parse_args(int argc, char* argv[]) {
    CommandLineArgs args;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "-h" || arg == "--help") {
            args.help = true;
            return args;
        }
        else if (arg == "-o" || arg == "--output") {
            if (i + 1 < argc) {
                args.output_file = argv[++i];
            } else {
                args.error = true;
                args.error_message = "Missing argument for " + arg;
                return args;
            }
        }
        else if (arg == "-a" || arg == "--allow-list") {
            if (i + 1 < argc) {
                args.allow_list_file = argv[++i];
            } else {
                args.error = true;
                args.error_message = "Missing argument for " + arg;
                return args;
            }
        }
        else if (arg == "--dump") {
            args.dump_graph = true;
        }
        else if (arg == "-v" || arg == "--verbose") {
            args.verbose = true;
        }
        else if (arg[0] == '-') {
            args.error = true;
            args.error_message = "Unknown option: " + arg;
            return args;
        }
        else {
            if (args.input_file.empty()) {
                args.input_file = arg;
            } else {
                args.error = true;
                args.error_message = "Multiple input files specified";
                return args;
            }
        }
    }

    if (args.input_file.empty()) {
        args.error = true;
        args.error_message = "No input file specified";
    }

    return args;
}

int main(int argc, char* argv[]) {
    using namespace dnas::graph;

    CommandLineArgs args = parse_args(argc, argv);

    if (args.help) {
        print_usage(argv[0]);
        return 0;
    }

    if (args.error) {
        std::cerr << "Error: " << args.error_message << "\n";
        std::cerr << "Use --help for usage information.\n";
        return 1;
    }

    try {
        if (args.verbose) {
            std::cout << "Input: " << args.input_file << "\n";
            if (!args.allow_list_file.empty()) {
                std::cout << "Allow-list: " << args.allow_list_file << "\n";
            }
            std::cout << "\nParsing " << args.input_file << "...\n";
        }

        LoadedGraph loaded = load_graph(args.input_file);

        if (args.dump_graph) {
            loaded.graph->print();
        }

        AllowList allow_list = args.allow_list_file.empty()
            ? AllowList::defaults()
            : AllowListLoader::load_from_file(args.allow_list_file);

        FeaturePropagator propagator(loaded.modules, std::move(allow_list));
        propagator.set_verbose(args.verbose);
        propagator.run(*loaded.graph);

        AnnotationReport::print(*loaded.graph);

        if (!args.output_file.empty()) {
            AnnotationReport::save_to_file(*loaded.graph, args.output_file);
            if (args.verbose) {
                std::cout << "\nReport written to " << args.output_file << "\n";
            }
        }
    }
    catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
