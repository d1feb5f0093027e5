#include <iostream>
#include <string>

#include <cli/cli_common.hpp>

void print_usage(const char* program_name) {
    std::cerr << "Usage: " << program_name << " <command> [options]\n";
    std::cerr << "\n";
    std::cerr << "Generates map-coloring puzzles and checks their minimum color count.\n";
    std::cerr << "\n";
    std::cerr << "Commands:\n";
    std::cerr << "  generate    Generate a puzzle (JSON or DOT)\n";
    std::cerr << "  solve       Report chromatic number, greedy bound and coloring state of a puzzle\n";
    std::cerr << "\n";
    std::cerr << "Run '" << program_name << " <command> --help' for command options.\n";
    std::cerr << "\n";
    std::cerr << "Environment:\n";
    std::cerr << "  CHROMAMAP_LOG_LEVEL - Set log level (trace, debug, info, warn, error, off)\n";
}

int main(int argc, char* argv[]) {
    if (argc < 2) {
        print_usage(argv[0]);
        return 1;
    }

    std::string command = argv[1];
    if (command == "generate") {
        return chromamap::cli::command_generate(argc, argv);
    } else if (command == "solve") {
        return chromamap::cli::command_solve(argc, argv);
    } else if (command == "--help" || command == "-h") {
        print_usage(argv[0]);
        return 0;
    }

    std::cerr << "Unknown command: " << command << "\n";
    print_usage(argv[0]);
    return 1;
}
