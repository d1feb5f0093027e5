#ifndef CHROMAMAP_CLI_COMMON_HPP
#define CHROMAMAP_CLI_COMMON_HPP

#include <common/logging.hpp>
#include <cstdint>
#include <fstream>
#include <iostream>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>

namespace chromamap::cli {

// Common context for all CLI commands
struct CommandContext {
    std::string input_path;
    std::string output_path;
    std::optional<std::string> config_path;
    bool verbose = false;
    bool help = false;
    std::optional<std::string> log_level;

    // generate
    std::string tier = "easy";
    int level = 1;
    double width = 800.0;
    double height = 600.0;
    std::optional<uint32_t> seed;
    bool dot = false;

    // solve
    bool resolve = false;
};

inline std::string require_value(int argc, char** argv, int& i, const std::string& flag) {
    if (i + 1 >= argc) {
        throw std::runtime_error(flag + " requires an argument");
    }
    return argv[++i];
}

// Parse arguments from start_idx onwards
inline CommandContext parse_common_args(int argc, char** argv, int start_idx) {
    CommandContext ctx;

    for (int i = start_idx; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "-v" || arg == "--verbose") {
            ctx.verbose = true;
        } else if (arg == "-h" || arg == "--help") {
            ctx.help = true;
        } else if (arg == "--log-level") {
            ctx.log_level = require_value(argc, argv, i, arg);
        } else if (arg == "-o" || arg == "--output") {
            ctx.output_path = require_value(argc, argv, i, arg);
        } else if (arg == "-c" || arg == "--config") {
            ctx.config_path = require_value(argc, argv, i, arg);
        } else if (arg == "--tier") {
            ctx.tier = require_value(argc, argv, i, arg);
        } else if (arg == "--level") {
            ctx.level = std::stoi(require_value(argc, argv, i, arg));
        } else if (arg == "--width") {
            ctx.width = std::stod(require_value(argc, argv, i, arg));
        } else if (arg == "--height") {
            ctx.height = std::stod(require_value(argc, argv, i, arg));
        } else if (arg == "--seed") {
            ctx.seed = static_cast<uint32_t>(std::stoul(require_value(argc, argv, i, arg)));
        } else if (arg == "--dot") {
            ctx.dot = true;
        } else if (arg == "--resolve") {
            ctx.resolve = true;
        } else if (!arg.empty() && arg[0] != '-') {
            if (ctx.input_path.empty()) {
                ctx.input_path = arg;
            } else {
                throw std::runtime_error("Unexpected positional argument: " + arg);
            }
        } else {
            throw std::runtime_error("Unknown option: " + arg);
        }
    }

    return ctx;
}

// --log-level wins over --verbose
inline void apply_log_level(const CommandContext& ctx) {
    if (ctx.log_level) {
        logging::set_level(*ctx.log_level);
    } else if (ctx.verbose) {
        logging::set_level("debug");
    }
}

// Write string to file
inline void write_file(const std::string& path, const std::string& content) {
    std::ofstream file(path);
    if (!file) {
        throw std::runtime_error("Cannot write to file: " + path);
    }
    file << content;
}

// Command function declarations
int command_generate(int argc, char** argv);
int command_solve(int argc, char** argv);

}  // namespace chromamap::cli

#endif // CHROMAMAP_CLI_COMMON_HPP
