#include "cli_common.hpp"
#include <common/logging.hpp>
#include <graph/graph.hpp>
#include <puzzle/puzzle.hpp>
#include <serialization/config_json.hpp>
#include <serialization/document.hpp>
#include <serialization/puzzle_json.hpp>
#include <random>

namespace chromamap::cli {

namespace {

void print_generate_usage() {
    std::cerr << "Usage: chromamap generate [options]\n";
    std::cerr << "Options:\n";
    std::cerr << "  --tier NAME          easy, medium or hard (default: easy)\n";
    std::cerr << "  --level N            Progression level, 1 or more (default: 1)\n";
    std::cerr << "  --width W            Board width (default: 800)\n";
    std::cerr << "  --height H           Board height (default: 600)\n";
    std::cerr << "  --seed S             Random seed (default: from config, else random)\n";
    std::cerr << "  -c, --config FILE    Generation config (JSON)\n";
    std::cerr << "  -o, --output FILE    Write the puzzle here instead of stdout\n";
    std::cerr << "  --dot                Write the region adjacency graph as DOT instead\n";
    std::cerr << "  -v, --verbose        Debug logging\n";
    std::cerr << "  --log-level LEVEL    trace, debug, info, warn, error or off\n";
}

}  // namespace

int command_generate(int argc, char** argv) {
    auto log = chromamap::logging::get_logger();

    try {
        CommandContext ctx = parse_common_args(argc, argv, 2);
        if (ctx.help) {
            print_generate_usage();
            return 0;
        }
        apply_log_level(ctx);

        Difficulty difficulty = difficulty_from_string(ctx.tier);

        GenerateConfig config;
        bool seed_from_config = false;
        if (ctx.config_path) {
            nlohmann::json j = json::read_json(*ctx.config_path);
            config = j.get<GenerateConfig>();
            seed_from_config = j.contains("random_seed");
            log->info("Using generation config from {}", *ctx.config_path);
        }

        // Command-line seed wins, then the config file, then a fresh one
        if (ctx.seed) {
            config.random_seed = *ctx.seed;
        } else if (!seed_from_config) {
            std::random_device device;
            config.random_seed = device();
        }

        Puzzle puzzle = generate_puzzle(difficulty, ctx.level, ctx.width, ctx.height, config);

        std::string output;
        if (ctx.dot) {
            output = Graph::from_regions(puzzle.regions).to_dot();
        } else {
            json::Document doc = json::Document::create(json::DocumentKind::Puzzle, puzzle);
            doc.settings = {
                {"tier", difficulty},
                {"level", ctx.level},
                {"board", {{"width", ctx.width}, {"height", ctx.height}}},
                {"generate", config}
            };
            doc.summary = puzzle_summary(puzzle);
            output = nlohmann::json(doc).dump(2);
        }

        if (ctx.output_path.empty()) {
            std::cout << output << "\n";
        } else {
            write_file(ctx.output_path, output);
            std::cerr << "Wrote " << ctx.output_path << " ("
                      << puzzle.regions.size() << " regions, minimum "
                      << puzzle.minimum_colors << " colors, seed "
                      << config.random_seed << ")\n";
        }

        return 0;

    } catch (const std::exception& e) {
        log->error("Error: {}", e.what());
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}

}  // namespace chromamap::cli
