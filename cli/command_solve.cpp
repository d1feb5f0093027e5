#include "cli_common.hpp"
#include <adjacency/adjacency_resolver.hpp>
#include <coloring/coloring_solver.hpp>
#include <common/logging.hpp>
#include <puzzle/gameplay.hpp>
#include <serialization/config_json.hpp>
#include <serialization/document.hpp>
#include <serialization/puzzle_json.hpp>

namespace chromamap::cli {

int command_solve(int argc, char** argv) {
    auto log = chromamap::logging::get_logger();

    try {
        CommandContext ctx = parse_common_args(argc, argv, 2);

        if (ctx.help || ctx.input_path.empty()) {
            std::cerr << "Usage: chromamap solve <puzzle.json> [-o <report.json>] [options]\n";
            std::cerr << "Options:\n";
            std::cerr << "  --resolve            Recompute adjacency from the region geometry\n";
            std::cerr << "  -c, --config FILE    Generation config supplying adjacency/coloring settings\n";
            std::cerr << "  -v, --verbose        Debug logging\n";
            std::cerr << "  --log-level LEVEL    trace, debug, info, warn, error or off\n";
            return ctx.help ? 0 : 1;
        }
        apply_log_level(ctx);

        GenerateConfig config;
        if (ctx.config_path) {
            config = json::read_json(*ctx.config_path).get<GenerateConfig>();
        }

        json::Document input = json::read_document(ctx.input_path, json::DocumentKind::Puzzle);
        Puzzle puzzle = input.payload.get<Puzzle>();
        log->info("Loaded {} regions from {}", puzzle.regions.size(), ctx.input_path);

        nlohmann::json report;
        if (ctx.resolve) {
            AdjacencyStats stats = AdjacencyResolver::resolve(puzzle.regions, config.adjacency);
            report["adjacency"] = stats;
        }

        ChromaticResult chromatic = ColoringSolver::chromatic_number_bounded(puzzle.regions, config.coloring);
        int greedy = ColoringSolver::greedy_upper_bound(puzzle.regions);
        auto hint = hint_region(puzzle.regions);

        report["chromatic"] = chromatic;
        report["greedy_upper_bound"] = greedy;
        report["stored_minimum_colors"] = puzzle.minimum_colors;
        report["complete"] = is_complete(puzzle.regions);
        report["proper"] = ColoringSolver::is_proper_coloring(puzzle.regions);
        report["colors_used"] = count_distinct_colors_used(puzzle.regions);
        report["hint"] = hint ? nlohmann::json(*hint) : nlohmann::json(nullptr);

        if (chromatic.exact && puzzle.minimum_colors != chromatic.colors) {
            log->warn("Stored minimum {} differs from the computed chromatic number {}",
                      puzzle.minimum_colors, chromatic.colors);
        }

        if (ctx.output_path.empty()) {
            std::cout << report.dump(2) << "\n";
        } else {
            json::Document doc = json::Document::create(json::DocumentKind::Report, report);
            doc.source = ctx.input_path;
            doc.settings = config;
            doc.summary = {{"chromatic_number", chromatic.colors}, {"exact", chromatic.exact}};
            json::write_json(ctx.output_path, doc);
            std::cerr << "Wrote " << ctx.output_path << " (chromatic number "
                      << chromatic.colors << (chromatic.exact ? "" : ", greedy bound")
                      << ", greedy " << greedy << ")\n";
        }

        return 0;

    } catch (const std::exception& e) {
        log->error("Error: {}", e.what());
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}

}  // namespace chromamap::cli
