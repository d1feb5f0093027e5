#include <gtest/gtest.h>
#include <serialization/document.hpp>
#include <serialization/config_json.hpp>
#include <serialization/puzzle_json.hpp>
#include "test_helpers.hpp"
#include <cstdio>

using namespace chromamap;

TEST(Serialization, RegionJson) {
    Region region = test::rect_region("region-1", 0, 0, 10, 20);
    region.adjacent_regions = {"region-3", "region-2"};

    nlohmann::json j = region;
    EXPECT_EQ(j["id"].get<std::string>(), "region-1");
    EXPECT_TRUE(j["color"].is_null());
    ASSERT_EQ(j["vertices"].size(), 4u);
    EXPECT_DOUBLE_EQ(j["vertices"][2][0].get<double>(), 10.0);
    EXPECT_DOUBLE_EQ(j["vertices"][2][1].get<double>(), 20.0);
    EXPECT_EQ(j["adjacent_regions"], nlohmann::json::array({"region-2", "region-3"}));

    region.color = "teal";
    j = region;
    EXPECT_EQ(j["color"].get<std::string>(), "teal");
}

TEST(Serialization, RegionWithoutCenterGetsInteriorPoint) {
    nlohmann::json j = {
        {"id", "u"},
        {"vertices", {{0, 0}, {30, 0}, {30, 30}, {20, 30}, {20, 5}, {10, 5}, {10, 30}, {0, 30}}}
    };
    Region region = j.get<Region>();
    EXPECT_FALSE(region.color.has_value());
    EXPECT_TRUE(region.adjacent_regions.empty());
    EXPECT_TRUE(contains_point(region.vertices, region.center));
}

TEST(Serialization, PuzzleRoundTripKeepsState) {
    Puzzle puzzle;
    puzzle.regions = test::grid_regions(2, 1);
    test::link(puzzle.regions, 0, 1);
    puzzle.regions[1].color = "red";
    puzzle.minimum_colors = 2;
    puzzle.minimum_exact = false;
    puzzle.difficulty.region_count = 2;
    puzzle.difficulty.complexity = 0.45f;

    Puzzle restored = nlohmann::json(puzzle).get<Puzzle>();

    ASSERT_EQ(restored.regions.size(), 2u);
    EXPECT_EQ(restored.regions[0].id, "cell-0-0");
    EXPECT_TRUE(restored.regions[0].is_adjacent_to("cell-0-1"));
    EXPECT_FALSE(restored.regions[0].is_colored());
    EXPECT_EQ(restored.regions[1].color, "red");
    EXPECT_EQ(restored.regions[1].vertices, puzzle.regions[1].vertices);
    EXPECT_EQ(restored.minimum_colors, 2);
    EXPECT_FALSE(restored.minimum_exact);
    EXPECT_EQ(restored.difficulty.region_count, 2);
    EXPECT_FLOAT_EQ(restored.difficulty.complexity, 0.45f);
}

TEST(Serialization, PartialConfigKeepsDefaults) {
    nlohmann::json j = {
        {"random_seed", 7},
        {"adjacency", {{"tolerance", 4.5}}}
    };
    GenerateConfig config = j.get<GenerateConfig>();

    EXPECT_EQ(config.random_seed, 7u);
    EXPECT_DOUBLE_EQ(config.adjacency.tolerance, 4.5);
    EXPECT_DOUBLE_EQ(config.adjacency.rejection_factor, 2.2);
    EXPECT_TRUE(config.adjacency.bridge_components);
    EXPECT_EQ(config.partition.perimeter_steps, 48);
    EXPECT_EQ(config.coloring.max_steps, 2000000u);
}

TEST(Serialization, DifficultyNames) {
    EXPECT_EQ(nlohmann::json(Difficulty::Hard).get<std::string>(), "hard");
    EXPECT_EQ(nlohmann::json("medium").get<Difficulty>(), Difficulty::Medium);
}

TEST(Serialization, DocumentRequiresKindAndPayload) {
    nlohmann::json no_payload = {{"format", "1.0"}, {"kind", "puzzle"}};
    nlohmann::json no_kind = {{"format", "1.0"}, {"payload", nlohmann::json::object()}};
    EXPECT_THROW(no_payload.get<json::Document>(), std::runtime_error);
    EXPECT_THROW(no_kind.get<json::Document>(), std::runtime_error);
}

TEST(Serialization, DocumentRejectsUnknownKind) {
    nlohmann::json j = {{"format", "1.0"}, {"kind", "solution"}, {"payload", 1}};
    EXPECT_THROW(j.get<json::Document>(), std::runtime_error);
}

TEST(Serialization, DocumentFormatMajorVersion) {
    EXPECT_EQ(json::major_version("1.0"), 1);
    EXPECT_EQ(json::major_version("12.3"), 12);
    EXPECT_THROW(json::major_version("v1"), std::runtime_error);

    nlohmann::json newer_minor = {{"format", "1.7"}, {"kind", "report"}, {"payload", 1}};
    EXPECT_NO_THROW(newer_minor.get<json::Document>());

    nlohmann::json next_major = {{"format", "2.0"}, {"kind", "report"}, {"payload", 1}};
    EXPECT_THROW(next_major.get<json::Document>(), std::runtime_error);
}

TEST(Serialization, PuzzleDocument) {
    Puzzle puzzle;
    puzzle.regions = test::grid_regions(2, 1);
    puzzle.regions[0].adjacent_regions.insert(puzzle.regions[1].id);
    puzzle.regions[1].adjacent_regions.insert(puzzle.regions[0].id);
    puzzle.minimum_colors = 2;

    json::Document doc = json::Document::create(json::DocumentKind::Puzzle, puzzle);
    doc.summary = puzzle_summary(puzzle);
    EXPECT_FALSE(doc.created.empty());

    nlohmann::json j = doc;
    EXPECT_EQ(j["kind"].get<std::string>(), "puzzle");
    EXPECT_EQ(j["format"].get<std::string>(), json::FORMAT_VERSION);
    EXPECT_EQ(j["summary"]["adjacency_count"].get<size_t>(), 1u);
    EXPECT_FALSE(j.contains("source"));

    json::Document parsed = j.get<json::Document>();
    EXPECT_EQ(parsed.kind, json::DocumentKind::Puzzle);
    Puzzle restored = parsed.payload.get<Puzzle>();
    ASSERT_EQ(restored.regions.size(), 2u);
    EXPECT_EQ(restored.minimum_colors, 2);
}

TEST(Serialization, ReadDocumentChecksKind) {
    std::string path = ::testing::TempDir() + "chromamap_report.json";
    json::Document report = json::Document::create(json::DocumentKind::Report, {{"proper", true}});
    report.source = "puzzle.json";
    json::write_json(path, report);

    json::Document loaded = json::read_document(path, json::DocumentKind::Report);
    EXPECT_EQ(loaded.source, "puzzle.json");
    EXPECT_TRUE(loaded.payload["proper"].get<bool>());
    EXPECT_THROW(json::read_document(path, json::DocumentKind::Puzzle), std::runtime_error);
    std::remove(path.c_str());
}

TEST(Serialization, MissingFileThrows) {
    EXPECT_THROW(json::read_document("/nonexistent/chromamap/puzzle.json", json::DocumentKind::Puzzle), std::runtime_error);
}
