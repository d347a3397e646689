/**
 * @file test_run_report.cpp
 * @brief Тесты сводки прогона
 */

#include <doctest/doctest.h>
#include "core/diagnostics.hpp"
#include "core/pipeline.hpp"
#include "io/run_report_writer.hpp"
#include <filesystem>
#include <nlohmann/json.hpp>

using namespace mastplanner::model;
namespace core = mastplanner::core;
namespace io = mastplanner::io;

TEST_CASE("Run summary JSON reports counts and selections") {
    auto result = core::runPipeline(core::makeReferenceTable());
    RunSettings settings;
    settings.crs = "EPSG:32633";

    auto j = nlohmann::json::parse(io::buildRunSummaryJson(result, settings));

    CHECK(j["schema_version"] == io::RUN_SUMMARY_SCHEMA_VERSION);
    CHECK(j["crs"] == "EPSG:32633");
    CHECK(j["mode"] == "both");
    CHECK(j["counts"]["rows"] == 6);
    CHECK(j["counts"]["turbines"] == 2);
    CHECK(j["counts"]["masts"] == 3);
    CHECK(j["single"]["mast_id"] == "Mast_01");
    CHECK(j["single"]["mean_adj_rss"].get<double>() == 3.5);
    CHECK(j["pair"]["mast_ids"][0] == "Mast_02");
    CHECK(j["pair"]["mast_ids"][1] == "Mast_03");
    CHECK(j["pair"]["total_rss"].get<double>() == 2.0);
    CHECK(j["pair"]["pairs_evaluated"] == 3);
    CHECK(j["warnings"].is_array());
}

TEST_CASE("Run summary marks skipped modes as null") {
    core::PipelineOptions options;
    options.mode = SelectionMode::Pair;
    auto result = core::runPipeline(core::makeReferenceTable(), options);

    RunSettings settings;
    settings.selection_mode = SelectionMode::Pair;
    auto j = nlohmann::json::parse(io::buildRunSummaryJson(result, settings));
    CHECK(j["single"].is_null());
    CHECK(j["pair"].is_object());
}

TEST_CASE("Run report files are written") {
    namespace fs = std::filesystem;
    auto out_dir = fs::temp_directory_path() / "mastplanner_run_report";
    std::error_code ec;
    fs::remove_all(out_dir, ec);

    auto result = core::runPipeline(core::makeReferenceTable());
    auto written = io::writeRunReport(result, RunSettings{}, out_dir);

    CHECK(fs::exists(written.json_path));
    CHECK(fs::exists(written.markdown_path));
    REQUIRE(written.files.size() == 2);
    for (const auto& path : written.files) {
        CHECK(fs::exists(path));
    }

    auto md = io::buildRunReportMarkdown(result, RunSettings{});
    CHECK(md.find("Mast_02 + Mast_03") != std::string::npos);
    CHECK(md.find("не задана") != std::string::npos);

    fs::remove_all(out_dir, ec);
}
