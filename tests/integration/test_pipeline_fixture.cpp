/**
 * @file test_pipeline_fixture.cpp
 * @brief Интеграционный тест полной обработки выгрузки TRIX
 */

#include <doctest/doctest.h>
#include "core/pipeline.hpp"
#include "io/file_utils.hpp"
#include "io/measurement_reader.hpp"
#include "io/run_report_writer.hpp"
#include "io/table_writer.hpp"
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <sstream>

using namespace mastplanner::model;
namespace core = mastplanner::core;
namespace io = mastplanner::io;

namespace {

std::filesystem::path fixturePath(const std::string& name) {
    return std::filesystem::path(MASTPLANNER_SOURCE_DIR) / "tests" / "fixtures" / name;
}

std::string readFile(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary);
    return std::string((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
}

} // namespace

TEST_CASE("Site fixture: parse, aggregate and select") {
    std::vector<double> reported;
    auto result = core::runPipeline(fixturePath("site_measurements.txt"), {},
        [&reported](double progress, std::string_view) { reported.push_back(progress); });

    REQUIRE_FALSE(reported.empty());
    CHECK(reported.front() == 0.0);
    CHECK(reported.back() == 1.0);

    CHECK(result.table.source_name == "site_measurements.txt");
    CHECK(result.table.metadata_lines.size() == 2);
    CHECK(result.table.size() == 9);

    const auto& agg = result.aggregation;
    CHECK(agg.turbines.size() == 3);
    CHECK(agg.masts.size() == 3);
    CHECK(agg.turbines[2].id == "WTG_03");
    CHECK(agg.turbines[2].point.position.x.value == 513180.0);

    // Пропущенное приращение подставлено как 100 %
    const auto& patched = agg.rows[7];
    CHECK(patched.turbine_id == "WTG_03");
    CHECK(patched.mast_id == "Mast_02");
    CHECK(patched.uncertainty.horiz_uc_vert_used == 100.0);
    REQUIRE(patched.uncertainty.adj_rss.has_value());
    CHECK(*patched.uncertainty.adj_rss == doctest::Approx(102.68786571528302));

    REQUIRE(result.single.has_value());
    CHECK(result.single->summary.mast_id == "Mast_03");
    CHECK(*result.single->summary.mean_adj_rss == doctest::Approx(5.869030656402785));

    REQUIRE(result.pair.has_value());
    CHECK(result.pair->best.first_id == "Mast_02");
    CHECK(result.pair->best.second_id == "Mast_03");
    CHECK(result.pair->best.total_rss == doctest::Approx(9.531625188495656));
    CHECK(result.pair->best.avg_rss == doctest::Approx(3.1772083961652187));
    CHECK(result.pair->pairs[0].total_rss == doctest::Approx(13.643872638068169));
    CHECK(result.pair->pairs[1].total_rss == doctest::Approx(12.389523827644261));

    bool reports_missing = false;
    for (const auto& w : result.warnings) {
        if (w.find(std::string(columns::kHorizUcVert)) != std::string::npos) reports_missing = true;
    }
    CHECK(reports_missing);
}

TEST_CASE("Site fixture: repeated runs produce identical files") {
    namespace fs = std::filesystem;
    auto root = fs::temp_directory_path() / "mastplanner_fixture_runs";
    std::error_code ec;
    fs::remove_all(root, ec);

    RunSettings settings;
    settings.input_path = fixturePath("site_measurements.txt");

    std::vector<fs::path> dirs = {root / "first", root / "second"};
    for (const auto& dir : dirs) {
        auto result = core::runPipeline(settings.input_path);
        io::writeRunTables(result, dir);
        io::writeRunReport(result, settings, dir);
    }

    for (const char* name : {io::FULL_TABLE_FILE, io::TURBINES_FILE, io::MASTS_FILE, io::GROUPED_FILE,
                             io::SINGLE_FILE, io::PAIR_FILE, io::ALL_PAIRS_FILE, "run_summary.json"}) {
        INFO("Файл: " << name);
        auto first = readFile(dirs[0] / name);
        CHECK_FALSE(first.empty());
        CHECK(first == readFile(dirs[1] / name));
    }

    auto grouped = readFile(dirs[0] / io::GROUPED_FILE);
    CHECK(grouped.find("512100.0,6422800.0,80.0,0.9,Mast_01,") != std::string::npos);

    fs::remove_all(root, ec);
}

TEST_CASE("Timestamped output directory follows the results naming") {
    using namespace std::chrono;
    // 2024-03-11 09:42:00 UTC
    system_clock::time_point when{seconds{1710150120}};
    CHECK(io::resultsDirName(when) == "met_mast_process_results_2024-03-11_09-42");

    namespace fs = std::filesystem;
    auto root = fs::temp_directory_path() / "mastplanner_out_dirs";
    std::error_code ec;
    fs::remove_all(root, ec);

    auto stamped = io::prepareOutputDirectory(root, true, when);
    CHECK(stamped == root / "met_mast_process_results_2024-03-11_09-42");
    CHECK(fs::is_directory(stamped));
    CHECK(io::prepareOutputDirectory(root, false, when) == root);

    fs::remove_all(root, ec);
}

TEST_CASE("Fixture is recognised as a measurement file") {
    CHECK(io::canReadMeasurementFile(fixturePath("site_measurements.txt")));
    CHECK_FALSE(io::canReadMeasurementFile(fixturePath("missing.txt")));
}
