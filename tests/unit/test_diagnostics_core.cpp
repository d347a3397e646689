/**
 * @file test_diagnostics_core.cpp
 * @brief Проверки core-диагностики и записи отчётов
 */

#include <doctest/doctest.h>
#include "core/diagnostics.hpp"
#include "io/diagnostics_writer.hpp"
#include <filesystem>
#include <fstream>
#include <nlohmann/json.hpp>

using namespace mastplanner::model;

TEST_CASE("core diagnostics produce report files") {
    namespace fs = std::filesystem;
    auto out_dir = fs::temp_directory_path() / "mastplanner_diag_core";
    std::error_code ec;
    fs::remove_all(out_dir, ec);

    mastplanner::core::DiagnosticsOptions options;
    options.artifacts_dir = out_dir;

    auto report = mastplanner::core::buildDiagnosticsReport(options);
    auto summary = report.summarize();

    CHECK(summary.count(DiagnosticStatus::Fail) == 0);
    CHECK(summary.count(DiagnosticStatus::Ok) == 4);
    CHECK(report.meta.app_version.size() > 0);
    CHECK(report.meta.input_schema.find("Reference RIX [%]") != std::string::npos);

    auto write_result = mastplanner::io::writeDiagnosticsReports(report, out_dir);
    CHECK(fs::exists(write_result.json_path));
    CHECK(fs::exists(write_result.markdown_path));

    std::ifstream ifs(write_result.json_path);
    nlohmann::json j;
    ifs >> j;
    CHECK(j["schema_version"] == report.meta.schema_version);
    CHECK(j["summary"]["status"] == "OK");
    CHECK(j["checks"].size() == 4);
    CHECK(j["summary"]["ok"] == 4);
    CHECK(j["checks"][0]["duration_ms"].get<double>() >= 0.0);
}

TEST_CASE("reference pipeline check reproduces the pair example") {
    auto report = mastplanner::core::buildDiagnosticsReport({std::filesystem::temp_directory_path() / "mastplanner_diag_ref"});

    const auto* check = report.findCheck("reference_pipeline");
    REQUIRE(check != nullptr);
    CHECK(check->status == DiagnosticStatus::Ok);
    CHECK(check->details.find("Mast_02 + Mast_03") != std::string::npos);

    const auto* invalid = report.findCheck("invalid_input");
    REQUIRE(invalid != nullptr);
    CHECK(invalid->status == DiagnosticStatus::Ok);

    CHECK(report.findCheck("render_selftest") == nullptr);
}

TEST_CASE("summary reflects the worst status") {
    DiagnosticsReport report;
    CHECK(report.summarize().status == DiagnosticStatus::Skipped);

    report.checks.push_back({"a", "A", DiagnosticStatus::Ok, "", {}});
    CHECK(report.summarize().status == DiagnosticStatus::Ok);

    report.checks.push_back({"b", "B", DiagnosticStatus::Warning, "", {}});
    CHECK(report.summarize().status == DiagnosticStatus::Warning);

    report.checks.push_back({"c", "C", DiagnosticStatus::Fail, "", {}});
    CHECK(report.summarize().status == DiagnosticStatus::Fail);
    CHECK(diagnosticStatusToString(DiagnosticStatus::Fail) == "FAIL");
}
