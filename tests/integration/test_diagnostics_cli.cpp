/**
 * @file test_diagnostics_cli.cpp
 * @brief Интеграционный тест самопроверки
 */

#include <doctest/doctest.h>
#include "app/diagnostics_runner.hpp"
#include <filesystem>
#include <fstream>
#include <nlohmann/json.hpp>

TEST_CASE("diagnostics command produces reports and probe artifact") {
    namespace fs = std::filesystem;
    auto out_dir = fs::temp_directory_path() / "mastplanner_diag_cli";
    std::error_code ec;
    fs::remove_all(out_dir, ec);

    auto res = mastplanner::app::runDiagnosticsCommand(out_dir);
    CHECK(res.exit_code == 0);

    auto json_path = out_dir / "report.json";
    auto md_path = out_dir / "report.md";
    CHECK(fs::exists(json_path));
    CHECK(fs::exists(md_path));
    CHECK(fs::exists(out_dir / "logs" / "fs_probe.txt"));

    std::ifstream ifs(json_path);
    nlohmann::json j;
    ifs >> j;
    CHECK(j["summary"]["status"] == "OK");
    CHECK(j["checks"].size() >= 3);
    CHECK(j["meta"]["input_schema"].get<std::string>().find("WTG X [m]") != std::string::npos);

    fs::remove_all(out_dir, ec);
}
