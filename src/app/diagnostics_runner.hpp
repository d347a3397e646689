/**
 * @file diagnostics_runner.hpp
 * @brief Запуск самопроверки из CLI
 */

#pragma once

#include "model/diagnostics.hpp"
#include <filesystem>

namespace mastplanner::app {

struct DiagnosticsCommandResult {
    int exit_code = 1;
    std::filesystem::path output_dir;
    mastplanner::model::DiagnosticsSummary summary;
    mastplanner::model::DiagnosticsReport report;
};

/**
 * @brief Выполнить диагностику и сохранить отчёты в каталог.
 * @param output_dir Каталог артефактов (report.md/json, logs/)
 */
DiagnosticsCommandResult runDiagnosticsCommand(const std::filesystem::path& output_dir);

} // namespace mastplanner::app
