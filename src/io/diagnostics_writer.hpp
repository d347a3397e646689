/**
 * @file diagnostics_writer.hpp
 * @brief Запись диагностических отчётов в Markdown и JSON
 */

#pragma once

#include "model/diagnostics.hpp"
#include <filesystem>
#include <string>

namespace mastplanner::io {

struct DiagnosticsWriteResult {
    std::filesystem::path json_path;
    std::filesystem::path markdown_path;
};

/**
 * @brief Диагностический отчёт в виде JSON-текста
 */
[[nodiscard]] std::string diagnosticsToJson(const mastplanner::model::DiagnosticsReport& report);

/**
 * @brief Записать диагностический отчёт (report.json, report.md) в указанный каталог.
 */
DiagnosticsWriteResult writeDiagnosticsReports(
    const mastplanner::model::DiagnosticsReport& report,
    const std::filesystem::path& output_dir
);

} // namespace mastplanner::io
