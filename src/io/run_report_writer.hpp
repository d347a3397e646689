/**
 * @file run_report_writer.hpp
 * @brief Экспорт сводки прогона (run_summary.json, run_report.md)
 */

#pragma once

#include "core/pipeline.hpp"
#include "model/run_settings.hpp"
#include <filesystem>
#include <string>
#include <vector>

namespace mastplanner::io {

/// Версия схемы run_summary.json
constexpr const char* RUN_SUMMARY_SCHEMA_VERSION = "1.0.0";

struct RunReportResult {
    std::filesystem::path json_path;
    std::filesystem::path markdown_path;
    std::vector<std::filesystem::path> files;   ///< Все записанные файлы
};

/**
 * @brief Сводка прогона в виде JSON-текста
 */
[[nodiscard]] std::string buildRunSummaryJson(
    const core::PipelineResult& result,
    const model::RunSettings& settings
);

/**
 * @brief Сводка прогона в Markdown
 */
[[nodiscard]] std::string buildRunReportMarkdown(
    const core::PipelineResult& result,
    const model::RunSettings& settings
);

/**
 * @brief Записать сводку прогона в каталог результатов.
 */
RunReportResult writeRunReport(
    const core::PipelineResult& result,
    const model::RunSettings& settings,
    const std::filesystem::path& output_dir
);

} // namespace mastplanner::io
