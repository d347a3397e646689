/**
 * @file diagnostics_runner.cpp
 * @brief Запуск самопроверки
 */

#include "diagnostics_runner.hpp"
#include "core/diagnostics.hpp"
#include "io/diagnostics_writer.hpp"

namespace mastplanner::app {

using namespace mastplanner::model;

DiagnosticsCommandResult runDiagnosticsCommand(const std::filesystem::path& output_dir) {
    DiagnosticsCommandResult result;
    result.output_dir = output_dir;
    std::filesystem::create_directories(output_dir);

    core::DiagnosticsOptions options;
    options.artifacts_dir = output_dir;

    result.report = core::buildDiagnosticsReport(options);
    result.summary = result.report.summarize();

    io::writeDiagnosticsReports(result.report, output_dir);

    result.exit_code = (result.summary.status == DiagnosticStatus::Fail) ? 1 : 0;
    return result;
}

} // namespace mastplanner::app
