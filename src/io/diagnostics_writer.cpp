/**
 * @file diagnostics_writer.cpp
 * @brief Запись отчёта самопроверки
 */

#include "diagnostics_writer.hpp"
#include "file_utils.hpp"
#include <nlohmann/json.hpp>
#include <array>
#include <cctype>
#include <iomanip>
#include <sstream>

namespace mastplanner::io {
namespace {

using namespace mastplanner::model;
using json = nlohmann::json;

constexpr std::array<DiagnosticStatus, 4> kStatuses = {
    DiagnosticStatus::Ok, DiagnosticStatus::Warning, DiagnosticStatus::Fail, DiagnosticStatus::Skipped
};

// Символ '|' в деталях ломает таблицу Markdown
std::string escapeCell(const std::string& text) {
    std::string out;
    out.reserve(text.size());
    for (char c : text) {
        if (c == '|') out += "\\|";
        else if (c == '\n') out += ' ';
        else out += c;
    }
    return out;
}

std::string formatDuration(double ms) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(1) << ms;
    return oss.str();
}

json checkToJson(const DiagnosticCheck& check) {
    json artifacts = json::array();
    for (const auto& art : check.artifacts) {
        artifacts.push_back({{"name", art.name}, {"path", art.relative_path.generic_string()}});
    }

    return {
        {"id", check.id},
        {"title", check.title},
        {"status", diagnosticStatusToString(check.status)},
        {"details", check.details},
        {"duration_ms", check.duration_ms},
        {"artifacts", artifacts}
    };
}

json summaryToJson(const DiagnosticsSummary& summary) {
    json j;
    j["status"] = diagnosticStatusToString(summary.status);
    for (auto status : kStatuses) {
        std::string key(diagnosticStatusToString(status));
        for (auto& c : key) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
        j[key] = summary.count(status);
    }
    return j;
}

std::string buildMarkdown(const DiagnosticsReport& report) {
    const auto summary = report.summarize();
    const auto& meta = report.meta;
    std::ostringstream out;

    out << "# Самопроверка MastPlanner\n\n"
        << "| Параметр | Значение |\n"
        << "|----------|----------|\n"
        << "| Версия | " << meta.app_version << " |\n"
        << "| Сборка | " << meta.build_type << " |\n"
        << "| Платформа | " << meta.platform << " |\n"
        << "| Время | " << meta.timestamp << " |\n"
        << "| Каталог | " << meta.artifacts_root.string() << " |\n"
        << "| Схема отчёта | " << meta.schema_version << " |\n\n";

    out << "Итог: **" << diagnosticStatusToString(summary.status) << "**";
    for (auto status : kStatuses) {
        out << ", " << diagnosticStatusToString(status) << ": " << summary.count(status);
    }
    out << "\n\n";

    out << "| Проверка | Статус | мс | Детали |\n"
        << "|----------|--------|----|--------|\n";
    for (const auto& check : report.checks) {
        out << "| " << check.title
            << " | " << diagnosticStatusToString(check.status)
            << " | " << formatDuration(check.duration_ms)
            << " | " << escapeCell(check.details) << " |\n";
        for (const auto& art : check.artifacts) {
            out << "|   ↳ " << art.name << " | | | " << art.relative_path.generic_string() << " |\n";
        }
    }

    out << "\n## Колонки входного файла\n\n" << meta.input_schema << "\n";
    return out.str();
}

json buildJson(const DiagnosticsReport& report) {
    const auto& meta = report.meta;

    json checks = json::array();
    for (const auto& check : report.checks) {
        checks.push_back(checkToJson(check));
    }

    return {
        {"schema_version", meta.schema_version},
        {"meta", {
            {"app_version", meta.app_version},
            {"build_type", meta.build_type},
            {"platform", meta.platform},
            {"input_schema", meta.input_schema},
            {"timestamp", meta.timestamp},
            {"artifacts_root", meta.artifacts_root.string()}
        }},
        {"checks", checks},
        {"summary", summaryToJson(report.summarize())}
    };
}

} // namespace

std::string diagnosticsToJson(const DiagnosticsReport& report) {
    return buildJson(report).dump(2);
}

DiagnosticsWriteResult writeDiagnosticsReports(
    const DiagnosticsReport& report,
    const std::filesystem::path& output_dir
) {
    std::filesystem::create_directories(output_dir);

    DiagnosticsWriteResult result;
    result.json_path = output_dir / "report.json";
    result.markdown_path = output_dir / "report.md";

    atomicWrite(result.json_path, diagnosticsToJson(report));
    atomicWrite(result.markdown_path, buildMarkdown(report));
    return result;
}

} // namespace mastplanner::io
