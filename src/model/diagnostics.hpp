/**
 * @file diagnostics.hpp
 * @brief Структуры данных для отчёта самопроверки
 *
 * Отчёт самопроверки: сборка, файловая система, эталонный расчёт
 * выбора мачт и отказ на некорректных данных.
 */

#pragma once

#include <array>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace mastplanner::model {

/// Статус проверки; порядок: от лучшего к худшему
enum class DiagnosticStatus {
    Skipped,
    Ok,
    Warning,
    Fail
};

[[nodiscard]] inline std::string_view diagnosticStatusToString(DiagnosticStatus status) noexcept {
    switch (status) {
    case DiagnosticStatus::Ok: return "OK";
    case DiagnosticStatus::Warning: return "WARN";
    case DiagnosticStatus::Fail: return "FAIL";
    case DiagnosticStatus::Skipped: return "SKIPPED";
    }
    return "UNKNOWN";
}

/// Файл, созданный проверкой (путь относительно каталога отчёта)
struct DiagnosticArtifact {
    std::string name;
    std::filesystem::path relative_path;
};

struct DiagnosticCheck {
    std::string id;
    std::string title;
    DiagnosticStatus status = DiagnosticStatus::Skipped;
    std::string details;
    std::vector<DiagnosticArtifact> artifacts;
    double duration_ms = 0.0;           ///< Время выполнения проверки
};

struct DiagnosticsMeta {
    std::string schema_version = "1.0.0";
    std::string app_version;
    std::string build_type;
    std::string platform;
    std::string input_schema;           ///< Обязательные колонки входного файла
    std::string timestamp;
    std::filesystem::path artifacts_root;
};

/**
 * @brief Число проверок по статусам и итоговый статус
 *
 * Итог: худший из встреченных статусов; без проверок Skipped.
 */
struct DiagnosticsSummary {
    DiagnosticStatus status = DiagnosticStatus::Skipped;
    std::array<size_t, 4> counts{};

    [[nodiscard]] size_t count(DiagnosticStatus s) const noexcept {
        return counts[static_cast<size_t>(s)];
    }
};

struct DiagnosticsReport {
    DiagnosticsMeta meta;
    std::vector<DiagnosticCheck> checks;

    /// Проверка по идентификатору или nullptr
    [[nodiscard]] const DiagnosticCheck* findCheck(std::string_view id) const noexcept {
        for (const auto& check : checks) {
            if (check.id == id) return &check;
        }
        return nullptr;
    }

    [[nodiscard]] DiagnosticsSummary summarize() const noexcept {
        DiagnosticsSummary summary;
        for (const auto& check : checks) {
            ++summary.counts[static_cast<size_t>(check.status)];
            if (check.status > summary.status) {
                summary.status = check.status;
            }
        }
        return summary;
    }
};

} // namespace mastplanner::model
