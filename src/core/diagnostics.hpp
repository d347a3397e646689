/**
 * @file diagnostics.hpp
 * @brief Запуск диагностических проверок (core)
 */

#pragma once

#include "model/diagnostics.hpp"
#include "model/measurement.hpp"
#include <filesystem>

namespace mastplanner::core {

struct DiagnosticsOptions {
    std::filesystem::path artifacts_dir;       ///< Корень каталога артефактов
};

/**
 * @brief Эталонная таблица: 2 турбины × 3 мачты
 *
 * adj_RSS по турбинам: T1 = [5, 1, 9], T2 = [2, 8, 1].
 * Оптимальная пара (Mast_02, Mast_03), сумма 2.
 */
[[nodiscard]] model::MeasurementTable makeReferenceTable();

/**
 * @brief Построить диагностический отчёт по core-проверкам.
 */
[[nodiscard]] model::DiagnosticsReport buildDiagnosticsReport(const DiagnosticsOptions& options);

} // namespace mastplanner::core
