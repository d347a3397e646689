/**
 * @file table_writer.hpp
 * @brief Экспорт таблиц прогона в CSV файлы
 */

#pragma once

#include "core/pipeline.hpp"
#include <filesystem>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace mastplanner::io {

using namespace mastplanner::model;

/// Имена файлов таблиц
constexpr const char* FULL_TABLE_FILE = "mast_points_data_full.csv";
constexpr const char* TURBINES_FILE = "turbines_locations.csv";
constexpr const char* MASTS_FILE = "met_masts_locations.csv";
constexpr const char* GROUPED_FILE = "mast_points_data.csv";
constexpr const char* SINGLE_FILE = "optimal_single_met_mast.csv";
constexpr const char* PAIR_FILE = "optimal_pair_met_mast.csv";
constexpr const char* ALL_PAIRS_FILE = "optimal_pair_met_mast_all_pairs.csv";

/**
 * @brief Опции экспорта таблиц
 */
struct TableExportOptions {
    char delimiter = ',';       ///< Разделитель полей
    int decimal_places = -1;    ///< -1: кратчайшее точное представление
};

/**
 * @brief Ошибка записи таблицы
 */
class TableWriteError : public std::runtime_error {
public:
    explicit TableWriteError(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * @brief Список записанных файлов
 */
struct TableExportResult {
    std::vector<std::filesystem::path> files;
};

/**
 * @brief Форматирование числа для CSV
 *
 * При decimal_places < 0 используется кратчайшее представление,
 * однозначно восстанавливающее значение; целые получают суффикс ".0"
 * (2.0, а не 2). NaN даёт пустую ячейку, бесконечности пишутся как
 * "inf" и "-inf".
 */
[[nodiscard]] std::string formatNumber(double value, int decimal_places = -1);

/**
 * @brief Пустая ячейка для отсутствующего значения
 */
[[nodiscard]] std::string formatNumber(const std::optional<double>& value, int decimal_places = -1);

/**
 * @brief Экранирование поля CSV (кавычки для полей с разделителем, кавычками, переводом строки)
 */
[[nodiscard]] std::string csvEscape(std::string_view field, char delimiter = ',');

/// Обогащённая исходная таблица
[[nodiscard]] std::string renderFullTable(
    const SiteAggregation& aggregation, const TableExportOptions& options = {});

/// Уникальные турбины с идентификаторами
[[nodiscard]] std::string renderTurbines(
    const TurbineList& turbines, const TableExportOptions& options = {});

/// Уникальные мачты с идентификаторами
[[nodiscard]] std::string renderMasts(
    const MastList& masts, const TableExportOptions& options = {});

/// Сгруппированная по мачтам таблица (одна строка на мачту)
[[nodiscard]] std::string renderGroupedMasts(
    const GroupedMastList& grouped, const TableExportOptions& options = {});

/// Выбранная одиночная мачта
[[nodiscard]] std::string renderSingleSelection(
    const MastSelection& selection, const TableExportOptions& options = {});

/// Две мачты лучшей пары
[[nodiscard]] std::string renderPairSelection(
    const PairSelection& selection, const TableExportOptions& options = {});

/// Все перебранные пары
[[nodiscard]] std::string renderAllPairs(
    const PairSelection& selection, const TableExportOptions& options = {});

/**
 * @brief Запись всех таблиц прогона
 *
 * Файлы выбора пишутся только для рассчитанных режимов.
 *
 * @param result Результат обработки
 * @param output_dir Каталог результатов (создаётся при необходимости)
 * @param options Опции экспорта
 * @throws TableWriteError При ошибке записи
 */
TableExportResult writeRunTables(
    const core::PipelineResult& result,
    const std::filesystem::path& output_dir,
    const TableExportOptions& options = {}
);

} // namespace mastplanner::io
