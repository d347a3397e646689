/**
 * @file pipeline.hpp
 * @brief Полная обработка файла измерений
 *
 * Координирует разбор, агрегацию и выбор мачт. Этапы передают
 * результаты по значению и не хранят состояние между вызовами.
 */

#pragma once

#include "model/measurement.hpp"
#include "model/selection.hpp"
#include "model/site_result.hpp"
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace mastplanner::core {

using namespace mastplanner::model;

/**
 * @brief Опции обработки
 */
struct PipelineOptions {
    SelectionMode mode = SelectionMode::Both;
};

/**
 * @brief Callback для индикации прогресса
 *
 * @param progress Прогресс от 0.0 до 1.0
 * @param message Описание текущей операции
 */
using ProgressCallback = std::function<void(double progress, std::string_view message)>;

/**
 * @brief Результат полной обработки
 */
struct PipelineResult {
    MeasurementTable table;
    SiteAggregation aggregation;
    std::optional<MastSelection> single;     ///< Заполнено в режимах Single / Both
    std::optional<PairSelection> pair;       ///< Заполнено в режимах Pair / Both
    std::vector<std::string> warnings;       ///< Замечания всех этапов
};

/**
 * @brief Обработка уже разобранной таблицы
 *
 * @param table Таблица измерений (передаётся во владение результата)
 * @param options Опции обработки
 * @param on_progress Callback прогресса (опционально)
 * @throws AggregationError, SelectionError
 */
[[nodiscard]] PipelineResult runPipeline(
    MeasurementTable table,
    const PipelineOptions& options = {},
    ProgressCallback on_progress = nullptr
);

/**
 * @brief Полная обработка файла: разбор → агрегация → выбор
 *
 * @param input_path Путь к файлу TRIX
 * @param options Опции обработки
 * @param on_progress Callback прогресса (опционально)
 * @throws io::ParseError, AggregationError, SelectionError
 */
[[nodiscard]] PipelineResult runPipeline(
    const std::filesystem::path& input_path,
    const PipelineOptions& options = {},
    ProgressCallback on_progress = nullptr
);

} // namespace mastplanner::core
