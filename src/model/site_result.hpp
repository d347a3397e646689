/**
 * @file site_result.hpp
 * @brief Результаты агрегации площадки: турбины, мачты, обогащённые строки
 */

#pragma once

#include "measurement.hpp"
#include <optional>
#include <string>
#include <vector>

namespace mastplanner::model {

/**
 * @brief Турбина (WTG): уникальный кортеж (x, y, z, rix)
 */
struct Turbine {
    SitePoint point;
    std::string id;     ///< WTG_01, WTG_02, ...
};

/**
 * @brief Метеомачта (опорная точка): уникальный кортеж (x, y, z, rix)
 */
struct Mast {
    SitePoint point;
    std::string id;     ///< Mast_01, Mast_02, ...
};

using TurbineList = std::vector<Turbine>;
using MastList = std::vector<Mast>;

/**
 * @brief Промежуточные и итоговая величины скорректированной неопределённости
 *
 * adj_rss не определена, если отсутствует горизонтальное расстояние
 * или вертикальное приращение.
 */
struct AdjustedUncertainty {
    double horiz_uc_horiz_used = 0.0;    ///< Значение после подстановки 100%
    double horiz_uc_vert_used = 0.0;     ///< Значение после подстановки 100%
    std::optional<double> adj_horiz_uc_horiz_dist;
    std::optional<double> adj_sum_horiz_uc;
    std::optional<double> adj_rss;       ///< adj_RSS_uncertainty, %

    [[nodiscard]] bool defined() const noexcept { return adj_rss.has_value(); }
};

/**
 * @brief Строка измерений с идентификаторами объектов и расчётом
 */
struct EnrichedRow {
    MeasurementRow source;
    size_t turbine_index = 0;   ///< Индекс в SiteAggregation::turbines
    size_t mast_index = 0;      ///< Индекс в SiteAggregation::masts
    std::string turbine_id;
    std::string mast_id;
    AdjustedUncertainty uncertainty;
};

using EnrichedRowList = std::vector<EnrichedRow>;

/**
 * @brief Средняя неопределённость по мачте
 */
struct GroupedMastSummary {
    SitePoint point;
    std::string mast_id;
    size_t mast_index = 0;                  ///< Индекс в SiteAggregation::masts
    std::optional<double> mean_adj_rss;     ///< Среднее по определённым значениям
    size_t row_count = 0;                   ///< Строк в группе
    size_t defined_count = 0;               ///< Строк с определённым adj_rss
};

using GroupedMastList = std::vector<GroupedMastSummary>;

/**
 * @brief Полный результат агрегации одного файла
 */
struct SiteAggregation {
    std::vector<std::string> columns;   ///< Исходные колонки (для экспорта)
    EnrichedRowList rows;
    TurbineList turbines;
    MastList masts;
    GroupedMastList grouped_masts;
    std::vector<std::string> warnings;

    [[nodiscard]] bool empty() const noexcept { return rows.empty(); }
};

} // namespace mastplanner::model
