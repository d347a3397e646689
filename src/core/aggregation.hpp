/**
 * @file aggregation.hpp
 * @brief Идентификация турбин и мачт, расчёт и группировка неопределённости
 */

#pragma once

#include "model/measurement.hpp"
#include "model/site_result.hpp"
#include <stdexcept>
#include <string>

namespace mastplanner::core {

using namespace mastplanner::model;

/**
 * @brief Ошибка агрегации (несогласованное производное состояние)
 */
class AggregationError : public std::runtime_error {
public:
    explicit AggregationError(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * @brief Агрегация таблицы измерений
 *
 * Выполняет:
 * 1. Дедупликацию турбин и мачт по кортежу (x, y, z, rix) в порядке
 *    первого появления, присвоение WTG_NN / Mast_NN
 * 2. Привязку идентификаторов к каждой строке
 * 3. Расчёт скорректированной неопределённости по строкам
 * 4. Усреднение adj_RSS_uncertainty по каждой мачте
 *
 * @param table Таблица после разбора
 * @return Обогащённые строки и сводные таблицы
 * @throws AggregationError Пустая таблица или нет обязательных колонок
 */
[[nodiscard]] SiteAggregation aggregateSite(const MeasurementTable& table);

/**
 * @brief Уникальные турбины в порядке первого появления
 */
[[nodiscard]] TurbineList extractTurbines(const MeasurementRowList& rows);

/**
 * @brief Уникальные мачты в порядке первого появления
 */
[[nodiscard]] MastList extractMasts(const MeasurementRowList& rows);

/**
 * @brief Сгруппированная по мачтам таблица средних значений
 *
 * Строки без определённого adj_rss не участвуют в среднем.
 * Порядок: по возрастанию ключа группы (x, y, z, rix, mast_id).
 *
 * @param rows Обогащённые строки
 * @param masts Уникальные мачты
 */
[[nodiscard]] GroupedMastList groupByMast(const EnrichedRowList& rows, const MastList& masts);

} // namespace mastplanner::core
