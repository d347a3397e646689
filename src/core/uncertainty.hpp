/**
 * @file uncertainty.hpp
 * @brief Расчёт скорректированной неопределённости оценки ветрового ресурса
 *
 * Горизонтальная составляющая складывается из приращения за счёт
 * горизонтального расстояния (с поправкой distance/1000) и приращения
 * за счёт перепада высот; итог объединяется с вертикальной
 * составляющей по корню из суммы квадратов (RSS).
 */

#pragma once

#include "model/measurement.hpp"
#include "model/site_result.hpp"

namespace mastplanner::core {

using namespace mastplanner::model;

/**
 * @brief Значение, подставляемое вместо отсутствующей горизонтальной составляющей (%)
 *
 * Пропуск трактуется как наихудший случай, а не как ноль.
 */
constexpr double kMissingHorizontalUncertainty = 100.0;

/**
 * @brief Делитель горизонтального расстояния (м → добавка в %)
 */
constexpr double kDistanceDivisor = 1000.0;

/**
 * @brief Расчёт скорректированной неопределённости для одной строки
 *
 * adj_horiz_uc_horiz_dist = (horiz_uc_horiz | 100) + horiz_distance / 1000
 * adj_sum_horiz_uc        = adj_horiz_uc_horiz_dist + (horiz_uc_vert | 100)
 * adj_RSS_uncertainty     = sqrt(adj_sum_horiz_uc² + vert_uc²)
 *
 * Порядок операций фиксирован: результат воспроизводим побитно.
 * При отсутствии horiz_distance или vert_uc соответствующие величины
 * не определены.
 *
 * @param row Исходная строка
 * @return Промежуточные и итоговая величины
 */
[[nodiscard]] AdjustedUncertainty calculateAdjustedUncertainty(const MeasurementRow& row) noexcept;

/**
 * @brief RSS двух составляющих
 */
[[nodiscard]] double rootSumSquare(double horizontal, double vertical) noexcept;

} // namespace mastplanner::core
