/**
 * @file uncertainty.cpp
 * @brief Реализация расчёта скорректированной неопределённости
 */

#include "uncertainty.hpp"
#include <cmath>

namespace mastplanner::core {

double rootSumSquare(double horizontal, double vertical) noexcept {
    // Без std::hypot: нужен тот же результат, что и sqrt(a² + b²)
    return std::sqrt(horizontal * horizontal + vertical * vertical);
}

AdjustedUncertainty calculateAdjustedUncertainty(const MeasurementRow& row) noexcept {
    AdjustedUncertainty result;

    result.horiz_uc_horiz_used = row.horiz_uc_horiz.has_value()
        ? row.horiz_uc_horiz->value
        : kMissingHorizontalUncertainty;
    result.horiz_uc_vert_used = row.horiz_uc_vert.has_value()
        ? row.horiz_uc_vert->value
        : kMissingHorizontalUncertainty;

    if (!row.horiz_distance.has_value()) {
        return result;
    }

    const double adj_horiz_dist = result.horiz_uc_horiz_used + row.horiz_distance->value / kDistanceDivisor;
    const double adj_sum = adj_horiz_dist + result.horiz_uc_vert_used;
    result.adj_horiz_uc_horiz_dist = adj_horiz_dist;
    result.adj_sum_horiz_uc = adj_sum;

    if (!row.vert_uc.has_value()) {
        return result;
    }

    result.adj_rss = rootSumSquare(adj_sum, row.vert_uc->value);
    return result;
}

} // namespace mastplanner::core
