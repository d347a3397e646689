/**
 * @file units.hpp
 * @brief Строго типизированные единицы измерения
 *
 * Координаты площадки задаются в метрах, RIX и приращения
 * неопределённости из выгрузки TRIX в процентах. Обёртки не дают
 * передать одно вместо другого.
 */

#pragma once

#include <compare>

namespace mastplanner::model {

/// Расстояние или координата, м
struct Meters {
    double value;

    constexpr explicit Meters(double v = 0.0) noexcept : value(v) {}

    constexpr auto operator<=>(const Meters& other) const noexcept = default;
};

/// Величина в процентах (RIX, приращения неопределённости)
struct Percent {
    double value;

    constexpr explicit Percent(double v = 0.0) noexcept : value(v) {}

    constexpr auto operator<=>(const Percent& other) const noexcept = default;
};

} // namespace mastplanner::model
