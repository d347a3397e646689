/**
 * @file types.hpp
 * @brief Базовые типы и перечисления
 */

#pragma once

#include "units.hpp"
#include <optional>
#include <string>
#include <string_view>
#include <cstddef>

namespace mastplanner::model {

/**
 * @brief Опциональное значение в процентах
 *
 * ВАЖНО: std::nullopt означает отсутствие данных в исходном файле
 * (пустая или нечисловая ячейка). Это НЕ ноль.
 */
using OptionalPercent = std::optional<Percent>;

/**
 * @brief Опциональное расстояние
 */
using OptionalMeters = std::optional<Meters>;

/**
 * @brief Режим выбора оптимальной мачты
 */
enum class SelectionMode {
    Single,   ///< Одна мачта с минимальной средней неопределённостью
    Pair,     ///< Пара мачт, минимизирующая суммарную неопределённость
    Both      ///< Оба расчёта за один прогон
};

/**
 * @brief 3D координата в единицах проекта
 */
struct Coordinate3D {
    Meters x{0.0};  ///< Восток (X)
    Meters y{0.0};  ///< Север (Y)
    Meters z{0.0};  ///< Высотная отметка (Z)

    constexpr Coordinate3D() noexcept = default;
    constexpr Coordinate3D(Meters x_, Meters y_, Meters z_) noexcept
        : x(x_), y(y_), z(z_) {}

    constexpr bool operator==(const Coordinate3D&) const noexcept = default;
};

/**
 * @brief Точка с индексом неровности рельефа
 *
 * Ключ идентичности турбины и мачты: (x, y, z, rix).
 * Две записи с совпадающими кортежами описывают один объект.
 */
struct SitePoint {
    Coordinate3D position;
    Percent rix{0.0};   ///< RIX, %

    constexpr bool operator==(const SitePoint&) const noexcept = default;
};

/**
 * @brief Преобразование SelectionMode в строку
 */
[[nodiscard]] inline std::string toString(SelectionMode mode) {
    switch (mode) {
        case SelectionMode::Single: return "single";
        case SelectionMode::Pair: return "pair";
        case SelectionMode::Both: return "both";
    }
    return "both";
}

/**
 * @brief Парсинг SelectionMode из строки
 *
 * Принимает также названия режимов из исходного диалога ("Single", "Pair").
 *
 * @throws std::invalid_argument Для неизвестного режима
 */
[[nodiscard]] SelectionMode parseSelectionMode(std::string_view str);

/**
 * @brief Идентификатор объекта по порядковому номеру
 *
 * makeEntityId("WTG", 0) == "WTG_01", makeEntityId("Mast", 11) == "Mast_12"
 *
 * @param prefix Префикс ("WTG" или "Mast")
 * @param index Индекс с нуля
 */
[[nodiscard]] std::string makeEntityId(std::string_view prefix, size_t index);

/// Префикс идентификаторов турбин
constexpr std::string_view kTurbineIdPrefix = "WTG";

/// Префикс идентификаторов мачт
constexpr std::string_view kMastIdPrefix = "Mast";

} // namespace mastplanner::model
