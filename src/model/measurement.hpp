/**
 * @file measurement.hpp
 * @brief Строка измерений турбина–мачта
 *
 * Схема соответствует табличному экспорту TRIX: одна строка связывает
 * одну турбину (WTG) с одной опорной точкой (мачтой).
 */

#pragma once

#include "types.hpp"
#include <array>
#include <string>
#include <vector>

namespace mastplanner::model {

/**
 * @brief Названия колонок исходного файла (после обрезки пробелов)
 */
namespace columns {
    inline constexpr std::string_view kTurbineX = "WTG X [m]";
    inline constexpr std::string_view kTurbineY = "WTG Y [m]";
    inline constexpr std::string_view kTurbineZ = "WTG Z [m]";
    inline constexpr std::string_view kTurbineRix = "WTG RIX [%]";
    inline constexpr std::string_view kMastX = "Reference Point X [m]";
    inline constexpr std::string_view kMastY = "Reference Point Y [m]";
    inline constexpr std::string_view kMastZ = "Reference Point Z [m]";
    inline constexpr std::string_view kMastRix = "Reference RIX [%]";
    inline constexpr std::string_view kHorizDistance = "Horizontal Distance [m]";
    inline constexpr std::string_view kHorizUcHoriz = "Horiz. Uc increase due to horiz. distance [%]";
    inline constexpr std::string_view kHorizUcVert = "Horiz. Uc increase due to vert. distance [%]";
    inline constexpr std::string_view kVertUc = "Vertical uncertainty increase [%]";

    /// Все обязательные колонки в порядке схемы
    inline constexpr std::array<std::string_view, 12> kRequired = {
        kTurbineX, kTurbineY, kTurbineZ, kTurbineRix,
        kMastX, kMastY, kMastZ, kMastRix,
        kHorizDistance, kHorizUcHoriz, kHorizUcVert, kVertUc
    };
}

/**
 * @brief Одна исходная запись измерений
 */
struct MeasurementRow {
    SitePoint turbine;                 ///< Координаты и RIX турбины
    SitePoint mast;                    ///< Координаты и RIX мачты (опорной точки)

    OptionalMeters horiz_distance;     ///< Горизонтальное расстояние турбина–мачта
    OptionalPercent horiz_uc_horiz;    ///< Приращение за счёт горизонтального расстояния
    OptionalPercent horiz_uc_vert;     ///< Приращение за счёт вертикального расстояния
    OptionalPercent vert_uc;           ///< Вертикальное приращение неопределённости

    size_t source_line = 0;            ///< Номер строки в файле (с 1)
    std::vector<std::string> fields;   ///< Исходные ячейки (по MeasurementTable::columns)
};

using MeasurementRowList = std::vector<MeasurementRow>;

/**
 * @brief Нормализованная таблица измерений
 */
struct MeasurementTable {
    std::string source_name;                  ///< Имя исходного файла
    std::vector<std::string> metadata_lines;  ///< Строки до заголовка колонок
    std::vector<std::string> columns;         ///< Названия колонок (обрезанные)
    MeasurementRowList rows;
    std::vector<std::string> warnings;        ///< Некритичные замечания разбора

    [[nodiscard]] bool empty() const noexcept { return rows.empty(); }
    [[nodiscard]] size_t size() const noexcept { return rows.size(); }

    /**
     * @brief Проверка наличия колонки
     */
    [[nodiscard]] bool hasColumn(std::string_view name) const noexcept {
        for (const auto& c : columns) {
            if (c == name) return true;
        }
        return false;
    }
};

} // namespace mastplanner::model
