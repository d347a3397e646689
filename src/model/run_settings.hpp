/**
 * @file run_settings.hpp
 * @brief Настройки прогона обработки
 */

#pragma once

#include "types.hpp"
#include <filesystem>
#include <string>

namespace mastplanner::model {

/**
 * @brief Настройки одного прогона
 *
 * Хранятся в JSON-файле (см. io/settings_io.hpp), параметры
 * командной строки имеют приоритет.
 */
struct RunSettings {
    std::filesystem::path input_path;       ///< Файл TRIX (табуляция)
    std::filesystem::path output_dir;       ///< Корневой каталог результатов
    SelectionMode selection_mode = SelectionMode::Both;
    std::string crs;                        ///< Идентификатор СК (например, EPSG:32633)
    bool timestamped_output = true;         ///< Создавать подкаталог с меткой времени UTC
    int decimal_places = -1;                ///< -1: кратчайшее точное представление
};

} // namespace mastplanner::model
