/**
 * @file settings_io.hpp
 * @brief Чтение и запись файла настроек прогона (JSON)
 */

#pragma once

#include "model/run_settings.hpp"
#include <filesystem>
#include <stdexcept>
#include <string>

namespace mastplanner::io {

using namespace mastplanner::model;

/// Текущая версия формата файла настроек
constexpr const char* SETTINGS_FORMAT_VERSION = "1.0.0";

/// Идентификатор формата
constexpr const char* SETTINGS_FORMAT_ID = "mastplanner-settings";

/**
 * @brief Ошибка работы с файлом настроек
 */
class SettingsError : public std::runtime_error {
public:
    explicit SettingsError(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * @brief Загрузка настроек из файла
 *
 * Отсутствующие ключи принимают значения по умолчанию. Относительные
 * пути input / output_dir отсчитываются от каталога файла настроек.
 *
 * @throws SettingsError Файл не открывается, некорректный JSON,
 *         неверный идентификатор формата или тип значения
 */
[[nodiscard]] RunSettings loadRunSettings(const std::filesystem::path& path);

/**
 * @brief Сохранение настроек (атомарная запись)
 * @throws SettingsError При ошибке записи
 */
void saveRunSettings(const RunSettings& settings, const std::filesystem::path& path);

/**
 * @brief Настройки в виде JSON-строки
 */
[[nodiscard]] std::string runSettingsToJson(const RunSettings& settings, int indent = 2);

/**
 * @brief Настройки из JSON-строки
 * @throws SettingsError При ошибке парсинга
 */
[[nodiscard]] RunSettings runSettingsFromJson(const std::string& json);

} // namespace mastplanner::io
