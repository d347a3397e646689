/**
 * @file file_utils.hpp
 * @brief Вспомогательные функции для работы с файлами результатов
 */

#pragma once

#include <chrono>
#include <filesystem>
#include <string>

namespace mastplanner::io {

/// Префикс каталога результатов прогона
constexpr const char* RESULTS_DIR_PREFIX = "met_mast_process_results_";

/**
 * @brief Атомарная запись строковых данных в файл (через временный файл + rename).
 * @throws std::runtime_error При ошибке записи
 */
void atomicWrite(const std::filesystem::path& path, const std::string& content);

/**
 * @brief Имя каталога результатов: met_mast_process_results_YYYY-MM-DD_HH-MM (UTC)
 */
[[nodiscard]] std::string resultsDirName(std::chrono::system_clock::time_point time);

/**
 * @brief Создать каталог результатов прогона
 *
 * @param root Корневой каталог, выбранный пользователем
 * @param timestamped Добавить подкаталог с меткой времени
 * @param time Момент запуска
 * @return Путь к созданному каталогу
 */
std::filesystem::path prepareOutputDirectory(
    const std::filesystem::path& root,
    bool timestamped,
    std::chrono::system_clock::time_point time = std::chrono::system_clock::now()
);

} // namespace mastplanner::io
