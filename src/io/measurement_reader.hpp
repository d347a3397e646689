/**
 * @file measurement_reader.hpp
 * @brief Импорт табличных файлов измерений TRIX
 *
 * Формат: текст UTF-8 с разделителем табуляция. Произвольное число
 * строк метаданных, строка заголовков колонок, строки данных и
 * завершающий блок примечаний, начинающийся со строки
 * "Assumptions:" или "*".
 */

#pragma once

#include "model/measurement.hpp"
#include <filesystem>
#include <istream>
#include <stdexcept>
#include <string>
#include <string_view>

namespace mastplanner::io {

using namespace mastplanner::model;

/**
 * @brief Ошибка разбора файла измерений
 */
class ParseError : public std::runtime_error {
public:
    ParseError(const std::string& message, size_t line = 0)
        : std::runtime_error(message)
        , line_(line) {}

    /// Номер строки файла (с 1), 0: ошибка не привязана к строке
    [[nodiscard]] size_t line() const noexcept { return line_; }

private:
    size_t line_;
};

/// Маркер начала блока примечаний
constexpr std::string_view kAssumptionsMarker = "Assumptions:";

/// Маркер строки сноски
constexpr std::string_view kFootnoteMarker = "*";

/**
 * @brief Чтение файла измерений
 *
 * @param path Путь к файлу
 * @return Нормализованная таблица
 * @throws ParseError Файл не открывается, нет обязательных колонок,
 *         нет строк данных или нечисловые координаты/RIX
 */
[[nodiscard]] MeasurementTable readMeasurementTable(const std::filesystem::path& path);

/**
 * @brief Чтение измерений из потока
 *
 * @param input Поток с содержимым файла
 * @param source_name Имя источника для сообщений
 */
[[nodiscard]] MeasurementTable readMeasurementTable(
    std::istream& input,
    const std::string& source_name
);

/**
 * @brief Проверка, может ли файл быть прочитан как файл измерений
 */
[[nodiscard]] bool canReadMeasurementFile(const std::filesystem::path& path) noexcept;

/**
 * @brief Проверка строки на маркер завершающего блока
 */
[[nodiscard]] bool isTrailerLine(std::string_view line) noexcept;

} // namespace mastplanner::io
