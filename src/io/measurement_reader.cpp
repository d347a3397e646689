/**
 * @file measurement_reader.cpp
 * @brief Реализация импорта файлов измерений TRIX
 */

#include "measurement_reader.hpp"
#include <fstream>
#include <sstream>
#include <algorithm>
#include <cctype>
#include <cmath>
#include <limits>
#include <optional>

namespace mastplanner::io {

namespace {

constexpr char kDelimiter = '\t';

std::string trim(std::string_view str) {
    size_t start = 0;
    while (start < str.size() && std::isspace(static_cast<unsigned char>(str[start]))) {
        ++start;
    }
    size_t end = str.size();
    while (end > start && std::isspace(static_cast<unsigned char>(str[end - 1]))) {
        --end;
    }
    return std::string(str.substr(start, end - start));
}

std::string stripBom(std::string_view str) {
    if (str.size() >= 3 &&
        static_cast<unsigned char>(str[0]) == 0xEF &&
        static_cast<unsigned char>(str[1]) == 0xBB &&
        static_cast<unsigned char>(str[2]) == 0xBF) {
        return std::string(str.substr(3));
    }
    return std::string(str);
}

/**
 * @brief Разбить строку по разделителю
 *
 * Кавычка открывает поле в кавычках только в начале поля, внутри
 * такого поля "" означает одну кавычку. Кавычка в середине поля
 * остаётся обычным символом и не склеивает соседние ячейки.
 */
std::vector<std::string> splitLine(std::string_view line, char delimiter) {
    std::vector<std::string> result;
    std::string current;
    bool in_quotes = false;
    bool field_start = true;

    for (size_t i = 0; i < line.size(); ++i) {
        char c = line[i];

        if (in_quotes) {
            if (c == '"') {
                if (i + 1 < line.size() && line[i + 1] == '"') {
                    current += '"';
                    ++i;
                } else {
                    in_quotes = false;
                }
            } else {
                current += c;
            }
        } else if (c == delimiter) {
            result.push_back(trim(current));
            current.clear();
            field_start = true;
        } else if (c == '"' && field_start) {
            in_quotes = true;
            field_start = false;
        } else {
            current += c;
            if (c != ' ') field_start = false;
        }
    }

    result.push_back(trim(current));
    return result;
}

double parseDouble(const std::string& str) {
    if (str.empty()) {
        return std::numeric_limits<double>::quiet_NaN();
    }

    try {
        size_t pos = 0;
        double value = std::stod(str, &pos);
        // Проверяем, что вся строка была обработана
        while (pos < str.size() && std::isspace(static_cast<unsigned char>(str[pos]))) {
            ++pos;
        }
        if (pos != str.size()) {
            return std::numeric_limits<double>::quiet_NaN();
        }
        return value;
    } catch (const std::invalid_argument&) {
        return std::numeric_limits<double>::quiet_NaN();
    } catch (const std::out_of_range&) {
        return std::numeric_limits<double>::quiet_NaN();
    }
}

/**
 * @brief Индексы обязательных колонок в строке заголовка
 */
struct ColumnIndex {
    std::array<std::optional<size_t>, columns::kRequired.size()> positions;

    [[nodiscard]] size_t found() const noexcept {
        return static_cast<size_t>(std::count_if(positions.begin(), positions.end(),
            [](const auto& p) { return p.has_value(); }));
    }

    [[nodiscard]] bool complete() const noexcept {
        return found() == positions.size();
    }

    [[nodiscard]] size_t at(std::string_view name) const {
        for (size_t i = 0; i < columns::kRequired.size(); ++i) {
            if (columns::kRequired[i] == name) {
                return positions[i].value();
            }
        }
        throw std::logic_error("Колонка не входит в схему: " + std::string(name));
    }
};

ColumnIndex indexColumns(const std::vector<std::string>& header) {
    ColumnIndex index;
    for (size_t i = 0; i < columns::kRequired.size(); ++i) {
        auto it = std::find(header.begin(), header.end(), columns::kRequired[i]);
        if (it != header.end()) {
            index.positions[i] = static_cast<size_t>(std::distance(header.begin(), it));
        }
    }
    return index;
}

std::string describeMissing(const ColumnIndex& index) {
    std::ostringstream oss;
    bool first = true;
    for (size_t i = 0; i < columns::kRequired.size(); ++i) {
        if (index.positions[i].has_value()) continue;
        if (!first) oss << ", ";
        oss << '"' << columns::kRequired[i] << '"';
        first = false;
    }
    return oss.str();
}

/**
 * @brief Счётчик пропущенных значений по колонке
 */
struct MissingCounter {
    std::string_view column;
    size_t count = 0;
};

double requireNumber(
    const std::vector<std::string>& fields,
    size_t column,
    std::string_view name,
    size_t line_num
) {
    double value = parseDouble(fields[column]);
    if (std::isnan(value)) {
        throw ParseError(
            "Некорректное значение в колонке \"" + std::string(name) + "\": \"" +
            fields[column] + "\". Координаты и RIX обязательны.",
            line_num
        );
    }
    return value;
}

std::optional<double> coerceNumber(
    const std::vector<std::string>& fields,
    size_t column,
    MissingCounter& missing
) {
    double value = parseDouble(fields[column]);
    if (std::isnan(value)) {
        ++missing.count;
        return std::nullopt;
    }
    return value;
}

} // anonymous namespace

bool isTrailerLine(std::string_view line) noexcept {
    return line.substr(0, kAssumptionsMarker.size()) == kAssumptionsMarker ||
           line.substr(0, kFootnoteMarker.size()) == kFootnoteMarker;
}

MeasurementTable readMeasurementTable(
    std::istream& input,
    const std::string& source_name
) {
    MeasurementTable table;
    table.source_name = source_name;

    std::optional<ColumnIndex> index;
    ColumnIndex best_candidate;

    MissingCounter missing_distance{columns::kHorizDistance};
    MissingCounter missing_uc_horiz{columns::kHorizUcHoriz};
    MissingCounter missing_uc_vert{columns::kHorizUcVert};
    MissingCounter missing_vert{columns::kVertUc};

    std::string line;
    size_t line_num = 0;

    while (std::getline(input, line)) {
        ++line_num;

        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (line_num == 1) {
            line = stripBom(line);
        }

        // Всё, что после маркера: примечания к таблице
        if (isTrailerLine(line)) {
            break;
        }

        if (trim(line).empty()) continue;

        auto fields = splitLine(line, kDelimiter);

        // До строки заголовков: метаданные
        if (!index.has_value()) {
            auto candidate = indexColumns(fields);
            if (candidate.complete()) {
                table.columns = fields;
                index = candidate;
            } else {
                if (candidate.found() > best_candidate.found()) {
                    best_candidate = candidate;
                }
                table.metadata_lines.push_back(line);
            }
            continue;
        }

        if (fields.size() > table.columns.size()) {
            bool extra_empty = std::all_of(fields.begin() + static_cast<std::ptrdiff_t>(table.columns.size()),
                fields.end(), [](const std::string& f) { return f.empty(); });
            if (!extra_empty) {
                throw ParseError(
                    "Ожидалось " + std::to_string(table.columns.size()) +
                    " полей, найдено " + std::to_string(fields.size()),
                    line_num
                );
            }
        }
        fields.resize(table.columns.size());

        const auto& idx = *index;
        MeasurementRow row;
        row.source_line = line_num;

        row.turbine.position = Coordinate3D{
            Meters{requireNumber(fields, idx.at(columns::kTurbineX), columns::kTurbineX, line_num)},
            Meters{requireNumber(fields, idx.at(columns::kTurbineY), columns::kTurbineY, line_num)},
            Meters{requireNumber(fields, idx.at(columns::kTurbineZ), columns::kTurbineZ, line_num)}
        };
        row.turbine.rix = Percent{requireNumber(fields, idx.at(columns::kTurbineRix), columns::kTurbineRix, line_num)};

        row.mast.position = Coordinate3D{
            Meters{requireNumber(fields, idx.at(columns::kMastX), columns::kMastX, line_num)},
            Meters{requireNumber(fields, idx.at(columns::kMastY), columns::kMastY, line_num)},
            Meters{requireNumber(fields, idx.at(columns::kMastZ), columns::kMastZ, line_num)}
        };
        row.mast.rix = Percent{requireNumber(fields, idx.at(columns::kMastRix), columns::kMastRix, line_num)};

        // Нечисловая составляющая неопределённости считается пропуском, не ошибкой
        if (auto v = coerceNumber(fields, idx.at(columns::kHorizDistance), missing_distance)) {
            row.horiz_distance = Meters{*v};
        }
        if (auto v = coerceNumber(fields, idx.at(columns::kHorizUcHoriz), missing_uc_horiz)) {
            row.horiz_uc_horiz = Percent{*v};
        }
        if (auto v = coerceNumber(fields, idx.at(columns::kHorizUcVert), missing_uc_vert)) {
            row.horiz_uc_vert = Percent{*v};
        }
        if (auto v = coerceNumber(fields, idx.at(columns::kVertUc), missing_vert)) {
            row.vert_uc = Percent{*v};
        }

        row.fields = std::move(fields);
        table.rows.push_back(std::move(row));
    }

    if (!index.has_value()) {
        if (line_num == 0) {
            throw ParseError("Файл пуст: " + source_name);
        }
        throw ParseError(
            "Не найдена строка заголовков. Отсутствуют обязательные колонки: " +
            describeMissing(best_candidate)
        );
    }

    if (table.rows.empty()) {
        throw ParseError("Файл не содержит строк измерений: " + source_name);
    }

    for (const auto* counter : {&missing_distance, &missing_uc_horiz, &missing_uc_vert, &missing_vert}) {
        if (counter->count == 0) continue;
        std::ostringstream oss;
        oss << "Колонка \"" << counter->column << "\": " << counter->count
            << " пустых/нечисловых значений";
        table.warnings.push_back(oss.str());
    }

    return table;
}

MeasurementTable readMeasurementTable(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file) {
        throw ParseError("Не удалось открыть файл: " + path.string());
    }

    auto table = readMeasurementTable(file, path.filename().string());
    table.source_name = path.filename().string();
    return table;
}

bool canReadMeasurementFile(const std::filesystem::path& path) noexcept {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec) || ec) {
        return false;
    }

    auto ext = path.extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(),
        [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    return ext == ".txt" || ext == ".tsv";
}

} // namespace mastplanner::io
