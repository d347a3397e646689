/**
 * @file table_writer.cpp
 * @brief Реализация экспорта таблиц прогона в CSV
 */

#include "table_writer.hpp"
#include "file_utils.hpp"
#include <algorithm>
#include <charconv>
#include <cmath>
#include <sstream>

namespace mastplanner::io {

namespace {

/// Колонки, добавляемые к исходной таблице
constexpr std::string_view kTurbineIdColumn = "turbine_id";
constexpr std::string_view kMastIdColumn = "mast_id";
constexpr std::string_view kAdjHorizDistColumn = "adj_horiz_uc_horiz_dist";
constexpr std::string_view kAdjSumColumn = "adj_sum_horiz_uc";
constexpr std::string_view kAdjRssColumn = "adj_RSS_uncertainty";

class LineBuilder {
public:
    explicit LineBuilder(const TableExportOptions& options) : options_(options) {}

    LineBuilder& text(std::string_view value) {
        separate();
        line_ += csvEscape(value, options_.delimiter);
        return *this;
    }

    LineBuilder& number(double value) {
        separate();
        line_ += formatNumber(value, options_.decimal_places);
        return *this;
    }

    LineBuilder& number(const std::optional<double>& value) {
        separate();
        line_ += formatNumber(value, options_.decimal_places);
        return *this;
    }

    void flush(std::ostringstream& out) {
        out << line_ << '\n';
        line_.clear();
        first_ = true;
    }

private:
    void separate() {
        if (!first_) line_ += options_.delimiter;
        first_ = false;
    }

    const TableExportOptions& options_;
    std::string line_;
    bool first_ = true;
};

std::optional<double> toDouble(const OptionalMeters& v) {
    if (!v.has_value()) return std::nullopt;
    return v->value;
}

std::optional<double> toDouble(const OptionalPercent& v) {
    if (!v.has_value()) return std::nullopt;
    return v->value;
}

/**
 * @brief Значение типизированной колонки строки
 *
 * Для колонок приращений выводятся значения после подстановки,
 * участвовавшие в расчёте. Прочие колонки остаются исходным текстом.
 */
bool typedCell(const EnrichedRow& row, std::string_view column, std::optional<double>& out) {
    const auto& src = row.source;
    if (column == columns::kTurbineX) { out = src.turbine.position.x.value; return true; }
    if (column == columns::kTurbineY) { out = src.turbine.position.y.value; return true; }
    if (column == columns::kTurbineZ) { out = src.turbine.position.z.value; return true; }
    if (column == columns::kTurbineRix) { out = src.turbine.rix.value; return true; }
    if (column == columns::kMastX) { out = src.mast.position.x.value; return true; }
    if (column == columns::kMastY) { out = src.mast.position.y.value; return true; }
    if (column == columns::kMastZ) { out = src.mast.position.z.value; return true; }
    if (column == columns::kMastRix) { out = src.mast.rix.value; return true; }
    if (column == columns::kHorizDistance) { out = toDouble(src.horiz_distance); return true; }
    if (column == columns::kHorizUcHoriz) { out = row.uncertainty.horiz_uc_horiz_used; return true; }
    if (column == columns::kHorizUcVert) { out = row.uncertainty.horiz_uc_vert_used; return true; }
    if (column == columns::kVertUc) { out = toDouble(src.vert_uc); return true; }
    return false;
}

void mastHeader(LineBuilder& line) {
    line.text(columns::kMastX)
        .text(columns::kMastY)
        .text(columns::kMastZ)
        .text(columns::kMastRix)
        .text(kMastIdColumn);
}

void sitePoint(LineBuilder& line, const SitePoint& point) {
    line.number(point.position.x.value)
        .number(point.position.y.value)
        .number(point.position.z.value)
        .number(point.rix.value);
}

void groupedRow(LineBuilder& line, const GroupedMastSummary& summary) {
    sitePoint(line, summary.point);
    line.text(summary.mast_id).number(summary.mean_adj_rss);
}

void writeFile(const std::filesystem::path& path, const std::string& content, TableExportResult& result) {
    try {
        atomicWrite(path, content);
    } catch (const std::exception& e) {
        throw TableWriteError("Не удалось записать таблицу " + path.string() + ": " + e.what());
    }
    result.files.push_back(path);
}

constexpr size_t kMaxIntegerDigits = 309;

} // anonymous namespace

std::string formatNumber(double value, int decimal_places) {
    if (std::isnan(value)) {
        return "";
    }
    if (std::isinf(value)) {
        return value > 0 ? "inf" : "-inf";
    }

    // Целая часть double занимает не более 309 цифр
    std::string buf(kMaxIntegerDigits + 3 + static_cast<size_t>(std::max(decimal_places, 0)), '\0');
    char* first = buf.data();
    char* last = first + buf.size();
    std::to_chars_result res;
    if (decimal_places >= 0) {
        res = std::to_chars(first, last, value, std::chars_format::fixed, decimal_places);
    } else {
        res = std::to_chars(first, last, value);
    }
    if (res.ec != std::errc{}) {
        throw TableWriteError("Не удалось отформатировать число");
    }

    std::string result(first, res.ptr);
    if (decimal_places < 0 && result.find_first_of(".e") == std::string::npos) {
        result += ".0";
    }
    return result;
}

std::string formatNumber(const std::optional<double>& value, int decimal_places) {
    if (!value.has_value()) {
        return "";
    }
    return formatNumber(*value, decimal_places);
}

std::string csvEscape(std::string_view field, char delimiter) {
    bool needs_quotes = field.find_first_of("\"\r\n") != std::string_view::npos ||
                        field.find(delimiter) != std::string_view::npos;
    if (!needs_quotes) {
        return std::string(field);
    }

    std::string result;
    result.reserve(field.size() + 2);
    result += '"';
    for (char c : field) {
        if (c == '"') result += '"';
        result += c;
    }
    result += '"';
    return result;
}

std::string renderFullTable(const SiteAggregation& aggregation, const TableExportOptions& options) {
    std::ostringstream out;
    LineBuilder line(options);

    for (const auto& column : aggregation.columns) {
        line.text(column);
    }
    line.text(kTurbineIdColumn)
        .text(kMastIdColumn)
        .text(kAdjHorizDistColumn)
        .text(kAdjSumColumn)
        .text(kAdjRssColumn);
    line.flush(out);

    for (const auto& row : aggregation.rows) {
        for (size_t c = 0; c < aggregation.columns.size(); ++c) {
            std::optional<double> value;
            if (typedCell(row, aggregation.columns[c], value)) {
                line.number(value);
            } else {
                line.text(c < row.source.fields.size() ? row.source.fields[c] : std::string());
            }
        }
        line.text(row.turbine_id)
            .text(row.mast_id)
            .number(row.uncertainty.adj_horiz_uc_horiz_dist)
            .number(row.uncertainty.adj_sum_horiz_uc)
            .number(row.uncertainty.adj_rss);
        line.flush(out);
    }

    return out.str();
}

std::string renderTurbines(const TurbineList& turbines, const TableExportOptions& options) {
    std::ostringstream out;
    LineBuilder line(options);

    line.text(columns::kTurbineX)
        .text(columns::kTurbineY)
        .text(columns::kTurbineZ)
        .text(columns::kTurbineRix)
        .text(kTurbineIdColumn);
    line.flush(out);

    for (const auto& turbine : turbines) {
        sitePoint(line, turbine.point);
        line.text(turbine.id);
        line.flush(out);
    }
    return out.str();
}

std::string renderMasts(const MastList& masts, const TableExportOptions& options) {
    std::ostringstream out;
    LineBuilder line(options);

    mastHeader(line);
    line.flush(out);

    for (const auto& mast : masts) {
        sitePoint(line, mast.point);
        line.text(mast.id);
        line.flush(out);
    }
    return out.str();
}

std::string renderGroupedMasts(const GroupedMastList& grouped, const TableExportOptions& options) {
    std::ostringstream out;
    LineBuilder line(options);

    mastHeader(line);
    line.text(kAdjRssColumn);
    line.flush(out);

    for (const auto& summary : grouped) {
        groupedRow(line, summary);
        line.flush(out);
    }
    return out.str();
}

std::string renderSingleSelection(const MastSelection& selection, const TableExportOptions& options) {
    std::ostringstream out;
    LineBuilder line(options);

    mastHeader(line);
    line.text(kAdjRssColumn);
    line.flush(out);

    groupedRow(line, selection.summary);
    line.flush(out);
    return out.str();
}

std::string renderPairSelection(const PairSelection& selection, const TableExportOptions& options) {
    std::ostringstream out;
    LineBuilder line(options);

    line.text("mast_id").text("x").text("y").text("z").text("pair_total_rss");
    line.flush(out);

    // pair_total_rss хранит среднее по турбинам, как в исходной выгрузке
    for (const Mast* mast : {&selection.first_mast, &selection.second_mast}) {
        line.text(mast->id)
            .number(mast->point.position.x.value)
            .number(mast->point.position.y.value)
            .number(mast->point.position.z.value)
            .number(selection.best.avg_rss);
        line.flush(out);
    }
    return out.str();
}

std::string renderAllPairs(const PairSelection& selection, const TableExportOptions& options) {
    std::ostringstream out;
    LineBuilder line(options);

    line.text("mast_id_1").text("mast_id_2").text("total_rss").text("avg_rss").text("is_best");
    line.flush(out);

    for (const auto& pair : selection.pairs) {
        line.text(pair.first_id).text(pair.second_id);
        if (pair.covered_turbines > 0) {
            line.number(pair.total_rss).number(pair.avg_rss);
        } else {
            line.number(std::nullopt).number(std::nullopt);
        }
        line.text(pair.is_best ? "True" : "False");
        line.flush(out);
    }
    return out.str();
}

TableExportResult writeRunTables(
    const core::PipelineResult& result,
    const std::filesystem::path& output_dir,
    const TableExportOptions& options
) {
    try {
        std::filesystem::create_directories(output_dir);
    } catch (const std::filesystem::filesystem_error& e) {
        throw TableWriteError("Не удалось создать каталог результатов: " + std::string(e.what()));
    }

    TableExportResult exported;
    const auto& agg = result.aggregation;

    writeFile(output_dir / FULL_TABLE_FILE, renderFullTable(agg, options), exported);
    writeFile(output_dir / TURBINES_FILE, renderTurbines(agg.turbines, options), exported);
    writeFile(output_dir / MASTS_FILE, renderMasts(agg.masts, options), exported);
    writeFile(output_dir / GROUPED_FILE, renderGroupedMasts(agg.grouped_masts, options), exported);

    if (result.single.has_value()) {
        writeFile(output_dir / SINGLE_FILE, renderSingleSelection(*result.single, options), exported);
    }
    if (result.pair.has_value()) {
        writeFile(output_dir / PAIR_FILE, renderPairSelection(*result.pair, options), exported);
        writeFile(output_dir / ALL_PAIRS_FILE, renderAllPairs(*result.pair, options), exported);
    }

    return exported;
}

} // namespace mastplanner::io
