/**
 * @file run_report_writer.cpp
 * @brief Экспорт сводки прогона
 */

#include "run_report_writer.hpp"
#include "file_utils.hpp"
#include <nlohmann/json.hpp>
#include <iomanip>
#include <sstream>

namespace mastplanner::io {
namespace {

using namespace mastplanner::model;

std::string formatPercent(double value) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(4) << value;
    return oss.str();
}

std::string formatMeters(Meters m) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(2) << m.value;
    return oss.str();
}

nlohmann::json pointToJson(const SitePoint& point) {
    return {
        {"x", point.position.x.value},
        {"y", point.position.y.value},
        {"z", point.position.z.value},
        {"rix", point.rix.value}
    };
}

nlohmann::json buildJson(const core::PipelineResult& result, const RunSettings& settings) {
    nlohmann::json j;
    const auto& agg = result.aggregation;

    j["schema_version"] = RUN_SUMMARY_SCHEMA_VERSION;
    j["input"] = {
        {"path", settings.input_path.string()},
        {"source_name", result.table.source_name},
        {"metadata_lines", result.table.metadata_lines}
    };
    j["crs"] = settings.crs;
    j["mode"] = toString(settings.selection_mode);

    size_t undefined_rows = 0;
    for (const auto& row : agg.rows) {
        if (!row.uncertainty.defined()) ++undefined_rows;
    }

    j["counts"] = {
        {"rows", agg.rows.size()},
        {"undefined_rows", undefined_rows},
        {"turbines", agg.turbines.size()},
        {"masts", agg.masts.size()}
    };

    if (result.single.has_value()) {
        const auto& s = result.single->summary;
        nlohmann::json single = {
            {"mast_id", s.mast_id},
            {"point", pointToJson(s.point)},
            {"row_count", s.row_count}
        };
        single["mean_adj_rss"] = s.mean_adj_rss.has_value()
            ? nlohmann::json(*s.mean_adj_rss) : nlohmann::json(nullptr);
        j["single"] = single;
    } else {
        j["single"] = nullptr;
    }

    if (result.pair.has_value()) {
        const auto& p = *result.pair;
        j["pair"] = {
            {"mast_ids", nlohmann::json::array({p.best.first_id, p.best.second_id})},
            {"total_rss", p.best.total_rss},
            {"avg_rss", p.best.avg_rss},
            {"covered_turbines", p.best.covered_turbines},
            {"uncovered_turbines", p.best.uncovered_turbines},
            {"pairs_evaluated", p.pairs.size()},
            {"undefined_cells", p.undefined_cells}
        };
    } else {
        j["pair"] = nullptr;
    }

    j["warnings"] = result.warnings;
    return j;
}

} // namespace

std::string buildRunSummaryJson(const core::PipelineResult& result, const RunSettings& settings) {
    return buildJson(result, settings).dump(2);
}

std::string buildRunReportMarkdown(const core::PipelineResult& result, const RunSettings& settings) {
    std::ostringstream out;
    const auto& agg = result.aggregation;

    out << "# Отчёт о выборе метеомачт\n\n";
    out << "- Исходный файл: " << result.table.source_name << "\n";
    out << "- Система координат: " << (settings.crs.empty() ? "не задана" : settings.crs) << "\n";
    out << "- Режим: " << toString(settings.selection_mode) << "\n";
    out << "- Строк измерений: " << agg.rows.size() << "\n";
    out << "- Турбин: " << agg.turbines.size() << ", мачт: " << agg.masts.size() << "\n\n";

    out << "## Средняя неопределённость по мачтам\n";
    out << "| Мачта | X (м) | Y (м) | Z (м) | RIX (%) | adj_RSS (%) | Строк |\n";
    out << "|-------|-------|-------|-------|---------|-------------|-------|\n";
    for (const auto& g : agg.grouped_masts) {
        out << "| " << g.mast_id
            << " | " << formatMeters(g.point.position.x)
            << " | " << formatMeters(g.point.position.y)
            << " | " << formatMeters(g.point.position.z)
            << " | " << formatPercent(g.point.rix.value)
            << " | " << (g.mean_adj_rss.has_value() ? formatPercent(*g.mean_adj_rss) : "нет данных")
            << " | " << g.row_count
            << " |\n";
    }
    out << "\n";

    if (result.single.has_value()) {
        const auto& s = result.single->summary;
        out << "## Оптимальная одиночная мачта\n";
        out << "- " << s.mast_id << ": средняя adj_RSS "
            << formatPercent(s.mean_adj_rss.value_or(0.0)) << " %\n\n";
    }

    if (result.pair.has_value()) {
        const auto& best = result.pair->best;
        out << "## Оптимальная пара мачт\n";
        out << "- " << best.first_id << " + " << best.second_id << "\n";
        out << "- Сумма по турбинам: " << formatPercent(best.total_rss) << " %\n";
        out << "- Среднее по турбинам: " << formatPercent(best.avg_rss) << " %\n";
        if (best.uncovered_turbines > 0) {
            out << "- Турбин без измерений: " << best.uncovered_turbines << "\n";
        }
        out << "- Перебрано пар: " << result.pair->pairs.size() << "\n\n";
    }

    if (!result.warnings.empty()) {
        out << "## Замечания\n";
        for (const auto& w : result.warnings) {
            out << "- " << w << "\n";
        }
    }

    return out.str();
}

RunReportResult writeRunReport(
    const core::PipelineResult& result,
    const RunSettings& settings,
    const std::filesystem::path& output_dir
) {
    std::filesystem::create_directories(output_dir);
    RunReportResult written;

    auto json_path = output_dir / "run_summary.json";
    auto md_path = output_dir / "run_report.md";

    atomicWrite(json_path, buildRunSummaryJson(result, settings));
    atomicWrite(md_path, buildRunReportMarkdown(result, settings));

    written.json_path = json_path;
    written.markdown_path = md_path;
    written.files = {json_path, md_path};
    return written;
}

} // namespace mastplanner::io
