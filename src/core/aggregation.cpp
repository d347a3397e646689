/**
 * @file aggregation.cpp
 * @brief Реализация агрегации площадки
 */

#include "aggregation.hpp"
#include "uncertainty.hpp"
#include <algorithm>
#include <array>
#include <map>
#include <set>
#include <sstream>
#include <tuple>
#include <utility>

namespace mastplanner::core {

namespace {

using IdentityKey = std::array<double, 4>;

IdentityKey identityKey(const SitePoint& p) noexcept {
    return {p.position.x.value, p.position.y.value, p.position.z.value, p.rix.value};
}

/**
 * @brief Уникальные точки в порядке первого появления
 */
template <typename Entity, typename Select>
std::vector<Entity> extractUnique(
    const MeasurementRowList& rows,
    std::string_view prefix,
    Select select
) {
    std::vector<Entity> result;
    std::map<IdentityKey, size_t> seen;

    for (const auto& row : rows) {
        const SitePoint& point = select(row);
        if (seen.emplace(identityKey(point), result.size()).second) {
            result.push_back({point, makeEntityId(prefix, result.size())});
        }
    }
    return result;
}

template <typename Entity>
std::map<IdentityKey, size_t> buildLookup(const std::vector<Entity>& entities) {
    std::map<IdentityKey, size_t> lookup;
    for (size_t i = 0; i < entities.size(); ++i) {
        lookup.emplace(identityKey(entities[i].point), i);
    }
    return lookup;
}

size_t findIndex(const std::map<IdentityKey, size_t>& lookup, const SitePoint& point, size_t line) {
    auto it = lookup.find(identityKey(point));
    if (it == lookup.end()) {
        throw AggregationError("Строка " + std::to_string(line) + ": объект не найден среди уникальных");
    }
    return it->second;
}

} // namespace

TurbineList extractTurbines(const MeasurementRowList& rows) {
    return extractUnique<Turbine>(rows, kTurbineIdPrefix,
        [](const MeasurementRow& r) -> const SitePoint& { return r.turbine; });
}

MastList extractMasts(const MeasurementRowList& rows) {
    return extractUnique<Mast>(rows, kMastIdPrefix,
        [](const MeasurementRow& r) -> const SitePoint& { return r.mast; });
}

GroupedMastList groupByMast(const EnrichedRowList& rows, const MastList& masts) {
    GroupedMastList grouped(masts.size());
    std::vector<double> sums(masts.size(), 0.0);

    for (size_t i = 0; i < masts.size(); ++i) {
        grouped[i].point = masts[i].point;
        grouped[i].mast_id = masts[i].id;
        grouped[i].mast_index = i;
    }

    for (const auto& row : rows) {
        if (row.mast_index >= masts.size()) {
            throw AggregationError("Индекс мачты вне диапазона: " + std::to_string(row.mast_index));
        }
        auto& group = grouped[row.mast_index];
        ++group.row_count;
        if (row.uncertainty.adj_rss.has_value()) {
            sums[row.mast_index] += *row.uncertainty.adj_rss;
            ++group.defined_count;
        }
    }

    for (size_t i = 0; i < grouped.size(); ++i) {
        auto& group = grouped[i];
        if (group.row_count == 0) {
            throw AggregationError("Мачта " + group.mast_id + " не имеет ни одной строки измерений");
        }
        if (group.defined_count > 0) {
            group.mean_adj_rss = sums[i] / static_cast<double>(group.defined_count);
        }
    }

    // Порядок как у сортирующей группировки: по ключу группы
    std::stable_sort(grouped.begin(), grouped.end(),
        [](const GroupedMastSummary& a, const GroupedMastSummary& b) {
            return std::tie(a.point.position.x.value, a.point.position.y.value,
                            a.point.position.z.value, a.point.rix.value, a.mast_id)
                 < std::tie(b.point.position.x.value, b.point.position.y.value,
                            b.point.position.z.value, b.point.rix.value, b.mast_id);
        });

    return grouped;
}

SiteAggregation aggregateSite(const MeasurementTable& table) {
    if (table.rows.empty()) {
        throw AggregationError("Нет строк измерений для агрегации");
    }

    std::ostringstream missing;
    for (const auto& name : columns::kRequired) {
        if (!table.hasColumn(name)) {
            if (missing.tellp() > 0) missing << ", ";
            missing << '"' << name << '"';
        }
    }
    if (missing.tellp() > 0) {
        throw AggregationError("Отсутствуют обязательные колонки: " + missing.str());
    }

    SiteAggregation result;
    result.columns = table.columns;
    result.turbines = extractTurbines(table.rows);
    result.masts = extractMasts(table.rows);

    const auto turbine_lookup = buildLookup(result.turbines);
    const auto mast_lookup = buildLookup(result.masts);

    std::set<std::pair<size_t, size_t>> measured_pairs;
    size_t duplicate_pairs = 0;
    size_t undefined_rows = 0;

    result.rows.reserve(table.rows.size());
    for (const auto& source : table.rows) {
        EnrichedRow row;
        row.source = source;
        row.turbine_index = findIndex(turbine_lookup, source.turbine, source.source_line);
        row.mast_index = findIndex(mast_lookup, source.mast, source.source_line);
        row.turbine_id = result.turbines[row.turbine_index].id;
        row.mast_id = result.masts[row.mast_index].id;
        row.uncertainty = calculateAdjustedUncertainty(source);

        if (!measured_pairs.emplace(row.turbine_index, row.mast_index).second) {
            ++duplicate_pairs;
        }
        if (!row.uncertainty.defined()) {
            ++undefined_rows;
        }

        result.rows.push_back(std::move(row));
    }

    result.grouped_masts = groupByMast(result.rows, result.masts);

    if (undefined_rows > 0) {
        result.warnings.push_back(
            "Строк без определённой adj_RSS_uncertainty (нет расстояния или вертикальной составляющей): " +
            std::to_string(undefined_rows));
    }
    if (duplicate_pairs > 0) {
        result.warnings.push_back(
            "Повторяющихся пар турбина–мачта: " + std::to_string(duplicate_pairs));
    }
    for (const auto& group : result.grouped_masts) {
        if (!group.mean_adj_rss.has_value()) {
            result.warnings.push_back("Мачта " + group.mast_id + ": нет ни одного определённого значения");
        }
    }

    return result;
}

} // namespace mastplanner::core
