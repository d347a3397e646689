/**
 * @file mast_selection.cpp
 * @brief Реализация выбора оптимальной мачты и пары мачт
 */

#include "mast_selection.hpp"
#include <algorithm>

namespace mastplanner::core {

UncertaintyMatrix::UncertaintyMatrix(size_t turbine_count, size_t mast_count)
    : turbines_(turbine_count)
    , masts_(mast_count)
    , cells_(turbine_count * mast_count) {}

void UncertaintyMatrix::set(size_t turbine, size_t mast, std::optional<double> value) {
    if (turbine >= turbines_ || mast >= masts_) {
        throw std::out_of_range("Ячейка матрицы вне диапазона");
    }
    cells_[turbine * masts_ + mast] = value;
}

std::optional<double> UncertaintyMatrix::at(size_t turbine, size_t mast) const {
    if (turbine >= turbines_ || mast >= masts_) {
        throw std::out_of_range("Ячейка матрицы вне диапазона");
    }
    return cells_[turbine * masts_ + mast];
}

size_t UncertaintyMatrix::undefinedCount() const noexcept {
    return static_cast<size_t>(std::count_if(cells_.begin(), cells_.end(),
        [](const std::optional<double>& c) { return !c.has_value(); }));
}

UncertaintyMatrix buildUncertaintyMatrix(const SiteAggregation& aggregation) {
    UncertaintyMatrix matrix(aggregation.turbines.size(), aggregation.masts.size());
    for (const auto& row : aggregation.rows) {
        // Неопределённое значение тоже перезаписывает ячейку
        matrix.set(row.turbine_index, row.mast_index, row.uncertainty.adj_rss);
    }
    return matrix;
}

MastSelection selectSingleMast(const GroupedMastList& grouped) {
    if (grouped.empty()) {
        throw SelectionError("Нет мачт для выбора");
    }

    std::optional<size_t> best;
    for (size_t i = 0; i < grouped.size(); ++i) {
        const auto& mean = grouped[i].mean_adj_rss;
        if (!mean.has_value()) continue;
        // Строгое сравнение: при равенстве остаётся первая строка
        if (!best.has_value() || *mean < *grouped[*best].mean_adj_rss) {
            best = i;
        }
    }

    if (!best.has_value()) {
        throw SelectionError("Ни у одной мачты нет определённой средней неопределённости");
    }

    return {grouped[*best], *best};
}

PairSelection selectMastPair(
    const UncertaintyMatrix& matrix,
    const MastList& masts
) {
    const size_t mast_count = matrix.mastCount();
    const size_t turbine_count = matrix.turbineCount();

    if (mast_count < 2) {
        throw SelectionError(
            "Для выбора пары нужно минимум две мачты, найдено: " + std::to_string(mast_count));
    }
    if (masts.size() != mast_count) {
        throw SelectionError("Число мачт не совпадает с размером матрицы");
    }

    PairSelection result;
    result.turbine_count = turbine_count;
    result.mast_count = mast_count;
    result.undefined_cells = matrix.undefinedCount();
    result.pairs.reserve(mast_count * (mast_count - 1) / 2);

    std::optional<size_t> best;

    for (size_t i = 0; i < mast_count; ++i) {
        for (size_t j = i + 1; j < mast_count; ++j) {
            MastPairCandidate candidate;
            candidate.first_index = i;
            candidate.second_index = j;
            candidate.first_id = masts[i].id;
            candidate.second_id = masts[j].id;

            for (size_t t = 0; t < turbine_count; ++t) {
                auto a = matrix.at(t, i);
                auto b = matrix.at(t, j);
                if (a.has_value() && b.has_value()) {
                    candidate.total_rss += std::min(*a, *b);
                } else if (a.has_value()) {
                    candidate.total_rss += *a;
                } else if (b.has_value()) {
                    candidate.total_rss += *b;
                } else {
                    ++candidate.uncovered_turbines;
                    continue;
                }
                ++candidate.covered_turbines;
            }

            if (candidate.covered_turbines > 0) {
                candidate.avg_rss = candidate.total_rss / static_cast<double>(candidate.covered_turbines);

                if (!best.has_value()) {
                    best = result.pairs.size();
                } else {
                    const auto& current = result.pairs[*best];
                    if (candidate.uncovered_turbines < current.uncovered_turbines ||
                        (candidate.uncovered_turbines == current.uncovered_turbines &&
                         candidate.total_rss < current.total_rss)) {
                        best = result.pairs.size();
                    }
                }
            }

            result.pairs.push_back(std::move(candidate));
        }
    }

    if (!best.has_value()) {
        throw SelectionError("Ни одна пара мачт не покрывает турбины");
    }

    result.pairs[*best].is_best = true;
    result.best = result.pairs[*best];
    result.first_mast = masts[result.best.first_index];
    result.second_mast = masts[result.best.second_index];
    return result;
}

PairSelection selectMastPair(const SiteAggregation& aggregation) {
    return selectMastPair(buildUncertaintyMatrix(aggregation), aggregation.masts);
}

} // namespace mastplanner::core
