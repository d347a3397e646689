/**
 * @file test_mast_selection.cpp
 * @brief Тесты выбора одиночной мачты и перебора пар
 */

#include <doctest/doctest.h>
#include "core/aggregation.hpp"
#include "core/diagnostics.hpp"
#include "core/mast_selection.hpp"

using namespace mastplanner::model;
using namespace mastplanner::core;

namespace {

MastList makeMasts(size_t count) {
    MastList masts;
    for (size_t i = 0; i < count; ++i) {
        Mast m;
        m.point.position = Coordinate3D{Meters{static_cast<double>(i) * 100.0}, Meters{0.0}, Meters{0.0}};
        m.id = makeEntityId(kMastIdPrefix, i);
        masts.push_back(m);
    }
    return masts;
}

UncertaintyMatrix makeMatrix(const std::vector<std::vector<double>>& values) {
    UncertaintyMatrix matrix(values.size(), values.front().size());
    for (size_t t = 0; t < values.size(); ++t) {
        for (size_t m = 0; m < values[t].size(); ++m) {
            matrix.set(t, m, values[t][m]);
        }
    }
    return matrix;
}

GroupedMastSummary summary(const std::string& id, std::optional<double> mean) {
    GroupedMastSummary s;
    s.mast_id = id;
    s.mean_adj_rss = mean;
    s.row_count = 1;
    s.defined_count = mean.has_value() ? 1 : 0;
    return s;
}

} // namespace

TEST_CASE("Pair search picks M2+M3 for the reference matrix") {
    // T1 = [5, 1, 9], T2 = [2, 8, 1]
    auto matrix = makeMatrix({{5.0, 1.0, 9.0}, {2.0, 8.0, 1.0}});
    auto result = selectMastPair(matrix, makeMasts(3));

    CHECK(result.best.first_id == "Mast_02");
    CHECK(result.best.second_id == "Mast_03");
    CHECK(result.best.total_rss == 2.0);
    CHECK(result.best.avg_rss == 1.0);
    CHECK(result.first_mast.id == "Mast_02");
    CHECK(result.second_mast.id == "Mast_03");

    REQUIRE(result.pairs.size() == 3);
    CHECK(result.pairs[0].first_id == "Mast_01");
    CHECK(result.pairs[0].second_id == "Mast_02");
    CHECK(result.pairs[0].total_rss == 3.0);
    CHECK(result.pairs[1].total_rss == 6.0);
    CHECK(result.pairs[2].total_rss == 2.0);

    size_t best_count = 0;
    for (const auto& p : result.pairs) {
        if (p.is_best) ++best_count;
    }
    CHECK(best_count == 1);
    CHECK(result.pairs[2].is_best);
    CHECK(result.undefined_cells == 0);
}

TEST_CASE("Pair ties keep the first pair in iteration order") {
    auto matrix = makeMatrix({{1.0, 1.0, 1.0}});
    auto result = selectMastPair(matrix, makeMasts(3));
    CHECK(result.best.first_index == 0);
    CHECK(result.best.second_index == 1);
    CHECK(result.pairs[0].is_best);
}

TEST_CASE("Pair ties between later pairs keep the earlier one") {
    // (0,1): 5 + 4, (0,2): 1 + 2, (1,2): 1 + 2
    auto matrix = makeMatrix({{5.0, 5.0, 1.0}, {4.0, 4.0, 2.0}});
    auto result = selectMastPair(matrix, makeMasts(3));
    REQUIRE(result.pairs.size() == 3);
    CHECK(result.pairs[0].total_rss == 9.0);
    CHECK(result.pairs[1].total_rss == 3.0);
    CHECK(result.pairs[2].total_rss == 3.0);
    CHECK(result.best.first_index == 0);
    CHECK(result.best.second_index == 2);
    CHECK(result.pairs[1].is_best);
    CHECK_FALSE(result.pairs[2].is_best);
}

TEST_CASE("Fewer than two masts cannot form a pair") {
    auto matrix = makeMatrix({{1.0}, {2.0}});
    CHECK_THROWS_AS((void)selectMastPair(matrix, makeMasts(1)), SelectionError);
}

TEST_CASE("Undefined cells are excluded from minima and sums") {
    UncertaintyMatrix matrix(2, 3);
    matrix.set(0, 0, 4.0);
    matrix.set(1, 1, 3.0);
    matrix.set(0, 2, 1.0);
    matrix.set(1, 2, 10.0);
    CHECK(matrix.undefinedCount() == 2);

    auto result = selectMastPair(matrix, makeMasts(3));

    // (0,1): 4 + 3, все турбины покрыты
    CHECK(result.pairs[0].total_rss == 7.0);
    CHECK(result.pairs[0].uncovered_turbines == 0);
    // (0,2): min(4,1) + 10
    CHECK(result.pairs[1].total_rss == 11.0);
    // (1,2): 1 + min(3,10)
    CHECK(result.pairs[2].total_rss == 4.0);
    CHECK(result.pairs[2].avg_rss == 2.0);
    CHECK(result.best.first_id == "Mast_02");
    CHECK(result.best.second_id == "Mast_03");
}

TEST_CASE("Pairs covering more turbines win over smaller sums") {
    UncertaintyMatrix matrix(2, 3);
    matrix.set(0, 0, 1.0);   // пара (0,1) покрывает только T1
    matrix.set(0, 2, 50.0);
    matrix.set(1, 2, 50.0);

    auto result = selectMastPair(matrix, makeMasts(3));
    CHECK(result.pairs[0].uncovered_turbines == 1);
    CHECK(result.best.uncovered_turbines == 0);
    // (0,2): min(1, 50) + 50
    CHECK(result.best.total_rss == 51.0);
    CHECK(result.best.first_id == "Mast_01");
    CHECK(result.best.second_id == "Mast_03");
}

TEST_CASE("Matrix without any defined cell has no pair") {
    UncertaintyMatrix matrix(1, 2);
    CHECK_THROWS_AS((void)selectMastPair(matrix, makeMasts(2)), SelectionError);
}

TEST_CASE("Matrix rejects out of range cells") {
    UncertaintyMatrix matrix(1, 2);
    CHECK_THROWS_AS(matrix.set(1, 0, 1.0), std::out_of_range);
    CHECK_THROWS_AS((void)matrix.at(0, 2), std::out_of_range);
    CHECK_FALSE(matrix.at(0, 1).has_value());
}

TEST_CASE("Single selection picks the minimum mean, first on ties") {
    GroupedMastList grouped = {
        summary("Mast_01", 3.0),
        summary("Mast_02", 1.5),
        summary("Mast_03", std::nullopt),
        summary("Mast_04", 1.5),
    };

    auto selection = selectSingleMast(grouped);
    CHECK(selection.summary.mast_id == "Mast_02");
    CHECK(selection.row_index == 1);
}

TEST_CASE("Single selection needs at least one defined mean") {
    CHECK_THROWS_AS((void)selectSingleMast(GroupedMastList{}), SelectionError);
    CHECK_THROWS_AS((void)selectSingleMast(GroupedMastList{summary("Mast_01", std::nullopt)}), SelectionError);
}

TEST_CASE("Matrix built from rows keeps the last duplicate") {
    auto table = makeReferenceTable();
    auto duplicate = table.rows[0];
    duplicate.horiz_uc_horiz = Percent{7.0};
    table.rows.push_back(duplicate);

    auto matrix = buildUncertaintyMatrix(aggregateSite(table));
    REQUIRE(matrix.at(0, 0).has_value());
    CHECK(*matrix.at(0, 0) == 7.0);
    CHECK(*matrix.at(1, 2) == 1.0);
}

TEST_CASE("Pair selection from aggregation reproduces the reference example") {
    auto result = selectMastPair(aggregateSite(makeReferenceTable()));
    CHECK(result.turbine_count == 2);
    CHECK(result.mast_count == 3);
    CHECK(result.best.first_id == "Mast_02");
    CHECK(result.best.second_id == "Mast_03");
    CHECK(result.best.total_rss == 2.0);
}
