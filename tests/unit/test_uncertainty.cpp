/**
 * @file test_uncertainty.cpp
 * @brief Тесты расчёта скорректированной неопределённости
 */

#include <doctest/doctest.h>
#include "core/uncertainty.hpp"
#include <cmath>

using namespace mastplanner::model;
using namespace mastplanner::core;

namespace {

MeasurementRow makeRow(OptionalPercent uc_horiz, OptionalMeters distance,
                       OptionalPercent uc_vert, OptionalPercent vert) {
    MeasurementRow row;
    row.horiz_uc_horiz = uc_horiz;
    row.horiz_distance = distance;
    row.horiz_uc_vert = uc_vert;
    row.vert_uc = vert;
    return row;
}

} // namespace

TEST_CASE("Missing horizontal increase is treated as 100 percent") {
    auto row = makeRow(std::nullopt, Meters{500.0}, Percent{2.0}, Percent{3.0});
    auto uc = calculateAdjustedUncertainty(row);

    CHECK(uc.horiz_uc_horiz_used == 100.0);
    REQUIRE(uc.adj_horiz_uc_horiz_dist.has_value());
    CHECK(*uc.adj_horiz_uc_horiz_dist == 100.5);
    REQUIRE(uc.adj_sum_horiz_uc.has_value());
    CHECK(*uc.adj_sum_horiz_uc == 102.5);
    REQUIRE(uc.adj_rss.has_value());
    CHECK(*uc.adj_rss == doctest::Approx(102.5439).epsilon(1e-6));
    CHECK(*uc.adj_rss == std::sqrt(102.5 * 102.5 + 3.0 * 3.0));
}

TEST_CASE("Both horizontal increases default independently") {
    auto row = makeRow(Percent{1.0}, Meters{0.0}, std::nullopt, Percent{0.0});
    auto uc = calculateAdjustedUncertainty(row);

    CHECK(uc.horiz_uc_horiz_used == 1.0);
    CHECK(uc.horiz_uc_vert_used == 100.0);
    REQUIRE(uc.adj_rss.has_value());
    CHECK(*uc.adj_rss == 101.0);
}

TEST_CASE("Missing distance leaves every derived value undefined") {
    auto row = makeRow(Percent{1.0}, std::nullopt, Percent{2.0}, Percent{3.0});
    auto uc = calculateAdjustedUncertainty(row);

    CHECK_FALSE(uc.adj_horiz_uc_horiz_dist.has_value());
    CHECK_FALSE(uc.adj_sum_horiz_uc.has_value());
    CHECK_FALSE(uc.defined());
}

TEST_CASE("Missing vertical increase leaves only RSS undefined") {
    auto row = makeRow(Percent{1.0}, Meters{1000.0}, Percent{2.0}, std::nullopt);
    auto uc = calculateAdjustedUncertainty(row);

    REQUIRE(uc.adj_sum_horiz_uc.has_value());
    CHECK(*uc.adj_sum_horiz_uc == 4.0);
    CHECK_FALSE(uc.defined());
}

TEST_CASE("RSS is non-negative and symmetric") {
    CHECK(rootSumSquare(3.0, 4.0) == 5.0);
    CHECK(rootSumSquare(-3.0, 4.0) == 5.0);
    CHECK(rootSumSquare(0.0, 0.0) == 0.0);
}

TEST_CASE("Calculation is reproducible") {
    auto row = makeRow(Percent{2.3}, Meters{1234.5}, Percent{0.7}, Percent{1.9});
    auto a = calculateAdjustedUncertainty(row);
    auto b = calculateAdjustedUncertainty(row);
    REQUIRE(a.adj_rss.has_value());
    CHECK(*a.adj_rss == *b.adj_rss);
}
