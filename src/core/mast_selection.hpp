/**
 * @file mast_selection.hpp
 * @brief Выбор оптимальной мачты и оптимальной пары мачт
 */

#pragma once

#include "model/selection.hpp"
#include "model/site_result.hpp"
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace mastplanner::core {

using namespace mastplanner::model;

/**
 * @brief Ошибка выбора (недостаточно объектов)
 */
class SelectionError : public std::runtime_error {
public:
    explicit SelectionError(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * @brief Плотная матрица adj_RSS_uncertainty турбина × мачта
 *
 * Ячейка без измерения не определена и не участвует в минимумах и суммах.
 */
class UncertaintyMatrix {
public:
    UncertaintyMatrix(size_t turbine_count, size_t mast_count);

    [[nodiscard]] size_t turbineCount() const noexcept { return turbines_; }
    [[nodiscard]] size_t mastCount() const noexcept { return masts_; }

    void set(size_t turbine, size_t mast, std::optional<double> value);
    [[nodiscard]] std::optional<double> at(size_t turbine, size_t mast) const;

    /**
     * @brief Количество неопределённых ячеек
     */
    [[nodiscard]] size_t undefinedCount() const noexcept;

private:
    size_t turbines_;
    size_t masts_;
    std::vector<std::optional<double>> cells_;
};

/**
 * @brief Построение матрицы по обогащённым строкам
 *
 * При повторе пары турбина–мачта действует последняя строка.
 */
[[nodiscard]] UncertaintyMatrix buildUncertaintyMatrix(const SiteAggregation& aggregation);

/**
 * @brief Выбор одиночной мачты с минимальной средней неопределённостью
 *
 * При равенстве выигрывает первая строка таблицы.
 *
 * @param grouped Сгруппированная по мачтам таблица
 * @throws SelectionError Таблица пуста или нет определённых значений
 */
[[nodiscard]] MastSelection selectSingleMast(const GroupedMastList& grouped);

/**
 * @brief Полный перебор пар мачт (i < j)
 *
 * Для каждой турбины берётся минимум из определённых значений двух
 * мачт, минимумы суммируются. Лучшая пара: с наименьшим числом
 * непокрытых турбин, затем с наименьшей суммой; при равенстве
 * первая в порядке перебора (0,1),(0,2),...,(1,2),...
 * Сложность O(M²·T).
 *
 * @param matrix Матрица турбина × мачта
 * @param masts Мачты (столбцы матрицы)
 * @throws SelectionError Менее двух мачт или ни одна пара не покрывает турбин
 */
[[nodiscard]] PairSelection selectMastPair(
    const UncertaintyMatrix& matrix,
    const MastList& masts
);

/**
 * @brief Перебор пар по результату агрегации
 */
[[nodiscard]] PairSelection selectMastPair(const SiteAggregation& aggregation);

} // namespace mastplanner::core
