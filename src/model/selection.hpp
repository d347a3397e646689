/**
 * @file selection.hpp
 * @brief Результаты выбора оптимальной мачты / пары мачт
 */

#pragma once

#include "site_result.hpp"
#include <string>
#include <vector>

namespace mastplanner::model {

/**
 * @brief Выбранная одиночная мачта
 */
struct MastSelection {
    GroupedMastSummary summary;   ///< Строка сгруппированной таблицы
    size_t row_index = 0;         ///< Позиция в сгруппированной таблице
};

/**
 * @brief Кандидат: неупорядоченная пара различных мачт
 */
struct MastPairCandidate {
    size_t first_index = 0;       ///< Индекс первой мачты (i < j)
    size_t second_index = 0;      ///< Индекс второй мачты
    std::string first_id;
    std::string second_id;
    double total_rss = 0.0;       ///< Сумма по турбинам min(rss_i, rss_j)
    double avg_rss = 0.0;         ///< total_rss / covered_turbines
    size_t covered_turbines = 0;  ///< Турбин с хотя бы одним измерением в паре
    size_t uncovered_turbines = 0;///< Турбин без измерений ни к одной мачте пары
    bool is_best = false;
};

using MastPairList = std::vector<MastPairCandidate>;

/**
 * @brief Результат перебора пар
 */
struct PairSelection {
    MastPairCandidate best;
    MastPairList pairs;           ///< Все пары в порядке (0,1),(0,2),...,(1,2),...
    Mast first_mast;              ///< Первая мачта лучшей пары
    Mast second_mast;             ///< Вторая мачта лучшей пары
    size_t turbine_count = 0;
    size_t mast_count = 0;
    size_t undefined_cells = 0;   ///< Пустых ячеек матрицы турбина × мачта
};

} // namespace mastplanner::model
