/**
 * @file pipeline.cpp
 * @brief Реализация полной обработки файла измерений
 */

#include "pipeline.hpp"
#include "aggregation.hpp"
#include "mast_selection.hpp"
#include "io/measurement_reader.hpp"
#include <utility>

namespace mastplanner::core {

namespace {

void report(const ProgressCallback& cb, double progress, std::string_view message) {
    if (cb) {
        cb(progress, message);
    }
}

bool wantsSingle(SelectionMode mode) noexcept {
    return mode == SelectionMode::Single || mode == SelectionMode::Both;
}

bool wantsPair(SelectionMode mode) noexcept {
    return mode == SelectionMode::Pair || mode == SelectionMode::Both;
}

} // namespace

PipelineResult runPipeline(
    MeasurementTable table,
    const PipelineOptions& options,
    ProgressCallback on_progress
) {
    PipelineResult result;

    report(on_progress, 0.3, "Агрегация турбин и мачт");
    result.aggregation = aggregateSite(table);

    result.warnings = table.warnings;
    result.warnings.insert(result.warnings.end(),
        result.aggregation.warnings.begin(), result.aggregation.warnings.end());

    if (wantsSingle(options.mode)) {
        report(on_progress, 0.6, "Выбор одиночной мачты");
        result.single = selectSingleMast(result.aggregation.grouped_masts);
    }

    if (wantsPair(options.mode)) {
        report(on_progress, 0.8, "Перебор пар мачт");
        auto pair = selectMastPair(result.aggregation);
        if (pair.undefined_cells > 0) {
            result.warnings.push_back(
                "Матрица турбина × мачта: " + std::to_string(pair.undefined_cells) +
                " неизмеренных ячеек исключены из минимумов и сумм");
        }
        result.pair = std::move(pair);
    }

    result.table = std::move(table);
    report(on_progress, 1.0, "Обработка завершена");
    return result;
}

PipelineResult runPipeline(
    const std::filesystem::path& input_path,
    const PipelineOptions& options,
    ProgressCallback on_progress
) {
    report(on_progress, 0.0, "Чтение файла измерений");
    auto table = io::readMeasurementTable(input_path);
    return runPipeline(std::move(table), options, std::move(on_progress));
}

} // namespace mastplanner::core
