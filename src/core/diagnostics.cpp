/**
 * @file diagnostics.cpp
 * @brief Реализация диагностических проверок (core)
 */

#include "diagnostics.hpp"
#include "aggregation.hpp"
#include "mast_selection.hpp"
#include "pipeline.hpp"
#include "io/measurement_reader.hpp"
#include <chrono>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <iterator>
#include <sstream>

namespace mastplanner::core {
namespace {

using namespace mastplanner::model;

// Время запуска в UTC, ISO 8601
std::string utcTimestamp(std::chrono::system_clock::time_point when) {
    const std::time_t seconds = std::chrono::system_clock::to_time_t(when);
    std::tm utc{};
#if defined(_WIN32)
    gmtime_s(&utc, &seconds);
#else
    gmtime_r(&seconds, &utc);
#endif
    std::ostringstream oss;
    oss << std::put_time(&utc, "%Y-%m-%dT%H:%M:%SZ");
    return oss.str();
}

constexpr const char* kPlatformName =
#if defined(__linux__)
    "Linux";
#elif defined(__APPLE__)
    "macOS";
#elif defined(_WIN32)
    "Windows";
#else
    "Unknown";
#endif

std::string describeInputSchema() {
    std::ostringstream oss;
    for (size_t i = 0; i < columns::kRequired.size(); ++i) {
        if (i > 0) oss << "; ";
        oss << columns::kRequired[i];
    }
    return oss.str();
}

DiagnosticCheck makeBuildInfoCheck(const DiagnosticsMeta& meta) {
    DiagnosticCheck check;
    check.id = "build_info";
    check.title = "Сборка и версия";
    check.status = DiagnosticStatus::Ok;

    std::ostringstream oss;
    oss << "Версия: " << meta.app_version
        << ", сборка: " << meta.build_type
        << ", платформа: " << meta.platform
        << ", колонок входного файла: " << columns::kRequired.size();
    check.details = oss.str();
    return check;
}

DiagnosticCheck makeFilesystemCheck(const std::filesystem::path& artifacts_dir) {
    DiagnosticCheck check;
    check.id = "filesystem";
    check.title = "Запись и чтение на диске";
    check.status = DiagnosticStatus::Fail;

    const std::string probe = "mastplanner diagnostics probe";

    try {
        auto logs_dir = artifacts_dir / "logs";
        std::filesystem::create_directories(logs_dir);
        auto probe_path = logs_dir / "fs_probe.txt";

        {
            std::ofstream ofs(probe_path, std::ios::binary);
            ofs << probe;
        }

        std::ifstream ifs(probe_path, std::ios::binary);
        std::string read_back((std::istreambuf_iterator<char>(ifs)), std::istreambuf_iterator<char>());

        if (read_back == probe) {
            check.status = DiagnosticStatus::Ok;
            check.details = "Запись/чтение в каталоге артефактов работает";
            check.artifacts.push_back({"probe", std::filesystem::path("logs") / "fs_probe.txt"});
        } else {
            check.details = "Прочитанное содержимое не совпадает с записанным";
        }
    } catch (const std::exception& ex) {
        check.details = std::string("Ошибка файловой системы: ") + ex.what();
    }

    return check;
}

DiagnosticCheck makeReferencePipelineCheck() {
    DiagnosticCheck check;
    check.id = "reference_pipeline";
    check.title = "Выбор мачт на эталонных данных";
    check.status = DiagnosticStatus::Fail;

    try {
        auto result = runPipeline(makeReferenceTable());

        if (!result.pair.has_value() || !result.single.has_value()) {
            check.details = "Расчёт не вернул результат выбора";
            return check;
        }

        const auto& best = result.pair->best;
        std::ostringstream oss;
        oss << "Пара " << best.first_id << " + " << best.second_id
            << ", сумма " << best.total_rss
            << "; одиночная " << result.single->summary.mast_id;
        check.details = oss.str();

        bool pair_ok = best.first_id == "Mast_02" && best.second_id == "Mast_03" && best.total_rss == 2.0;
        bool pairs_ok = result.pair->pairs.size() == 3 &&
                        result.pair->pairs[0].total_rss == 3.0 &&
                        result.pair->pairs[1].total_rss == 6.0;
        if (pair_ok && pairs_ok) {
            check.status = DiagnosticStatus::Ok;
        } else {
            check.details += " (ожидалась пара Mast_02 + Mast_03, сумма 2)";
        }
    } catch (const std::exception& ex) {
        check.details = std::string("Ошибка расчёта: ") + ex.what();
    }

    return check;
}

DiagnosticCheck makeInvalidInputCheck() {
    DiagnosticCheck check;
    check.id = "invalid_input";
    check.title = "Обработка пустых/неполных данных";
    check.status = DiagnosticStatus::Fail;

    bool empty_rejected = false;
    try {
        std::istringstream empty;
        auto table = io::readMeasurementTable(empty, "empty");
        check.details = "Пустой файл принят (" + std::to_string(table.size()) + " строк)";
        return check;
    } catch (const io::ParseError&) {
        empty_rejected = true;
    } catch (const std::exception& ex) {
        check.details = std::string("Пустой файл: неожиданная ошибка: ") + ex.what();
        return check;
    }

    try {
        auto table = makeReferenceTable();
        // Оставляем одну мачту: Mast_01
        MeasurementRowList single_mast;
        for (size_t i = 0; i < table.rows.size(); i += 3) {
            single_mast.push_back(table.rows[i]);
        }
        table.rows = std::move(single_mast);

        auto pair = selectMastPair(aggregateSite(table));
        check.details = "Пара выбрана при одной мачте: " + pair.best.first_id;
    } catch (const SelectionError&) {
        if (empty_rejected) {
            check.status = DiagnosticStatus::Ok;
            check.details = "Пустой файл: ParseError; одна мачта: SelectionError";
        }
    } catch (const std::exception& ex) {
        check.details = std::string("Неожиданная ошибка: ") + ex.what();
    }

    return check;
}

MeasurementRow makeReferenceRow(double turbine_x, double mast_x, double rss, size_t line) {
    MeasurementRow row;
    row.turbine.position = Coordinate3D{Meters{turbine_x}, Meters{0.0}, Meters{100.0}};
    row.turbine.rix = Percent{0.0};
    row.mast.position = Coordinate3D{Meters{mast_x}, Meters{500.0}, Meters{100.0}};
    row.mast.rix = Percent{0.0};
    // Нулевое расстояние и приращения: adj_RSS = sqrt(rss²) = rss
    row.horiz_distance = Meters{0.0};
    row.horiz_uc_horiz = Percent{rss};
    row.horiz_uc_vert = Percent{0.0};
    row.vert_uc = Percent{0.0};
    row.source_line = line;
    return row;
}

template <typename Check>
DiagnosticCheck timed(Check&& check) {
    auto start = std::chrono::steady_clock::now();
    DiagnosticCheck result = check();
    std::chrono::duration<double, std::milli> elapsed = std::chrono::steady_clock::now() - start;
    result.duration_ms = elapsed.count();
    return result;
}

} // namespace

model::MeasurementTable makeReferenceTable() {
    MeasurementTable table;
    table.source_name = "reference";
    table.columns.assign(columns::kRequired.begin(), columns::kRequired.end());

    const double turbines[] = {0.0, 1000.0};
    const double masts[] = {0.0, 300.0, 600.0};
    const double rss[2][3] = {{5.0, 1.0, 9.0}, {2.0, 8.0, 1.0}};

    size_t line = 2;
    for (size_t t = 0; t < 2; ++t) {
        for (size_t m = 0; m < 3; ++m) {
            table.rows.push_back(makeReferenceRow(turbines[t], masts[m], rss[t][m], line++));
        }
    }
    return table;
}

model::DiagnosticsReport buildDiagnosticsReport(const DiagnosticsOptions& options) {
    DiagnosticsReport report;
    report.meta.app_version = MASTPLANNER_VERSION;
    report.meta.build_type = MASTPLANNER_BUILD_TYPE;
    report.meta.platform = kPlatformName;
    report.meta.input_schema = describeInputSchema();
    report.meta.timestamp = utcTimestamp(std::chrono::system_clock::now());
    report.meta.artifacts_root = options.artifacts_dir;

    report.checks.push_back(timed([&] { return makeBuildInfoCheck(report.meta); }));
    report.checks.push_back(timed([&] { return makeFilesystemCheck(options.artifacts_dir); }));
    report.checks.push_back(timed(makeReferencePipelineCheck));
    report.checks.push_back(timed(makeInvalidInputCheck));

    return report;
}

} // namespace mastplanner::core
