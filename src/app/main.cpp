/**
 * @file main.cpp
 * @brief Точка входа приложения MastPlanner
 */

#include "diagnostics_runner.hpp"
#include "core/aggregation.hpp"
#include "core/mast_selection.hpp"
#include "core/pipeline.hpp"
#include "io/file_utils.hpp"
#include "io/measurement_reader.hpp"
#include "io/run_report_writer.hpp"
#include "io/settings_io.hpp"
#include "io/table_writer.hpp"
#include "model/run_settings.hpp"
#include <iomanip>
#include <iostream>
#include <filesystem>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

namespace {

using namespace mastplanner::model;

/**
 * @brief Ошибка в аргументах командной строки (код возврата 2)
 */
class UsageError : public std::runtime_error {
public:
    explicit UsageError(const std::string& message)
        : std::runtime_error(message) {}
};

void printUsage(std::ostream& out) {
    out << "Использование:\n"
        << "  mastplanner --input <файл> [--out <каталог>] [--mode single|pair|both]\n"
        << "              [--crs <id>] [--settings <файл.json>] [--no-timestamp]\n"
        << "              [--decimals <n>]\n"
        << "  mastplanner --diagnostics [--out <каталог>]\n"
        << "  mastplanner --help\n";
}

/**
 * @brief Явно заданные параметры командной строки
 *
 * Незаданные значения берутся из файла настроек.
 */
struct CliOverrides {
    std::optional<std::filesystem::path> input;
    std::optional<std::filesystem::path> out;
    std::optional<SelectionMode> mode;
    std::optional<std::string> crs;
    std::optional<std::filesystem::path> settings;
    std::optional<int> decimals;
    bool no_timestamp = false;
};

std::string requireValue(int argc, char* argv[], int& i) {
    if (i + 1 >= argc) {
        throw UsageError(std::string("Не указано значение для ") + argv[i]);
    }
    return argv[++i];
}

CliOverrides parseRunArguments(int argc, char* argv[]) {
    CliOverrides cli;
    for (int i = 1; i < argc; ++i) {
        std::string_view arg(argv[i]);
        if (arg == "--input") {
            cli.input = requireValue(argc, argv, i);
        } else if (arg == "--out") {
            cli.out = requireValue(argc, argv, i);
        } else if (arg == "--mode") {
            auto value = requireValue(argc, argv, i);
            try {
                cli.mode = parseSelectionMode(value);
            } catch (const std::invalid_argument& e) {
                throw UsageError(e.what());
            }
        } else if (arg == "--crs") {
            cli.crs = requireValue(argc, argv, i);
        } else if (arg == "--settings") {
            cli.settings = requireValue(argc, argv, i);
        } else if (arg == "--decimals") {
            auto value = requireValue(argc, argv, i);
            try {
                size_t pos = 0;
                int n = std::stoi(value, &pos);
                if (pos != value.size() || n < 0) {
                    throw UsageError("--decimals ожидает неотрицательное целое: " + value);
                }
                cli.decimals = n;
            } catch (const std::logic_error&) {
                throw UsageError("--decimals ожидает неотрицательное целое: " + value);
            }
        } else if (arg == "--no-timestamp") {
            cli.no_timestamp = true;
        } else {
            throw UsageError("Неизвестный параметр: " + std::string(arg));
        }
    }
    return cli;
}

RunSettings resolveSettings(const CliOverrides& cli) {
    RunSettings settings;
    if (cli.settings.has_value()) {
        settings = mastplanner::io::loadRunSettings(*cli.settings);
    }

    if (cli.input.has_value()) settings.input_path = *cli.input;
    if (cli.out.has_value()) settings.output_dir = *cli.out;
    if (cli.mode.has_value()) settings.selection_mode = *cli.mode;
    if (cli.crs.has_value()) settings.crs = *cli.crs;
    if (cli.decimals.has_value()) settings.decimal_places = *cli.decimals;
    if (cli.no_timestamp) settings.timestamped_output = false;

    if (settings.input_path.empty()) {
        throw UsageError("Не указан входной файл (--input или ключ \"input\" в настройках)");
    }
    if (settings.output_dir.empty()) {
        settings.output_dir = std::filesystem::current_path();
    }
    return settings;
}

int runPlanner(const RunSettings& settings) {
    namespace core = mastplanner::core;
    namespace io = mastplanner::io;

    core::PipelineOptions options;
    options.mode = settings.selection_mode;

    auto result = core::runPipeline(settings.input_path, options,
        [](double progress, std::string_view message) {
            std::cout << "[" << std::setw(3) << static_cast<int>(progress * 100.0) << "%] "
                      << message << std::endl;
        });

    auto out_dir = io::prepareOutputDirectory(settings.output_dir, settings.timestamped_output);

    io::TableExportOptions table_options;
    table_options.decimal_places = settings.decimal_places;
    auto exported = io::writeRunTables(result, out_dir, table_options);
    auto report = io::writeRunReport(result, settings, out_dir);

    for (const auto& w : result.warnings) {
        std::cout << "Предупреждение: " << w << std::endl;
    }

    std::cout << "Турбин: " << result.aggregation.turbines.size()
              << ", мачт: " << result.aggregation.masts.size() << std::endl;
    if (result.single.has_value()) {
        const auto& s = result.single->summary;
        std::cout << "Оптимальная мачта: " << s.mast_id
                  << " (adj_RSS " << io::formatNumber(s.mean_adj_rss) << " %)" << std::endl;
    }
    if (result.pair.has_value()) {
        const auto& best = result.pair->best;
        std::cout << "Оптимальная пара: " << best.first_id << " + " << best.second_id
                  << " (сумма " << io::formatNumber(best.total_rss)
                  << ", среднее " << io::formatNumber(best.avg_rss) << ")" << std::endl;
    }
    std::cout << "Записано файлов: " << exported.files.size() + report.files.size()
              << ", каталог: " << out_dir.string() << std::endl;
    return 0;
}

int runDiagnostics(int argc, char* argv[]) {
    std::filesystem::path out_dir;
    for (int i = 2; i < argc; ++i) {
        std::string_view arg(argv[i]);
        if (arg == "--out") {
            out_dir = requireValue(argc, argv, i);
        } else {
            throw UsageError("Неизвестный параметр: " + std::string(arg));
        }
    }

    if (out_dir.empty()) {
        out_dir = std::filesystem::temp_directory_path() / "mastplanner_diagnostics";
    }

    auto result = mastplanner::app::runDiagnosticsCommand(out_dir);
    if (result.exit_code == 0) {
        std::cout << "Диагностика завершена: " << out_dir.string() << std::endl;
    } else {
        std::cerr << "Диагностика завершилась с ошибками: " << out_dir.string() << std::endl;
    }
    return result.exit_code;
}

} // namespace

int main(int argc, char* argv[]) {
    try {
        if (argc < 2) {
            printUsage(std::cerr);
            return 2;
        }

        std::string_view command(argv[1]);
        if (command == "--help" || command == "-h") {
            printUsage(std::cout);
            return 0;
        }

        // Самопроверка: --diagnostics [--out <путь>]
        if (command == "--diagnostics") {
            return runDiagnostics(argc, argv);
        }

        return runPlanner(resolveSettings(parseRunArguments(argc, argv)));
    } catch (const UsageError& e) {
        std::cerr << "Ошибка параметров: " << e.what() << std::endl;
        printUsage(std::cerr);
        return 2;
    } catch (const mastplanner::io::ParseError& e) {
        std::cerr << "ParseError";
        if (e.line() > 0) std::cerr << " (строка " << e.line() << ")";
        std::cerr << ": " << e.what() << std::endl;
        return 1;
    } catch (const mastplanner::core::AggregationError& e) {
        std::cerr << "AggregationError: " << e.what() << std::endl;
        return 1;
    } catch (const mastplanner::core::SelectionError& e) {
        std::cerr << "SelectionError: " << e.what() << std::endl;
        return 1;
    } catch (const mastplanner::io::SettingsError& e) {
        std::cerr << "SettingsError: " << e.what() << std::endl;
        return 1;
    } catch (const mastplanner::io::TableWriteError& e) {
        std::cerr << "TableWriteError: " << e.what() << std::endl;
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Критическая ошибка: " << e.what() << std::endl;
        return 1;
    }
}
