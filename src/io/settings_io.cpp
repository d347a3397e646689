/**
 * @file settings_io.cpp
 * @brief Реализация работы с файлом настроек прогона
 */

#include "settings_io.hpp"
#include "file_utils.hpp"
#include <nlohmann/json.hpp>
#include <fstream>

namespace mastplanner::io {

using json = nlohmann::json;

namespace {

json settingsToJsonInternal(const RunSettings& s) {
    json j;

    j["version"] = SETTINGS_FORMAT_VERSION;
    j["format"] = SETTINGS_FORMAT_ID;

    j["input"] = s.input_path.string();
    j["output_dir"] = s.output_dir.string();
    j["mode"] = toString(s.selection_mode);
    j["crs"] = s.crs;
    j["timestamped_output"] = s.timestamped_output;
    j["decimal_places"] = s.decimal_places;

    return j;
}

RunSettings settingsFromJsonInternal(const json& j) {
    if (!j.is_object()) {
        throw SettingsError("Файл настроек должен содержать JSON-объект");
    }

    std::string format = j.value("format", "");
    if (format != SETTINGS_FORMAT_ID) {
        throw SettingsError("Неверный формат файла настроек: '" + format + "'");
    }

    RunSettings s;
    try {
        s.input_path = j.value("input", "");
        s.output_dir = j.value("output_dir", "");
        s.crs = j.value("crs", "");
        s.timestamped_output = j.value("timestamped_output", true);
        s.decimal_places = j.value("decimal_places", -1);
        if (j.contains("mode")) {
            s.selection_mode = parseSelectionMode(j.at("mode").get<std::string>());
        }
    } catch (const json::exception& e) {
        throw SettingsError("Некорректное значение в файле настроек: " + std::string(e.what()));
    } catch (const std::invalid_argument& e) {
        throw SettingsError(e.what());
    }

    if (s.decimal_places < -1) {
        throw SettingsError("decimal_places должно быть -1 или неотрицательным");
    }

    return s;
}

json parseJson(const std::string& text) {
    try {
        return json::parse(text);
    } catch (const json::parse_error& e) {
        throw SettingsError("Ошибка парсинга JSON: " + std::string(e.what()));
    }
}

} // anonymous namespace

RunSettings loadRunSettings(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file) {
        throw SettingsError("Не удалось открыть файл: " + path.string());
    }

    json j;
    try {
        file >> j;
    } catch (const json::parse_error& e) {
        throw SettingsError("Ошибка парсинга JSON: " + std::string(e.what()));
    }

    RunSettings s = settingsFromJsonInternal(j);

    auto base = path.parent_path();
    if (!s.input_path.empty() && s.input_path.is_relative()) {
        s.input_path = base / s.input_path;
    }
    if (!s.output_dir.empty() && s.output_dir.is_relative()) {
        s.output_dir = base / s.output_dir;
    }
    return s;
}

void saveRunSettings(const RunSettings& settings, const std::filesystem::path& path) {
    try {
        atomicWrite(path, settingsToJsonInternal(settings).dump(2));
    } catch (const std::exception& e) {
        throw SettingsError("Ошибка сохранения файла: " + std::string(e.what()));
    }
}

std::string runSettingsToJson(const RunSettings& settings, int indent) {
    return settingsToJsonInternal(settings).dump(indent);
}

RunSettings runSettingsFromJson(const std::string& json_str) {
    return settingsFromJsonInternal(parseJson(json_str));
}

} // namespace mastplanner::io
