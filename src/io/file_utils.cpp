/**
 * @file file_utils.cpp
 * @brief Вспомогательные функции для работы с файлами результатов
 */

#include "file_utils.hpp"
#include <ctime>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace mastplanner::io {

void atomicWrite(const std::filesystem::path& path, const std::string& content) {
    auto dir = path.parent_path();
    if (!dir.empty()) {
        std::filesystem::create_directories(dir);
    }

    auto tmp = path;
    tmp += ".tmp";

    {
        std::ofstream ofs(tmp, std::ios::binary);
        if (!ofs) {
            throw std::runtime_error("Не удалось открыть временный файл для записи: " + tmp.string());
        }
        ofs.write(content.data(), static_cast<std::streamsize>(content.size()));
        if (!ofs) {
            throw std::runtime_error("Ошибка записи во временный файл: " + tmp.string());
        }
    }

    std::error_code ec;
    std::filesystem::remove(path, ec);
    ec.clear();
    std::filesystem::rename(tmp, path, ec);
    if (ec) {
        std::filesystem::remove(tmp, ec);
        throw std::runtime_error("Не удалось атомарно сохранить файл: " + path.string());
    }
}

std::string resultsDirName(std::chrono::system_clock::time_point time) {
    const std::time_t seconds = std::chrono::system_clock::to_time_t(time);
    std::tm utc{};
#if defined(_WIN32)
    gmtime_s(&utc, &seconds);
#else
    gmtime_r(&seconds, &utc);
#endif
    std::ostringstream name;
    name << RESULTS_DIR_PREFIX << std::put_time(&utc, "%Y-%m-%d_%H-%M");
    return name.str();
}

std::filesystem::path prepareOutputDirectory(
    const std::filesystem::path& root,
    bool timestamped,
    std::chrono::system_clock::time_point time
) {
    auto dir = timestamped ? root / resultsDirName(time) : root;
    std::filesystem::create_directories(dir);
    return dir;
}

} // namespace mastplanner::io
