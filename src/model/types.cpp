/**
 * @file types.cpp
 * @brief Реализация базовых типов
 */

#include "types.hpp"
#include <sstream>
#include <iomanip>
#include <stdexcept>

namespace mastplanner::model {

SelectionMode parseSelectionMode(std::string_view str) {
    if (str == "single" || str == "Single") return SelectionMode::Single;
    if (str == "pair" || str == "Pair") return SelectionMode::Pair;
    if (str == "both" || str == "Both") return SelectionMode::Both;
    throw std::invalid_argument("Неизвестный режим выбора мачты: " + std::string(str));
}

std::string makeEntityId(std::string_view prefix, size_t index) {
    std::ostringstream ss;
    ss << prefix << '_' << std::setfill('0') << std::setw(2) << (index + 1);
    return ss.str();
}

} // namespace mastplanner::model
