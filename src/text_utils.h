#ifndef EXPERIMENT_QUALITY_TEXT_UTILS_H
#define EXPERIMENT_QUALITY_TEXT_UTILS_H

#include <string>

namespace exp_quality {

// Обрезка пробелов, табуляций и переводов строки по краям
inline std::string trim(const std::string& str) {
    const char* whitespace = " \t\r\n";
    const size_t first = str.find_first_not_of(whitespace);
    if (first == std::string::npos) {
        return std::string();
    }
    const size_t last = str.find_last_not_of(whitespace);
    return str.substr(first, last - first + 1);
}

} // namespace exp_quality

#endif // EXPERIMENT_QUALITY_TEXT_UTILS_H
