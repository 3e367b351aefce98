#include "experiment_quality/threshold_store.h"
#include "text_utils.h"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace exp_quality {

// ============== ThresholdValue ==============

ThresholdValue ThresholdValue::parse(const std::string& text) {
    std::string lower = text;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    bool looks_real = lower.find("e-") != std::string::npos ||
                      lower.find("e+") != std::string::npos ||
                      lower.find('.') != std::string::npos;

    // Значение принимается только если разобрана вся строка
    try {
        size_t pos = 0;
        if (looks_real) {
            double v = std::stod(text, &pos);
            if (pos == text.size()) {
                return ThresholdValue(v);
            }
        } else {
            long long v = std::stoll(text, &pos);
            if (pos == text.size()) {
                return ThresholdValue(static_cast<std::int64_t>(v));
            }
        }
    } catch (const std::invalid_argument&) {
        // не число
    } catch (const std::out_of_range&) {
        // число вне диапазона — сохраняем как текст
    }

    return ThresholdValue(text);
}

double ThresholdValue::to_double() const {
    if (is_integer()) return static_cast<double>(as_integer());
    if (is_real()) return as_real();
    throw ConfigurationError("Expected numeric threshold value, got text '" + as_text() + "'");
}

std::string ThresholdValue::to_string() const {
    if (is_integer()) {
        return std::to_string(as_integer());
    }
    if (is_text()) {
        return as_text();
    }

    double v = as_real();
    std::ostringstream oss;
    oss.precision(15);
    oss << v;
    std::string s = oss.str();
    if (std::isfinite(v) && std::stod(s) != v) {
        oss.str("");
        oss.precision(17);
        oss << v;
        s = oss.str();
    }

    // Без '.' и экспоненты значение прочиталось бы обратно как целое
    if (s.find('.') == std::string::npos && s.find('e') == std::string::npos &&
        std::isfinite(v)) {
        s += ".0";
    }
    return s;
}

// ============== Вспомогательные функции разбора ==============

bool ThresholdStore::parse_section_header(const std::string& line, std::string& section) {
    if (line.size() < 2 || line.front() != '[' || line.back() != ']') {
        return false;
    }
    section = trim(line.substr(1, line.size() - 2));
    return true;
}

bool ThresholdStore::parse_key_value(const std::string& line, std::string& key, std::string& value) {
    size_t equals_pos = line.find('=');
    if (equals_pos == std::string::npos) {
        return false;
    }

    key = trim(line.substr(0, equals_pos));
    value = trim(line.substr(equals_pos + 1));

    // Комментарий в конце значения
    size_t hash_pos = value.find('#');
    if (hash_pos != std::string::npos) {
        value = trim(value.substr(0, hash_pos));
    }
    return true;
}

// ============== Разбор и чтение ==============

ThresholdStore ThresholdStore::parse(const std::string& text, bool strict_mode) {
    ThresholdStore store;
    std::istringstream input(text);
    std::string line;
    std::string current_section;
    bool section_open = false;
    int line_number = 0;

    while (std::getline(input, line)) {
        line_number++;
        line = trim(line);

        if (line.empty() || line[0] == '#') {
            continue;
        }

        std::string section;
        if (parse_section_header(line, section)) {
            current_section = section;
            section_open = true;
            store.categories_[current_section] = Category();
            continue;
        }

        std::string key, value;
        if (!parse_key_value(line, key, value)) {
            continue;
        }

        if (!section_open) {
            std::string message = "Key '" + key + "' at line " + std::to_string(line_number) +
                                  " appears before any [section] header";
            if (strict_mode) {
                throw ConfigurationError(message);
            }
            store.warnings_.push_back(message + "; ignored");
            continue;
        }

        if (key.empty()) {
            store.warnings_.push_back("Empty key at line " + std::to_string(line_number) + "; ignored");
            continue;
        }

        store.categories_[current_section][key] = ThresholdValue::parse(value);
    }

    return store;
}

ThresholdStore ThresholdStore::read_from_file(const std::string& filename, bool strict_mode) {
    // Каталог тоже открывается через ifstream, поэтому проверяем тип заранее
    if (!std::filesystem::is_regular_file(filename)) {
        throw std::runtime_error("Quality thresholds file not found: " + filename);
    }

    std::ifstream file(filename);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open quality thresholds file: " + filename);
    }

    std::ostringstream buffer;
    buffer << file.rdbuf();
    if (file.bad()) {
        throw std::runtime_error("Cannot read quality thresholds file: " + filename);
    }

    return parse(buffer.str(), strict_mode);
}

void ThresholdStore::write_to_file(const std::string& filename) const {
    std::ofstream file(filename);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot create file: " + filename);
    }

    file << "# Quality thresholds\n";
    file << "# Generated by ThresholdStore\n\n";
    file << format();

    if (!file) {
        throw std::runtime_error("Error writing file: " + filename);
    }
}

// ============== Доступ к значениям ==============

bool ThresholdStore::has_category(const std::string& category) const {
    return categories_.find(category) != categories_.end();
}

bool ThresholdStore::has_key(const std::string& category, const std::string& key) const {
    auto it = categories_.find(category);
    return it != categories_.end() && it->second.find(key) != it->second.end();
}

const ThresholdStore::Category& ThresholdStore::category(const std::string& category) const {
    auto it = categories_.find(category);
    if (it == categories_.end()) {
        throw ConfigurationError("Missing threshold category [" + category + "]");
    }
    return it->second;
}

const ThresholdValue& ThresholdStore::value(const std::string& category_name, const std::string& key) const {
    const Category& entries = category(category_name);
    auto it = entries.find(key);
    if (it == entries.end()) {
        throw ConfigurationError("Missing threshold '" + key + "' in [" + category_name + "]");
    }
    return it->second;
}

double ThresholdStore::get_number(const std::string& category_name, const std::string& key) const {
    const ThresholdValue& v = value(category_name, key);
    if (!v.is_numeric()) {
        throw ConfigurationError("Threshold '" + key + "' in [" + category_name +
                                 "] is not numeric: '" + v.as_text() + "'");
    }
    return v.to_double();
}

std::int64_t ThresholdStore::get_int(const std::string& category_name, const std::string& key) const {
    const ThresholdValue& v = value(category_name, key);
    if (v.is_integer()) {
        return v.as_integer();
    }
    if (v.is_real() && std::isfinite(v.as_real()) && std::floor(v.as_real()) == v.as_real()) {
        return static_cast<std::int64_t>(v.as_real());
    }
    throw ConfigurationError("Threshold '" + key + "' in [" + category_name +
                             "] is not an integer: '" + v.to_string() + "'");
}

const std::string& ThresholdStore::get_string(const std::string& category_name, const std::string& key) const {
    const ThresholdValue& v = value(category_name, key);
    if (!v.is_text()) {
        throw ConfigurationError("Threshold '" + key + "' in [" + category_name + "] is not text");
    }
    return v.as_text();
}

std::vector<std::string> ThresholdStore::category_names() const {
    std::vector<std::string> names;
    names.reserve(categories_.size());
    for (const auto& entry : categories_) {
        names.push_back(entry.first);
    }
    return names;
}

void ThresholdStore::set(const std::string& category_name, const std::string& key, const ThresholdValue& value) {
    categories_[category_name][key] = value;
}

std::string ThresholdStore::format() const {
    std::ostringstream oss;
    bool first = true;
    for (const auto& section : categories_) {
        if (!first) oss << "\n";
        first = false;
        oss << "[" << section.first << "]\n";
        for (const auto& entry : section.second) {
            oss << entry.first << " = " << entry.second.to_string() << "\n";
        }
    }
    return oss.str();
}

} // namespace exp_quality
