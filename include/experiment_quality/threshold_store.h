#ifndef EXPERIMENT_QUALITY_THRESHOLD_STORE_H
#define EXPERIMENT_QUALITY_THRESHOLD_STORE_H

#include "types.h"
#include <cstdint>
#include <map>
#include <string>
#include <variant>
#include <vector>

namespace exp_quality {

/**
 * @brief Значение порога: целое, вещественное или текст
 *
 * Тип определяется автоматически при разборе строки конфигурации.
 */
class ThresholdValue {
public:
    ThresholdValue() : value_(std::int64_t(0)) {}
    ThresholdValue(std::int64_t v) : value_(v) {}
    ThresholdValue(int v) : value_(static_cast<std::int64_t>(v)) {}
    ThresholdValue(double v) : value_(v) {}
    ThresholdValue(const std::string& v) : value_(v) {}
    ThresholdValue(const char* v) : value_(std::string(v)) {}

    /**
     * @brief Разбор строкового значения с автоопределением типа
     *
     * Строка с '.' или маркером экспоненты (e-/e+) разбирается как double,
     * иначе как целое. Если разбор не удался, сохраняется исходный текст.
     */
    static ThresholdValue parse(const std::string& text);

    bool is_integer() const { return std::holds_alternative<std::int64_t>(value_); }
    bool is_real() const { return std::holds_alternative<double>(value_); }
    bool is_numeric() const { return is_integer() || is_real(); }
    bool is_text() const { return std::holds_alternative<std::string>(value_); }

    std::int64_t as_integer() const { return std::get<std::int64_t>(value_); }
    double as_real() const { return std::get<double>(value_); }
    const std::string& as_text() const { return std::get<std::string>(value_); }

    // Числовое значение независимо от представления; для текста бросает исключение
    double to_double() const;

    std::string to_string() const;

    bool operator==(const ThresholdValue& other) const { return value_ == other.value_; }
    bool operator!=(const ThresholdValue& other) const { return !(*this == other); }

private:
    std::variant<std::int64_t, double, std::string> value_;
};

/**
 * @brief Хранилище именованных порогов качества
 *
 * Формат конфигурации (построчный):
 * - пустые строки и строки, начинающиеся с '#', пропускаются
 * - [section] открывает категорию
 * - key = value  # комментарий
 *
 * После построения хранилище не изменяется и может разделяться
 * между потоками только для чтения.
 */
class ThresholdStore {
public:
    using Category = std::map<std::string, ThresholdValue>;

    ThresholdStore() = default;

    /**
     * @brief Разбор текста конфигурации
     * @param text содержимое файла порогов
     * @param strict_mode пара ключ-значение до первой секции считается ошибкой
     * @throws ConfigurationError в строгом режиме при ключе вне секции
     */
    static ThresholdStore parse(const std::string& text, bool strict_mode = false);

    /**
     * @brief Чтение порогов из файла
     * @throws std::runtime_error если файл отсутствует или не читается
     */
    static ThresholdStore read_from_file(const std::string& filename, bool strict_mode = false);

    /**
     * @brief Запись порогов в файл в том же формате
     * @throws std::runtime_error при ошибке записи
     */
    void write_to_file(const std::string& filename) const;

    // ============== Доступ к значениям ==============

    bool has_category(const std::string& category) const;
    bool has_key(const std::string& category, const std::string& key) const;

    /**
     * @brief Категория целиком
     * @throws ConfigurationError если категории нет
     */
    const Category& category(const std::string& category) const;

    /**
     * @throws ConfigurationError если нет категории или ключа
     */
    const ThresholdValue& value(const std::string& category, const std::string& key) const;

    // Целое или вещественное значение как double
    double get_number(const std::string& category, const std::string& key) const;

    // Целое значение; вещественное допускается только без дробной части
    std::int64_t get_int(const std::string& category, const std::string& key) const;

    const std::string& get_string(const std::string& category, const std::string& key) const;

    std::vector<std::string> category_names() const;

    // Предупреждения, накопленные при разборе
    const std::vector<std::string>& warnings() const { return warnings_; }

    /**
     * @brief Сериализация в текст конфигурации
     */
    std::string format() const;

    // Программное заполнение (для построения хранилища без файла)
    void set(const std::string& category, const std::string& key, const ThresholdValue& value);

private:
    std::map<std::string, Category> categories_;
    std::vector<std::string> warnings_;

    static bool parse_section_header(const std::string& line, std::string& section);
    static bool parse_key_value(const std::string& line, std::string& key, std::string& value);
};

} // namespace exp_quality

#endif // EXPERIMENT_QUALITY_THRESHOLD_STORE_H
