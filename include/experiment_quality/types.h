#ifndef EXPERIMENT_QUALITY_TYPES_H
#define EXPERIMENT_QUALITY_TYPES_H

#include <vector>
#include <string>
#include <optional>
#include <stdexcept>

namespace exp_quality {

// ============== Исключения ==============

/**
 * @brief Ошибка конфигурации порогов
 *
 * Отсутствующая категория или ключ, значение неверного типа,
 * ключ вне секции в строгом режиме.
 */
class ConfigurationError : public std::runtime_error {
public:
    explicit ConfigurationError(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * @brief Несовпадение размерностей векторов параметров
 */
class DimensionMismatch : public std::invalid_argument {
public:
    explicit DimensionMismatch(const std::string& message)
        : std::invalid_argument(message) {}
};

// ============== Метки качества ==============

/**
 * @brief Градация качества по L2-норме ошибки аппроксимации
 *
 * Порядок значений соответствует ухудшению качества.
 */
enum class L2Quality {
    EXCELLENT = 0,  // l2 < 0.5 * t
    GOOD,           // l2 < 1.0 * t
    FAIR,           // l2 < 2.0 * t
    POOR            // l2 >= 2.0 * t
};

/**
 * @brief Качество распределения значений целевой функции
 */
enum class DistributionQuality {
    GOOD = 0,           // доля выбросов не превышает допустимую
    POOR,               // слишком много выбросов
    INSUFFICIENT_DATA   // недостаточно точек для оценки
};

std::string to_string(L2Quality quality);
std::string to_string(DistributionQuality quality);

// ============== Результаты анализа ==============

/**
 * @brief Статистика восстановления параметров
 */
struct RecoveryStats {
    double min_distance;                // минимальное расстояние до p_true
    double mean_distance;               // среднее расстояние до p_true
    int num_recoveries;                 // число точек с d < порога
    std::vector<double> all_distances;  // расстояния в порядке входных точек

    RecoveryStats()
        : min_distance(0.0), mean_distance(0.0), num_recoveries(0) {}
};

/**
 * @brief Результат обнаружения застоя сходимости по степеням полинома
 */
struct StagnationResult {
    bool is_stagnant;
    std::optional<int> stagnation_start_degree;  // начало текущей серии застоя
    int stagnant_count;                          // длина серии на конец прохода
    std::vector<double> improvement_factors;     // e[curr] / e[prev] по парам степеней

    StagnationResult()
        : is_stagnant(false), stagnant_count(0) {}
};

/**
 * @brief Результат проверки распределения значений целевой функции
 */
struct ObjectiveDistributionResult {
    bool has_outliers;
    int num_outliers;
    double outlier_fraction;     // num_outliers / n
    DistributionQuality quality;
    double q1;
    double q3;
    double iqr;                  // q3 - q1

    ObjectiveDistributionResult()
        : has_outliers(false), num_outliers(0), outlier_fraction(0.0)
        , quality(DistributionQuality::INSUFFICIENT_DATA)
        , q1(0.0), q3(0.0), iqr(0.0) {}
};

/**
 * @brief Строка таблицы восстановления параметров для одной степени
 */
struct RecoveryTableRow {
    int degree;
    int num_critical_points;
    double min_distance;
    double mean_distance;
    int num_recoveries;

    RecoveryTableRow()
        : degree(0), num_critical_points(0)
        , min_distance(0.0), mean_distance(0.0), num_recoveries(0) {}
};

/**
 * @brief Сводка эксперимента для одной степени (results_summary.json)
 */
struct DegreeSummary {
    int degree;
    std::optional<double> l2_norm;
    std::optional<double> best_value;
    std::optional<int> critical_points;

    DegreeSummary() : degree(0) {}
};

} // namespace exp_quality

#endif // EXPERIMENT_QUALITY_TYPES_H
