#ifndef EXPERIMENT_QUALITY_QUALITY_DIAGNOSTICS_H
#define EXPERIMENT_QUALITY_QUALITY_DIAGNOSTICS_H

#include "types.h"
#include "threshold_store.h"
#include <map>
#include <unordered_map>
#include <vector>

namespace exp_quality {

// Имена категорий и ключей в файле порогов
namespace threshold_keys {
    constexpr const char* L2_NORM = "l2_norm_thresholds";
    constexpr const char* L2_DEFAULT = "default";
    constexpr const char* PARAMETER_RECOVERY = "parameter_recovery";
    constexpr const char* PARAM_DISTANCE = "param_distance_threshold";
    constexpr const char* CONVERGENCE = "convergence";
    constexpr const char* MIN_IMPROVEMENT_FACTOR = "min_improvement_factor";
    constexpr const char* STAGNATION_TOLERANCE = "stagnation_tolerance";
    constexpr const char* ABSOLUTE_IMPROVEMENT = "absolute_improvement_threshold";
    constexpr const char* OBJECTIVE_DISTRIBUTION = "objective_distribution";
    constexpr const char* MIN_POINTS = "min_points_for_distribution_check";
    constexpr const char* MAX_OUTLIER_FRACTION = "max_outlier_fraction";
    constexpr const char* IQR_MULTIPLIER = "outlier_iqr_multiplier";
}

// ============== Качество L2-нормы ==============

/**
 * @brief Порог L2 для заданной размерности
 *
 * Берётся l2_norm_thresholds["dim_<dimension>"], при отсутствии —
 * l2_norm_thresholds["default"].
 *
 * @throws ConfigurationError если нет категории или значения default
 */
double l2_threshold_for_dimension(int dimension, const ThresholdStore& thresholds);

/**
 * @brief Градуированная оценка L2-нормы с учётом размерности задачи
 *
 * Первое подходящее условие:
 * - l2 < 0.5 t → EXCELLENT
 * - l2 < 1.0 t → GOOD
 * - l2 < 2.0 t → FAIR
 * - иначе → POOR
 */
L2Quality check_l2_quality(double l2_norm, int dimension, const ThresholdStore& thresholds);

// ============== Застой сходимости ==============

/**
 * @brief Обнаружение застоя сходимости по степеням полинома
 *
 * Степени обходятся строго по возрастанию. Для каждой пары (prev, curr):
 * - если e[curr] < absolute_improvement_threshold, фактор 0.0 и сброс серии;
 * - иначе фактор e[curr]/e[prev]; при факторе ≥ min_improvement_factor
 *   серия застоя продолжается (начало фиксируется на первой степени серии),
 *   иначе серия сбрасывается.
 * Застой: длина серии на конец прохода ≥ stagnation_tolerance.
 *
 * @param errors_by_degree степень → ошибка (L2)
 * @throws ConfigurationError при отсутствии порогов [convergence]
 * @throws std::invalid_argument при нулевой предыдущей ошибке
 */
StagnationResult detect_stagnation(const std::map<int, double>& errors_by_degree,
                                   const ThresholdStore& thresholds);

StagnationResult detect_stagnation(const std::unordered_map<int, double>& errors_by_degree,
                                   const ThresholdStore& thresholds);

// ============== Распределение значений целевой функции ==============

/**
 * @brief Квантиль отсортированной выборки с линейной интерполяцией
 *
 * h = (n - 1) p, значение интерполируется между соседними порядковыми
 * статистиками.
 *
 * @param sorted_values выборка, отсортированная по возрастанию
 * @param p вероятность в [0, 1]
 * @throws std::invalid_argument для пустой выборки или p вне [0, 1]
 */
double quantile_sorted(const std::vector<double>& sorted_values, double p);

/**
 * @brief Проверка распределения значений целевой функции на выбросы (IQR)
 *
 * Выбросы — значения строго вне [q1 - k·iqr, q3 + k·iqr].
 * При n < min_points_for_distribution_check возвращается INSUFFICIENT_DATA.
 */
ObjectiveDistributionResult check_objective_distribution_quality(const std::vector<double>& objectives,
                                                                 const ThresholdStore& thresholds);

} // namespace exp_quality

#endif // EXPERIMENT_QUALITY_QUALITY_DIAGNOSTICS_H
