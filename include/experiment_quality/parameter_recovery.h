#ifndef EXPERIMENT_QUALITY_PARAMETER_RECOVERY_H
#define EXPERIMENT_QUALITY_PARAMETER_RECOVERY_H

#include "types.h"
#include <Eigen/Dense>
#include <optional>
#include <string>
#include <vector>

namespace exp_quality {

/**
 * @brief Евклидово расстояние между найденным и истинным векторами параметров
 * @param p_found найденный вектор (например, координаты критической точки)
 * @param p_true истинный вектор параметров
 * @return ||p_found - p_true||
 * @throws DimensionMismatch при разной длине векторов
 */
double param_distance(const Eigen::VectorXd& p_found, const Eigen::VectorXd& p_true);
double param_distance(const std::vector<double>& p_found, const std::vector<double>& p_true);

/**
 * @brief Статистика восстановления параметров по набору критических точек
 *
 * Для каждой точки вычисляется расстояние до p_true, затем агрегируются
 * минимум, среднее и число точек с расстоянием строго меньше порога.
 *
 * @param points координаты точек по строкам (cols == p_true.size())
 * @param p_true истинный вектор параметров
 * @param recovery_threshold порог расстояния для "восстановленной" точки
 * @throws std::invalid_argument если точек нет
 * @throws DimensionMismatch при несовпадении размерности
 */
RecoveryStats compute_recovery_stats(const Eigen::MatrixXd& points,
                                     const Eigen::VectorXd& p_true,
                                     double recovery_threshold);

RecoveryStats compute_recovery_stats(const std::vector<std::vector<double>>& points,
                                     const std::vector<double>& p_true,
                                     double recovery_threshold);

/**
 * @brief Таблица восстановления параметров по степеням полинома
 *
 * Для каждой степени загружает файл критических точек эксперимента
 * и вычисляет статистику восстановления. Порядок строк совпадает
 * с порядком степеней на входе.
 *
 * @throws std::runtime_error если файл критических точек не найден
 */
std::vector<RecoveryTableRow> generate_parameter_recovery_table(const std::string& experiment_path,
                                                                const Eigen::VectorXd& p_true,
                                                                const std::vector<int>& degrees,
                                                                double recovery_threshold);

// Строка с наибольшим числом восстановлений (при равенстве с меньшим min_distance)
std::optional<RecoveryTableRow> best_recovery_row(const std::vector<RecoveryTableRow>& rows);

} // namespace exp_quality

#endif // EXPERIMENT_QUALITY_PARAMETER_RECOVERY_H
