#include "experiment_quality/parameter_recovery.h"
#include "experiment_quality/experiment_loader.h"
#include <algorithm>
#include <stdexcept>

namespace exp_quality {

double param_distance(const Eigen::VectorXd& p_found, const Eigen::VectorXd& p_true) {
    if (p_found.size() != p_true.size()) {
        throw DimensionMismatch("p_found and p_true must have same dimension (" +
                                std::to_string(p_found.size()) + " vs " +
                                std::to_string(p_true.size()) + ")");
    }
    return (p_found - p_true).norm();
}

double param_distance(const std::vector<double>& p_found, const std::vector<double>& p_true) {
    Eigen::Map<const Eigen::VectorXd> found(p_found.data(), static_cast<Eigen::Index>(p_found.size()));
    Eigen::Map<const Eigen::VectorXd> truth(p_true.data(), static_cast<Eigen::Index>(p_true.size()));
    return param_distance(Eigen::VectorXd(found), Eigen::VectorXd(truth));
}

RecoveryStats compute_recovery_stats(const Eigen::MatrixXd& points,
                                     const Eigen::VectorXd& p_true,
                                     double recovery_threshold) {
    if (points.rows() == 0) {
        throw std::invalid_argument("Cannot compute recovery statistics: no critical points");
    }
    if (points.cols() != p_true.size()) {
        throw DimensionMismatch("Critical points have dimension " + std::to_string(points.cols()) +
                                ", p_true has dimension " + std::to_string(p_true.size()));
    }

    RecoveryStats stats;
    stats.all_distances.reserve(static_cast<size_t>(points.rows()));

    double sum = 0.0;
    for (Eigen::Index i = 0; i < points.rows(); ++i) {
        double d = param_distance(Eigen::VectorXd(points.row(i).transpose()), p_true);
        stats.all_distances.push_back(d);
        sum += d;
        if (d < recovery_threshold) {
            stats.num_recoveries++;
        }
    }

    stats.min_distance = *std::min_element(stats.all_distances.begin(), stats.all_distances.end());
    stats.mean_distance = sum / static_cast<double>(stats.all_distances.size());
    return stats;
}

RecoveryStats compute_recovery_stats(const std::vector<std::vector<double>>& points,
                                     const std::vector<double>& p_true,
                                     double recovery_threshold) {
    if (points.empty()) {
        throw std::invalid_argument("Cannot compute recovery statistics: no critical points");
    }

    const Eigen::Index dim = static_cast<Eigen::Index>(p_true.size());
    Eigen::MatrixXd matrix(static_cast<Eigen::Index>(points.size()), dim);
    for (size_t i = 0; i < points.size(); ++i) {
        if (points[i].size() != p_true.size()) {
            throw DimensionMismatch("Critical point " + std::to_string(i) + " has dimension " +
                                    std::to_string(points[i].size()) + ", p_true has dimension " +
                                    std::to_string(p_true.size()));
        }
        for (Eigen::Index j = 0; j < dim; ++j) {
            matrix(static_cast<Eigen::Index>(i), j) = points[i][static_cast<size_t>(j)];
        }
    }

    Eigen::Map<const Eigen::VectorXd> truth(p_true.data(), dim);
    return compute_recovery_stats(matrix, Eigen::VectorXd(truth), recovery_threshold);
}

std::vector<RecoveryTableRow> generate_parameter_recovery_table(const std::string& experiment_path,
                                                                const Eigen::VectorXd& p_true,
                                                                const std::vector<int>& degrees,
                                                                double recovery_threshold) {
    std::vector<RecoveryTableRow> rows;
    rows.reserve(degrees.size());

    for (int degree : degrees) {
        CriticalPointTable table = load_critical_points_for_degree(experiment_path, degree);
        RecoveryStats stats = compute_recovery_stats(table.coordinates, p_true, recovery_threshold);

        RecoveryTableRow row;
        row.degree = degree;
        row.num_critical_points = static_cast<int>(table.num_points());
        row.min_distance = stats.min_distance;
        row.mean_distance = stats.mean_distance;
        row.num_recoveries = stats.num_recoveries;
        rows.push_back(row);
    }

    return rows;
}

std::optional<RecoveryTableRow> best_recovery_row(const std::vector<RecoveryTableRow>& rows) {
    if (rows.empty()) {
        return std::nullopt;
    }

    auto best = std::max_element(rows.begin(), rows.end(),
        [](const RecoveryTableRow& a, const RecoveryTableRow& b) {
            if (a.num_recoveries != b.num_recoveries) {
                return a.num_recoveries < b.num_recoveries;
            }
            return a.min_distance > b.min_distance;
        });
    return *best;
}

} // namespace exp_quality
