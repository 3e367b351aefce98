#include "experiment_quality/quality_diagnostics.h"
#include <algorithm>
#include <cmath>
#include <iterator>
#include <stdexcept>

namespace exp_quality {

std::string to_string(L2Quality quality) {
    switch (quality) {
        case L2Quality::EXCELLENT: return "excellent";
        case L2Quality::GOOD:      return "good";
        case L2Quality::FAIR:      return "fair";
        case L2Quality::POOR:      return "poor";
    }
    return "unknown";
}

std::string to_string(DistributionQuality quality) {
    switch (quality) {
        case DistributionQuality::GOOD:              return "good";
        case DistributionQuality::POOR:              return "poor";
        case DistributionQuality::INSUFFICIENT_DATA: return "insufficient_data";
    }
    return "unknown";
}

// ============== Качество L2-нормы ==============

double l2_threshold_for_dimension(int dimension, const ThresholdStore& thresholds) {
    const std::string dim_key = "dim_" + std::to_string(dimension);
    if (thresholds.has_key(threshold_keys::L2_NORM, dim_key)) {
        return thresholds.get_number(threshold_keys::L2_NORM, dim_key);
    }
    return thresholds.get_number(threshold_keys::L2_NORM, threshold_keys::L2_DEFAULT);
}

L2Quality check_l2_quality(double l2_norm, int dimension, const ThresholdStore& thresholds) {
    const double threshold = l2_threshold_for_dimension(dimension, thresholds);

    if (l2_norm < 0.5 * threshold) {
        return L2Quality::EXCELLENT;
    } else if (l2_norm < 1.0 * threshold) {
        return L2Quality::GOOD;
    } else if (l2_norm < 2.0 * threshold) {
        return L2Quality::FAIR;
    }
    return L2Quality::POOR;
}

// ============== Застой сходимости ==============

StagnationResult detect_stagnation(const std::map<int, double>& errors_by_degree,
                                   const ThresholdStore& thresholds) {
    const double min_improvement_factor =
        thresholds.get_number(threshold_keys::CONVERGENCE, threshold_keys::MIN_IMPROVEMENT_FACTOR);
    const double stagnation_tolerance =
        thresholds.get_number(threshold_keys::CONVERGENCE, threshold_keys::STAGNATION_TOLERANCE);
    const double absolute_threshold =
        thresholds.get_number(threshold_keys::CONVERGENCE, threshold_keys::ABSOLUTE_IMPROVEMENT);

    StagnationResult result;
    if (errors_by_degree.size() < 2) {
        return result;
    }

    result.improvement_factors.reserve(errors_by_degree.size() - 1);

    // std::map упорядочен по степени
    auto prev = errors_by_degree.begin();
    for (auto curr = std::next(prev); curr != errors_by_degree.end(); prev = curr, ++curr) {
        const double prev_error = prev->second;
        const double curr_error = curr->second;

        // Уже сошлось, не считается застоем
        if (curr_error < absolute_threshold) {
            result.improvement_factors.push_back(0.0);
            result.stagnant_count = 0;
            result.stagnation_start_degree.reset();
            continue;
        }

        if (prev_error == 0.0) {
            throw std::invalid_argument("Cannot compute improvement factor at degree " +
                                        std::to_string(curr->first) +
                                        ": error at degree " + std::to_string(prev->first) + " is zero");
        }

        const double factor = curr_error / prev_error;
        result.improvement_factors.push_back(factor);

        if (factor >= min_improvement_factor) {
            result.stagnant_count++;
            if (!result.stagnation_start_degree) {
                result.stagnation_start_degree = curr->first;
            }
        } else {
            result.stagnant_count = 0;
            result.stagnation_start_degree.reset();
        }
    }

    result.is_stagnant = result.stagnant_count >= stagnation_tolerance;
    return result;
}

StagnationResult detect_stagnation(const std::unordered_map<int, double>& errors_by_degree,
                                   const ThresholdStore& thresholds) {
    std::map<int, double> ordered(errors_by_degree.begin(), errors_by_degree.end());
    return detect_stagnation(ordered, thresholds);
}

// ============== Распределение значений целевой функции ==============

double quantile_sorted(const std::vector<double>& sorted_values, double p) {
    if (sorted_values.empty()) {
        throw std::invalid_argument("Quantile of empty sample");
    }
    if (!(p >= 0.0 && p <= 1.0)) {
        throw std::invalid_argument("Quantile probability must be in [0, 1]");
    }

    const size_t n = sorted_values.size();
    const double h = static_cast<double>(n - 1) * p;
    const size_t lo = static_cast<size_t>(std::floor(h));
    const size_t hi = std::min(lo + 1, n - 1);
    const double frac = h - static_cast<double>(lo);

    return sorted_values[lo] + frac * (sorted_values[hi] - sorted_values[lo]);
}

ObjectiveDistributionResult check_objective_distribution_quality(const std::vector<double>& objectives,
                                                                 const ThresholdStore& thresholds) {
    const double min_points =
        thresholds.get_number(threshold_keys::OBJECTIVE_DISTRIBUTION, threshold_keys::MIN_POINTS);
    const double max_outlier_fraction =
        thresholds.get_number(threshold_keys::OBJECTIVE_DISTRIBUTION, threshold_keys::MAX_OUTLIER_FRACTION);
    const double iqr_multiplier =
        thresholds.get_number(threshold_keys::OBJECTIVE_DISTRIBUTION, threshold_keys::IQR_MULTIPLIER);

    ObjectiveDistributionResult result;
    const size_t n = objectives.size();

    if (static_cast<double>(n) < min_points || n == 0) {
        return result;
    }

    std::vector<double> sorted_objs = objectives;
    std::sort(sorted_objs.begin(), sorted_objs.end());

    result.q1 = quantile_sorted(sorted_objs, 0.25);
    result.q3 = quantile_sorted(sorted_objs, 0.75);
    result.iqr = result.q3 - result.q1;

    const double lower_bound = result.q1 - iqr_multiplier * result.iqr;
    const double upper_bound = result.q3 + iqr_multiplier * result.iqr;

    result.num_outliers = static_cast<int>(std::count_if(objectives.begin(), objectives.end(),
        [lower_bound, upper_bound](double x) { return x < lower_bound || x > upper_bound; }));
    result.outlier_fraction = static_cast<double>(result.num_outliers) / static_cast<double>(n);

    result.has_outliers = result.num_outliers > 0;
    result.quality = result.outlier_fraction <= max_outlier_fraction
        ? DistributionQuality::GOOD
        : DistributionQuality::POOR;

    return result;
}

} // namespace exp_quality
