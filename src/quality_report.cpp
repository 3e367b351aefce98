#include "experiment_quality/quality_report.h"
#include "experiment_quality/quality_diagnostics.h"
#include "experiment_quality/parameter_recovery.h"
#include "experiment_quality/experiment_loader.h"
#include <filesystem>
#include <iomanip>
#include <set>
#include <sstream>

namespace exp_quality {

namespace fs = std::filesystem;

// ============== ExperimentQualityReport ==============

bool ExperimentQualityReport::has_problems() const {
    if (l2_quality && *l2_quality == L2Quality::POOR) {
        return true;
    }
    if (stagnation && stagnation->is_stagnant) {
        return true;
    }
    if (objective_distribution && objective_distribution->quality == DistributionQuality::POOR) {
        return true;
    }
    return false;
}

std::optional<double> ExperimentQualityReport::overall_improvement() const {
    if (l2_by_degree.size() < 2) {
        return std::nullopt;
    }
    double first_l2 = l2_by_degree.begin()->second;
    double last_l2 = l2_by_degree.rbegin()->second;
    if (last_l2 == 0.0) {
        return std::nullopt;
    }
    return first_l2 / last_l2;
}

std::string ExperimentQualityReport::format() const {
    std::ostringstream oss;

    oss << "=== EXPERIMENT QUALITY REPORT ===\n";
    if (!experiment_path.empty()) {
        oss << "Experiment: " << experiment_path << "\n";
    }
    oss << "Dimension: " << dimension << "\n\n";

    // L2-норма
    oss << "L2 NORM QUALITY\n";
    if (l2_quality && final_l2_norm && final_degree) {
        oss << "  Quality: " << to_string(*l2_quality) << "\n";
        oss << "  Final L2 norm (degree " << *final_degree << "): "
            << std::setprecision(6) << *final_l2_norm << "\n";
        oss << "  Threshold for " << dimension << "D: " << l2_threshold << "\n";
    } else {
        oss << "  No L2 norm data available\n";
    }

    // Сходимость
    oss << "\nCONVERGENCE\n";
    if (!l2_by_degree.empty()) {
        oss << "  " << std::left << std::setw(8) << "Degree" << std::setw(16) << "L2 norm"
            << "Factor\n" << std::right;
        size_t step = 0;
        for (auto it = l2_by_degree.begin(); it != l2_by_degree.end(); ++it) {
            oss << "  " << std::left << std::setw(8) << it->first
                << std::setw(16) << std::scientific << std::setprecision(4) << it->second;
            if (it != l2_by_degree.begin() && stagnation && step < stagnation->improvement_factors.size()) {
                oss << std::fixed << std::setprecision(4) << stagnation->improvement_factors[step];
                step++;
            } else {
                oss << "-";
            }
            oss << std::right << std::defaultfloat << "\n";
        }
    }
    if (stagnation) {
        if (stagnation->is_stagnant) {
            oss << "  Status: STAGNANT since degree " << stagnation->stagnation_start_degree.value_or(0)
                << " (" << stagnation->stagnant_count << " consecutive steps)\n";
        } else {
            oss << "  Status: improving";
            if (stagnation->stagnant_count > 0) {
                oss << " (" << stagnation->stagnant_count << " slow steps at the end)";
            }
            oss << "\n";
        }
        if (auto improvement = overall_improvement()) {
            oss << "  Overall: " << std::fixed << std::setprecision(2) << *improvement
                << "x improvement\n" << std::defaultfloat;
        }
    } else {
        oss << "  Not enough degrees for stagnation analysis\n";
    }

    // Распределение значений целевой функции
    oss << "\nOBJECTIVE DISTRIBUTION\n";
    if (objective_distribution) {
        const ObjectiveDistributionResult& d = *objective_distribution;
        oss << "  Quality: " << to_string(d.quality) << "\n";
        if (d.quality != DistributionQuality::INSUFFICIENT_DATA) {
            oss << "  Q1 = " << std::setprecision(6) << d.q1 << ", Q3 = " << d.q3
                << ", IQR = " << d.iqr << "\n";
            oss << "  Outliers: " << d.num_outliers << " (" << std::fixed << std::setprecision(1)
                << 100.0 * d.outlier_fraction << "%)\n" << std::defaultfloat;
        }
    } else {
        oss << "  No objective values available\n";
    }

    // Восстановление параметров
    oss << "\nPARAMETER RECOVERY\n";
    if (!has_ground_truth) {
        oss << "  No ground truth (p_true) for this experiment\n";
    } else if (recovery_rows.empty()) {
        oss << "  No critical point data\n";
    } else {
        oss << "  Recovery threshold: distance < " << std::setprecision(6) << recovery_threshold << "\n";
        oss << "  " << std::left << std::setw(8) << "Degree" << std::setw(8) << "#CPs"
            << std::setw(14) << "Min dist" << std::setw(14) << "Mean dist" << "Recoveries\n";
        for (const auto& row : recovery_rows) {
            oss << "  " << std::setw(8) << row.degree << std::setw(8) << row.num_critical_points
                << std::scientific << std::setprecision(4)
                << std::setw(14) << row.min_distance << std::setw(14) << row.mean_distance
                << std::defaultfloat << row.num_recoveries << "\n";
        }
        oss << std::right;
        if (auto best = best_recovery_row(recovery_rows)) {
            oss << "  Best recovery count: " << best->num_recoveries
                << " (at degree " << best->degree << ")\n";
        }
    }

    if (!warnings.empty()) {
        oss << "\nWarnings (" << warnings.size() << "):\n";
        for (size_t i = 0; i < warnings.size(); ++i) {
            oss << "  " << (i + 1) << ". " << warnings[i] << "\n";
        }
    }

    return oss.str();
}

// ============== QualityAnalyzer ==============

ExperimentQualityReport QualityAnalyzer::analyze(const std::vector<DegreeSummary>& summaries, int dimension) const {
    ExperimentQualityReport report;
    report.dimension = dimension;

    std::vector<double> best_values;
    for (const auto& summary : summaries) {
        if (summary.l2_norm) {
            report.l2_by_degree[summary.degree] = *summary.l2_norm;
        }
        if (summary.best_value) {
            best_values.push_back(*summary.best_value);
        }
    }

    if (!report.l2_by_degree.empty()) {
        const auto& last = *report.l2_by_degree.rbegin();
        report.final_degree = last.first;
        report.final_l2_norm = last.second;
        report.l2_threshold = l2_threshold_for_dimension(dimension, thresholds_);
        report.l2_quality = check_l2_quality(last.second, dimension, thresholds_);
    } else {
        report.warnings.push_back("No L2 norm data available");
    }

    if (report.l2_by_degree.size() >= 2) {
        try {
            report.stagnation = detect_stagnation(report.l2_by_degree, thresholds_);
        } catch (const std::invalid_argument& e) {
            report.warnings.push_back(std::string("Stagnation analysis skipped: ") + e.what());
        }
    }

    if (!best_values.empty()) {
        report.objective_distribution = check_objective_distribution_quality(best_values, thresholds_);
    }

    return report;
}

ExperimentQualityReport QualityAnalyzer::analyze_experiment(const std::string& experiment_path) const {
    std::vector<std::string> warnings;

    // Конфигурация эксперимента
    std::optional<ExperimentConfig> config;
    if (fs::is_regular_file(fs::path(experiment_path) / ExperimentLoader::CONFIG_FILE)) {
        config = ExperimentLoader::load_experiment_config(experiment_path);
    } else {
        warnings.push_back("No experiment_config.json found");
    }

    int dimension = DEFAULT_DIMENSION;
    if (config && config->dimension) {
        dimension = *config->dimension;
    } else if (config && config->p_true) {
        dimension = static_cast<int>(config->p_true->size());
    } else {
        warnings.push_back("Dimension unknown, assuming " + std::to_string(DEFAULT_DIMENSION));
    }

    // Сводка по степеням
    std::vector<DegreeSummary> summaries;
    if (fs::is_regular_file(fs::path(experiment_path) / ExperimentLoader::RESULTS_SUMMARY_FILE)) {
        summaries = ExperimentLoader::load_results_summary(experiment_path);
    } else {
        warnings.push_back("No results_summary.json found");
    }

    ExperimentQualityReport report = analyze(summaries, dimension);
    report.experiment_path = experiment_path;
    warnings.insert(warnings.end(), report.warnings.begin(), report.warnings.end());
    report.warnings = std::move(warnings);

    report.has_ground_truth = config && config->p_true;
    if (report.has_ground_truth) {
        add_recovery_table(report, experiment_path, *config->p_true, summaries);
    }

    return report;
}

void QualityAnalyzer::add_recovery_table(ExperimentQualityReport& report,
                                         const std::string& experiment_path,
                                         const Eigen::VectorXd& p_true,
                                         const std::vector<DegreeSummary>& summaries) const {
    if (!thresholds_.has_key(threshold_keys::PARAMETER_RECOVERY, threshold_keys::PARAM_DISTANCE)) {
        report.warnings.push_back("No parameter_recovery.param_distance_threshold configured; recovery table skipped");
        return;
    }
    report.recovery_threshold = thresholds_.get_number(threshold_keys::PARAMETER_RECOVERY,
                                                       threshold_keys::PARAM_DISTANCE);

    // Степени из сводки и из найденных в каталоге файлов точек
    std::set<int> degrees;
    for (const auto& summary : summaries) {
        degrees.insert(summary.degree);
    }
    for (int degree : ExperimentLoader::discover_degrees(experiment_path)) {
        degrees.insert(degree);
    }

    for (int degree : degrees) {
        if (!fs::is_regular_file(ExperimentLoader::raw_critical_points_path(experiment_path, degree)) &&
            !fs::is_regular_file(ExperimentLoader::legacy_critical_points_path(experiment_path, degree))) {
            report.warnings.push_back("No critical points file for degree " + std::to_string(degree));
            continue;
        }

        try {
            std::vector<RecoveryTableRow> rows =
                generate_parameter_recovery_table(experiment_path, p_true, {degree}, report.recovery_threshold);
            report.recovery_rows.insert(report.recovery_rows.end(), rows.begin(), rows.end());
        } catch (const DimensionMismatch&) {
            throw;
        } catch (const std::invalid_argument& e) {
            report.warnings.push_back("Degree " + std::to_string(degree) + ": " + e.what());
        }
    }
}

} // namespace exp_quality
