#ifndef EXPERIMENT_QUALITY_QUALITY_REPORT_H
#define EXPERIMENT_QUALITY_QUALITY_REPORT_H

#include "types.h"
#include "threshold_store.h"
#include <Eigen/Dense>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace exp_quality {

/**
 * @brief Отчёт о качестве одного эксперимента
 */
struct ExperimentQualityReport {
    std::string experiment_path;
    int dimension;

    // L2-норма на последней степени
    std::optional<int> final_degree;
    std::optional<double> final_l2_norm;
    std::optional<L2Quality> l2_quality;
    double l2_threshold;

    std::map<int, double> l2_by_degree;
    std::optional<StagnationResult> stagnation;       // при ≥ 2 степенях с L2
    std::optional<ObjectiveDistributionResult> objective_distribution;

    // Восстановление параметров (при наличии p_true)
    bool has_ground_truth;
    double recovery_threshold;
    std::vector<RecoveryTableRow> recovery_rows;

    std::vector<std::string> warnings;

    ExperimentQualityReport()
        : dimension(0), l2_threshold(0.0)
        , has_ground_truth(false), recovery_threshold(0.0) {}

    /**
     * @brief Форматирование отчёта
     */
    std::string format() const;

    bool has_warnings() const { return !warnings.empty(); }

    /**
     * @brief Есть ли замечания к качеству
     *
     * Плохая L2-норма, застой сходимости или избыток выбросов.
     */
    bool has_problems() const;

    // Отношение L2 первой степени к L2 последней
    std::optional<double> overall_improvement() const;
};

/**
 * @brief Построитель отчётов о качестве экспериментов
 *
 * Хранит ссылку на пороги; пороги должны пережить анализатор.
 */
class QualityAnalyzer {
public:
    // Размерность, если конфигурация эксперимента её не содержит
    static constexpr int DEFAULT_DIMENSION = 4;

    explicit QualityAnalyzer(const ThresholdStore& thresholds)
        : thresholds_(thresholds) {}
    // Временное хранилище порогов не переживёт анализатор
    QualityAnalyzer(ThresholdStore&&) = delete;

    /**
     * @brief Анализ каталога эксперимента
     *
     * Читает experiment_config.json, results_summary.json и файлы
     * критических точек. Таблица восстановления строится по степеням
     * из сводки и по степеням, найденным в именах файлов точек. Отсутствие сводки или файлов точек отражается
     * в предупреждениях отчёта.
     *
     * @throws ConfigurationError при отсутствии нужных категорий порогов
     */
    ExperimentQualityReport analyze_experiment(const std::string& experiment_path) const;

    /**
     * @brief Анализ по данным в памяти
     * @param summaries сводка по степеням
     * @param dimension размерность задачи
     */
    ExperimentQualityReport analyze(const std::vector<DegreeSummary>& summaries, int dimension) const;

    const ThresholdStore& thresholds() const { return thresholds_; }

private:
    const ThresholdStore& thresholds_;

    void add_recovery_table(ExperimentQualityReport& report,
                            const std::string& experiment_path,
                            const Eigen::VectorXd& p_true,
                            const std::vector<DegreeSummary>& summaries) const;
};

} // namespace exp_quality

#endif // EXPERIMENT_QUALITY_QUALITY_REPORT_H
