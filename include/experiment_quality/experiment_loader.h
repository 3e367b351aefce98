#ifndef EXPERIMENT_QUALITY_EXPERIMENT_LOADER_H
#define EXPERIMENT_QUALITY_EXPERIMENT_LOADER_H

#include "types.h"
#include <Eigen/Dense>
#include <yaml-cpp/yaml.h>
#include <optional>
#include <string>
#include <vector>

namespace exp_quality {

/**
 * @brief Конфигурация эксперимента (experiment_config.json)
 *
 * JSON читается через yaml-cpp. Поля dimension, basis и p_true ищутся
 * на верхнем уровне документа либо на один уровень глубже.
 */
struct ExperimentConfig {
    std::string path;                      // путь к прочитанному файлу
    YAML::Node document;                   // исходный документ
    std::optional<int> dimension;
    std::optional<std::string> basis;
    std::optional<Eigen::VectorXd> p_true;
};

/**
 * @brief Формат файла критических точек
 */
enum class CriticalPointFormat {
    RAW,     // critical_points_raw_deg_N.csv: [index,] p1..pN, objective
    LEGACY   // critical_points_deg_N.csv: x1..xN, z
};

/**
 * @brief Критические точки одной степени полинома
 */
struct CriticalPointTable {
    std::string source_path;
    CriticalPointFormat format;
    std::vector<std::string> coordinate_columns;  // p1..pN или x1..xN
    Eigen::MatrixXd coordinates;                  // по строке на точку
    std::vector<double> objectives;               // пусто, если столбца нет

    CriticalPointTable() : format(CriticalPointFormat::RAW) {}

    Eigen::Index num_points() const { return coordinates.rows(); }
    Eigen::Index dimension() const { return coordinates.cols(); }
    bool has_objectives() const { return !objectives.empty(); }
};

class ExperimentLoader {
public:
    static constexpr const char* CONFIG_FILE = "experiment_config.json";
    static constexpr const char* RESULTS_SUMMARY_FILE = "results_summary.json";

    /**
     * @brief Чтение experiment_config.json из каталога эксперимента
     * @throws std::runtime_error если файла нет или он некорректен
     */
    static ExperimentConfig load_experiment_config(const std::string& experiment_path);

    /**
     * @brief Истинные параметры из загруженного документа конфигурации
     *
     * Ищется p_true на верхнем уровне, затем внутри вложенных объектов.
     * Значение null считается отсутствующим.
     *
     * @throws std::runtime_error если p_true не является списком чисел
     */
    static std::optional<Eigen::VectorXd> extract_true_parameters(const YAML::Node& document);

    /**
     * @brief Проверка наличия истинных параметров у эксперимента
     *
     * Любая ошибка загрузки конфигурации трактуется как отсутствие p_true.
     */
    static bool has_ground_truth(const std::string& experiment_path);

    /**
     * @brief Загрузка критических точек для степени
     *
     * Сначала ищется critical_points_raw_deg_<d>.csv, затем
     * critical_points_deg_<d>.csv.
     *
     * @throws std::runtime_error если нет ни одного файла или данные некорректны
     */
    static CriticalPointTable load_critical_points_for_degree(const std::string& experiment_path, int degree);

    /**
     * @brief Чтение CSV файла критических точек заданного формата
     */
    static CriticalPointTable read_critical_points_csv(const std::string& filename, CriticalPointFormat format);

    /**
     * @brief Чтение results_summary.json
     *
     * Корень — список объектов по степеням, либо объект со списком
     * в поле "results" или "degrees". Строки упорядочены по степени.
     *
     * @throws std::runtime_error если файла нет или он некорректен
     */
    static std::vector<DegreeSummary> load_results_summary(const std::string& experiment_path);

    /**
     * @brief Степени, для которых в каталоге есть файлы критических точек
     *
     * Учитываются оба формата имени (raw и legacy). Результат отсортирован
     * по возрастанию; для несуществующего каталога список пуст.
     */
    static std::vector<int> discover_degrees(const std::string& experiment_path);

    // Пути к файлам эксперимента
    static std::string raw_critical_points_path(const std::string& experiment_path, int degree);
    static std::string legacy_critical_points_path(const std::string& experiment_path, int degree);

private:
    static constexpr size_t MAX_COLUMN_INDEX_DIGITS = 9;

    static char detect_csv_delimiter(const std::string& header_line);
    static bool has_csv_header(const std::string& line, char delimiter);
    static std::vector<std::string> split_csv_line(const std::string& line, char delimiter);
    static bool parse_indexed_column(const std::string& name, char prefix, int& index);
    static std::optional<YAML::Node> find_field(const YAML::Node& document, const std::string& key);
    static DegreeSummary parse_degree_entry(const YAML::Node& entry, const std::string& filename);
};

// Краткие формы вызова без имени класса
inline ExperimentConfig load_experiment_config(const std::string& experiment_path) {
    return ExperimentLoader::load_experiment_config(experiment_path);
}

inline bool has_ground_truth(const std::string& experiment_path) {
    return ExperimentLoader::has_ground_truth(experiment_path);
}

inline CriticalPointTable load_critical_points_for_degree(const std::string& experiment_path, int degree) {
    return ExperimentLoader::load_critical_points_for_degree(experiment_path, degree);
}

inline std::vector<DegreeSummary> load_results_summary(const std::string& experiment_path) {
    return ExperimentLoader::load_results_summary(experiment_path);
}

} // namespace exp_quality

#endif // EXPERIMENT_QUALITY_EXPERIMENT_LOADER_H
