#include "experiment_quality/experiment_loader.h"
#include "text_utils.h"
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <map>
#include <regex>
#include <set>
#include <sstream>
#include <stdexcept>

namespace exp_quality {

namespace fs = std::filesystem;

// ============== Вспомогательные функции ==============

char ExperimentLoader::detect_csv_delimiter(const std::string& header_line) {
    // Разделитель заголовка: самый частый из ',', ';', '\t' (при равенстве побеждает первый)
    char best = ',';
    long best_count = -1;
    for (char candidate : {',', ';', '\t'}) {
        long count = static_cast<long>(std::count(header_line.begin(), header_line.end(), candidate));
        if (count > best_count) {
            best = candidate;
            best_count = count;
        }
    }
    return best;
}

bool ExperimentLoader::has_csv_header(const std::string& line, char delimiter) {
    std::istringstream iss(trim(line));
    std::string token;
    std::getline(iss, token, delimiter);
    token = trim(token);

    // Если первый токен не число, считаем строку заголовком
    try {
        size_t pos = 0;
        std::stod(token, &pos);
        return pos != token.size();
    } catch (const std::invalid_argument&) {
        return true;
    } catch (const std::out_of_range&) {
        return false;
    }
}

std::vector<std::string> ExperimentLoader::split_csv_line(const std::string& line, char delimiter) {
    std::vector<std::string> cells;
    std::istringstream iss(line);
    std::string cell;
    while (std::getline(iss, cell, delimiter)) {
        cell = trim(cell);
        if (cell.size() >= 2 && cell.front() == '"' && cell.back() == '"') {
            cell = cell.substr(1, cell.size() - 2);
        }
        cells.push_back(cell);
    }
    // Завершающий разделитель означает пустую последнюю ячейку
    if (!line.empty() && line.back() == delimiter) {
        cells.emplace_back();
    }
    return cells;
}

bool ExperimentLoader::parse_indexed_column(const std::string& name, char prefix, int& index) {
    if (name.size() < 2 || name[0] != prefix) {
        return false;
    }
    for (size_t i = 1; i < name.size(); ++i) {
        if (!std::isdigit(static_cast<unsigned char>(name[i]))) {
            return false;
        }
    }
    // Номер столбца должен помещаться в int
    if (name.size() - 1 > MAX_COLUMN_INDEX_DIGITS) {
        throw std::runtime_error("Column index too large: " + name);
    }
    index = std::stoi(name.substr(1));
    return index > 0;
}

std::optional<YAML::Node> ExperimentLoader::find_field(const YAML::Node& document, const std::string& key) {
    if (!document.IsMap()) {
        return std::nullopt;
    }

    if (document[key] && !document[key].IsNull()) {
        return document[key];
    }

    // Вложенный формат: { "experiment": { "p_true": [...] } }
    for (const auto& entry : document) {
        const YAML::Node& child = entry.second;
        if (child.IsMap() && child[key] && !child[key].IsNull()) {
            return child[key];
        }
    }
    return std::nullopt;
}

std::string ExperimentLoader::raw_critical_points_path(const std::string& experiment_path, int degree) {
    return (fs::path(experiment_path) / ("critical_points_raw_deg_" + std::to_string(degree) + ".csv")).string();
}

std::string ExperimentLoader::legacy_critical_points_path(const std::string& experiment_path, int degree) {
    return (fs::path(experiment_path) / ("critical_points_deg_" + std::to_string(degree) + ".csv")).string();
}

std::vector<int> ExperimentLoader::discover_degrees(const std::string& experiment_path) {
    std::vector<int> degrees;
    std::error_code ec;
    if (!fs::is_directory(experiment_path, ec)) {
        return degrees;
    }

    static const std::regex pattern(R"(critical_points_(?:raw_)?deg_(\d{1,9})\.csv)");

    std::set<int> found;
    for (const auto& entry : fs::directory_iterator(experiment_path)) {
        if (!entry.is_regular_file()) {
            continue;
        }
        const std::string name = entry.path().filename().string();
        std::smatch match;
        if (std::regex_match(name, match, pattern)) {
            found.insert(std::stoi(match[1].str()));
        }
    }

    degrees.assign(found.begin(), found.end());
    return degrees;
}

// ============== Конфигурация эксперимента ==============

ExperimentConfig ExperimentLoader::load_experiment_config(const std::string& experiment_path) {
    const std::string config_file = (fs::path(experiment_path) / CONFIG_FILE).string();
    if (!fs::is_regular_file(config_file)) {
        throw std::runtime_error("Config file not found: " + config_file);
    }

    ExperimentConfig config;
    config.path = config_file;

    try {
        config.document = YAML::LoadFile(config_file);

        if (!config.document.IsMap()) {
            throw std::runtime_error("Experiment config must be a JSON object: " + config_file);
        }

        if (auto dim = find_field(config.document, "dimension")) {
            config.dimension = dim->as<int>();
        }
        if (auto basis = find_field(config.document, "basis")) {
            config.basis = basis->as<std::string>();
        }
        config.p_true = extract_true_parameters(config.document);

    } catch (const YAML::Exception& e) {
        throw std::runtime_error("JSON parsing error in " + config_file + ": " + std::string(e.what()));
    }

    return config;
}

std::optional<Eigen::VectorXd> ExperimentLoader::extract_true_parameters(const YAML::Node& document) {
    std::optional<YAML::Node> node = find_field(document, "p_true");
    if (!node) {
        return std::nullopt;
    }

    if (!node->IsSequence()) {
        throw std::runtime_error("p_true must be a list of numbers");
    }

    Eigen::VectorXd p_true(static_cast<Eigen::Index>(node->size()));
    for (size_t i = 0; i < node->size(); ++i) {
        try {
            p_true(static_cast<Eigen::Index>(i)) = (*node)[i].as<double>();
        } catch (const YAML::Exception& e) {
            throw std::runtime_error("p_true[" + std::to_string(i) + "] is not a number: " +
                                     std::string(e.what()));
        }
    }
    return p_true;
}

bool ExperimentLoader::has_ground_truth(const std::string& experiment_path) {
    try {
        ExperimentConfig config = load_experiment_config(experiment_path);
        return config.p_true.has_value();
    } catch (const std::exception&) {
        return false;
    }
}

// ============== Критические точки ==============

CriticalPointTable ExperimentLoader::load_critical_points_for_degree(const std::string& experiment_path, int degree) {
    const std::string raw_file = raw_critical_points_path(experiment_path, degree);
    if (fs::is_regular_file(raw_file)) {
        return read_critical_points_csv(raw_file, CriticalPointFormat::RAW);
    }

    const std::string legacy_file = legacy_critical_points_path(experiment_path, degree);
    if (fs::is_regular_file(legacy_file)) {
        return read_critical_points_csv(legacy_file, CriticalPointFormat::LEGACY);
    }

    throw std::runtime_error("Critical points file not found for degree " + std::to_string(degree) +
                             ". Tried:\n  " + raw_file + "\n  " + legacy_file);
}

CriticalPointTable ExperimentLoader::read_critical_points_csv(const std::string& filename, CriticalPointFormat format) {
    std::ifstream file(filename);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open critical points CSV file: " + filename);
    }

    const char coord_prefix = format == CriticalPointFormat::RAW ? 'p' : 'x';
    const std::string objective_name = format == CriticalPointFormat::RAW ? "objective" : "z";

    CriticalPointTable table;
    table.source_path = filename;
    table.format = format;

    std::vector<int> coord_positions;   // позиции столбцов p1..pN в строке
    int objective_position = -1;
    size_t header_size = 0;
    bool header_processed = false;
    char delimiter = ',';

    std::vector<std::vector<double>> rows;
    std::vector<double> objectives;
    std::string line;
    int line_number = 0;

    while (std::getline(file, line)) {
        line_number++;
        line = trim(line);

        if (line.empty() || line[0] == '#') {
            continue;
        }

        if (!header_processed) {
            delimiter = detect_csv_delimiter(line);
            if (!has_csv_header(line, delimiter)) {
                throw std::runtime_error("Missing CSV header in " + filename +
                                         " (expected columns " + coord_prefix + "1.." + coord_prefix +
                                         "N, " + objective_name + ")");
            }

            std::vector<std::string> columns = split_csv_line(line, delimiter);
            header_size = columns.size();

            std::map<int, int> indexed;  // номер параметра → позиция столбца
            for (size_t i = 0; i < columns.size(); ++i) {
                int index = 0;
                bool is_coordinate = false;
                try {
                    is_coordinate = parse_indexed_column(columns[i], coord_prefix, index);
                } catch (const std::runtime_error& e) {
                    throw std::runtime_error(std::string(e.what()) + " in " + filename);
                }
                if (is_coordinate) {
                    if (!indexed.emplace(index, static_cast<int>(i)).second) {
                        throw std::runtime_error("Duplicate column " + columns[i] + " in " + filename);
                    }
                } else if (columns[i] == objective_name) {
                    objective_position = static_cast<int>(i);
                }
            }

            if (indexed.empty()) {
                throw std::runtime_error("No coordinate columns (" + std::string(1, coord_prefix) +
                                         "1, " + std::string(1, coord_prefix) + "2, ...) in " + filename);
            }

            int expected = 1;
            for (const auto& entry : indexed) {
                if (entry.first != expected) {
                    throw std::runtime_error("DataFrame missing column: " + std::string(1, coord_prefix) +
                                             std::to_string(expected) + " in " + filename);
                }
                coord_positions.push_back(entry.second);
                table.coordinate_columns.push_back(columns[static_cast<size_t>(entry.second)]);
                expected++;
            }

            header_processed = true;
            continue;
        }

        std::vector<std::string> cells = split_csv_line(line, delimiter);
        if (cells.size() < header_size) {
            throw std::runtime_error("Missing required columns at line " + std::to_string(line_number) +
                                     " of " + filename);
        }

        auto parse_cell = [&](int position) {
            const std::string& cell = cells[static_cast<size_t>(position)];
            try {
                size_t pos = 0;
                double v = std::stod(cell, &pos);
                if (pos != cell.size()) {
                    throw std::invalid_argument(cell);
                }
                return v;
            } catch (const std::exception&) {
                throw std::runtime_error("Invalid numeric value '" + cell + "' at line " +
                                         std::to_string(line_number) + " of " + filename);
            }
        };

        std::vector<double> row;
        row.reserve(coord_positions.size());
        for (int position : coord_positions) {
            row.push_back(parse_cell(position));
        }
        rows.push_back(std::move(row));

        if (objective_position >= 0) {
            objectives.push_back(parse_cell(objective_position));
        }
    }

    if (!header_processed) {
        throw std::runtime_error("Empty critical points file: " + filename);
    }

    const Eigen::Index n = static_cast<Eigen::Index>(rows.size());
    const Eigen::Index dim = static_cast<Eigen::Index>(coord_positions.size());
    table.coordinates.resize(n, dim);
    for (Eigen::Index i = 0; i < n; ++i) {
        for (Eigen::Index j = 0; j < dim; ++j) {
            table.coordinates(i, j) = rows[static_cast<size_t>(i)][static_cast<size_t>(j)];
        }
    }
    table.objectives = std::move(objectives);

    return table;
}

// ============== Сводка результатов ==============

DegreeSummary ExperimentLoader::parse_degree_entry(const YAML::Node& entry, const std::string& filename) {
    if (!entry.IsMap() || !entry["degree"]) {
        throw std::runtime_error("Results summary entry without 'degree' in " + filename);
    }

    DegreeSummary summary;
    summary.degree = entry["degree"].as<int>();

    auto optional_double = [&entry](const char* key) -> std::optional<double> {
        if (entry[key] && !entry[key].IsNull()) {
            return entry[key].as<double>();
        }
        return std::nullopt;
    };

    summary.l2_norm = optional_double("L2_norm");
    if (!summary.l2_norm) {
        summary.l2_norm = optional_double("l2_norm");
    }
    summary.best_value = optional_double("best_value");

    if (entry["critical_points"] && !entry["critical_points"].IsNull()) {
        summary.critical_points = entry["critical_points"].as<int>();
    }
    return summary;
}

std::vector<DegreeSummary> ExperimentLoader::load_results_summary(const std::string& experiment_path) {
    const std::string summary_file = (fs::path(experiment_path) / RESULTS_SUMMARY_FILE).string();
    if (!fs::is_regular_file(summary_file)) {
        throw std::runtime_error("Results summary not found: " + summary_file);
    }

    std::vector<DegreeSummary> summaries;

    try {
        YAML::Node root = YAML::LoadFile(summary_file);

        YAML::Node entries;
        if (root.IsSequence()) {
            entries = root;
        } else if (root.IsMap() && root["results"] && root["results"].IsSequence()) {
            entries = root["results"];
        } else if (root.IsMap() && root["degrees"] && root["degrees"].IsSequence()) {
            entries = root["degrees"];
        } else {
            throw std::runtime_error("Unrecognized results summary layout in " + summary_file);
        }

        for (const auto& entry : entries) {
            summaries.push_back(parse_degree_entry(entry, summary_file));
        }

    } catch (const YAML::Exception& e) {
        throw std::runtime_error("JSON parsing error in " + summary_file + ": " + std::string(e.what()));
    }

    std::sort(summaries.begin(), summaries.end(),
              [](const DegreeSummary& a, const DegreeSummary& b) { return a.degree < b.degree; });

    for (size_t i = 1; i < summaries.size(); ++i) {
        if (summaries[i].degree == summaries[i - 1].degree) {
            throw std::runtime_error("Duplicate degree " + std::to_string(summaries[i].degree) +
                                     " in " + summary_file);
        }
    }

    return summaries;
}

} // namespace exp_quality
