#include <iostream>
#include <string>
#include "experiment_quality/threshold_store.h"
#include "experiment_quality/quality_report.h"

using namespace exp_quality;

namespace {

void print_usage(const char* program) {
    std::cerr << "Usage: " << program << " <experiment_dir> [--thresholds <file>] [--strict]\n"
              << "  --thresholds <file>  quality thresholds (default: data/quality_thresholds.toml)\n"
              << "  --strict             reject keys outside of [section] blocks\n";
}

} // namespace

int main(int argc, char** argv) {
    std::string experiment_path;
    std::string thresholds_path = "data/quality_thresholds.toml";
    bool strict_mode = false;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--thresholds") {
            if (i + 1 >= argc) {
                print_usage(argv[0]);
                return 2;
            }
            thresholds_path = argv[++i];
        } else if (arg == "--strict") {
            strict_mode = true;
        } else if (arg == "-h" || arg == "--help") {
            print_usage(argv[0]);
            return 0;
        } else if (experiment_path.empty()) {
            experiment_path = arg;
        } else {
            print_usage(argv[0]);
            return 2;
        }
    }

    if (experiment_path.empty()) {
        print_usage(argv[0]);
        return 2;
    }

    try {
        std::cout << "Reading quality thresholds from: " << thresholds_path << "\n";
        ThresholdStore thresholds = ThresholdStore::read_from_file(thresholds_path, strict_mode);
        for (const auto& warning : thresholds.warnings()) {
            std::cerr << "WARNING: " << warning << "\n";
        }

        QualityAnalyzer analyzer(thresholds);
        ExperimentQualityReport report = analyzer.analyze_experiment(experiment_path);

        std::cout << "\n" << report.format();

        if (report.has_problems()) {
            std::cout << "\nQuality issues detected.\n";
        } else {
            std::cout << "\nNo quality issues detected.\n";
        }

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
