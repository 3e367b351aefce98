#include <gtest/gtest.h>
#include "experiment_quality/experiment_loader.h"
#include "experiment_quality/parameter_recovery.h"
#include <filesystem>
#include <fstream>

using namespace exp_quality;

namespace fs = std::filesystem;

// Временный каталог эксперимента
class ExperimentDirTest : public ::testing::Test {
protected:
    fs::path dir;

    void SetUp() override {
        const ::testing::TestInfo* info = ::testing::UnitTest::GetInstance()->current_test_info();
        dir = fs::temp_directory_path() /
              (std::string("exp_quality_loader_") + info->test_suite_name() + "_" + info->name());
        fs::remove_all(dir);
        fs::create_directories(dir);
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(dir, ec);
    }

    void write(const std::string& name, const std::string& content) {
        std::ofstream out(dir / name);
        out << content;
    }

    std::string path() const { return dir.string(); }
};

// ============== Конфигурация эксперимента ==============

TEST_F(ExperimentDirTest, ConfigWithTopLevelTrueParameters) {
    write("experiment_config.json",
          "{\"dimension\": 4, \"basis\": \"chebyshev\", \"p_true\": [0.2, 0.3, 0.5, 0.6]}");

    ExperimentConfig config = load_experiment_config(path());

    ASSERT_TRUE(config.dimension.has_value());
    EXPECT_EQ(*config.dimension, 4);
    ASSERT_TRUE(config.basis.has_value());
    EXPECT_EQ(*config.basis, "chebyshev");
    ASSERT_TRUE(config.p_true.has_value());
    ASSERT_EQ(config.p_true->size(), 4);
    EXPECT_DOUBLE_EQ((*config.p_true)(0), 0.2);
    EXPECT_DOUBLE_EQ((*config.p_true)(3), 0.6);
    EXPECT_TRUE(has_ground_truth(path()));
}

TEST_F(ExperimentDirTest, ConfigWithNestedTrueParameters) {
    write("experiment_config.json",
          "{\"experiment\": {\"name\": \"lv4d\", \"p_true\": [1.5, -0.5]}, \"seed\": 7}");

    ExperimentConfig config = load_experiment_config(path());

    ASSERT_TRUE(config.p_true.has_value());
    ASSERT_EQ(config.p_true->size(), 2);
    EXPECT_DOUBLE_EQ((*config.p_true)(1), -0.5);
    EXPECT_FALSE(config.dimension.has_value());
}

TEST_F(ExperimentDirTest, NullTrueParametersMeanNoGroundTruth) {
    write("experiment_config.json", "{\"dimension\": 2, \"p_true\": null}");

    ExperimentConfig config = load_experiment_config(path());
    EXPECT_FALSE(config.p_true.has_value());
    EXPECT_FALSE(has_ground_truth(path()));
}

TEST_F(ExperimentDirTest, NonNumericTrueParametersThrow) {
    write("experiment_config.json", "{\"p_true\": [0.1, \"abc\"]}");
    EXPECT_THROW(load_experiment_config(path()), std::runtime_error);
    EXPECT_FALSE(has_ground_truth(path()));
}

TEST_F(ExperimentDirTest, MissingConfigThrows) {
    EXPECT_THROW(load_experiment_config(path()), std::runtime_error);
    EXPECT_FALSE(has_ground_truth(path()));
    EXPECT_FALSE(has_ground_truth("/nonexistent/experiment"));
}

TEST(ExtractTrueParametersTest, FromDocumentInMemory) {
    YAML::Node document = YAML::Load("{\"p_true\": [1.0, 2.0, 3.0]}");
    auto p_true = ExperimentLoader::extract_true_parameters(document);
    ASSERT_TRUE(p_true.has_value());
    EXPECT_EQ(p_true->size(), 3);

    YAML::Node without = YAML::Load("{\"dimension\": 3}");
    EXPECT_FALSE(ExperimentLoader::extract_true_parameters(without).has_value());

    YAML::Node scalar = YAML::Load("{\"p_true\": 0.5}");
    EXPECT_THROW(ExperimentLoader::extract_true_parameters(scalar), std::runtime_error);
}

// ============== Критические точки ==============

TEST_F(ExperimentDirTest, RawFileWithIndexColumn) {
    write("critical_points_raw_deg_4.csv",
          ",p1,p2,objective\n"
          "1,0.1,0.2,-1.5\n"
          "2,0.3,0.4,-0.5\n"
          "3,0.5,0.6,2.0\n");

    CriticalPointTable table = load_critical_points_for_degree(path(), 4);

    EXPECT_EQ(table.format, CriticalPointFormat::RAW);
    EXPECT_EQ(table.num_points(), 3);
    EXPECT_EQ(table.dimension(), 2);
    EXPECT_EQ(table.coordinate_columns, (std::vector<std::string>{"p1", "p2"}));
    EXPECT_DOUBLE_EQ(table.coordinates(1, 0), 0.3);
    EXPECT_DOUBLE_EQ(table.coordinates(2, 1), 0.6);
    ASSERT_TRUE(table.has_objectives());
    EXPECT_DOUBLE_EQ(table.objectives[0], -1.5);
}

TEST_F(ExperimentDirTest, ColumnsAreOrderedByIndex) {
    write("critical_points_raw_deg_2.csv",
          "objective,p2,p1\n"
          "5.0,0.2,0.1\n");

    CriticalPointTable table = load_critical_points_for_degree(path(), 2);

    EXPECT_EQ(table.coordinate_columns, (std::vector<std::string>{"p1", "p2"}));
    EXPECT_DOUBLE_EQ(table.coordinates(0, 0), 0.1);
    EXPECT_DOUBLE_EQ(table.coordinates(0, 1), 0.2);
    EXPECT_DOUBLE_EQ(table.objectives[0], 5.0);
}

TEST_F(ExperimentDirTest, RawFilePreferredOverLegacy) {
    write("critical_points_raw_deg_6.csv", "p1,objective\n0.1,1.0\n0.2,2.0\n");
    write("critical_points_deg_6.csv", "x1,z\n9.0,9.0\n");

    CriticalPointTable table = load_critical_points_for_degree(path(), 6);

    EXPECT_EQ(table.format, CriticalPointFormat::RAW);
    EXPECT_EQ(table.num_points(), 2);
}

TEST_F(ExperimentDirTest, LegacyFileUsesXAndZColumns) {
    write("critical_points_deg_8.csv",
          "x1;x2;x3;z\n"
          "0.1;0.2;0.3;-4.0\n");

    CriticalPointTable table = load_critical_points_for_degree(path(), 8);

    EXPECT_EQ(table.format, CriticalPointFormat::LEGACY);
    EXPECT_EQ(table.dimension(), 3);
    EXPECT_DOUBLE_EQ(table.coordinates(0, 2), 0.3);
    ASSERT_EQ(table.objectives.size(), 1u);
    EXPECT_DOUBLE_EQ(table.objectives[0], -4.0);
}

TEST_F(ExperimentDirTest, MissingFileErrorNamesBothPaths) {
    try {
        load_critical_points_for_degree(path(), 12);
        FAIL() << "Expected std::runtime_error";
    } catch (const std::runtime_error& e) {
        std::string message = e.what();
        EXPECT_NE(message.find("critical_points_raw_deg_12.csv"), std::string::npos);
        EXPECT_NE(message.find("critical_points_deg_12.csv"), std::string::npos);
    }
}

TEST_F(ExperimentDirTest, MalformedCriticalPointFilesThrow) {
    write("critical_points_raw_deg_1.csv", "p1,objective\n0.1,abc\n");
    EXPECT_THROW(load_critical_points_for_degree(path(), 1), std::runtime_error);

    write("critical_points_raw_deg_2.csv", "0.1,0.2\n0.3,0.4\n");
    EXPECT_THROW(load_critical_points_for_degree(path(), 2), std::runtime_error);

    write("critical_points_raw_deg_3.csv", "p1,p3,objective\n0.1,0.2,0.3\n");
    EXPECT_THROW(load_critical_points_for_degree(path(), 3), std::runtime_error);

    write("critical_points_raw_deg_4.csv", "p1,p2,objective\n0.1,0.2\n");
    EXPECT_THROW(load_critical_points_for_degree(path(), 4), std::runtime_error);

    write("critical_points_raw_deg_5.csv", "");
    EXPECT_THROW(load_critical_points_for_degree(path(), 5), std::runtime_error);
}

TEST_F(ExperimentDirTest, OversizedColumnIndexNamesFile) {
    write("critical_points_raw_deg_7.csv", "p1,p99999999999,objective\n0.1,0.2,0.3\n");

    try {
        load_critical_points_for_degree(path(), 7);
        FAIL() << "Expected std::runtime_error";
    } catch (const std::runtime_error& e) {
        EXPECT_NE(std::string(e.what()).find("critical_points_raw_deg_7.csv"), std::string::npos);
    }
}

TEST_F(ExperimentDirTest, DiscoverDegreesFromFileNames) {
    write("critical_points_raw_deg_10.csv", "p1,objective\n0.1,1.0\n");
    write("critical_points_deg_4.csv", "x1,z\n0.1,1.0\n");
    write("critical_points_deg_10.csv", "x1,z\n0.1,1.0\n");
    write("critical_points_deg_x.csv", "x1,z\n0.1,1.0\n");
    write("critical_points_deg_6.csv.bak", "x1,z\n0.1,1.0\n");
    write("results_summary.json", "[]");

    EXPECT_EQ(ExperimentLoader::discover_degrees(path()), (std::vector<int>{4, 10}));
    EXPECT_TRUE(ExperimentLoader::discover_degrees("/nonexistent/experiment").empty());
}

// ============== Сводка результатов ==============

TEST_F(ExperimentDirTest, SummaryAsListIsSortedByDegree) {
    write("results_summary.json",
          "[{\"degree\": 6, \"L2_norm\": 0.05, \"best_value\": -1.0, \"critical_points\": 12},"
          " {\"degree\": 4, \"L2_norm\": 0.2, \"best_value\": -0.8, \"critical_points\": 7}]");

    std::vector<DegreeSummary> summaries = load_results_summary(path());

    ASSERT_EQ(summaries.size(), 2u);
    EXPECT_EQ(summaries[0].degree, 4);
    EXPECT_EQ(summaries[1].degree, 6);
    ASSERT_TRUE(summaries[0].l2_norm.has_value());
    EXPECT_DOUBLE_EQ(*summaries[0].l2_norm, 0.2);
    ASSERT_TRUE(summaries[1].critical_points.has_value());
    EXPECT_EQ(*summaries[1].critical_points, 12);
}

TEST_F(ExperimentDirTest, SummaryWithResultsFieldAndOptionalValues) {
    write("results_summary.json",
          "{\"experiment\": \"lv4d\", \"results\": ["
          " {\"degree\": 2, \"l2_norm\": 1.5},"
          " {\"degree\": 3, \"L2_norm\": null, \"best_value\": 0.25}]}");

    std::vector<DegreeSummary> summaries = load_results_summary(path());

    ASSERT_EQ(summaries.size(), 2u);
    ASSERT_TRUE(summaries[0].l2_norm.has_value());
    EXPECT_DOUBLE_EQ(*summaries[0].l2_norm, 1.5);
    EXPECT_FALSE(summaries[0].best_value.has_value());
    EXPECT_FALSE(summaries[1].l2_norm.has_value());
    ASSERT_TRUE(summaries[1].best_value.has_value());
    EXPECT_DOUBLE_EQ(*summaries[1].best_value, 0.25);
    EXPECT_FALSE(summaries[1].critical_points.has_value());
}

TEST_F(ExperimentDirTest, SummaryErrors) {
    EXPECT_THROW(load_results_summary(path()), std::runtime_error);

    write("results_summary.json", "[{\"degree\": 4, \"L2_norm\": 0.1}, {\"degree\": 4, \"L2_norm\": 0.2}]");
    EXPECT_THROW(load_results_summary(path()), std::runtime_error);

    write("results_summary.json", "[{\"L2_norm\": 0.1}]");
    EXPECT_THROW(load_results_summary(path()), std::runtime_error);

    write("results_summary.json", "{\"status\": \"done\"}");
    EXPECT_THROW(load_results_summary(path()), std::runtime_error);
}

// ============== Таблица восстановления ==============

TEST_F(ExperimentDirTest, RecoveryTableFollowsRequestedDegrees) {
    write("critical_points_raw_deg_4.csv",
          "p1,p2,objective\n"
          "0.5,0.5,1.0\n"
          "0.205,0.3,0.5\n");
    write("critical_points_deg_6.csv",
          "x1,x2,z\n"
          "0.2,0.301,0.1\n"
          "0.2005,0.3,0.2\n"
          "1.0,1.0,3.0\n");

    Eigen::VectorXd p_true(2);
    p_true << 0.2, 0.3;

    std::vector<RecoveryTableRow> rows = generate_parameter_recovery_table(path(), p_true, {6, 4}, 0.01);

    ASSERT_EQ(rows.size(), 2u);
    EXPECT_EQ(rows[0].degree, 6);
    EXPECT_EQ(rows[0].num_critical_points, 3);
    EXPECT_EQ(rows[0].num_recoveries, 2);
    EXPECT_NEAR(rows[0].min_distance, 0.0005, 1e-12);

    EXPECT_EQ(rows[1].degree, 4);
    EXPECT_EQ(rows[1].num_critical_points, 2);
    EXPECT_EQ(rows[1].num_recoveries, 1);
    EXPECT_NEAR(rows[1].min_distance, 0.005, 1e-12);

    EXPECT_THROW(generate_parameter_recovery_table(path(), p_true, {8}, 0.01), std::runtime_error);

    Eigen::VectorXd wrong_dim = Eigen::VectorXd::Zero(3);
    EXPECT_THROW(generate_parameter_recovery_table(path(), wrong_dim, {4}, 0.01), DimensionMismatch);
}
