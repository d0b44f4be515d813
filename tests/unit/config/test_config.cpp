//
// Created by gregorian-rayne on 10/06/26.
//

#include <gtest/gtest.h>
#include "cga/config/config.hpp"

#include <filesystem>
#include <fstream>
#include <limits>

using namespace cga;
using namespace cga::config;

class ConfigTest : public ::testing::Test {
protected:
    void SetUp() override {
        temp_dir_ = std::filesystem::temp_directory_path() / "cga_config_test";
        std::filesystem::create_directories(temp_dir_);
    }

    void TearDown() override {
        std::filesystem::remove_all(temp_dir_);
    }

    std::filesystem::path write_file(const std::string& name, const std::string& content) const {
        const auto path = temp_dir_ / name;
        std::ofstream out(path);
        out << content;
        return path;
    }

    std::filesystem::path temp_dir_;
};

TEST_F(ConfigTest, EmptyDocument_YieldsDefaults) {
    const auto result = load_from_string("");
    ASSERT_TRUE(result.is_ok());

    const auto& options = result.value().analyzer;
    EXPECT_DOUBLE_EQ(options.pagerank.damping, 0.85);
    EXPECT_EQ(options.pagerank.max_iterations, 100u);
    EXPECT_DOUBLE_EQ(options.pagerank.tolerance, 1e-6);
    EXPECT_EQ(options.max_cycles, 0u);
    EXPECT_FALSE(options.parallel);
    EXPECT_EQ(options.thresholds.max_call_cycles, 10u);
    EXPECT_DOUBLE_EQ(options.thresholds.max_average_instability, 0.8);
    EXPECT_EQ(options.thresholds.max_coupling, 20u);
    EXPECT_DOUBLE_EQ(options.thresholds.max_dependency_density, 0.3);
    EXPECT_DOUBLE_EQ(options.thresholds.max_call_density, 0.5);
    EXPECT_EQ(result.value().logging.level, "info");
}

TEST_F(ConfigTest, AllSections) {
    const auto result = load_from_string(R"(
        [pagerank]
        damping = 0.9
        max_iterations = 50
        tolerance = 1e-4

        [cycles]
        max_cycles = 25

        [analysis]
        parallel = true

        [thresholds]
        max_call_cycles = 3
        max_average_instability = 0.5
        max_coupling = 8
        max_dependency_density = 0.2
        max_call_density = 0.4

        [logging]
        level = "debug"
    )");
    ASSERT_TRUE(result.is_ok()) << result.error().to_string();

    const auto& config = result.value();
    EXPECT_DOUBLE_EQ(config.analyzer.pagerank.damping, 0.9);
    EXPECT_EQ(config.analyzer.pagerank.max_iterations, 50u);
    EXPECT_DOUBLE_EQ(config.analyzer.pagerank.tolerance, 1e-4);
    EXPECT_EQ(config.analyzer.max_cycles, 25u);
    EXPECT_TRUE(config.analyzer.parallel);
    EXPECT_EQ(config.analyzer.thresholds.max_call_cycles, 3u);
    EXPECT_DOUBLE_EQ(config.analyzer.thresholds.max_average_instability, 0.5);
    EXPECT_EQ(config.analyzer.thresholds.max_coupling, 8u);
    EXPECT_DOUBLE_EQ(config.analyzer.thresholds.max_dependency_density, 0.2);
    EXPECT_DOUBLE_EQ(config.analyzer.thresholds.max_call_density, 0.4);
    EXPECT_EQ(config.logging.level, "debug");
}

TEST_F(ConfigTest, PartialSection_KeepsOtherDefaults) {
    const auto result = load_from_string("[pagerank]\ndamping = 0.5\n");
    ASSERT_TRUE(result.is_ok());

    EXPECT_DOUBLE_EQ(result.value().analyzer.pagerank.damping, 0.5);
    EXPECT_EQ(result.value().analyzer.pagerank.max_iterations, 100u);
}

TEST_F(ConfigTest, MalformedToml) {
    const auto result = load_from_string("[pagerank\ndamping = ");
    ASSERT_TRUE(result.is_err());
    EXPECT_EQ(result.error().code(), ErrorCode::ParseError);
}

TEST_F(ConfigTest, DampingOutOfRange) {
    const auto result = load_from_string("[pagerank]\ndamping = 1.5\n");
    ASSERT_TRUE(result.is_err());
    EXPECT_EQ(result.error().code(), ErrorCode::ConfigError);
    EXPECT_EQ(*result.error().context(), "pagerank.damping");
}

TEST_F(ConfigTest, NegativeCount) {
    const auto result = load_from_string("[cycles]\nmax_cycles = -1\n");
    ASSERT_TRUE(result.is_err());
    EXPECT_EQ(result.error().code(), ErrorCode::ConfigError);
    EXPECT_EQ(*result.error().context(), "cycles.max_cycles");
}

TEST_F(ConfigTest, NegativeThreshold) {
    const auto result = load_from_string("[thresholds]\nmax_call_density = -0.1\n");
    ASSERT_TRUE(result.is_err());
    EXPECT_EQ(*result.error().context(), "thresholds.max_call_density");
}

TEST_F(ConfigTest, DampingNaN) {
    const auto result = load_from_string("[pagerank]\ndamping = nan\n");
    ASSERT_TRUE(result.is_err());
    EXPECT_EQ(result.error().code(), ErrorCode::ConfigError);
    EXPECT_EQ(*result.error().context(), "pagerank.damping");
}

TEST_F(ConfigTest, NonFiniteValuesRejected) {
    Config config;
    config.analyzer.pagerank.tolerance = std::numeric_limits<double>::quiet_NaN();
    ASSERT_TRUE(config.validate().is_err());
    EXPECT_EQ(*config.validate().error().context(), "pagerank.tolerance");

    config = Config{};
    config.analyzer.thresholds.max_average_instability = std::numeric_limits<double>::infinity();
    ASSERT_TRUE(config.validate().is_err());
    EXPECT_EQ(*config.validate().error().context(), "thresholds.max_average_instability");

    config = Config{};
    config.analyzer.thresholds.max_call_density = std::numeric_limits<double>::quiet_NaN();
    ASSERT_TRUE(config.validate().is_err());
    EXPECT_EQ(*config.validate().error().context(), "thresholds.max_call_density");
}

TEST_F(ConfigTest, UnknownLogLevel) {
    const auto result = load_from_string("[logging]\nlevel = \"loud\"\n");
    ASSERT_TRUE(result.is_err());
    EXPECT_EQ(*result.error().context(), "logging.level");
}

TEST_F(ConfigTest, Validate_DefaultsAreValid) {
    const Config config;
    EXPECT_TRUE(config.validate().is_ok());
}

TEST_F(ConfigTest, LoadFromFile) {
    const auto path = write_file("cga.toml", "[analysis]\nparallel = true\n");

    const auto result = load_from_file(path);
    ASSERT_TRUE(result.is_ok());
    EXPECT_TRUE(result.value().analyzer.parallel);
}

TEST_F(ConfigTest, LoadFromFile_Missing) {
    const auto result = load_from_file(temp_dir_ / "missing.toml");
    ASSERT_TRUE(result.is_err());
    EXPECT_EQ(result.error().code(), ErrorCode::NotFound);
}

TEST_F(ConfigTest, LoadFromFile_ErrorNamesFile) {
    const auto path = write_file("bad.toml", "[pagerank]\ndamping = 7.0\n");

    const auto result = load_from_file(path);
    ASSERT_TRUE(result.is_err());
    EXPECT_NE(result.error().context()->find(path.string()), std::string::npos);
}

TEST_F(ConfigTest, LoadFromFile_SampleData) {
    const auto result = load_from_file(std::filesystem::path(CGA_TEST_DATA_DIR) / "cga.toml");
    ASSERT_TRUE(result.is_ok()) << result.error().to_string();

    EXPECT_DOUBLE_EQ(result.value().analyzer.pagerank.damping, 0.9);
    EXPECT_EQ(result.value().analyzer.thresholds.max_coupling, 4u);
    EXPECT_EQ(result.value().logging.level, "warn");
}
