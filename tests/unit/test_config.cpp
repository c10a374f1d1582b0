/**
 * @file test_config.cpp
 * @brief Unit tests for configuration loading.
 */

#include "core/config.hpp"

#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>

using namespace course_planner;

class ConfigTest : public ::testing::Test {
protected:
    std::filesystem::path temp_dir_;

    void SetUp() override {
        temp_dir_ = std::filesystem::temp_directory_path() / "cp_test_config";
        std::filesystem::create_directories(temp_dir_);
    }

    void TearDown() override {
        std::filesystem::remove_all(temp_dir_);
    }

    std::filesystem::path write_toml(const std::string& content) {
        auto path = temp_dir_ / "test.toml";
        std::ofstream ofs(path);
        ofs << content;
        return path;
    }
};

TEST_F(ConfigTest, DefaultConfig) {
    auto config = default_config();
    EXPECT_EQ(config.schedule.max_courses_per_semester, 5u);
    EXPECT_EQ(config.schedule.max_credits_per_semester, 18u);
    EXPECT_EQ(config.schedule.target_semesters, 8u);
    EXPECT_EQ(config.schedule.priority, "unlock_first");
    EXPECT_EQ(config.readiness.almost_ready_threshold, 75u);
    EXPECT_EQ(config.analysis.bottleneck_depth, 3u);
    EXPECT_EQ(config.executor.thread_count, 0u);
    EXPECT_TRUE(validate_config(config).has_value());
}

TEST_F(ConfigTest, LoadFullConfig) {
    auto path = write_toml(R"(
        [analysis]
        bottleneck_min_dependents = 2
        bottleneck_min_prerequisites = 1
        bottleneck_depth = 2
        bottleneck_limit = 4
        max_traversal_depth = 6
        deep_chain_min_depth = 2

        [readiness]
        almost_ready_threshold = 60
        recommendation_min_score = 50
        recommendation_limit = 7
        unlock_horizon = 1

        [schedule]
        max_courses_per_semester = 4
        max_credits_per_semester = 15
        target_semesters = 6
        default_credits = 4
        priority = "shallow_first"

        [paths]
        max_paths = 5
        exhaustive_limit = 100

        [executor]
        thread_count = 2

        [telemetry]
        log_dir = "/tmp/cp_logs"
        max_file_size_mb = 10
        rotate_count = 3
        log_level = "debug"
    )");

    auto result = load_config(path);
    ASSERT_TRUE(result.has_value()) << result.error().message;

    const auto& c = *result;
    EXPECT_EQ(c.analysis.bottleneck_min_dependents, 2u);
    EXPECT_EQ(c.analysis.bottleneck_min_prerequisites, 1u);
    EXPECT_EQ(c.analysis.bottleneck_depth, 2u);
    EXPECT_EQ(c.analysis.bottleneck_limit, 4u);
    EXPECT_EQ(c.analysis.max_traversal_depth, 6u);
    EXPECT_EQ(c.analysis.deep_chain_min_depth, 2u);
    EXPECT_EQ(c.readiness.almost_ready_threshold, 60u);
    EXPECT_EQ(c.readiness.recommendation_min_score, 50u);
    EXPECT_EQ(c.readiness.recommendation_limit, 7u);
    EXPECT_EQ(c.readiness.unlock_horizon, 1u);
    EXPECT_EQ(c.schedule.max_courses_per_semester, 4u);
    EXPECT_EQ(c.schedule.max_credits_per_semester, 15u);
    EXPECT_EQ(c.schedule.target_semesters, 6u);
    EXPECT_EQ(c.schedule.default_credits, 4u);
    EXPECT_EQ(c.schedule.priority, "shallow_first");
    EXPECT_EQ(c.paths.max_paths, 5u);
    EXPECT_EQ(c.paths.exhaustive_limit, 100u);
    EXPECT_EQ(c.executor.thread_count, 2u);
    EXPECT_EQ(c.telemetry.log_dir, "/tmp/cp_logs");
    EXPECT_EQ(c.telemetry.max_file_size_mb, 10u);
    EXPECT_EQ(c.telemetry.rotate_count, 3u);
    EXPECT_EQ(c.telemetry.log_level, "debug");
}

TEST_F(ConfigTest, PartialConfigKeepsDefaults) {
    auto result = parse_config(R"(
        [schedule]
        max_courses_per_semester = 3
    )");
    ASSERT_TRUE(result.has_value()) << result.error().message;
    EXPECT_EQ(result->schedule.max_courses_per_semester, 3u);
    EXPECT_EQ(result->schedule.max_credits_per_semester, 18u);
    EXPECT_EQ(result->paths.max_paths, 3u);
    EXPECT_EQ(result->telemetry.log_level, "info");
}

TEST_F(ConfigTest, MissingFile) {
    auto result = load_config(temp_dir_ / "nonexistent.toml");
    ASSERT_FALSE(result.has_value());
    EXPECT_TRUE(result.error().is(ErrorCode::IoError));
}

TEST_F(ConfigTest, InvalidToml) {
    auto path = write_toml("this is not [valid toml");
    auto result = load_config(path);
    ASSERT_FALSE(result.has_value());
    EXPECT_TRUE(result.error().is(ErrorCode::ConfigError));
}

TEST_F(ConfigTest, CourseCapOutOfRange) {
    for (const char* doc : {"[schedule]\nmax_courses_per_semester = 0\n",
                            "[schedule]\nmax_courses_per_semester = 9\n"}) {
        auto result = parse_config(doc);
        ASSERT_FALSE(result.has_value()) << doc;
        EXPECT_TRUE(result.error().is(ErrorCode::ConfigError));
    }
}

TEST_F(ConfigTest, CreditCapOutOfRange) {
    for (const char* doc : {"[schedule]\nmax_credits_per_semester = 5\n",
                            "[schedule]\nmax_credits_per_semester = 25\n"}) {
        auto result = parse_config(doc);
        ASSERT_FALSE(result.has_value()) << doc;
        EXPECT_TRUE(result.error().is(ErrorCode::ConfigError));
    }
}

TEST_F(ConfigTest, CapBoundariesAccepted) {
    auto low = parse_config(R"(
        [schedule]
        max_courses_per_semester = 1
        max_credits_per_semester = 6
        target_semesters = 1
    )");
    EXPECT_TRUE(low.has_value());

    auto high = parse_config(R"(
        [schedule]
        max_courses_per_semester = 8
        max_credits_per_semester = 24
        target_semesters = 12
    )");
    EXPECT_TRUE(high.has_value());
}

TEST_F(ConfigTest, TargetSemestersOutOfRange) {
    auto result = parse_config("[schedule]\ntarget_semesters = 13\n");
    ASSERT_FALSE(result.has_value());
    EXPECT_TRUE(result.error().is(ErrorCode::ConfigError));
}

TEST_F(ConfigTest, UnknownPriorityRejected) {
    auto result = parse_config("[schedule]\npriority = \"random\"\n");
    ASSERT_FALSE(result.has_value());
    EXPECT_NE(result.error().message.find("random"), std::string::npos);
}

TEST_F(ConfigTest, BottleneckDepthOutOfRange) {
    auto result = parse_config("[analysis]\nbottleneck_depth = 4\n");
    ASSERT_FALSE(result.has_value());
    EXPECT_TRUE(result.error().is(ErrorCode::ConfigError));
}

TEST_F(ConfigTest, ReadinessThresholdAbove100) {
    auto result = parse_config("[readiness]\nalmost_ready_threshold = 101\n");
    ASSERT_FALSE(result.has_value());
    EXPECT_TRUE(result.error().is(ErrorCode::ConfigError));
}

TEST_F(ConfigTest, NegativeValueRejected) {
    for (const char* doc : {"[paths]\nexhaustive_limit = -1\n",
                            "[schedule]\ndefault_credits = -3\n",
                            "[analysis]\nmax_traversal_depth = -1\n",
                            "[readiness]\nrecommendation_limit = -1\n"}) {
        auto result = parse_config(doc);
        ASSERT_FALSE(result.has_value()) << doc;
        EXPECT_TRUE(result.error().is(ErrorCode::ConfigError));
        EXPECT_NE(result.error().message.find("got -"), std::string::npos) << doc;
    }
}

TEST_F(ConfigTest, ValueAbove32BitsRejected) {
    auto result = parse_config("[executor]\nthread_count = 4294967296\n");
    ASSERT_FALSE(result.has_value());
    EXPECT_TRUE(result.error().is(ErrorCode::ConfigError));
    EXPECT_NE(result.error().message.find("executor.thread_count"), std::string::npos);
}

TEST_F(ConfigTest, DefaultCreditsOutOfRange) {
    for (const char* doc : {"[schedule]\ndefault_credits = 0\n",
                            "[schedule]\ndefault_credits = 25\n"}) {
        auto result = parse_config(doc);
        ASSERT_FALSE(result.has_value()) << doc;
        EXPECT_TRUE(result.error().is(ErrorCode::ConfigError));
    }
    EXPECT_TRUE(parse_config("[schedule]\ndefault_credits = 24\n").has_value());
}

TEST_F(ConfigTest, PathLimitsOutOfRange) {
    for (const char* doc : {"[paths]\nmax_paths = 0\n",
                            "[paths]\nmax_paths = 21\n",
                            "[paths]\nexhaustive_limit = 10001\n"}) {
        auto result = parse_config(doc);
        ASSERT_FALSE(result.has_value()) << doc;
        EXPECT_TRUE(result.error().is(ErrorCode::ConfigError));
    }
    EXPECT_TRUE(parse_config("[paths]\nmax_paths = 20\nexhaustive_limit = 0\n").has_value());
}
