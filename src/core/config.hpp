/**
 * @file config.hpp
 * @brief Planner configuration with TOML deserialization.
 */

#pragma once

#include <cstdint>
#include <filesystem>
#include <string>

#include "core/result.hpp"

namespace course_planner {

struct AnalysisConfig {
    uint32_t bottleneck_min_dependents = 3;
    uint32_t bottleneck_min_prerequisites = 2;
    uint32_t bottleneck_depth = 3;          ///< Prerequisite depth counted, 1..3
    uint32_t bottleneck_limit = 10;
    uint32_t max_traversal_depth = 0;       ///< 0 = unbounded
    uint32_t deep_chain_min_depth = 3;
};

struct ReadinessConfig {
    uint32_t almost_ready_threshold = 75;
    uint32_t recommendation_min_score = 75;
    uint32_t recommendation_limit = 15;
    uint32_t unlock_horizon = 2;            ///< Dependent hops counted as "unlocks"
};

struct ScheduleConfig {
    uint32_t max_courses_per_semester = 5;
    uint32_t max_credits_per_semester = 18;
    uint32_t target_semesters = 8;
    uint32_t default_credits = 3;
    std::string priority = "unlock_first";  ///< "unlock_first", "shallow_first", "lexicographic"
};

struct PathsConfig {
    uint32_t max_paths = 3;
    uint32_t exhaustive_limit = 50;
};

struct ExecutorConfig {
    uint32_t thread_count = 0;              ///< 0 = hardware_concurrency
};

struct TelemetryConfig {
    std::filesystem::path log_dir = "./logs";
    uint32_t max_file_size_mb = 50;
    uint32_t rotate_count = 5;
    std::string log_level = "info";
};

/**
 * @brief Top-level planner configuration.
 */
struct Config {
    AnalysisConfig analysis;
    ReadinessConfig readiness;
    ScheduleConfig schedule;
    PathsConfig paths;
    ExecutorConfig executor;
    TelemetryConfig telemetry;
};

/**
 * @brief Load configuration from a TOML file.
 *
 * Missing keys keep their defaults. Negative integers, schedule and path
 * limits outside their allowed ranges and unknown priority names yield a
 * ConfigError.
 */
Result<Config> load_config(const std::filesystem::path& path);

/**
 * @brief Parse configuration from an in-memory TOML document.
 */
Result<Config> parse_config(std::string_view toml_text);

/**
 * @brief Check value ranges of an already-populated configuration.
 */
Result<void> validate_config(const Config& config);

Config default_config();

}  // namespace course_planner
