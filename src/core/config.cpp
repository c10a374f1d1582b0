/**
 * @file config.cpp
 * @brief Configuration loading from TOML files using toml++.
 */

#include "core/config.hpp"

#include <toml++/toml.hpp>

#include <limits>
#include <optional>

namespace course_planner {

namespace {

/// Reads unsigned keys of one section; the first negative or oversized value is kept as an error.
class SectionReader {
public:
    SectionReader(toml::node_view<const toml::node> section, std::string_view name,
                  std::optional<Error>& error)
        : section_(section), name_(name), error_(error) {}

    uint32_t u32(std::string_view key, uint32_t fallback) {
        auto value = section_[key].value<int64_t>();
        if (!value) return fallback;
        if (*value < 0 || *value > std::numeric_limits<uint32_t>::max()) {
            if (!error_) {
                error_ = Error{ErrorCode::ConfigError,
                               std::string{name_} + "." + std::string{key}
                               + " must be a non-negative 32-bit integer, got "
                               + std::to_string(*value)};
            }
            return fallback;
        }
        return static_cast<uint32_t>(*value);
    }

private:
    toml::node_view<const toml::node> section_;
    std::string_view name_;
    std::optional<Error>& error_;
};

Result<Config> from_table(const toml::table& tbl) {
    Config config;
    std::optional<Error> error;

    // [analysis]
    if (auto analysis = tbl["analysis"]; analysis.is_table()) {
        SectionReader read(analysis, "analysis", error);
        auto& a = config.analysis;
        a.bottleneck_min_dependents = read.u32("bottleneck_min_dependents",
                                               a.bottleneck_min_dependents);
        a.bottleneck_min_prerequisites = read.u32("bottleneck_min_prerequisites",
                                                  a.bottleneck_min_prerequisites);
        a.bottleneck_depth = read.u32("bottleneck_depth", a.bottleneck_depth);
        a.bottleneck_limit = read.u32("bottleneck_limit", a.bottleneck_limit);
        a.max_traversal_depth = read.u32("max_traversal_depth", a.max_traversal_depth);
        a.deep_chain_min_depth = read.u32("deep_chain_min_depth", a.deep_chain_min_depth);
    }

    // [readiness]
    if (auto readiness = tbl["readiness"]; readiness.is_table()) {
        SectionReader read(readiness, "readiness", error);
        auto& r = config.readiness;
        r.almost_ready_threshold = read.u32("almost_ready_threshold", r.almost_ready_threshold);
        r.recommendation_min_score = read.u32("recommendation_min_score",
                                              r.recommendation_min_score);
        r.recommendation_limit = read.u32("recommendation_limit", r.recommendation_limit);
        r.unlock_horizon = read.u32("unlock_horizon", r.unlock_horizon);
    }

    // [schedule]
    if (auto schedule = tbl["schedule"]; schedule.is_table()) {
        SectionReader read(schedule, "schedule", error);
        auto& s = config.schedule;
        s.max_courses_per_semester = read.u32("max_courses_per_semester",
                                              s.max_courses_per_semester);
        s.max_credits_per_semester = read.u32("max_credits_per_semester",
                                              s.max_credits_per_semester);
        s.target_semesters = read.u32("target_semesters", s.target_semesters);
        s.default_credits = read.u32("default_credits", s.default_credits);
        s.priority = schedule["priority"].value_or(s.priority);
    }

    // [paths]
    if (auto paths = tbl["paths"]; paths.is_table()) {
        SectionReader read(paths, "paths", error);
        config.paths.max_paths = read.u32("max_paths", config.paths.max_paths);
        config.paths.exhaustive_limit = read.u32("exhaustive_limit",
                                                 config.paths.exhaustive_limit);
    }

    // [executor]
    if (auto executor = tbl["executor"]; executor.is_table()) {
        SectionReader read(executor, "executor", error);
        config.executor.thread_count = read.u32("thread_count", config.executor.thread_count);
    }

    // [telemetry]
    if (auto telemetry = tbl["telemetry"]; telemetry.is_table()) {
        SectionReader read(telemetry, "telemetry", error);
        config.telemetry.log_dir = telemetry["log_dir"].value_or(std::string{"./logs"});
        config.telemetry.max_file_size_mb = read.u32("max_file_size_mb",
                                                     config.telemetry.max_file_size_mb);
        config.telemetry.rotate_count = read.u32("rotate_count", config.telemetry.rotate_count);
        config.telemetry.log_level = telemetry["log_level"].value_or(std::string{"info"});
    }

    if (error) return *error;
    return config;
}

Result<Config> checked(Result<Config> config) {
    if (!config) return config;
    if (auto valid = validate_config(*config); !valid) {
        return valid.error();
    }
    return config;
}

}  // anonymous namespace

Result<void> validate_config(const Config& config) {
    const auto& s = config.schedule;
    if (s.max_courses_per_semester < 1 || s.max_courses_per_semester > 8) {
        return Error{ErrorCode::ConfigError,
                     "schedule.max_courses_per_semester must be within [1, 8], got "
                     + std::to_string(s.max_courses_per_semester)};
    }
    if (s.max_credits_per_semester < 6 || s.max_credits_per_semester > 24) {
        return Error{ErrorCode::ConfigError,
                     "schedule.max_credits_per_semester must be within [6, 24], got "
                     + std::to_string(s.max_credits_per_semester)};
    }
    if (s.target_semesters < 1 || s.target_semesters > 12) {
        return Error{ErrorCode::ConfigError,
                     "schedule.target_semesters must be within [1, 12], got "
                     + std::to_string(s.target_semesters)};
    }
    if (s.priority != "unlock_first" && s.priority != "shallow_first"
        && s.priority != "lexicographic") {
        return Error{ErrorCode::ConfigError, "Unknown schedule.priority: " + s.priority};
    }
    const auto depth = config.analysis.bottleneck_depth;
    if (depth < 1 || depth > 3) {
        return Error{ErrorCode::ConfigError,
                     "analysis.bottleneck_depth must be within [1, 3], got "
                     + std::to_string(depth)};
    }
    if (s.default_credits < 1 || s.default_credits > 24) {
        return Error{ErrorCode::ConfigError,
                     "schedule.default_credits must be within [1, 24], got "
                     + std::to_string(s.default_credits)};
    }
    const auto& p = config.paths;
    if (p.max_paths < 1 || p.max_paths > 20) {
        return Error{ErrorCode::ConfigError,
                     "paths.max_paths must be within [1, 20], got " + std::to_string(p.max_paths)};
    }
    if (p.exhaustive_limit > 10000) {
        return Error{ErrorCode::ConfigError,
                     "paths.exhaustive_limit must be at most 10000, got "
                     + std::to_string(p.exhaustive_limit)};
    }
    if (config.readiness.almost_ready_threshold > 100
        || config.readiness.recommendation_min_score > 100) {
        return Error{ErrorCode::ConfigError, "readiness thresholds must be within [0, 100]"};
    }
    return {};
}

Result<Config> load_config(const std::filesystem::path& path) {
    if (!std::filesystem::exists(path)) {
        return Error{ErrorCode::IoError, "Configuration file not found: " + path.string()};
    }

    try {
        auto tbl = toml::parse_file(path.string());
        return checked(from_table(tbl));
    } catch (const toml::parse_error& err) {
        return Error{ErrorCode::ConfigError,
                     std::string{"TOML parse error: "} + std::string{err.description()}};
    }
}

Result<Config> parse_config(std::string_view toml_text) {
    try {
        auto tbl = toml::parse(toml_text);
        return checked(from_table(tbl));
    } catch (const toml::parse_error& err) {
        return Error{ErrorCode::ConfigError,
                     std::string{"TOML parse error: "} + std::string{err.description()}};
    }
}

Config default_config() {
    return Config{};
}

}  // namespace course_planner
