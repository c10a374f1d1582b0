/**
 * @file planning_session.hpp
 * @brief Top-level PlanningSession facade: ties all modules together.
 *
 * Provides a single entry point for:
 *   1. Loading a catalog into the shared snapshot cache
 *   2. Graph queries (cycles, closures, chains)
 *   3. Student analyses (readiness, eligibility, recommendations, progress)
 *   4. Planning (degree plan, optimized schedule, graduation paths)
 *
 * Every request takes its own reference to the current snapshot and builds
 * its own ReachabilityIndex, so requests never share mutable state. This is
 * the only layer that logs: snapshot stats, cycles, rejected requests and
 * plan summaries.
 */

#pragma once

#include "analysis/bottleneck.hpp"
#include "analysis/progress.hpp"
#include "analysis/readiness.hpp"
#include "core/config.hpp"
#include "core/logger.hpp"
#include "core/result.hpp"
#include "core/types.hpp"
#include "executor/request_pool.hpp"
#include "graph/cycle_detector.hpp"
#include "graph/reachability.hpp"
#include "planner/degree_planner.hpp"
#include "planner/path_explorer.hpp"
#include "planner/schedule_optimizer.hpp"
#include "snapshot/catalog_loader.hpp"
#include "snapshot/snapshot_cache.hpp"

#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace course_planner {

class PlanningSession {
public:
    struct Options {
        Config config;
        std::unique_ptr<ILogSink> log_sink;
        LogLevel log_level = LogLevel::Info;
    };

    explicit PlanningSession(Options opts);

    PlanningSession(const PlanningSession&) = delete;
    PlanningSession& operator=(const PlanningSession&) = delete;

    // ── Snapshot ─────────────────────────────
    /// Load a catalog file and publish it; the old snapshot stays on failure.
    Result<uint64_t> load(const std::filesystem::path& catalog_path);
    /// Validate and publish an in-memory document.
    Result<uint64_t> install(const CatalogDocument& document);
    [[nodiscard]] std::shared_ptr<const PlanningSnapshot> snapshot() const { return cache_.current(); }

    // ── Graph queries ────────────────────────
    [[nodiscard]] Result<std::vector<Cycle>> cycles(bool enumerate_all = false);
    [[nodiscard]] Result<std::vector<CourseCode>> prerequisites(const CourseCode& code);
    [[nodiscard]] Result<std::vector<CourseCode>> dependents(const CourseCode& code);
    [[nodiscard]] Result<Closure> transitive_prerequisites(
        const CourseCode& code, std::optional<uint32_t> max_depth = std::nullopt);
    [[nodiscard]] Result<Closure> transitive_dependents(
        const CourseCode& code, std::optional<uint32_t> max_depth = std::nullopt);
    [[nodiscard]] Result<std::vector<DepthLayer>> deep_chains(
        const CourseCode& code, std::optional<uint32_t> min_depth = std::nullopt);
    [[nodiscard]] Result<uint32_t> prerequisite_depth(const CourseCode& code);

    // ── Student analyses ─────────────────────
    [[nodiscard]] Result<ReadinessReport> readiness(const StudentId& student,
                                                    const CourseCode& course);
    [[nodiscard]] Result<EligibilityReport> eligibility(const StudentId& student,
                                                        const CourseCode& course);
    [[nodiscard]] Result<EligibilityReport> validate_completed(
        const CourseCode& course, const std::vector<CourseCode>& completed);
    [[nodiscard]] Result<std::vector<Recommendation>> recommend(const StudentId& student,
                                                                std::string_view semester);
    [[nodiscard]] Result<RemainingBuckets> buckets(const StudentId& student);
    [[nodiscard]] Result<std::vector<BottleneckEntry>> bottlenecks();
    [[nodiscard]] Result<std::vector<CourseImpact>> impact(std::string_view prefix = {});
    /// All students, summarized concurrently on the request pool.
    [[nodiscard]] Result<std::vector<ProgressSummary>> progress();

    // ── Planning ─────────────────────────────
    [[nodiscard]] Result<DegreePlan> degree_plan(const StudentId& student);
    /// Plan over the snapshot's semesters after `after` (all when unset).
    [[nodiscard]] Result<SchedulePlan> schedule(const StudentId& student,
                                                std::optional<SemesterId> after = std::nullopt);
    [[nodiscard]] Result<std::vector<GraduationPath>> paths(
        const StudentId& student, std::optional<SemesterId> after = std::nullopt);

    // ── Accessors ────────────────────────────
    Logger& logger() { return logger_; }
    [[nodiscard]] const Config& config() const { return config_; }
    RequestPool& pool() { return pool_; }

private:
    struct StudentContext {
        std::shared_ptr<const PlanningSnapshot> snapshot;
        StudentState student;
        std::optional<ProgramRequirement> program;
    };

    [[nodiscard]] Result<std::shared_ptr<const PlanningSnapshot>> require_snapshot(
        std::string_view operation);
    [[nodiscard]] Result<StudentContext> student_context(std::string_view operation,
                                                         const StudentId& id,
                                                         bool need_program);
    [[nodiscard]] ScheduleRequest schedule_request(const StudentContext& ctx,
                                                   std::optional<SemesterId> after) const;
    uint64_t publish(PlanningSnapshot snapshot, std::string_view source);

    template <typename T>
    Result<T> checked(std::string_view operation, Result<T> result);

    Config config_;
    Logger logger_;
    SnapshotCache cache_;
    RequestPool pool_;
};

}  // namespace course_planner
