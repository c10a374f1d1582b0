/**
 * @file readiness.hpp
 * @brief Per-student readiness, eligibility and next-semester recommendations.
 *
 * Readiness measures direct prerequisites only: a course with no direct
 * prerequisites is always "Ready Now", whatever the student has completed.
 * Eligibility is the transitive counterpart and needs a ReachabilityIndex.
 * Only completed courses satisfy a prerequisite; enrolled ones do not.
 */

#pragma once

#include "core/result.hpp"
#include "core/types.hpp"
#include "graph/course_graph.hpp"
#include "graph/reachability.hpp"

#include <optional>
#include <vector>

namespace course_planner {

struct ReadinessReport {
    CourseCode course;
    uint32_t score{0};                      ///< 0..100
    std::vector<CourseCode> required;       ///< Direct prerequisites, sorted
    std::vector<CourseCode> missing;        ///< Sorted
    ReadinessStatus status = ReadinessStatus::NotReady;
};

enum class EligibilityReason : uint8_t {
    Ok,
    MissingPrerequisites
};

[[nodiscard]] constexpr std::string_view to_string(EligibilityReason reason) noexcept {
    switch (reason) {
        case EligibilityReason::Ok:                   return "ok";
        case EligibilityReason::MissingPrerequisites: return "missing_prerequisites";
    }
    return "unknown";
}

struct EligibilityReport {
    CourseCode course;
    std::vector<CourseCode> required;       ///< Transitive prerequisites, sorted
    std::vector<CourseCode> completed;      ///< Student's completed courses, sorted
    std::vector<CourseCode> missing;        ///< Sorted
    bool can_take{false};
    EligibilityReason reason = EligibilityReason::MissingPrerequisites;
};

struct Recommendation {
    ReadinessReport readiness;
    std::optional<Credits> credits;
    std::vector<CourseCode> unlocks;        ///< Dependents within the unlock horizon, sorted
};

class ReadinessScorer {
public:
    explicit ReadinessScorer(const CourseGraph& graph, uint32_t almost_ready_threshold = 75)
        : graph_(graph), almost_ready_threshold_(almost_ready_threshold) {}

    /**
     * @brief Score a student's readiness for a target course.
     *
     * score = 100 when the course has no direct prerequisites or none are
     * missing, otherwise floor(100 * (1 - missing / required)).
     */
    [[nodiscard]] Result<ReadinessReport> score(const StudentState& student,
                                                const CourseCode& target) const;

    [[nodiscard]] static uint32_t compute_score(size_t required, size_t missing) noexcept;
    [[nodiscard]] ReadinessStatus classify(uint32_t score) const noexcept;

    /// Transitive check: every prerequisite at any depth must be completed.
    [[nodiscard]] Result<EligibilityReport> check_eligibility(const StudentState& student,
                                                              const CourseCode& target,
                                                              const ReachabilityIndex& reach) const;

    /// Same as check_eligibility for an ad-hoc list of completed courses.
    [[nodiscard]] Result<EligibilityReport> validate_completed(
        const CourseCode& target, const std::vector<CourseCode>& completed,
        const ReachabilityIndex& reach) const;

    /**
     * @brief Offered courses the student has not completed, scoring at least
     *        `min_score`, ordered by score descending then code.
     */
    [[nodiscard]] Result<std::vector<Recommendation>> recommend(
        const StudentState& student, const SemesterOffering& semester,
        const ReachabilityIndex& reach, uint32_t min_score, size_t limit,
        uint32_t unlock_horizon) const;

private:
    const CourseGraph& graph_;
    uint32_t almost_ready_threshold_;
};

}  // namespace course_planner
