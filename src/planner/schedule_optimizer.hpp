/**
 * @file schedule_optimizer.hpp
 * @brief ScheduleOptimizer: assigns a program's remaining courses to
 *        offered semesters under per-semester caps.
 *
 * Infeasibility never fails a request: courses that cannot be placed are
 * reported as `unscheduled` (horizon or caps ran out) or `unreachable`
 * (never offered inside the horizon). Only a prerequisite cycle under a
 * remaining course or an unknown required code aborts the optimization.
 */

#pragma once

#include "core/config.hpp"
#include "core/result.hpp"
#include "core/types.hpp"
#include "graph/reachability.hpp"
#include "planner/priority_policy.hpp"

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace course_planner {

struct ScheduleConstraints {
    uint32_t max_courses_per_semester = 5;
    uint32_t max_credits_per_semester = 18;
    uint32_t target_semesters = 8;
    Credits default_credits = 3;        ///< Charged for courses with unknown credits

    [[nodiscard]] static ScheduleConstraints from_config(const ScheduleConfig& config);
};

struct ScheduleRequest {
    StudentState student;
    std::vector<CourseCode> required;           ///< Program requirements, completed ones included
    std::vector<SemesterOffering> semesters;    ///< Future semesters, any order
    ScheduleConstraints constraints;
};

struct ScheduledCourse {
    CourseCode code;
    std::string name;
    Credits credits{0};
};

struct SemesterPlan {
    SemesterId id;
    std::string name;
    std::vector<ScheduledCourse> courses;       ///< In admission order
    Credits total_credits{0};

    [[nodiscard]] std::vector<CourseCode> codes() const;
};

/**
 * @brief Output of one optimization run.
 *
 * `semesters` stops at the first semester after which nothing remains to
 * place, so trailing empty semesters of the horizon are not listed.
 */
struct SchedulePlan {
    std::string policy;
    std::vector<SemesterPlan> semesters;
    std::vector<CourseCode> unscheduled;        ///< Sorted
    std::vector<CourseCode> unreachable;        ///< Sorted
    std::vector<std::string> warnings;

    [[nodiscard]] size_t scheduled_count() const noexcept;
    [[nodiscard]] bool complete() const noexcept {
        return unscheduled.empty() && unreachable.empty();
    }
    /// Scheduled courses flattened semester by semester.
    [[nodiscard]] std::vector<CourseCode> ordering() const;
    [[nodiscard]] std::optional<size_t> semester_position(const CourseCode& code) const;
};

class ScheduleOptimizer {
public:
    ScheduleOptimizer(const ReachabilityIndex& reach,
                      std::shared_ptr<const IPriorityPolicy> policy);

    [[nodiscard]] Result<SchedulePlan> optimize(const ScheduleRequest& request) const;

    [[nodiscard]] const IPriorityPolicy& policy() const noexcept { return *policy_; }

private:
    const ReachabilityIndex& reach_;
    std::shared_ptr<const IPriorityPolicy> policy_;
};

/**
 * @brief Courses of `required` still to be planned for a student: not
 *        completed, not enrolled, deduplicated and sorted.
 *
 * Fails with NotFound for a code absent from the catalog.
 */
[[nodiscard]] Result<std::vector<CourseIndex>> remaining_courses(
    const CourseGraph& graph, const StudentState& student,
    const std::vector<CourseCode>& required);

/**
 * @brief Ranking attributes of each remaining course, in the order of
 *        `remaining`.
 *
 * `unlocks` counts remaining courses that transitively require the course;
 * `remaining_depth` is its longest chain of not-completed prerequisites.
 * Fails with CycleDetected when any remaining course reaches a cycle.
 */
[[nodiscard]] Result<std::vector<CandidateRank>> candidate_ranks(
    const ReachabilityIndex& reach, const StudentState& student,
    const std::vector<CourseIndex>& remaining);

}  // namespace course_planner
