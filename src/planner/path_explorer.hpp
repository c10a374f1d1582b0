/**
 * @file path_explorer.hpp
 * @brief GraduationPathExplorer: alternative valid total orderings of a
 *        student's remaining required courses.
 *
 * Each built-in priority policy drives one ScheduleOptimizer run; the plan
 * is flattened into a total ordering (scheduled courses semester by
 * semester, then everything left over in policy order). Distinct orderings
 * are kept. When policy variation yields fewer than requested, exhaustive
 * backtracking enumeration tops the list up.
 */

#pragma once

#include "core/result.hpp"
#include "core/types.hpp"
#include "graph/reachability.hpp"
#include "planner/priority_policy.hpp"
#include "planner/schedule_optimizer.hpp"

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace course_planner {

struct GraduationPath {
    std::string strategy;                   ///< Policy name, or "exhaustive"
    std::vector<CourseCode> ordering;
    std::optional<SchedulePlan> plan;       ///< Set for policy-driven paths
};

struct PathExplorerOptions {
    uint32_t max_paths = 3;
    uint32_t exhaustive_limit = 50;
};

class GraduationPathExplorer {
public:
    explicit GraduationPathExplorer(
        const ReachabilityIndex& reach,
        std::vector<std::shared_ptr<const IPriorityPolicy>> policies = builtin_priority_policies());

    /// Up to `max_paths` distinct orderings; empty when nothing remains.
    [[nodiscard]] Result<std::vector<GraduationPath>> explore(
        const ScheduleRequest& request, const PathExplorerOptions& options) const;

    /// Topological orderings of the remaining courses in lexicographic
    /// generation order, at most `limit` of them.
    [[nodiscard]] Result<std::vector<std::vector<CourseCode>>> enumerate_orderings(
        const StudentState& student, const std::vector<CourseCode>& required,
        uint32_t limit) const;

private:
    [[nodiscard]] std::vector<CourseCode> flatten(const SchedulePlan& plan,
                                                  const std::vector<CandidateRank>& ranks,
                                                  const IPriorityPolicy& policy) const;

    const ReachabilityIndex& reach_;
    std::vector<std::shared_ptr<const IPriorityPolicy>> policies_;
};

/**
 * @brief True when every course in `ordering` appears once and after each of
 *        its direct prerequisites that the ordering also contains.
 */
[[nodiscard]] bool satisfies_prerequisite_order(const CourseGraph& graph,
                                                const std::vector<CourseCode>& ordering);

}  // namespace course_planner
