/**
 * @file degree_planner.hpp
 * @brief Unconstrained degree plan: remaining courses layered by prerequisites.
 */

#pragma once

#include "core/result.hpp"
#include "core/types.hpp"
#include "graph/reachability.hpp"

#include <vector>

namespace course_planner {

struct DegreePlan {
    std::vector<CourseCode> remaining;              ///< Sorted
    std::vector<std::vector<CourseCode>> layers;    ///< Each layer sorted
};

/**
 * @brief Layer the remaining courses of a program into the fewest semesters.
 *
 * Offerings and caps are ignored. A course joins the first layer after all
 * of its remaining prerequisites; completed prerequisites and those outside
 * the remaining set do not hold it back. Fails with CycleDetected, naming
 * the cycle, when some remaining courses can never be layered, and with
 * NotFound for a required code absent from the catalog.
 */
[[nodiscard]] Result<DegreePlan> plan_degree(const ReachabilityIndex& reach,
                                             const StudentState& student,
                                             const std::vector<CourseCode>& required);

}  // namespace course_planner
