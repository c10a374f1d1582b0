/**
 * @file degree_planner.cpp
 * @brief Layered (Kahn-style) degree planning.
 */

#include "planner/degree_planner.hpp"
#include "planner/schedule_optimizer.hpp"

namespace course_planner {

Result<DegreePlan> plan_degree(const ReachabilityIndex& reach,
                               const StudentState& student,
                               const std::vector<CourseCode>& required) {
    const auto& graph = reach.graph();

    auto remaining = remaining_courses(graph, student, required);
    if (!remaining) return remaining.error();

    DegreePlan plan;
    plan.remaining = graph.codes(*remaining);

    std::vector<bool> pending(graph.course_count(), false);
    for (auto idx : *remaining) pending[idx] = true;

    std::vector<CourseIndex> open = *remaining;
    while (!open.empty()) {
        std::vector<CourseIndex> layer;
        std::vector<CourseIndex> rest;
        for (auto idx : open) {
            bool blocked = false;
            for (auto prereq : graph.prerequisite_indices(idx)) {
                if (pending[prereq]) {
                    blocked = true;
                    break;
                }
            }
            (blocked ? rest : layer).push_back(idx);
        }

        if (layer.empty()) {
            // Every open course waits on another open course: a cycle is reachable.
            auto below = reach.closure(TraversalDirection::Prerequisites, rest.front());
            if (!below) return below.error();
            return make_error<DegreePlan>(ErrorCode::CycleDetected,
                                          "Cycle detected in degree requirements",
                                          graph.codes(rest));
        }

        for (auto idx : layer) pending[idx] = false;
        plan.layers.push_back(graph.codes(layer));
        open = std::move(rest);
    }
    return plan;
}

}  // namespace course_planner
