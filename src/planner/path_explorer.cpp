/**
 * @file path_explorer.cpp
 * @brief GraduationPathExplorer: policy-varied and exhaustive orderings.
 */

#include "planner/path_explorer.hpp"

#include <algorithm>
#include <limits>
#include <set>
#include <unordered_map>

namespace course_planner {

namespace {

/**
 * Backtracking enumeration of topological orderings over a fixed course
 * set. Only prerequisites inside the set constrain the order. Stops as soon
 * as `limit` orderings have been collected.
 */
class OrderingEnumerator {
public:
    OrderingEnumerator(const CourseGraph& graph, const std::vector<CourseIndex>& courses,
                       uint32_t limit)
        : graph_(graph)
        , courses_(courses)
        , limit_(limit)
        , in_set_(graph.course_count(), false)
        , taken_(graph.course_count(), false) {
        for (auto idx : courses_) in_set_[idx] = true;
        order_.reserve(courses_.size());
    }

    std::vector<std::vector<CourseCode>> run() {
        if (limit_ > 0) extend();
        return std::move(results_);
    }

private:
    [[nodiscard]] bool available(CourseIndex idx) const {
        for (auto prereq : graph_.prerequisite_indices(idx)) {
            if (in_set_[prereq] && !taken_[prereq]) return false;
        }
        return true;
    }

    void extend() {
        if (order_.size() == courses_.size()) {
            results_.push_back(graph_.codes(order_));
            return;
        }
        for (auto idx : courses_) {
            if (results_.size() >= limit_) return;
            if (taken_[idx] || !available(idx)) continue;
            taken_[idx] = true;
            order_.push_back(idx);
            extend();
            order_.pop_back();
            taken_[idx] = false;
        }
    }

    const CourseGraph& graph_;
    const std::vector<CourseIndex>& courses_;
    uint32_t limit_;
    std::vector<bool> in_set_;
    std::vector<bool> taken_;
    std::vector<CourseIndex> order_;
    std::vector<std::vector<CourseCode>> results_;
};

}  // anonymous namespace

GraduationPathExplorer::GraduationPathExplorer(
    const ReachabilityIndex& reach,
    std::vector<std::shared_ptr<const IPriorityPolicy>> policies)
    : reach_(reach)
    , policies_(std::move(policies)) {}

Result<std::vector<GraduationPath>> GraduationPathExplorer::explore(
    const ScheduleRequest& request, const PathExplorerOptions& options) const {
    const auto& graph = reach_.graph();

    auto remaining = remaining_courses(graph, request.student, request.required);
    if (!remaining) return remaining.error();
    auto ranks = candidate_ranks(reach_, request.student, *remaining);
    if (!ranks) return ranks.error();

    std::vector<GraduationPath> paths;
    if (remaining->empty() || options.max_paths == 0) return paths;

    std::set<std::vector<CourseCode>> seen;

    for (const auto& policy : policies_) {
        if (paths.size() >= options.max_paths) break;

        ScheduleOptimizer optimizer(reach_, policy);
        auto plan = optimizer.optimize(request);
        if (!plan) return plan.error();

        auto ordering = flatten(*plan, *ranks, *policy);
        if (!seen.insert(ordering).second) continue;
        paths.push_back(GraduationPath{
            .strategy = std::string{policy->name()},
            .ordering = std::move(ordering),
            .plan = std::move(*plan)
        });
    }

    if (paths.size() < options.max_paths) {
        auto orderings = enumerate_orderings(request.student, request.required,
                                             options.exhaustive_limit);
        if (!orderings) return orderings.error();
        for (auto& ordering : *orderings) {
            if (paths.size() >= options.max_paths) break;
            if (!seen.insert(ordering).second) continue;
            paths.push_back(GraduationPath{
                .strategy = "exhaustive",
                .ordering = std::move(ordering),
                .plan = std::nullopt
            });
        }
    }
    return paths;
}

Result<std::vector<std::vector<CourseCode>>> GraduationPathExplorer::enumerate_orderings(
    const StudentState& student, const std::vector<CourseCode>& required,
    uint32_t limit) const {
    const auto& graph = reach_.graph();

    auto remaining = remaining_courses(graph, student, required);
    if (!remaining) return remaining.error();
    for (auto idx : *remaining) {
        auto below = reach_.closure(TraversalDirection::Prerequisites, idx);
        if (!below) return below.error();
    }

    OrderingEnumerator enumerator(graph, *remaining, limit);
    return enumerator.run();
}

std::vector<CourseCode> GraduationPathExplorer::flatten(
    const SchedulePlan& plan, const std::vector<CandidateRank>& ranks,
    const IPriorityPolicy& policy) const {
    const auto& graph = reach_.graph();
    constexpr size_t kUnplaced = std::numeric_limits<size_t>::max();

    std::unordered_map<CourseIndex, size_t> slot;
    for (const auto& rank : ranks) {
        slot[rank.course] = plan.semester_position(rank.code).value_or(kUnplaced);
    }

    // Kahn's algorithm keyed by (semester, policy order); leftovers go last.
    std::vector<bool> emitted(graph.course_count(), false);
    std::vector<CourseCode> ordering;
    ordering.reserve(ranks.size());

    while (ordering.size() < ranks.size()) {
        const CandidateRank* best = nullptr;
        for (const auto& rank : ranks) {
            if (emitted[rank.course]) continue;
            bool ready = true;
            for (auto prereq : graph.prerequisite_indices(rank.course)) {
                if (slot.contains(prereq) && !emitted[prereq]) {
                    ready = false;
                    break;
                }
            }
            if (!ready) continue;
            if (best == nullptr
                || slot[rank.course] < slot[best->course]
                || (slot[rank.course] == slot[best->course] && policy.precedes(rank, *best))) {
                best = &rank;
            }
        }
        // candidate_ranks has already rejected cycles, so some course is always ready.
        emitted[best->course] = true;
        ordering.push_back(best->code);
    }
    return ordering;
}

bool satisfies_prerequisite_order(const CourseGraph& graph,
                                  const std::vector<CourseCode>& ordering) {
    std::unordered_map<CourseCode, size_t> position;
    for (size_t i = 0; i < ordering.size(); ++i) {
        if (!position.emplace(ordering[i], i).second) return false;
    }
    for (size_t i = 0; i < ordering.size(); ++i) {
        auto prereqs = graph.prerequisites(ordering[i]);
        if (!prereqs) return false;
        for (const auto& p : *prereqs) {
            auto it = position.find(p);
            if (it != position.end() && it->second >= i) return false;
        }
    }
    return true;
}

}  // namespace course_planner
