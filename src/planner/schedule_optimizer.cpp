/**
 * @file schedule_optimizer.cpp
 * @brief ScheduleOptimizer: greedy semester-by-semester assignment.
 *
 * Algorithm:
 *   remaining = required - completed - enrolled
 *   Reject if any remaining course reaches a prerequisite cycle.
 *   For each semester of the horizon in chronological order:
 *     eligible = remaining courses offered this semester whose direct
 *                prerequisites are completed or placed in an earlier semester
 *     Rank eligible with the priority policy.
 *     Admit in rank order; stop at the course-count cap, skip a course
 *     whose credits would push the semester over the credit cap.
 *
 * Complexity: O(S × R × P) where S = semesters, R = remaining courses,
 * P = prerequisites per course.
 */

#include "planner/schedule_optimizer.hpp"

#include <algorithm>
#include <deque>
#include <unordered_set>

namespace course_planner {

namespace {

std::string semester_display(const SemesterOffering& semester) {
    return semester.name.empty() ? semester.id.label() : semester.name;
}

std::string join(const std::vector<std::string>& items) {
    std::string out;
    for (size_t i = 0; i < items.size(); ++i) {
        if (i > 0) out += ", ";
        out += items[i];
    }
    return out;
}

}  // anonymous namespace

// ─────────────────────────────────────────────
// Value helpers
// ─────────────────────────────────────────────

ScheduleConstraints ScheduleConstraints::from_config(const ScheduleConfig& config) {
    return ScheduleConstraints{
        .max_courses_per_semester = config.max_courses_per_semester,
        .max_credits_per_semester = config.max_credits_per_semester,
        .target_semesters = config.target_semesters,
        .default_credits = config.default_credits
    };
}

std::vector<CourseCode> SemesterPlan::codes() const {
    std::vector<CourseCode> out;
    out.reserve(courses.size());
    for (const auto& c : courses) out.push_back(c.code);
    return out;
}

size_t SchedulePlan::scheduled_count() const noexcept {
    size_t total = 0;
    for (const auto& s : semesters) total += s.courses.size();
    return total;
}

std::vector<CourseCode> SchedulePlan::ordering() const {
    std::vector<CourseCode> out;
    for (const auto& s : semesters) {
        for (const auto& c : s.courses) out.push_back(c.code);
    }
    return out;
}

std::optional<size_t> SchedulePlan::semester_position(const CourseCode& code) const {
    for (size_t i = 0; i < semesters.size(); ++i) {
        for (const auto& c : semesters[i].courses) {
            if (c.code == code) return i;
        }
    }
    return std::nullopt;
}

Result<std::vector<CourseIndex>> remaining_courses(const CourseGraph& graph,
                                                   const StudentState& student,
                                                   const std::vector<CourseCode>& required) {
    std::vector<CourseIndex> out;
    for (const auto& code : required) {
        auto idx = graph.index_of(code);
        if (!idx) return not_found("Required course", code);
        if (student.has_completed(code) || student.enrolled.contains(code)) continue;
        out.push_back(*idx);
    }
    std::sort(out.begin(), out.end());
    out.erase(std::unique(out.begin(), out.end()), out.end());
    return out;
}

Result<std::vector<CandidateRank>> candidate_ranks(const ReachabilityIndex& reach,
                                                   const StudentState& student,
                                                   const std::vector<CourseIndex>& remaining) {
    const auto& graph = reach.graph();
    const size_t n = graph.course_count();
    std::vector<bool> is_remaining(n, false);
    for (auto idx : remaining) is_remaining[idx] = true;

    // Any cycle below a remaining course makes every ordering invalid.
    std::vector<CourseIndex> involved;
    for (auto idx : remaining) {
        auto below = reach.closure(TraversalDirection::Prerequisites, idx);
        if (!below) return below.error();
        involved.insert(involved.end(), below->begin(), below->end());
        involved.push_back(idx);
    }
    std::sort(involved.begin(), involved.end());
    involved.erase(std::unique(involved.begin(), involved.end()), involved.end());

    // A prerequisite always has a smaller chain depth than its dependent, so
    // visiting by ascending chain depth sees prerequisites first.
    std::vector<std::pair<uint32_t, CourseIndex>> by_depth;
    by_depth.reserve(involved.size());
    for (auto idx : involved) {
        auto depth = reach.chain_depth(TraversalDirection::Prerequisites, idx);
        if (!depth) return depth.error();
        by_depth.emplace_back(*depth, idx);
    }
    std::sort(by_depth.begin(), by_depth.end());

    std::vector<uint32_t> remaining_depth(n, 0);
    for (const auto& [_, idx] : by_depth) {
        uint32_t depth = 0;
        for (auto prereq : graph.prerequisite_indices(idx)) {
            if (student.has_completed(graph.code_of(prereq))) continue;
            depth = std::max(depth, remaining_depth[prereq] + 1);
        }
        remaining_depth[idx] = depth;
    }

    std::vector<CandidateRank> ranks;
    ranks.reserve(remaining.size());
    for (auto idx : remaining) {
        std::vector<bool> seen(n, false);
        std::deque<CourseIndex> frontier{idx};
        seen[idx] = true;
        uint32_t unlocks = 0;
        while (!frontier.empty()) {
            auto current = frontier.front();
            frontier.pop_front();
            for (auto dep : graph.dependent_indices(current)) {
                if (seen[dep] || !is_remaining[dep]) continue;
                seen[dep] = true;
                ++unlocks;
                frontier.push_back(dep);
            }
        }
        ranks.push_back(CandidateRank{
            .course = idx,
            .code = graph.code_of(idx),
            .unlocks = unlocks,
            .remaining_depth = remaining_depth[idx]
        });
    }
    return ranks;
}

// ─────────────────────────────────────────────
// ScheduleOptimizer
// ─────────────────────────────────────────────

ScheduleOptimizer::ScheduleOptimizer(const ReachabilityIndex& reach,
                                     std::shared_ptr<const IPriorityPolicy> policy)
    : reach_(reach)
    , policy_(std::move(policy)) {
    if (!policy_) policy_ = std::make_shared<UnlockFirstPolicy>();
}

Result<SchedulePlan> ScheduleOptimizer::optimize(const ScheduleRequest& request) const {
    const auto& graph = reach_.graph();
    const auto& student = request.student;
    const auto& limits = request.constraints;

    auto remaining_result = remaining_courses(graph, student, request.required);
    if (!remaining_result) return remaining_result.error();
    const auto& remaining = *remaining_result;

    auto ranks = candidate_ranks(reach_, student, remaining);
    if (!ranks) return ranks.error();

    const size_t n = graph.course_count();

    // Horizon: chronological, capped at the target semester count.
    std::vector<const SemesterOffering*> horizon;
    horizon.reserve(request.semesters.size());
    for (const auto& s : request.semesters) horizon.push_back(&s);
    std::stable_sort(horizon.begin(), horizon.end(),
                     [](const SemesterOffering* a, const SemesterOffering* b) {
                         return a->id < b->id;
                     });
    if (horizon.size() > limits.target_semesters) horizon.resize(limits.target_semesters);

    std::vector<std::unordered_set<CourseCode>> offered;
    offered.reserve(horizon.size());
    for (const auto* s : horizon) {
        offered.emplace_back(s->offered.begin(), s->offered.end());
    }

    SchedulePlan plan;
    plan.policy = std::string{policy_->name()};

    // With no semesters at all everything is merely unscheduled.
    std::vector<bool> unreachable(n, false);
    for (auto idx : remaining) {
        if (horizon.empty()) break;
        const auto& code = graph.code_of(idx);
        bool anywhere = std::any_of(offered.begin(), offered.end(),
                                    [&](const auto& set) { return set.contains(code); });
        if (!anywhere) {
            unreachable[idx] = true;
            plan.unreachable.push_back(code);
        }
    }

    auto credits_of = [&](CourseIndex idx) -> Credits {
        return graph.at(idx).credits.value_or(limits.default_credits);
    };

    std::vector<bool> satisfied(n, false);
    for (CourseIndex idx = 0; idx < n; ++idx) {
        satisfied[idx] = student.has_completed(graph.code_of(idx));
    }
    std::vector<bool> placed(n, false);
    size_t open = remaining.size() - plan.unreachable.size();

    for (size_t s = 0; s < horizon.size() && open > 0; ++s) {
        std::vector<CandidateRank> eligible;
        for (size_t r = 0; r < remaining.size(); ++r) {
            auto idx = remaining[r];
            if (placed[idx] || unreachable[idx]) continue;
            if (!offered[s].contains(graph.code_of(idx))) continue;
            const auto& prereqs = graph.prerequisite_indices(idx);
            bool ready = std::all_of(prereqs.begin(), prereqs.end(),
                                     [&](CourseIndex p) { return satisfied[p]; });
            if (!ready) continue;
            eligible.push_back((*ranks)[r]);
        }
        policy_->rank(eligible);

        std::vector<CourseIndex> admitted;
        SemesterPlan semester{
            .id = horizon[s]->id,
            .name = horizon[s]->name,
            .courses = {},
            .total_credits = 0
        };
        for (const auto& candidate : eligible) {
            if (semester.courses.size() >= limits.max_courses_per_semester) break;
            Credits credits = credits_of(candidate.course);
            if (credits > limits.max_credits_per_semester - semester.total_credits) continue;

            semester.courses.push_back(ScheduledCourse{
                .code = candidate.code,
                .name = graph.at(candidate.course).name,
                .credits = credits
            });
            semester.total_credits += credits;
            admitted.push_back(candidate.course);
            placed[candidate.course] = true;
            --open;
        }

        // Same-semester placements do not satisfy each other.
        for (auto idx : admitted) satisfied[idx] = true;
        plan.semesters.push_back(std::move(semester));
    }

    for (auto idx : remaining) {
        if (!placed[idx] && !unreachable[idx]) plan.unscheduled.push_back(graph.code_of(idx));
    }

    // ── Warnings ──────────────────────────────
    if (horizon.empty()) {
        plan.warnings.emplace_back("No semesters available for scheduling");
    }
    std::vector<std::string> empty;
    for (size_t s = 0; s < plan.semesters.size(); ++s) {
        if (plan.semesters[s].courses.empty()) empty.push_back(semester_display(*horizon[s]));
    }
    if (!empty.empty()) {
        plan.warnings.push_back("Empty semesters: " + join(empty));
    }
    for (auto idx : remaining) {
        if (placed[idx] || unreachable[idx]) continue;
        Credits credits = credits_of(idx);
        if (credits > limits.max_credits_per_semester) {
            plan.warnings.push_back(graph.code_of(idx) + " carries " + std::to_string(credits)
                                    + " credits, above the per-semester cap of "
                                    + std::to_string(limits.max_credits_per_semester));
        }
    }

    return plan;
}

}  // namespace course_planner
