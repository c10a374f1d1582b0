/**
 * @file bottleneck.cpp
 * @brief BottleneckAnalyzer: bottleneck ranking and difficulty/impact scoring.
 *
 * Scoring:
 *   difficulty = 2 * total_prerequisites + 10 * max_prerequisite_depth
 *   impact     = 2 * dependents          +  5 * max_dependent_depth
 *
 * Type:
 *   Foundation  no prerequisites, more than 5 dependents
 *   Capstone    more than 5 prerequisites, no dependents
 *   Core        more than 3 dependents
 *   Advanced    more than 3 prerequisites
 *   Regular     everything else
 */

#include "analysis/bottleneck.hpp"

#include <algorithm>

namespace course_planner {

std::vector<BottleneckEntry> BottleneckAnalyzer::rank(const BottleneckCriteria& criteria) const {
    const auto& graph = reach_.graph();
    const uint32_t depth = std::clamp<uint32_t>(criteria.prerequisite_depth, 1, 3);

    std::vector<BottleneckEntry> entries;
    for (CourseIndex idx = 0; idx < graph.course_count(); ++idx) {
        const auto& dependents = graph.dependent_indices(idx);
        auto unlocks = static_cast<uint32_t>(dependents.size());
        if (unlocks < criteria.min_dependents) continue;

        auto prereqs = reach_.bounded_closure(TraversalDirection::Prerequisites, idx, depth);
        auto total = static_cast<uint32_t>(prereqs.size());
        if (total < criteria.min_prerequisites) continue;

        entries.push_back(BottleneckEntry{
            .course = graph.code_of(idx),
            .name = graph.at(idx).name,
            .unlocks = unlocks,
            .total_prerequisites = total,
            .unlocked_courses = graph.codes(dependents)
        });
    }

    std::sort(entries.begin(), entries.end(),
              [](const BottleneckEntry& a, const BottleneckEntry& b) {
                  if (a.unlocks != b.unlocks) return a.unlocks > b.unlocks;
                  if (a.total_prerequisites != b.total_prerequisites) {
                      return a.total_prerequisites > b.total_prerequisites;
                  }
                  return a.course < b.course;
              });

    if (criteria.limit > 0 && entries.size() > criteria.limit) {
        entries.resize(criteria.limit);
    }
    return entries;
}

CourseType BottleneckAnalyzer::classify(uint32_t total_prerequisites,
                                        uint32_t dependents) noexcept {
    if (total_prerequisites == 0 && dependents > 5) return CourseType::Foundation;
    if (total_prerequisites > 5 && dependents == 0) return CourseType::Capstone;
    if (dependents > 3) return CourseType::Core;
    if (total_prerequisites > 3) return CourseType::Advanced;
    return CourseType::Regular;
}

Result<std::vector<CourseImpact>> BottleneckAnalyzer::impact(std::string_view prefix) const {
    const auto& graph = reach_.graph();
    std::vector<CourseImpact> out;

    for (CourseIndex idx = 0; idx < graph.course_count(); ++idx) {
        const auto& course = graph.at(idx);
        if (!prefix.empty() && !course.code.starts_with(prefix) && course.department != prefix) {
            continue;
        }

        auto prereqs = reach_.closure(TraversalDirection::Prerequisites, idx);
        if (!prereqs) return prereqs.error();
        auto dependents = reach_.closure(TraversalDirection::Dependents, idx);
        if (!dependents) return dependents.error();
        auto chain = reach_.critical_chain(course.code);
        if (!chain) return chain.error();

        CourseImpact item;
        item.course = course.code;
        item.name = course.name;
        item.direct_prerequisites = static_cast<uint32_t>(graph.prerequisite_indices(idx).size());
        item.total_prerequisites = static_cast<uint32_t>(prereqs->size());
        item.max_prerequisite_depth =
            reach_.chain_depth(TraversalDirection::Prerequisites, idx).value_or(0);
        item.dependents = static_cast<uint32_t>(dependents->size());
        item.max_dependent_depth =
            reach_.chain_depth(TraversalDirection::Dependents, idx).value_or(0);
        item.critical_chain = std::move(*chain);
        item.difficulty = 2 * item.total_prerequisites + 10 * item.max_prerequisite_depth;
        item.impact = 2 * item.dependents + 5 * item.max_dependent_depth;
        item.type = classify(item.total_prerequisites, item.dependents);
        out.push_back(std::move(item));
    }

    std::sort(out.begin(), out.end(), [](const CourseImpact& a, const CourseImpact& b) {
        if (a.difficulty != b.difficulty) return a.difficulty > b.difficulty;
        if (a.impact != b.impact) return a.impact > b.impact;
        return a.course < b.course;
    });
    return out;
}

}  // namespace course_planner
