/**
 * @file progress.cpp
 * @brief Progress summaries and remaining-course buckets.
 */

#include "analysis/progress.hpp"

#include <algorithm>
#include <cmath>

namespace course_planner {

ProgressSummary summarize_progress(const CourseGraph& graph,
                                   const StudentState& student,
                                   Credits default_credits) {
    ProgressSummary summary;
    summary.student = student.id;
    summary.name = student.name;
    summary.program = student.program;
    summary.completed = static_cast<uint32_t>(student.completed.size());

    for (const auto& code : student.completed) {
        const auto* course = graph.find(code);
        summary.completed_credits += (course && course->credits) ? *course->credits
                                                                 : default_credits;
    }

    for (CourseIndex idx = 0; idx < graph.course_count(); ++idx) {
        if (student.has_completed(graph.code_of(idx))) continue;

        bool all_met = true;
        for (auto prereq : graph.prerequisite_indices(idx)) {
            if (!student.has_completed(graph.code_of(prereq))) {
                all_met = false;
                break;
            }
        }
        if (all_met) {
            ++summary.available;
        } else {
            ++summary.blocked;
        }
    }

    const double denominator = static_cast<double>(summary.completed + summary.available
                                                   + summary.blocked);
    if (denominator > 0.0) {
        double pct = 100.0 * static_cast<double>(summary.completed) / denominator;
        summary.progress_percent = std::round(pct * 100.0) / 100.0;
    }
    return summary;
}

void sort_by_progress(std::vector<ProgressSummary>& summaries) {
    std::sort(summaries.begin(), summaries.end(),
              [](const ProgressSummary& a, const ProgressSummary& b) {
                  if (a.progress_percent != b.progress_percent) {
                      return a.progress_percent > b.progress_percent;
                  }
                  return a.student < b.student;
              });
}

Result<RemainingBuckets> bucket_remaining(const CourseGraph& graph,
                                          const StudentState& student,
                                          const ProgramRequirement& program) {
    std::vector<CourseCode> remaining;
    for (const auto& code : program.required) {
        if (student.has_completed(code) || student.enrolled.contains(code)) continue;
        remaining.push_back(code);
    }
    std::sort(remaining.begin(), remaining.end());
    remaining.erase(std::unique(remaining.begin(), remaining.end()), remaining.end());

    RemainingBuckets buckets;
    for (const auto& code : remaining) {
        auto prereqs = graph.prerequisites(code);
        if (!prereqs) return prereqs.error();

        BucketEntry entry{.course = code, .missing = {}};
        for (const auto& p : *prereqs) {
            if (!student.has_completed(p)) entry.missing.push_back(p);
        }
        buckets[bucket_for_missing(entry.missing.size())].push_back(std::move(entry));
    }
    return buckets;
}

}  // namespace course_planner
