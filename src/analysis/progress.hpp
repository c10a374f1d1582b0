/**
 * @file progress.hpp
 * @brief Student progress summaries and remaining-course buckets.
 */

#pragma once

#include "core/result.hpp"
#include "core/types.hpp"
#include "graph/course_graph.hpp"

#include <map>
#include <vector>

namespace course_planner {

struct ProgressSummary {
    StudentId student;
    std::string name;
    std::optional<ProgramName> program;
    uint32_t completed{0};
    uint32_t completed_credits{0};
    uint32_t available{0};      ///< Not completed, every direct prerequisite completed
    uint32_t blocked{0};        ///< Not completed, at least one direct prerequisite missing
    double progress_percent{0.0};
};

struct BucketEntry {
    CourseCode course;
    std::vector<CourseCode> missing;    ///< Missing direct prerequisites, sorted
};

using RemainingBuckets = std::map<ProgressBucket, std::vector<BucketEntry>>;

/**
 * @brief Summarize one student against the whole catalog.
 *
 * Completed courses absent from the catalog still count toward `completed`
 * and credit `default_credits` each.
 */
[[nodiscard]] ProgressSummary summarize_progress(const CourseGraph& graph,
                                                 const StudentState& student,
                                                 Credits default_credits);

/// Order summaries by progress desc, then student id.
void sort_by_progress(std::vector<ProgressSummary>& summaries);

/**
 * @brief Group a program's remaining courses by count of missing direct
 *        prerequisites. Completed and enrolled courses are not remaining.
 */
[[nodiscard]] Result<RemainingBuckets> bucket_remaining(const CourseGraph& graph,
                                                        const StudentState& student,
                                                        const ProgramRequirement& program);

}  // namespace course_planner
