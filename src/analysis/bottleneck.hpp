/**
 * @file bottleneck.hpp
 * @brief Curriculum bottleneck ranking and per-course impact analysis.
 */

#pragma once

#include "core/result.hpp"
#include "core/types.hpp"
#include "graph/reachability.hpp"

#include <string_view>
#include <vector>

namespace course_planner {

struct BottleneckCriteria {
    uint32_t min_dependents = 3;
    uint32_t min_prerequisites = 2;
    uint32_t prerequisite_depth = 3;    ///< Depth of the prerequisite set counted, 1..3
    size_t limit = 0;                   ///< 0 = no limit
};

struct BottleneckEntry {
    CourseCode course;
    std::string name;
    uint32_t unlocks{0};                        ///< Distinct direct dependents
    uint32_t total_prerequisites{0};            ///< Bounded-depth prerequisite set size
    std::vector<CourseCode> unlocked_courses;   ///< Direct dependents, sorted
};

struct CourseImpact {
    CourseCode course;
    std::string name;
    CourseType type = CourseType::Regular;
    uint32_t direct_prerequisites{0};
    uint32_t total_prerequisites{0};
    uint32_t max_prerequisite_depth{0};
    uint32_t dependents{0};                     ///< Transitive
    uint32_t max_dependent_depth{0};
    std::vector<CourseCode> critical_chain;     ///< Longest prerequisite chain, course first
    uint32_t difficulty{0};                     ///< 2 * total + 10 * max depth
    uint32_t impact{0};                         ///< 2 * dependents + 5 * max dependent depth
};

/**
 * @brief Ranks courses by what they unlock against what they demand.
 *
 * Bottleneck output is ordered by unlocks desc, total prerequisites desc,
 * then code asc. Bounded-depth traversal keeps ranking usable on catalogs
 * that still contain cycles.
 */
class BottleneckAnalyzer {
public:
    explicit BottleneckAnalyzer(const ReachabilityIndex& reach) : reach_(reach) {}

    [[nodiscard]] std::vector<BottleneckEntry> rank(const BottleneckCriteria& criteria) const;

    /**
     * @brief Difficulty / impact profile of every course whose code starts
     *        with `prefix` or whose department equals it (all when empty).
     *
     * Needs unbounded closures, so a cycle anywhere under a selected course
     * fails the whole analysis with CycleDetected.
     */
    [[nodiscard]] Result<std::vector<CourseImpact>> impact(std::string_view prefix = {}) const;

    [[nodiscard]] static CourseType classify(uint32_t total_prerequisites, uint32_t dependents) noexcept;

private:
    const ReachabilityIndex& reach_;
};

}  // namespace course_planner
