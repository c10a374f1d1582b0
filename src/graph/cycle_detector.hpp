/**
 * @file cycle_detector.hpp
 * @brief Prerequisite cycle detection over a CourseGraph.
 *
 * Strongly connected components are computed with an iterative Tarjan pass
 * (O(V+E)). Every component with more than one course yields one
 * representative cycle; every self-edge yields a one-course cycle. Cycles
 * are rotated to start at their smallest course code and the list is sorted,
 * so equal catalogs always produce the same report.
 */

#pragma once

#include "graph/course_graph.hpp"

#include <vector>

namespace course_planner {

using Cycle = std::vector<CourseCode>;

class CycleDetector {
public:
    explicit CycleDetector(const CourseGraph& graph) : graph_(graph) {}

    /// Strongly connected components, each sorted, ordered by first member.
    [[nodiscard]] std::vector<std::vector<CourseIndex>> strongly_connected_components() const;

    /// One representative cycle per non-trivial component plus self-edges.
    [[nodiscard]] std::vector<Cycle> find_cycles() const;

    /**
     * @brief Enumerate elementary cycles, at most `limit` of them, each no
     *        longer than `max_length` courses.
     *
     * Each cycle is reported once, rotated to start at its smallest code.
     */
    [[nodiscard]] std::vector<Cycle> enumerate_cycles(size_t limit = 20,
                                                      size_t max_length = 10) const;

    [[nodiscard]] bool has_cycle() const;

private:
    [[nodiscard]] Cycle representative_cycle(const std::vector<CourseIndex>& component) const;

    const CourseGraph& graph_;
};

}  // namespace course_planner
