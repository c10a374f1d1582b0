/**
 * @file course_graph.hpp
 * @brief In-memory prerequisite graph built from a catalog snapshot.
 *
 * Courses are stored sorted by code and addressed by a dense CourseIndex, so
 * index order equals code order and every neighbor list is already in the
 * deterministic order the analyses report. Edge direction follows the
 * catalog: `A -> B` means "A requires B". Forward lists hold prerequisites,
 * reverse lists hold dependents.
 */

#pragma once

#include "core/result.hpp"
#include "core/types.hpp"

#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace course_planner {

using CourseIndex = uint32_t;

/**
 * @brief Courses and prerequisite edges as supplied by the storage layer.
 */
struct CatalogSnapshot {
    std::vector<Course> courses;
    std::vector<PrerequisiteEdge> edges;
};

/**
 * @brief Read-only directed graph of courses and `requires` edges.
 */
class CourseGraph {
public:
    CourseGraph() = default;

    /**
     * @brief Build adjacency in both directions.
     *
     * Fails with MalformedGraph when an edge references a code absent from
     * the course list or when a course code appears twice. Duplicate edges
     * collapse into one. Self-edges are kept and surface as cycles.
     */
    [[nodiscard]] static Result<CourseGraph> build(const CatalogSnapshot& snapshot);

    // ── Lookup ────────────────────────────────
    [[nodiscard]] Result<Course> course(const CourseCode& code) const;
    [[nodiscard]] const Course* find(const CourseCode& code) const noexcept;
    [[nodiscard]] bool contains(const CourseCode& code) const noexcept;
    [[nodiscard]] std::optional<CourseIndex> index_of(const CourseCode& code) const noexcept;
    [[nodiscard]] const Course& at(CourseIndex idx) const { return courses_.at(idx); }
    [[nodiscard]] const CourseCode& code_of(CourseIndex idx) const { return courses_.at(idx).code; }

    // ── Iteration ─────────────────────────────
    [[nodiscard]] const std::vector<Course>& courses() const noexcept { return courses_; }
    [[nodiscard]] size_t course_count() const noexcept { return courses_.size(); }
    [[nodiscard]] size_t edge_count() const noexcept { return edge_count_; }

    // ── Neighbors (by code) ───────────────────
    [[nodiscard]] Result<std::vector<CourseCode>> prerequisites(const CourseCode& code) const;
    [[nodiscard]] Result<std::vector<CourseCode>> dependents(const CourseCode& code) const;

    // ── Neighbors (by index) ──────────────────
    [[nodiscard]] const std::vector<CourseIndex>& prerequisite_indices(CourseIndex idx) const {
        return prerequisites_.at(idx);
    }
    [[nodiscard]] const std::vector<CourseIndex>& dependent_indices(CourseIndex idx) const {
        return dependents_.at(idx);
    }

    [[nodiscard]] bool has_self_edge(CourseIndex idx) const;
    [[nodiscard]] std::vector<CourseCode> codes(const std::vector<CourseIndex>& indices) const;

private:
    std::vector<Course> courses_;
    std::unordered_map<CourseCode, CourseIndex> index_;
    std::vector<std::vector<CourseIndex>> prerequisites_;   // forward edges
    std::vector<std::vector<CourseIndex>> dependents_;      // backward edges
    size_t edge_count_{0};
};

}  // namespace course_planner
