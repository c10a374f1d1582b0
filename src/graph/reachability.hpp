/**
 * @file reachability.hpp
 * @brief Transitive prerequisite / dependent closures over a CourseGraph.
 *
 * Unbounded queries use a memoized depth-first traversal: each course's
 * closure and longest chain are computed once and reused by every later
 * query on the same index. A course that can reach a cycle has no closure;
 * the query fails with CycleDetected naming the cycle instead of looping.
 *
 * Depth-bounded queries expand layer by layer (layer d holds the courses at
 * the end of some chain of exactly d edges) and never fail on cycles; their
 * result is marked partial when the bound cut the traversal short.
 *
 * An index caches into mutable state and is meant to live inside one
 * planning request; share the CourseGraph across threads, not the index.
 */

#pragma once

#include "core/result.hpp"
#include "graph/course_graph.hpp"

#include <cstdint>
#include <optional>
#include <vector>

namespace course_planner {

enum class TraversalDirection : uint8_t {
    Prerequisites,  ///< Follow outgoing `requires` edges
    Dependents      ///< Follow incoming `requires` edges
};

/**
 * @brief Result of a transitive query.
 *
 * `chain_depth` is the length of the longest chain explored, capped at the
 * depth bound when one was given.
 */
struct Closure {
    CourseCode origin;
    std::vector<CourseCode> courses;    ///< Sorted, never contains origin
    uint32_t chain_depth{0};
    bool partial{false};
};

struct DepthLayer {
    uint32_t depth{0};
    std::vector<CourseCode> courses;    ///< Sorted
};

class ReachabilityIndex {
public:
    explicit ReachabilityIndex(const CourseGraph& graph);

    // ── By code ───────────────────────────────
    [[nodiscard]] Result<Closure> transitive_prerequisites(
        const CourseCode& code, std::optional<uint32_t> max_depth = std::nullopt) const;
    [[nodiscard]] Result<Closure> transitive_dependents(
        const CourseCode& code, std::optional<uint32_t> max_depth = std::nullopt) const;

    /// Longest prerequisite chain below a course; 0 when it has none.
    [[nodiscard]] Result<uint32_t> prerequisite_depth(const CourseCode& code) const;
    /// Longest dependent chain above a course; 0 when nothing requires it.
    [[nodiscard]] Result<uint32_t> dependent_depth(const CourseCode& code) const;

    /// Longest prerequisite chain starting at the course (inclusive).
    [[nodiscard]] Result<std::vector<CourseCode>> critical_chain(const CourseCode& code) const;

    /// Distinct prerequisites at the end of a chain of exactly d edges, d >= min_depth.
    [[nodiscard]] Result<std::vector<DepthLayer>> prerequisites_by_depth(
        const CourseCode& code, uint32_t min_depth) const;

    // ── By index ──────────────────────────────
    [[nodiscard]] Result<std::vector<CourseIndex>> closure(TraversalDirection dir,
                                                           CourseIndex idx) const;
    [[nodiscard]] Result<uint32_t> chain_depth(TraversalDirection dir, CourseIndex idx) const;

    /// Courses reachable within `max_depth` edges (origin excluded), sorted.
    [[nodiscard]] std::vector<CourseIndex> bounded_closure(TraversalDirection dir,
                                                           CourseIndex idx,
                                                           uint32_t max_depth,
                                                           uint32_t* reached_depth = nullptr,
                                                           bool* partial = nullptr) const;

    [[nodiscard]] const CourseGraph& graph() const noexcept { return graph_; }

private:
    struct Memo {
        std::vector<std::optional<std::vector<CourseIndex>>> closure;
        std::vector<uint32_t> depth;
    };

    [[nodiscard]] Result<void> ensure(TraversalDirection dir, CourseIndex root) const;
    [[nodiscard]] Result<Closure> query(TraversalDirection dir, const CourseCode& code,
                                        std::optional<uint32_t> max_depth) const;
    [[nodiscard]] const std::vector<CourseIndex>& neighbors(TraversalDirection dir,
                                                            CourseIndex idx) const;
    [[nodiscard]] Memo& memo(TraversalDirection dir) const;

    const CourseGraph& graph_;
    mutable Memo prerequisite_memo_;
    mutable Memo dependent_memo_;
};

}  // namespace course_planner
