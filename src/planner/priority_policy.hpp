/**
 * @file priority_policy.hpp
 * @brief Ranking rules the ScheduleOptimizer applies to each eligible set.
 *
 * Every policy ends with course code ascending, so any two distinct
 * candidates compare strictly and plans are reproducible.
 */

#pragma once

#include "core/result.hpp"
#include "core/types.hpp"
#include "graph/course_graph.hpp"

#include <memory>
#include <string_view>
#include <vector>

namespace course_planner {

/**
 * @brief Scheduling attributes of one candidate course.
 */
struct CandidateRank {
    CourseIndex course{0};
    CourseCode code;
    uint32_t unlocks{0};            ///< Remaining required courses that transitively need it
    uint32_t remaining_depth{0};    ///< Longest chain of not-yet-completed prerequisites
};

/**
 * @brief Abstract interface for eligible-set ordering (runtime polymorphism).
 */
class IPriorityPolicy {
public:
    virtual ~IPriorityPolicy() = default;

    /// Strict weak ordering: true when `a` should be admitted before `b`.
    [[nodiscard]] virtual bool precedes(const CandidateRank& a, const CandidateRank& b) const = 0;
    [[nodiscard]] virtual std::string_view name() const noexcept = 0;

    void rank(std::vector<CandidateRank>& candidates) const;
};

/// Unlock count desc, remaining depth asc, code asc.
class UnlockFirstPolicy : public IPriorityPolicy {
public:
    [[nodiscard]] bool precedes(const CandidateRank& a, const CandidateRank& b) const override;
    [[nodiscard]] std::string_view name() const noexcept override { return "unlock_first"; }
};

/// Remaining depth asc, unlock count desc, code asc.
class ShallowFirstPolicy : public IPriorityPolicy {
public:
    [[nodiscard]] bool precedes(const CandidateRank& a, const CandidateRank& b) const override;
    [[nodiscard]] std::string_view name() const noexcept override { return "shallow_first"; }
};

/// Code asc only.
class LexicographicPolicy : public IPriorityPolicy {
public:
    [[nodiscard]] bool precedes(const CandidateRank& a, const CandidateRank& b) const override;
    [[nodiscard]] std::string_view name() const noexcept override { return "lexicographic"; }
};

/// Build a policy from its configuration name.
[[nodiscard]] Result<std::shared_ptr<const IPriorityPolicy>> make_priority_policy(
    std::string_view name);

/// All built-in policies in the order path exploration tries them.
[[nodiscard]] std::vector<std::shared_ptr<const IPriorityPolicy>> builtin_priority_policies();

}  // namespace course_planner
