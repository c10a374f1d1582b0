/**
 * @file priority_policy.cpp
 * @brief Built-in eligible-set ranking policies.
 */

#include "planner/priority_policy.hpp"

#include <algorithm>

namespace course_planner {

void IPriorityPolicy::rank(std::vector<CandidateRank>& candidates) const {
    std::sort(candidates.begin(), candidates.end(),
              [this](const CandidateRank& a, const CandidateRank& b) { return precedes(a, b); });
}

bool UnlockFirstPolicy::precedes(const CandidateRank& a, const CandidateRank& b) const {
    if (a.unlocks != b.unlocks) return a.unlocks > b.unlocks;
    if (a.remaining_depth != b.remaining_depth) return a.remaining_depth < b.remaining_depth;
    return a.code < b.code;
}

bool ShallowFirstPolicy::precedes(const CandidateRank& a, const CandidateRank& b) const {
    if (a.remaining_depth != b.remaining_depth) return a.remaining_depth < b.remaining_depth;
    if (a.unlocks != b.unlocks) return a.unlocks > b.unlocks;
    return a.code < b.code;
}

bool LexicographicPolicy::precedes(const CandidateRank& a, const CandidateRank& b) const {
    return a.code < b.code;
}

Result<std::shared_ptr<const IPriorityPolicy>> make_priority_policy(std::string_view name) {
    using PolicyPtr = std::shared_ptr<const IPriorityPolicy>;
    if (name == "unlock_first") return PolicyPtr{std::make_shared<UnlockFirstPolicy>()};
    if (name == "shallow_first") return PolicyPtr{std::make_shared<ShallowFirstPolicy>()};
    if (name == "lexicographic") return PolicyPtr{std::make_shared<LexicographicPolicy>()};
    return Error{ErrorCode::InvalidArgument,
                 "Unknown priority policy: " + std::string{name}};
}

std::vector<std::shared_ptr<const IPriorityPolicy>> builtin_priority_policies() {
    return {
        std::make_shared<UnlockFirstPolicy>(),
        std::make_shared<ShallowFirstPolicy>(),
        std::make_shared<LexicographicPolicy>()
    };
}

}  // namespace course_planner
