/**
 * @file types.hpp
 * @brief Fundamental types used throughout CoursePlanner.
 *
 * Defines CourseCode, Course, SemesterOffering, StudentState and the other
 * shared vocabulary types. All types are plain values; a planning snapshot
 * built from them is never mutated after construction.
 */

#pragma once

#include <compare>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_set>
#include <vector>

namespace course_planner {

// ─────────────────────────────────────────────
// Identity Types
// ─────────────────────────────────────────────

using CourseCode = std::string;
using StudentId = std::string;
using ProgramName = std::string;
using Credits = uint32_t;
using CourseSet = std::unordered_set<CourseCode>;

// ─────────────────────────────────────────────
// Catalog Entities
// ─────────────────────────────────────────────

/**
 * @brief A course in the catalog.
 *
 * Credits are optional: the catalog does not always carry a credit weight,
 * and the scheduler substitutes the configured default when it is absent.
 */
struct Course {
    CourseCode code;
    std::string name;
    std::optional<Credits> credits;
    std::string department;

    auto operator<=>(const Course&) const = default;
};

/**
 * @brief Directed `requires` relation: `course` requires `prerequisite`.
 */
struct PrerequisiteEdge {
    CourseCode course;
    CourseCode prerequisite;

    auto operator<=>(const PrerequisiteEdge&) const = default;
};

/**
 * @brief (year, term) identity of a semester. Orders chronologically.
 */
struct SemesterId {
    int32_t year{0};
    uint32_t term_index{0};

    auto operator<=>(const SemesterId&) const = default;

    [[nodiscard]] std::string label() const {
        return std::to_string(year) + "-T" + std::to_string(term_index);
    }
};

struct SemesterOffering {
    SemesterId id;
    std::string name;                       ///< Display name, e.g. "Fall 2024"
    std::vector<CourseCode> offered;

    [[nodiscard]] bool offers(std::string_view code) const noexcept {
        for (const auto& c : offered) {
            if (c == code) return true;
        }
        return false;
    }
};

/**
 * @brief Immutable view of one student's record for a planning call.
 *
 * Only `completed` satisfies prerequisites; `enrolled` courses are excluded
 * from the remaining set but never count toward readiness.
 */
struct StudentState {
    StudentId id;
    std::string name;
    std::optional<ProgramName> program;
    CourseSet completed;
    CourseSet enrolled;

    [[nodiscard]] bool has_completed(const CourseCode& code) const {
        return completed.contains(code);
    }
};

struct ProgramRequirement {
    ProgramName name;
    std::vector<CourseCode> required;
};

// ─────────────────────────────────────────────
// Readiness
// ─────────────────────────────────────────────

enum class ReadinessStatus : uint8_t {
    ReadyNow,
    AlmostReady,
    NotReady
};

[[nodiscard]] constexpr std::string_view to_string(ReadinessStatus status) noexcept {
    switch (status) {
        case ReadinessStatus::ReadyNow:    return "Ready Now";
        case ReadinessStatus::AlmostReady: return "Almost Ready";
        case ReadinessStatus::NotReady:    return "Not Ready";
    }
    return "unknown";
}

/**
 * @brief Grouping of remaining courses by count of missing direct prerequisites.
 */
enum class ProgressBucket : uint8_t {
    ReadyNow,       ///< 0 missing
    AlmostReady,    ///< 1 missing
    PlanSoon,       ///< 2 missing
    PlanLater       ///< 3 or more missing
};

[[nodiscard]] constexpr std::string_view to_string(ProgressBucket bucket) noexcept {
    switch (bucket) {
        case ProgressBucket::ReadyNow:    return "Ready Now";
        case ProgressBucket::AlmostReady: return "Almost Ready";
        case ProgressBucket::PlanSoon:    return "Plan Soon";
        case ProgressBucket::PlanLater:   return "Plan Later";
    }
    return "unknown";
}

[[nodiscard]] constexpr ProgressBucket bucket_for_missing(size_t missing) noexcept {
    if (missing == 0) return ProgressBucket::ReadyNow;
    if (missing == 1) return ProgressBucket::AlmostReady;
    if (missing == 2) return ProgressBucket::PlanSoon;
    return ProgressBucket::PlanLater;
}

/**
 * @brief Curriculum role derived from prerequisite and dependent counts.
 */
enum class CourseType : uint8_t {
    Foundation,
    Capstone,
    Core,
    Advanced,
    Regular
};

[[nodiscard]] constexpr std::string_view to_string(CourseType type) noexcept {
    switch (type) {
        case CourseType::Foundation: return "Foundation";
        case CourseType::Capstone:   return "Capstone";
        case CourseType::Core:       return "Core";
        case CourseType::Advanced:   return "Advanced";
        case CourseType::Regular:    return "Regular";
    }
    return "unknown";
}

}  // namespace course_planner
