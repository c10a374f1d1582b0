/**
 * @file catalog_loader.hpp
 * @brief PlanningSnapshot and its TOML catalog reader.
 *
 * Catalog document layout:
 *
 *   [[course]]        code, name, credits (optional), department
 *   [[prerequisite]]  course, requires (code or array of codes)
 *   [[semester]]      year, term, name, offered = [codes]
 *   [[student]]       id, name, program, completed = [...], enrolled = [...]
 *   [[program]]       name, required = [codes]
 *
 * All reading happens here, before any analysis runs; the snapshot that
 * comes out is immutable.
 */

#pragma once

#include "core/result.hpp"
#include "core/types.hpp"
#include "graph/course_graph.hpp"

#include <filesystem>
#include <map>
#include <optional>
#include <string_view>
#include <vector>

namespace course_planner {

/**
 * @brief Raw contents of a catalog document, not yet cross-checked.
 */
struct CatalogDocument {
    CatalogSnapshot catalog;
    std::vector<SemesterOffering> semesters;
    std::vector<StudentState> students;
    std::vector<ProgramRequirement> programs;
};

/**
 * @brief Read-only planning inputs shared by every request.
 */
struct PlanningSnapshot {
    CourseGraph graph;
    std::vector<SemesterOffering> semesters;            ///< Chronological
    std::map<StudentId, StudentState> students;
    std::map<ProgramName, ProgramRequirement> programs;

    [[nodiscard]] Result<StudentState> student(const StudentId& id) const;
    [[nodiscard]] Result<ProgramRequirement> program(const ProgramName& name) const;
    /// Program the student is enrolled in; NotFound when none is set.
    [[nodiscard]] Result<ProgramRequirement> program_for(const StudentState& student) const;
    /// Semester by label ("2025-T1") or display name.
    [[nodiscard]] Result<SemesterOffering> semester(std::string_view key) const;
    /// Semesters strictly after `after`, chronological; all when unset.
    [[nodiscard]] std::vector<SemesterOffering> semesters_after(
        const std::optional<SemesterId>& after) const;
};

[[nodiscard]] Result<CatalogDocument> parse_catalog(std::string_view toml_text);
[[nodiscard]] Result<CatalogDocument> load_catalog(const std::filesystem::path& path);

/**
 * @brief Build the graph and cross-check the document.
 *
 * MalformedGraph when: the graph cannot be built; a semester offers an
 * unknown course or repeats a (year, term); a student id repeats or names
 * an unknown program; a program name repeats. Courses a student completed
 * outside the catalog are kept (transfer credit).
 */
[[nodiscard]] Result<PlanningSnapshot> build_snapshot(const CatalogDocument& document);

[[nodiscard]] Result<PlanningSnapshot> load_snapshot(const std::filesystem::path& path);

/// Parse a "YYYY-Tn" semester label.
[[nodiscard]] std::optional<SemesterId> parse_semester_label(std::string_view label);

}  // namespace course_planner
