/**
 * @file catalog_loader.cpp
 * @brief Catalog document parsing with toml++ and snapshot validation.
 */

#include "snapshot/catalog_loader.hpp"

#include <toml++/toml.hpp>

#include <algorithm>
#include <charconv>
#include <limits>
#include <set>

namespace course_planner {

namespace {

using Section = const toml::table&;

Error malformed(std::string message) {
    return Error{ErrorCode::MalformedGraph, std::move(message)};
}

std::string entry_name(std::string_view kind, size_t i) {
    return std::string{kind} + " entry #" + std::to_string(i + 1);
}

/// A string, or an array of strings; anything else yields nullopt.
std::optional<std::vector<std::string>> read_codes(toml::node_view<const toml::node> node) {
    std::vector<std::string> out;
    if (!node) return out;
    if (auto single = node.value<std::string>()) {
        out.push_back(std::move(*single));
        return out;
    }
    const auto* arr = node.as_array();
    if (!arr) return std::nullopt;
    for (const auto& el : *arr) {
        auto code = el.value<std::string>();
        if (!code) return std::nullopt;
        out.push_back(std::move(*code));
    }
    return out;
}

template <typename Fn>
Result<void> for_each_table(const toml::table& root, std::string_view key,
                            std::string_view kind, Fn&& fn) {
    auto node = root[key];
    if (!node) return {};
    const auto* arr = node.as_array();
    if (!arr) return malformed("`" + std::string{key} + "` must be an array of tables");
    for (size_t i = 0; i < arr->size(); ++i) {
        const auto* tbl = (*arr)[i].as_table();
        if (!tbl) return malformed(entry_name(kind, i) + " is not a table");
        if (auto ok = fn(*tbl, i); !ok) return ok.error();
    }
    return {};
}

Result<void> read_courses(Section root, CatalogDocument& doc) {
    return for_each_table(root, "course", "course", [&](Section t, size_t i) -> Result<void> {
        Course course;
        auto code = t["code"].value<std::string>();
        if (!code || code->empty()) return malformed(entry_name("course", i) + " has no code");
        course.code = std::move(*code);
        course.name = t["name"].value_or(std::string{});
        course.department = t["department"].value_or(std::string{});
        if (auto credits = t["credits"].value<int64_t>()) {
            if (*credits < 0) return malformed("Course " + course.code + " has negative credits");
            if (*credits > std::numeric_limits<Credits>::max()) {
                return malformed("Course " + course.code + " has credits out of range: "
                                 + std::to_string(*credits));
            }
            course.credits = static_cast<Credits>(*credits);
        }
        doc.catalog.courses.push_back(std::move(course));
        return {};
    });
}

Result<void> read_prerequisites(Section root, CatalogDocument& doc) {
    return for_each_table(root, "prerequisite", "prerequisite",
                          [&](Section t, size_t i) -> Result<void> {
        auto course = t["course"].value<std::string>();
        auto requires_codes = read_codes(t["requires"]);
        if (!course || !requires_codes) {
            return malformed(entry_name("prerequisite", i)
                             + " needs `course` and `requires` (code or list of codes)");
        }
        for (auto& prereq : *requires_codes) {
            doc.catalog.edges.push_back(PrerequisiteEdge{.course = *course,
                                                         .prerequisite = std::move(prereq)});
        }
        return {};
    });
}

Result<void> read_semesters(Section root, CatalogDocument& doc) {
    return for_each_table(root, "semester", "semester", [&](Section t, size_t i) -> Result<void> {
        auto year = t["year"].value<int64_t>();
        auto term = t["term"].value<int64_t>();
        auto offered = read_codes(t["offered"]);
        if (!year || !term || *term < 0 || !offered) {
            return malformed(entry_name("semester", i)
                             + " needs integer `year`, non-negative `term` and `offered` codes");
        }
        if (*year < std::numeric_limits<int32_t>::min() || *year > std::numeric_limits<int32_t>::max()
            || *term > std::numeric_limits<uint32_t>::max()) {
            return malformed(entry_name("semester", i) + " has `year` or `term` out of range");
        }
        SemesterOffering semester;
        semester.id = SemesterId{.year = static_cast<int32_t>(*year),
                                 .term_index = static_cast<uint32_t>(*term)};
        semester.name = t["name"].value_or(semester.id.label());
        semester.offered = std::move(*offered);
        doc.semesters.push_back(std::move(semester));
        return {};
    });
}

Result<void> read_students(Section root, CatalogDocument& doc) {
    return for_each_table(root, "student", "student", [&](Section t, size_t i) -> Result<void> {
        auto id = t["id"].value<std::string>();
        auto completed = read_codes(t["completed"]);
        auto enrolled = read_codes(t["enrolled"]);
        if (!id || id->empty() || !completed || !enrolled) {
            return malformed(entry_name("student", i)
                             + " needs `id` and code lists for `completed` and `enrolled`");
        }
        StudentState student;
        student.id = std::move(*id);
        student.name = t["name"].value_or(std::string{});
        if (auto program = t["program"].value<std::string>()) {
            student.program = std::move(*program);
        }
        student.completed.insert(completed->begin(), completed->end());
        student.enrolled.insert(enrolled->begin(), enrolled->end());
        doc.students.push_back(std::move(student));
        return {};
    });
}

Result<void> read_programs(Section root, CatalogDocument& doc) {
    return for_each_table(root, "program", "program", [&](Section t, size_t i) -> Result<void> {
        auto name = t["name"].value<std::string>();
        auto required = read_codes(t["required"]);
        if (!name || name->empty() || !required) {
            return malformed(entry_name("program", i) + " needs `name` and `required` codes");
        }
        doc.programs.push_back(ProgramRequirement{.name = std::move(*name),
                                                  .required = std::move(*required)});
        return {};
    });
}

Result<CatalogDocument> from_table(const toml::table& root) {
    CatalogDocument doc;
    for (auto reader : {read_courses, read_prerequisites, read_semesters,
                        read_students, read_programs}) {
        if (auto ok = reader(root, doc); !ok) return ok.error();
    }
    return doc;
}

}  // anonymous namespace

// ─────────────────────────────────────────────
// Parsing
// ─────────────────────────────────────────────

Result<CatalogDocument> parse_catalog(std::string_view toml_text) {
    try {
        auto tbl = toml::parse(toml_text);
        return from_table(tbl);
    } catch (const toml::parse_error& err) {
        return malformed(std::string{"Catalog TOML parse error: "}
                         + std::string{err.description()});
    }
}

Result<CatalogDocument> load_catalog(const std::filesystem::path& path) {
    if (!std::filesystem::exists(path)) {
        return Error{ErrorCode::IoError, "Catalog file not found: " + path.string()};
    }
    try {
        auto tbl = toml::parse_file(path.string());
        return from_table(tbl);
    } catch (const toml::parse_error& err) {
        return malformed("Catalog TOML parse error in " + path.string() + ": "
                         + std::string{err.description()});
    }
}

// ─────────────────────────────────────────────
// Validation
// ─────────────────────────────────────────────

Result<PlanningSnapshot> build_snapshot(const CatalogDocument& document) {
    auto graph = CourseGraph::build(document.catalog);
    if (!graph) return graph.error();

    PlanningSnapshot snapshot;
    snapshot.graph = std::move(*graph);

    for (const auto& program : document.programs) {
        if (!snapshot.programs.emplace(program.name, program).second) {
            return malformed("Duplicate program: " + program.name);
        }
    }

    std::set<SemesterId> seen_terms;
    for (const auto& semester : document.semesters) {
        if (!seen_terms.insert(semester.id).second) {
            return malformed("Duplicate semester: " + semester.id.label());
        }
        for (const auto& code : semester.offered) {
            if (!snapshot.graph.contains(code)) {
                return Error{ErrorCode::MalformedGraph,
                             "Semester " + semester.id.label() + " offers unknown course " + code,
                             {code}};
            }
        }
        snapshot.semesters.push_back(semester);
    }
    std::sort(snapshot.semesters.begin(), snapshot.semesters.end(),
              [](const SemesterOffering& a, const SemesterOffering& b) { return a.id < b.id; });

    for (const auto& student : document.students) {
        if (student.program && !snapshot.programs.contains(*student.program)) {
            return malformed("Student " + student.id + " references unknown program "
                             + *student.program);
        }
        if (!snapshot.students.emplace(student.id, student).second) {
            return malformed("Duplicate student id: " + student.id);
        }
    }

    return snapshot;
}

Result<PlanningSnapshot> load_snapshot(const std::filesystem::path& path) {
    return load_catalog(path).and_then(
        [](const CatalogDocument& doc) { return build_snapshot(doc); });
}

std::optional<SemesterId> parse_semester_label(std::string_view label) {
    auto sep = label.find("-T");
    if (sep == std::string_view::npos || sep == 0 || sep + 2 >= label.size()) return std::nullopt;

    auto year_text = label.substr(0, sep);
    auto term_text = label.substr(sep + 2);
    int32_t year = 0;
    uint32_t term = 0;
    auto [year_end, year_ec] = std::from_chars(year_text.data(), year_text.data() + year_text.size(), year);
    auto [term_end, term_ec] = std::from_chars(term_text.data(), term_text.data() + term_text.size(), term);
    if (year_ec != std::errc{} || year_end != year_text.data() + year_text.size()) return std::nullopt;
    if (term_ec != std::errc{} || term_end != term_text.data() + term_text.size()) return std::nullopt;
    return SemesterId{.year = year, .term_index = term};
}

// ─────────────────────────────────────────────
// Lookup
// ─────────────────────────────────────────────

Result<StudentState> PlanningSnapshot::student(const StudentId& id) const {
    auto it = students.find(id);
    if (it == students.end()) return not_found("Student", id);
    return it->second;
}

Result<ProgramRequirement> PlanningSnapshot::program(const ProgramName& name) const {
    auto it = programs.find(name);
    if (it == programs.end()) return not_found("Program", name);
    return it->second;
}

Result<ProgramRequirement> PlanningSnapshot::program_for(const StudentState& s) const {
    if (!s.program) {
        return Error{ErrorCode::NotFound, "Student " + s.id + " has no program", {s.id}};
    }
    return program(*s.program);
}

Result<SemesterOffering> PlanningSnapshot::semester(std::string_view key) const {
    for (const auto& s : semesters) {
        if (s.id.label() == key || s.name == key) return s;
    }
    return not_found("Semester", std::string{key});
}

std::vector<SemesterOffering> PlanningSnapshot::semesters_after(
    const std::optional<SemesterId>& after) const {
    std::vector<SemesterOffering> out;
    for (const auto& s : semesters) {
        if (!after || *after < s.id) out.push_back(s);
    }
    return out;
}

}  // namespace course_planner
