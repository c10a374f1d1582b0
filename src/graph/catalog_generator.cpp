/**
 * @file catalog_generator.cpp
 * @brief Synthetic catalog generator shapes.
 *
 * Generates catalogs that model common curriculum shapes:
 * - Linear chains (one long sequence, worst case for chain depth)
 * - Layered curricula (year-by-year programs with cross-layer fan-in)
 * - Random DAGs (for stress testing and benchmarking)
 */

#include "graph/catalog_generator.hpp"

#include <algorithm>
#include <numeric>

namespace course_planner {

namespace {

std::string course_code(std::string_view prefix, size_t i) {
    std::string digits = std::to_string(i);
    if (digits.size() < 3) digits.insert(0, 3 - digits.size(), '0');
    return std::string{prefix} + digits;
}

Course make_course(std::string code, std::string department, Credits credits) {
    Course course;
    course.name = "Course " + code;
    course.code = std::move(code);
    course.credits = credits;
    course.department = std::move(department);
    return course;
}

}  // anonymous namespace

// ─────────────────────────────────────────────
// Linear Chain: C000 <- C001 <- ... <- Cn-1
// ─────────────────────────────────────────────

CatalogSnapshot CatalogGenerator::linear_chain(size_t num_courses, std::string_view prefix) {
    CatalogSnapshot catalog;
    for (size_t i = 0; i < num_courses; ++i) {
        catalog.courses.push_back(make_course(course_code(prefix, i), std::string{prefix}, 3));
        if (i > 0) {
            catalog.edges.push_back(PrerequisiteEdge{
                .course = course_code(prefix, i),
                .prerequisite = course_code(prefix, i - 1)
            });
        }
    }
    return catalog;
}

// ─────────────────────────────────────────────
// Layered Curriculum:
//
//   L0:  L0C000  L0C001  L0C002
//           \  /     \   /
//   L1:   L1C000    L1C001  ...
//
// Level l courses draw their prerequisites from level l-1 only.
// ─────────────────────────────────────────────

CatalogSnapshot CatalogGenerator::layered_curriculum(size_t layers, size_t width, size_t fan_in,
                                                     std::mt19937& rng) {
    CatalogSnapshot catalog;
    std::uniform_int_distribution<Credits> credit_dist(2, 4);
    fan_in = std::min(fan_in, width);

    std::vector<CourseCode> previous;
    for (size_t l = 0; l < layers; ++l) {
        std::string prefix = "L" + std::to_string(l) + "C";
        std::vector<CourseCode> current;
        for (size_t w = 0; w < width; ++w) {
            auto code = course_code(prefix, w);
            catalog.courses.push_back(make_course(code, "L" + std::to_string(l),
                                                  credit_dist(rng)));

            if (!previous.empty()) {
                std::vector<size_t> picks(previous.size());
                std::iota(picks.begin(), picks.end(), 0);
                std::shuffle(picks.begin(), picks.end(), rng);
                for (size_t k = 0; k < fan_in; ++k) {
                    catalog.edges.push_back(PrerequisiteEdge{
                        .course = code,
                        .prerequisite = previous[picks[k]]
                    });
                }
            }
            current.push_back(std::move(code));
        }
        previous = std::move(current);
    }
    return catalog;
}

// ─────────────────────────────────────────────
// Random DAG: edges only point to lower-numbered courses.
// ─────────────────────────────────────────────

CatalogSnapshot CatalogGenerator::random_dag(size_t num_courses, float edge_probability,
                                             std::mt19937& rng) {
    CatalogSnapshot catalog;
    std::uniform_real_distribution<float> coin(0.0f, 1.0f);
    std::uniform_int_distribution<Credits> credit_dist(1, 4);

    for (size_t i = 0; i < num_courses; ++i) {
        catalog.courses.push_back(make_course(course_code("R", i), "RND", credit_dist(rng)));
        for (size_t j = 0; j < i; ++j) {
            if (coin(rng) < edge_probability) {
                catalog.edges.push_back(PrerequisiteEdge{
                    .course = course_code("R", i),
                    .prerequisite = course_code("R", j)
                });
            }
        }
    }
    return catalog;
}

std::vector<SemesterOffering> CatalogGenerator::open_semesters(const CatalogSnapshot& catalog,
                                                               size_t count,
                                                               int32_t start_year) {
    auto codes = all_codes(catalog);
    std::vector<SemesterOffering> semesters;
    semesters.reserve(count);
    for (size_t i = 0; i < count; ++i) {
        SemesterOffering semester;
        semester.id = SemesterId{.year = start_year + static_cast<int32_t>(i / 2),
                                 .term_index = static_cast<uint32_t>(i % 2)};
        semester.name = semester.id.label();
        semester.offered = codes;
        semesters.push_back(std::move(semester));
    }
    return semesters;
}

std::vector<CourseCode> CatalogGenerator::all_codes(const CatalogSnapshot& catalog) {
    std::vector<CourseCode> codes;
    codes.reserve(catalog.courses.size());
    for (const auto& c : catalog.courses) codes.push_back(c.code);
    return codes;
}

}  // namespace course_planner
