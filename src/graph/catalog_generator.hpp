/**
 * @file catalog_generator.hpp
 * @brief Synthetic catalogs for testing and benchmarking.
 */

#pragma once

#include "core/types.hpp"
#include "graph/course_graph.hpp"

#include <random>
#include <string_view>

namespace course_planner {

/**
 * @brief Factory for synthetic course catalogs with various shapes.
 *
 * Codes are zero-padded ("C007") so code order matches generation order.
 * Every generated catalog is acyclic.
 */
class CatalogGenerator {
public:
    /// C000 <- C001 <- ... : each course requires its predecessor.
    static CatalogSnapshot linear_chain(size_t num_courses, std::string_view prefix = "C");

    /// `layers` levels of `width` courses; each course above level 0
    /// requires `fan_in` distinct courses from the level below.
    static CatalogSnapshot layered_curriculum(size_t layers, size_t width, size_t fan_in,
                                              std::mt19937& rng);

    /// Course i requires course j < i with probability `edge_probability`.
    static CatalogSnapshot random_dag(size_t num_courses, float edge_probability,
                                      std::mt19937& rng);

    /// `count` consecutive two-term semesters from `start_year`, each
    /// offering every course of the catalog.
    static std::vector<SemesterOffering> open_semesters(const CatalogSnapshot& catalog,
                                                        size_t count, int32_t start_year);

    [[nodiscard]] static std::vector<CourseCode> all_codes(const CatalogSnapshot& catalog);
};

}  // namespace course_planner
