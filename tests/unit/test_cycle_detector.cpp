/**
 * @file test_cycle_detector.cpp
 * @brief Unit tests for prerequisite cycle detection.
 */

#include "graph/catalog_generator.hpp"
#include "graph/cycle_detector.hpp"
#include "support/catalog_fixtures.hpp"

#include <gtest/gtest.h>
#include <random>

using namespace course_planner;
using fixtures::graph_of;

TEST(CycleDetectorTest, AcyclicGraphHasNoCycles) {
    auto graph = graph_of({"CS125", "MATH241", "CS225"},
                          {{"CS225", "CS125"}, {"CS225", "MATH241"}});
    CycleDetector detector(graph);
    EXPECT_FALSE(detector.has_cycle());
    EXPECT_TRUE(detector.find_cycles().empty());
    EXPECT_TRUE(detector.enumerate_cycles().empty());
}

TEST(CycleDetectorTest, ThreeCourseCycle) {
    // A requires B, B requires C, C requires A.
    auto graph = graph_of({"A", "B", "C"}, {{"A", "B"}, {"B", "C"}, {"C", "A"}});
    CycleDetector detector(graph);

    EXPECT_TRUE(detector.has_cycle());
    auto cycles = detector.find_cycles();
    ASSERT_EQ(cycles.size(), 1u);
    EXPECT_EQ(cycles[0], (Cycle{"A", "B", "C"}));
    EXPECT_EQ(format_cycle(cycles[0]), "A -> B -> C -> A");
}

TEST(CycleDetectorTest, CycleIsRotatedToSmallestCode) {
    auto graph = graph_of({"M", "N", "B"}, {{"M", "N"}, {"N", "B"}, {"B", "M"}});
    auto cycles = CycleDetector(graph).find_cycles();
    ASSERT_EQ(cycles.size(), 1u);
    EXPECT_EQ(cycles[0].front(), "B");
}

TEST(CycleDetectorTest, SelfEdgeIsACycle) {
    auto graph = graph_of({"A", "B"}, {{"A", "A"}, {"B", "A"}});
    CycleDetector detector(graph);
    EXPECT_TRUE(detector.has_cycle());
    auto cycles = detector.find_cycles();
    ASSERT_EQ(cycles.size(), 1u);
    EXPECT_EQ(cycles[0], (Cycle{"A"}));
}

TEST(CycleDetectorTest, OneRepresentativePerComponent) {
    auto graph = graph_of({"A", "B", "C", "X", "Y", "Z"},
                          {{"A", "B"}, {"B", "A"}, {"X", "Y"}, {"Y", "X"}, {"C", "A"}, {"Z", "C"}});
    CycleDetector detector(graph);

    auto components = detector.strongly_connected_components();
    size_t non_trivial = 0;
    for (const auto& c : components) non_trivial += c.size() > 1 ? 1 : 0;
    EXPECT_EQ(non_trivial, 2u);

    auto cycles = detector.find_cycles();
    ASSERT_EQ(cycles.size(), 2u);
    EXPECT_EQ(cycles[0], (Cycle{"A", "B"}));
    EXPECT_EQ(cycles[1], (Cycle{"X", "Y"}));
}

TEST(CycleDetectorTest, EnumeratesEveryElementaryCycle) {
    // Two cycles share A: A-B-A and A-C-A.
    auto graph = graph_of({"A", "B", "C"}, {{"A", "B"}, {"B", "A"}, {"A", "C"}, {"C", "A"}});
    CycleDetector detector(graph);

    EXPECT_EQ(detector.find_cycles().size(), 1u);
    auto all = detector.enumerate_cycles();
    ASSERT_EQ(all.size(), 2u);
    EXPECT_EQ(all[0], (Cycle{"A", "B"}));
    EXPECT_EQ(all[1], (Cycle{"A", "C"}));
}

TEST(CycleDetectorTest, EnumerationRespectsLimits) {
    auto graph = graph_of({"A", "B", "C"}, {{"A", "B"}, {"B", "A"}, {"A", "C"}, {"C", "A"}});
    CycleDetector detector(graph);
    EXPECT_EQ(detector.enumerate_cycles(1).size(), 1u);
    EXPECT_TRUE(detector.enumerate_cycles(0).empty());

    auto long_cycle = graph_of({"A", "B", "C", "D"},
                               {{"A", "B"}, {"B", "C"}, {"C", "D"}, {"D", "A"}});
    EXPECT_TRUE(CycleDetector(long_cycle).enumerate_cycles(20, 3).empty());
    EXPECT_EQ(CycleDetector(long_cycle).enumerate_cycles(20, 4).size(), 1u);
}

TEST(CycleDetectorTest, GeneratedCatalogsAreAcyclic) {
    std::mt19937 rng(7);
    auto graph = CourseGraph::build(CatalogGenerator::random_dag(200, 0.05f, rng)).value();
    EXPECT_FALSE(CycleDetector(graph).has_cycle());
}
