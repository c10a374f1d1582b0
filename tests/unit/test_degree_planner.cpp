/**
 * @file test_degree_planner.cpp
 * @brief Unit tests for unconstrained layered degree planning.
 */

#include "graph/catalog_generator.hpp"
#include "planner/degree_planner.hpp"
#include "support/catalog_fixtures.hpp"

#include <gtest/gtest.h>

using namespace course_planner;
using fixtures::graph_of;
using fixtures::student;

TEST(DegreePlannerTest, LayersFollowPrerequisites) {
    auto graph = graph_of({"CS125", "CS225", "CS374", "MATH241"},
                          {{"CS225", "CS125"}, {"CS225", "MATH241"}, {"CS374", "CS225"}});
    ReachabilityIndex reach(graph);

    auto plan = plan_degree(reach, student({}), {"CS374", "CS225", "CS125", "MATH241"});
    ASSERT_TRUE(plan.has_value()) << plan.error().message;
    EXPECT_EQ(plan->remaining, (std::vector<CourseCode>{"CS125", "CS225", "CS374", "MATH241"}));
    ASSERT_EQ(plan->layers.size(), 3u);
    EXPECT_EQ(plan->layers[0], (std::vector<CourseCode>{"CS125", "MATH241"}));
    EXPECT_EQ(plan->layers[1], (std::vector<CourseCode>{"CS225"}));
    EXPECT_EQ(plan->layers[2], (std::vector<CourseCode>{"CS374"}));
}

TEST(DegreePlannerTest, CompletedCoursesDropOut) {
    auto graph = graph_of({"A", "B", "C"}, {{"B", "A"}, {"C", "B"}});
    ReachabilityIndex reach(graph);

    auto plan = plan_degree(reach, student({"A"}), {"A", "B", "C"});
    ASSERT_TRUE(plan.has_value());
    ASSERT_EQ(plan->layers.size(), 2u);
    EXPECT_EQ(plan->layers[0], (std::vector<CourseCode>{"B"}));
    EXPECT_EQ(plan->layers[1], (std::vector<CourseCode>{"C"}));
}

TEST(DegreePlannerTest, PrerequisitesOutsideRequirementsDoNotBlock) {
    auto graph = graph_of({"A", "B"}, {{"B", "A"}});
    ReachabilityIndex reach(graph);

    auto plan = plan_degree(reach, student({}), {"B"});
    ASSERT_TRUE(plan.has_value());
    ASSERT_EQ(plan->layers.size(), 1u);
    EXPECT_EQ(plan->layers[0], (std::vector<CourseCode>{"B"}));
}

TEST(DegreePlannerTest, EverythingCompleted) {
    auto graph = graph_of({"A"});
    ReachabilityIndex reach(graph);
    auto plan = plan_degree(reach, student({"A"}), {"A"});
    ASSERT_TRUE(plan.has_value());
    EXPECT_TRUE(plan->remaining.empty());
    EXPECT_TRUE(plan->layers.empty());
}

TEST(DegreePlannerTest, CycleIsReported) {
    auto graph = graph_of({"A", "B", "C", "D"},
                          {{"A", "B"}, {"B", "C"}, {"C", "A"}, {"D", "A"}});
    ReachabilityIndex reach(graph);

    auto plan = plan_degree(reach, student({}), {"A", "B", "C", "D"});
    ASSERT_FALSE(plan.has_value());
    EXPECT_TRUE(plan.error().is(ErrorCode::CycleDetected));
    EXPECT_EQ(plan.error().courses, (std::vector<std::string>{"A", "B", "C"}));
}

TEST(DegreePlannerTest, UnknownRequiredCourse) {
    auto graph = graph_of({"A"});
    ReachabilityIndex reach(graph);
    auto plan = plan_degree(reach, student({}), {"CS999"});
    ASSERT_FALSE(plan.has_value());
    EXPECT_TRUE(plan.error().is(ErrorCode::NotFound));
}

TEST(DegreePlannerTest, LinearChainNeedsOneLayerPerCourse) {
    auto snapshot = CatalogGenerator::linear_chain(6);
    auto graph = CourseGraph::build(snapshot).value();
    ReachabilityIndex reach(graph);

    auto plan = plan_degree(reach, student({}), CatalogGenerator::all_codes(snapshot));
    ASSERT_TRUE(plan.has_value());
    EXPECT_EQ(plan->layers.size(), 6u);
}
