/**
 * @file test_reachability.cpp
 * @brief Unit tests for transitive closures, chain depths and depth layers.
 */

#include "graph/catalog_generator.hpp"
#include "graph/reachability.hpp"
#include "support/catalog_fixtures.hpp"

#include <gtest/gtest.h>
#include <algorithm>

using namespace course_planner;
using fixtures::graph_of;

namespace {

// D requires C and B; C requires A; B requires A.
CourseGraph diamond() {
    return graph_of({"A", "B", "C", "D"}, {{"D", "C"}, {"D", "B"}, {"C", "A"}, {"B", "A"}});
}

}  // namespace

TEST(ReachabilityTest, TransitivePrerequisites) {
    auto graph = diamond();
    ReachabilityIndex reach(graph);

    auto closure = reach.transitive_prerequisites("D");
    ASSERT_TRUE(closure.has_value()) << closure.error().message;
    EXPECT_EQ(closure->origin, "D");
    EXPECT_EQ(closure->courses, (std::vector<CourseCode>{"A", "B", "C"}));
    EXPECT_EQ(closure->chain_depth, 2u);
    EXPECT_FALSE(closure->partial);
}

TEST(ReachabilityTest, TransitiveDependents) {
    auto graph = diamond();
    ReachabilityIndex reach(graph);

    auto closure = reach.transitive_dependents("A");
    ASSERT_TRUE(closure.has_value());
    EXPECT_EQ(closure->courses, (std::vector<CourseCode>{"B", "C", "D"}));
    EXPECT_EQ(closure->chain_depth, 2u);
    EXPECT_TRUE(reach.transitive_dependents("D")->courses.empty());
}

TEST(ReachabilityTest, ClosureIsMonotoneAlongEdges) {
    std::mt19937 rng(11);
    auto graph = CourseGraph::build(CatalogGenerator::random_dag(60, 0.1f, rng)).value();
    ReachabilityIndex reach(graph);

    for (CourseIndex idx = 0; idx < graph.course_count(); ++idx) {
        auto outer = reach.closure(TraversalDirection::Prerequisites, idx);
        ASSERT_TRUE(outer.has_value());
        EXPECT_FALSE(std::binary_search(outer->begin(), outer->end(), idx));
        for (auto prereq : graph.prerequisite_indices(idx)) {
            auto inner = reach.closure(TraversalDirection::Prerequisites, prereq);
            ASSERT_TRUE(inner.has_value());
            EXPECT_TRUE(std::includes(outer->begin(), outer->end(),
                                      inner->begin(), inner->end()));
        }
    }
}

TEST(ReachabilityTest, UnknownCourse) {
    auto graph = diamond();
    ReachabilityIndex reach(graph);
    EXPECT_TRUE(reach.transitive_prerequisites("CS999").error().is(ErrorCode::NotFound));
    EXPECT_TRUE(reach.prerequisite_depth("CS999").error().is(ErrorCode::NotFound));
}

TEST(ReachabilityTest, CycleFailsUnboundedQuery) {
    auto graph = graph_of({"A", "B", "C", "D"},
                          {{"A", "B"}, {"B", "C"}, {"C", "A"}, {"D", "A"}});
    ReachabilityIndex reach(graph);

    auto closure = reach.transitive_prerequisites("D");
    ASSERT_FALSE(closure.has_value());
    EXPECT_TRUE(closure.error().is(ErrorCode::CycleDetected));
    EXPECT_EQ(closure.error().courses, (std::vector<std::string>{"A", "B", "C"}));

    auto dependents = reach.transitive_dependents("A");
    ASSERT_FALSE(dependents.has_value());
    EXPECT_EQ(dependents.error().courses, (std::vector<std::string>{"A", "B", "C"}));
}

TEST(ReachabilityTest, BoundedQueryToleratesCycles) {
    auto graph = graph_of({"A", "B", "C"}, {{"A", "B"}, {"B", "C"}, {"C", "A"}});
    ReachabilityIndex reach(graph);

    auto closure = reach.transitive_prerequisites("A", 5);
    ASSERT_TRUE(closure.has_value());
    EXPECT_EQ(closure->courses, (std::vector<CourseCode>{"B", "C"}));
    EXPECT_TRUE(closure->partial);
}

TEST(ReachabilityTest, DepthBoundMarksPartial) {
    auto graph = CourseGraph::build(CatalogGenerator::linear_chain(5)).value();
    ReachabilityIndex reach(graph);

    auto cut = reach.transitive_prerequisites("C004", 2);
    ASSERT_TRUE(cut.has_value());
    EXPECT_EQ(cut->courses, (std::vector<CourseCode>{"C002", "C003"}));
    EXPECT_EQ(cut->chain_depth, 2u);
    EXPECT_TRUE(cut->partial);

    auto whole = reach.transitive_prerequisites("C004", 10);
    ASSERT_TRUE(whole.has_value());
    EXPECT_EQ(whole->courses.size(), 4u);
    EXPECT_EQ(whole->chain_depth, 4u);
    EXPECT_FALSE(whole->partial);
}

TEST(ReachabilityTest, DepthsAndCriticalChain) {
    auto graph = graph_of({"A", "B", "C", "D", "E"},
                          {{"E", "D"}, {"E", "A"}, {"D", "C"}, {"C", "B"}});
    ReachabilityIndex reach(graph);

    EXPECT_EQ(*reach.prerequisite_depth("E"), 3u);
    EXPECT_EQ(*reach.prerequisite_depth("A"), 0u);
    EXPECT_EQ(*reach.dependent_depth("B"), 3u);

    auto chain = reach.critical_chain("E");
    ASSERT_TRUE(chain.has_value());
    EXPECT_EQ(*chain, (std::vector<CourseCode>{"E", "D", "C", "B"}));
}

TEST(ReachabilityTest, PrerequisitesByDepth) {
    auto graph = CourseGraph::build(CatalogGenerator::linear_chain(5)).value();
    ReachabilityIndex reach(graph);

    auto layers = reach.prerequisites_by_depth("C004", 3);
    ASSERT_TRUE(layers.has_value());
    ASSERT_EQ(layers->size(), 2u);
    EXPECT_EQ((*layers)[0].depth, 3u);
    EXPECT_EQ((*layers)[0].courses, (std::vector<CourseCode>{"C001"}));
    EXPECT_EQ((*layers)[1].depth, 4u);
    EXPECT_EQ((*layers)[1].courses, (std::vector<CourseCode>{"C000"}));

    EXPECT_TRUE(reach.prerequisites_by_depth("C001", 3)->empty());
}

TEST(ReachabilityTest, DiamondLayersListSharedPrerequisiteOnce) {
    auto graph = diamond();
    ReachabilityIndex reach(graph);
    auto layers = reach.prerequisites_by_depth("D", 1);
    ASSERT_TRUE(layers.has_value());
    ASSERT_EQ(layers->size(), 2u);
    EXPECT_EQ((*layers)[0].courses, (std::vector<CourseCode>{"B", "C"}));
    EXPECT_EQ((*layers)[1].courses, (std::vector<CourseCode>{"A"}));
}
