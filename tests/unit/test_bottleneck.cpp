/**
 * @file test_bottleneck.cpp
 * @brief Unit tests for bottleneck ranking and difficulty/impact scoring.
 */

#include "analysis/bottleneck.hpp"
#include "support/catalog_fixtures.hpp"

#include <gtest/gtest.h>

using namespace course_planner;
using fixtures::graph_of;

class BottleneckTest : public ::testing::Test {
protected:
    // HUB requires P1 and P2 and is required by D1..D4.
    // MID requires P1 and P2 and is required by D1..D3.
    CourseGraph graph_ = graph_of(
        {"D1", "D2", "D3", "D4", "HUB", "MID", "P1", "P2"},
        {{"HUB", "P1"}, {"HUB", "P2"}, {"MID", "P1"}, {"MID", "P2"},
         {"D1", "HUB"}, {"D2", "HUB"}, {"D3", "HUB"}, {"D4", "HUB"},
         {"D1", "MID"}, {"D2", "MID"}, {"D3", "MID"}});
    ReachabilityIndex reach_{graph_};
    BottleneckAnalyzer analyzer_{reach_};
};

TEST_F(BottleneckTest, RanksByUnlocksThenPrerequisites) {
    auto entries = analyzer_.rank(BottleneckCriteria{});
    ASSERT_EQ(entries.size(), 2u);

    EXPECT_EQ(entries[0].course, "HUB");
    EXPECT_EQ(entries[0].unlocks, 4u);
    EXPECT_EQ(entries[0].total_prerequisites, 2u);
    EXPECT_EQ(entries[0].unlocked_courses, (std::vector<CourseCode>{"D1", "D2", "D3", "D4"}));

    EXPECT_EQ(entries[1].course, "MID");
    EXPECT_EQ(entries[1].unlocks, 3u);
}

TEST_F(BottleneckTest, CriteriaFilter) {
    BottleneckCriteria strict{.min_dependents = 4, .min_prerequisites = 2,
                              .prerequisite_depth = 3, .limit = 0};
    auto entries = analyzer_.rank(strict);
    ASSERT_EQ(entries.size(), 1u);
    EXPECT_EQ(entries[0].course, "HUB");

    BottleneckCriteria needs_more{.min_dependents = 1, .min_prerequisites = 3,
                                  .prerequisite_depth = 3, .limit = 0};
    // Only the D courses have three or more prerequisites, and nothing requires them.
    EXPECT_TRUE(analyzer_.rank(needs_more).empty());
}

TEST_F(BottleneckTest, LimitTruncates) {
    BottleneckCriteria limited;
    limited.limit = 1;
    auto entries = analyzer_.rank(limited);
    ASSERT_EQ(entries.size(), 1u);
    EXPECT_EQ(entries[0].course, "HUB");
}

TEST_F(BottleneckTest, RankingSurvivesCycles) {
    auto graph = graph_of({"A", "B", "C", "X", "Y", "Z"},
                          {{"A", "B"}, {"B", "A"}, {"A", "Z"},
                           {"X", "A"}, {"Y", "A"}, {"C", "A"}, {"B", "C"}});
    ReachabilityIndex reach(graph);
    BottleneckAnalyzer analyzer(reach);

    auto entries = analyzer.rank(BottleneckCriteria{});
    ASSERT_EQ(entries.size(), 1u);
    EXPECT_EQ(entries[0].course, "A");
}

TEST_F(BottleneckTest, ClassifyCourseTypes) {
    EXPECT_EQ(BottleneckAnalyzer::classify(0, 6), CourseType::Foundation);
    EXPECT_EQ(BottleneckAnalyzer::classify(6, 0), CourseType::Capstone);
    EXPECT_EQ(BottleneckAnalyzer::classify(1, 4), CourseType::Core);
    EXPECT_EQ(BottleneckAnalyzer::classify(4, 1), CourseType::Advanced);
    EXPECT_EQ(BottleneckAnalyzer::classify(1, 1), CourseType::Regular);
    EXPECT_EQ(BottleneckAnalyzer::classify(0, 5), CourseType::Core);
}

TEST_F(BottleneckTest, ImpactScores) {
    auto items = analyzer_.impact();
    ASSERT_TRUE(items.has_value()) << items.error().message;
    ASSERT_EQ(items->size(), graph_.course_count());

    const CourseImpact* hub = nullptr;
    const CourseImpact* p1 = nullptr;
    for (const auto& i : *items) {
        if (i.course == "HUB") hub = &i;
        if (i.course == "P1") p1 = &i;
    }
    ASSERT_NE(hub, nullptr);
    ASSERT_NE(p1, nullptr);

    EXPECT_EQ(hub->total_prerequisites, 2u);
    EXPECT_EQ(hub->max_prerequisite_depth, 1u);
    EXPECT_EQ(hub->dependents, 4u);
    EXPECT_EQ(hub->max_dependent_depth, 1u);
    EXPECT_EQ(hub->difficulty, 2u * 2 + 10u * 1);
    EXPECT_EQ(hub->impact, 2u * 4 + 5u * 1);
    EXPECT_EQ(hub->type, CourseType::Core);

    // P1 unlocks HUB, MID and D1..D4.
    EXPECT_EQ(p1->dependents, 6u);
    EXPECT_EQ(p1->max_dependent_depth, 2u);
    EXPECT_EQ(p1->type, CourseType::Foundation);
    EXPECT_EQ(p1->critical_chain, (std::vector<CourseCode>{"P1"}));

    // Ordered by difficulty desc: the D courses sit on top.
    EXPECT_EQ(items->front().course, "D1");
}

TEST_F(BottleneckTest, ImpactPrefixFilter) {
    auto items = analyzer_.impact("P");
    ASSERT_TRUE(items.has_value());
    ASSERT_EQ(items->size(), 2u);
    EXPECT_EQ((*items)[0].course, "P1");
    EXPECT_EQ((*items)[1].course, "P2");
}

TEST_F(BottleneckTest, ImpactFailsOnCycle) {
    auto graph = graph_of({"A", "B"}, {{"A", "B"}, {"B", "A"}});
    ReachabilityIndex reach(graph);
    auto items = BottleneckAnalyzer(reach).impact();
    ASSERT_FALSE(items.has_value());
    EXPECT_TRUE(items.error().is(ErrorCode::CycleDetected));
}
