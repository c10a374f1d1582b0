/**
 * @file test_progress.cpp
 * @brief Unit tests for progress summaries and remaining-course buckets.
 */

#include "analysis/progress.hpp"
#include "support/catalog_fixtures.hpp"

#include <gtest/gtest.h>

using namespace course_planner;
using fixtures::catalog;
using fixtures::student;

class ProgressTest : public ::testing::Test {
protected:
    // C requires A and B; D requires C; E requires A, B and C.
    CourseGraph graph_ = CourseGraph::build(catalog(
        {{"A", 4}, {"B", std::nullopt}, {"C", 3}, {"D", 3}, {"E", 3}},
        {{"C", "A"}, {"C", "B"}, {"D", "C"}, {"E", "A"}, {"E", "B"}, {"E", "C"}})).value();
};

TEST_F(ProgressTest, SummaryCountsAndCredits) {
    auto s = student({"A", "B"});
    auto summary = summarize_progress(graph_, s, 3);

    EXPECT_EQ(summary.student, "s1");
    EXPECT_EQ(summary.completed, 2u);
    EXPECT_EQ(summary.completed_credits, 4u + 3u);   // B has no credits: default applies
    EXPECT_EQ(summary.available, 1u);                // C
    EXPECT_EQ(summary.blocked, 2u);                  // D, E
    EXPECT_DOUBLE_EQ(summary.progress_percent, 40.0);
}

TEST_F(ProgressTest, PercentRoundsToTwoDecimals) {
    auto summary = summarize_progress(graph_, student({"A"}), 3);
    // 1 of 5 courses: denominator counts completed + available + blocked.
    EXPECT_DOUBLE_EQ(summary.progress_percent, 20.0);

    auto graph = fixtures::graph_of({"A", "B", "C"});
    auto third = summarize_progress(graph, student({"A"}), 3);
    EXPECT_DOUBLE_EQ(third.progress_percent, 33.33);
}

TEST_F(ProgressTest, TransferCreditCountsTowardCompleted) {
    auto summary = summarize_progress(graph_, student({"A", "TRANSFER101"}), 3);
    EXPECT_EQ(summary.completed, 2u);
    EXPECT_EQ(summary.completed_credits, 4u + 3u);
}

TEST_F(ProgressTest, EmptyCatalogHasZeroProgress) {
    CourseGraph empty;
    auto summary = summarize_progress(empty, student({}), 3);
    EXPECT_DOUBLE_EQ(summary.progress_percent, 0.0);
}

TEST_F(ProgressTest, SortByProgress) {
    std::vector<ProgressSummary> summaries{
        ProgressSummary{.student = "b", .progress_percent = 10.0},
        ProgressSummary{.student = "a", .progress_percent = 10.0},
        ProgressSummary{.student = "c", .progress_percent = 50.0},
    };
    sort_by_progress(summaries);
    EXPECT_EQ(summaries[0].student, "c");
    EXPECT_EQ(summaries[1].student, "a");
    EXPECT_EQ(summaries[2].student, "b");
}

TEST_F(ProgressTest, BucketsByMissingDirectPrerequisites) {
    ProgramRequirement program{.name = "Core", .required = {"A", "B", "C", "D", "E"}};
    auto buckets = bucket_remaining(graph_, student({"A"}, {"B"}), program);
    ASSERT_TRUE(buckets.has_value()) << buckets.error().message;

    // A completed, B enrolled: C misses B, D misses C, E misses B and C.
    ASSERT_EQ(buckets->count(ProgressBucket::ReadyNow), 0u);
    const auto& almost = buckets->at(ProgressBucket::AlmostReady);
    ASSERT_EQ(almost.size(), 2u);
    EXPECT_EQ(almost[0].course, "C");
    EXPECT_EQ(almost[0].missing, (std::vector<CourseCode>{"B"}));
    EXPECT_EQ(almost[1].course, "D");

    const auto& soon = buckets->at(ProgressBucket::PlanSoon);
    ASSERT_EQ(soon.size(), 1u);
    EXPECT_EQ(soon[0].course, "E");
    EXPECT_EQ(soon[0].missing, (std::vector<CourseCode>{"B", "C"}));
}

TEST_F(ProgressTest, PlanLaterBucket) {
    ProgramRequirement program{.name = "Core", .required = {"E", "A"}};
    auto buckets = bucket_remaining(graph_, student({}), program);
    ASSERT_TRUE(buckets.has_value());
    ASSERT_EQ(buckets->at(ProgressBucket::PlanLater).size(), 1u);
    EXPECT_EQ(buckets->at(ProgressBucket::ReadyNow)[0].course, "A");
}

TEST_F(ProgressTest, BucketUnknownRequiredCourse) {
    ProgramRequirement program{.name = "Core", .required = {"CS999"}};
    auto buckets = bucket_remaining(graph_, student({}), program);
    ASSERT_FALSE(buckets.has_value());
    EXPECT_TRUE(buckets.error().is(ErrorCode::NotFound));
}
