/**
 * @file test_snapshot_cache.cpp
 * @brief Unit tests for SnapshotCache publication and replacement.
 */

#include "snapshot/snapshot_cache.hpp"
#include "graph/catalog_generator.hpp"

#include <gtest/gtest.h>
#include <atomic>
#include <thread>
#include <vector>

using namespace course_planner;

namespace {

std::shared_ptr<const PlanningSnapshot> chain_snapshot(size_t n) {
    CatalogDocument doc;
    doc.catalog = CatalogGenerator::linear_chain(n);
    return std::make_shared<const PlanningSnapshot>(build_snapshot(doc).value());
}

}  // namespace

TEST(SnapshotCacheTest, StartsEmpty) {
    SnapshotCache cache;
    EXPECT_TRUE(cache.empty());
    EXPECT_EQ(cache.current(), nullptr);
    EXPECT_EQ(cache.generation(), 0u);
}

TEST(SnapshotCacheTest, InitialSnapshotIsGenerationOne) {
    SnapshotCache cache(chain_snapshot(3));
    EXPECT_FALSE(cache.empty());
    EXPECT_EQ(cache.generation(), 1u);
    EXPECT_EQ(cache.current()->graph.course_count(), 3u);
}

TEST(SnapshotCacheTest, ReaderKeepsOldSnapshotAfterReplace) {
    SnapshotCache cache(chain_snapshot(3));
    auto held = cache.current();

    EXPECT_EQ(cache.replace(chain_snapshot(5)), 2u);
    EXPECT_EQ(held->graph.course_count(), 3u);
    EXPECT_EQ(cache.current()->graph.course_count(), 5u);
}

TEST(SnapshotCacheTest, ConcurrentReadersDuringReplace) {
    SnapshotCache cache(chain_snapshot(4));
    std::atomic<bool> done{false};
    std::atomic<int> bad_reads{0};

    std::vector<std::jthread> readers;
    for (int i = 0; i < 4; ++i) {
        readers.emplace_back([&] {
            while (!done.load()) {
                auto snapshot = cache.current();
                auto n = snapshot->graph.course_count();
                if (n != 4 && n != 6) bad_reads.fetch_add(1);
            }
        });
    }

    for (int i = 0; i < 50; ++i) {
        (void)cache.replace(chain_snapshot(i % 2 == 0 ? 6 : 4));
    }
    done.store(true);
    readers.clear();

    EXPECT_EQ(bad_reads.load(), 0);
    EXPECT_EQ(cache.generation(), 51u);
}
