/**
 * @file snapshot_cache.cpp
 * @brief SnapshotCache implementation.
 */

#include "snapshot/snapshot_cache.hpp"

#include <mutex>

namespace course_planner {

SnapshotCache::SnapshotCache(std::shared_ptr<const PlanningSnapshot> initial)
    : snapshot_(std::move(initial))
    , generation_(snapshot_ ? 1 : 0) {}

std::shared_ptr<const PlanningSnapshot> SnapshotCache::current() const {
    std::shared_lock lock(mutex_);
    return snapshot_;
}

uint64_t SnapshotCache::replace(std::shared_ptr<const PlanningSnapshot> next) {
    std::unique_lock lock(mutex_);
    snapshot_ = std::move(next);
    return ++generation_;
}

uint64_t SnapshotCache::generation() const noexcept {
    std::shared_lock lock(mutex_);
    return generation_;
}

bool SnapshotCache::empty() const noexcept {
    std::shared_lock lock(mutex_);
    return snapshot_ == nullptr;
}

}  // namespace course_planner
