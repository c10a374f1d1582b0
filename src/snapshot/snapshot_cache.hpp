/**
 * @file snapshot_cache.hpp
 * @brief Shared holder of the current PlanningSnapshot.
 */

#pragma once

#include "snapshot/catalog_loader.hpp"

#include <cstdint>
#include <memory>
#include <shared_mutex>

namespace course_planner {

/**
 * @brief Hands out the current snapshot to concurrent requests.
 *
 * Readers copy the shared pointer and keep using their copy even after a
 * replace(); a snapshot is never modified once published. Thread-safe via
 * shared_mutex.
 */
class SnapshotCache {
public:
    SnapshotCache() = default;
    explicit SnapshotCache(std::shared_ptr<const PlanningSnapshot> initial);

    [[nodiscard]] std::shared_ptr<const PlanningSnapshot> current() const;

    /// Publish a new snapshot; returns the new generation number.
    uint64_t replace(std::shared_ptr<const PlanningSnapshot> next);

    [[nodiscard]] uint64_t generation() const noexcept;
    [[nodiscard]] bool empty() const noexcept;

private:
    mutable std::shared_mutex mutex_;
    std::shared_ptr<const PlanningSnapshot> snapshot_;
    uint64_t generation_{0};
};

}  // namespace course_planner
