/**
 * @file cycle_detector.cpp
 * @brief CycleDetector: iterative Tarjan SCC plus bounded cycle enumeration.
 */

#include "graph/cycle_detector.hpp"

#include <algorithm>
#include <functional>
#include <limits>
#include <queue>

namespace course_planner {

namespace {

constexpr uint32_t kUnvisited = std::numeric_limits<uint32_t>::max();

}  // anonymous namespace

// ─────────────────────────────────────────────
// Strongly Connected Components (Tarjan)
// ─────────────────────────────────────────────

std::vector<std::vector<CourseIndex>> CycleDetector::strongly_connected_components() const {
    const size_t n = graph_.course_count();
    std::vector<uint32_t> index(n, kUnvisited);
    std::vector<uint32_t> lowlink(n, 0);
    std::vector<bool> on_stack(n, false);
    std::vector<CourseIndex> scc_stack;
    std::vector<std::vector<CourseIndex>> components;
    uint32_t next_index = 0;

    struct Frame {
        CourseIndex node;
        size_t neighbor_idx;
    };

    for (CourseIndex root = 0; root < n; ++root) {
        if (index[root] != kUnvisited) continue;

        std::vector<Frame> dfs_stack;
        dfs_stack.push_back({root, 0});
        index[root] = lowlink[root] = next_index++;
        scc_stack.push_back(root);
        on_stack[root] = true;

        while (!dfs_stack.empty()) {
            auto& frame = dfs_stack.back();
            const auto& neighbors = graph_.prerequisite_indices(frame.node);

            if (frame.neighbor_idx < neighbors.size()) {
                CourseIndex next = neighbors[frame.neighbor_idx++];
                if (index[next] == kUnvisited) {
                    index[next] = lowlink[next] = next_index++;
                    scc_stack.push_back(next);
                    on_stack[next] = true;
                    dfs_stack.push_back({next, 0});
                } else if (on_stack[next]) {
                    lowlink[frame.node] = std::min(lowlink[frame.node], index[next]);
                }
                continue;
            }

            CourseIndex node = frame.node;
            dfs_stack.pop_back();

            if (lowlink[node] == index[node]) {
                std::vector<CourseIndex> component;
                CourseIndex member = 0;
                do {
                    member = scc_stack.back();
                    scc_stack.pop_back();
                    on_stack[member] = false;
                    component.push_back(member);
                } while (member != node);
                std::sort(component.begin(), component.end());
                components.push_back(std::move(component));
            }

            if (!dfs_stack.empty()) {
                auto parent = dfs_stack.back().node;
                lowlink[parent] = std::min(lowlink[parent], lowlink[node]);
            }
        }
    }

    std::sort(components.begin(), components.end(),
              [](const auto& a, const auto& b) { return a.front() < b.front(); });
    return components;
}

// ─────────────────────────────────────────────
// Representative Cycles
// ─────────────────────────────────────────────

Cycle CycleDetector::representative_cycle(const std::vector<CourseIndex>& component) const {
    // Shortest cycle through the smallest member, found by BFS restricted
    // to the component. Neighbor lists are sorted, so ties resolve by code.
    const CourseIndex start = component.front();
    auto in_component = [&](CourseIndex idx) {
        return std::binary_search(component.begin(), component.end(), idx);
    };

    std::vector<CourseIndex> parent(graph_.course_count(), kUnvisited);
    std::queue<CourseIndex> frontier;
    frontier.push(start);
    parent[start] = start;

    while (!frontier.empty()) {
        auto current = frontier.front();
        frontier.pop();

        for (auto next : graph_.prerequisite_indices(current)) {
            if (next == start && current != start) {
                std::vector<CourseIndex> path;
                for (auto node = current; node != start; node = parent[node]) {
                    path.push_back(node);
                }
                path.push_back(start);
                std::reverse(path.begin(), path.end());
                return graph_.codes(path);
            }
            if (in_component(next) && parent[next] == kUnvisited) {
                parent[next] = current;
                frontier.push(next);
            }
        }
    }

    return graph_.codes(component);
}

std::vector<Cycle> CycleDetector::find_cycles() const {
    std::vector<Cycle> cycles;

    for (const auto& component : strongly_connected_components()) {
        if (component.size() > 1) {
            cycles.push_back(representative_cycle(component));
        }
    }
    for (CourseIndex idx = 0; idx < graph_.course_count(); ++idx) {
        if (graph_.has_self_edge(idx)) {
            cycles.push_back(Cycle{graph_.code_of(idx)});
        }
    }

    std::sort(cycles.begin(), cycles.end());
    return cycles;
}

bool CycleDetector::has_cycle() const {
    for (CourseIndex idx = 0; idx < graph_.course_count(); ++idx) {
        if (graph_.has_self_edge(idx)) return true;
    }
    for (const auto& component : strongly_connected_components()) {
        if (component.size() > 1) return true;
    }
    return false;
}

// ─────────────────────────────────────────────
// Elementary Cycle Enumeration
// ─────────────────────────────────────────────

std::vector<Cycle> CycleDetector::enumerate_cycles(size_t limit, size_t max_length) const {
    std::vector<Cycle> cycles;
    if (limit == 0 || max_length == 0) return cycles;

    // Restrict each search to the start's component: no cycle leaves it.
    std::vector<size_t> component_of(graph_.course_count(), 0);
    const auto components = strongly_connected_components();
    for (size_t c = 0; c < components.size(); ++c) {
        for (auto idx : components[c]) component_of[idx] = c;
    }

    std::vector<CourseIndex> path;
    std::vector<bool> on_path(graph_.course_count(), false);

    // Only nodes with index > start are expanded, so each cycle is found
    // exactly once, from its smallest member.
    std::function<void(CourseIndex, CourseIndex)> extend = [&](CourseIndex start,
                                                               CourseIndex node) {
        for (auto next : graph_.prerequisite_indices(node)) {
            if (cycles.size() >= limit) return;
            if (next == start) {
                cycles.push_back(graph_.codes(path));
                continue;
            }
            if (next < start || on_path[next] || component_of[next] != component_of[start]) {
                continue;
            }
            if (path.size() >= max_length) continue;

            path.push_back(next);
            on_path[next] = true;
            extend(start, next);
            on_path[next] = false;
            path.pop_back();
        }
    };

    for (CourseIndex start = 0; start < graph_.course_count(); ++start) {
        if (cycles.size() >= limit) break;
        if (!graph_.has_self_edge(start) && components[component_of[start]].size() < 2) {
            continue;
        }

        path.assign(1, start);
        on_path[start] = true;
        extend(start, start);
        on_path[start] = false;
    }

    std::sort(cycles.begin(), cycles.end());
    return cycles;
}

}  // namespace course_planner
