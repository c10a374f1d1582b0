/**
 * @file reachability.cpp
 * @brief ReachabilityIndex: memoized closures, longest chains, depth layers.
 */

#include "graph/reachability.hpp"

#include <algorithm>

namespace course_planner {

namespace {

enum class Color : uint8_t { White, Gray, Black };

/// Rotate so the smallest index leads; indices order like codes.
std::vector<CourseIndex> canonical_cycle(std::vector<CourseIndex> cycle) {
    auto smallest = std::min_element(cycle.begin(), cycle.end());
    std::rotate(cycle.begin(), smallest, cycle.end());
    return cycle;
}

}  // anonymous namespace

ReachabilityIndex::ReachabilityIndex(const CourseGraph& graph) : graph_(graph) {
    const size_t n = graph_.course_count();
    prerequisite_memo_.closure.resize(n);
    prerequisite_memo_.depth.assign(n, 0);
    dependent_memo_.closure.resize(n);
    dependent_memo_.depth.assign(n, 0);
}

const std::vector<CourseIndex>& ReachabilityIndex::neighbors(TraversalDirection dir,
                                                             CourseIndex idx) const {
    return dir == TraversalDirection::Prerequisites ? graph_.prerequisite_indices(idx)
                                                    : graph_.dependent_indices(idx);
}

ReachabilityIndex::Memo& ReachabilityIndex::memo(TraversalDirection dir) const {
    return dir == TraversalDirection::Prerequisites ? prerequisite_memo_ : dependent_memo_;
}

// ─────────────────────────────────────────────
// Memoized DFS
// ─────────────────────────────────────────────

Result<void> ReachabilityIndex::ensure(TraversalDirection dir, CourseIndex root) const {
    auto& m = memo(dir);
    if (m.closure[root]) return {};

    std::vector<Color> color(graph_.course_count(), Color::White);

    struct Frame {
        CourseIndex node;
        size_t neighbor_idx;
    };

    std::vector<Frame> dfs_stack;
    dfs_stack.push_back({root, 0});
    color[root] = Color::Gray;

    while (!dfs_stack.empty()) {
        auto& frame = dfs_stack.back();
        const auto& next_list = neighbors(dir, frame.node);

        if (frame.neighbor_idx < next_list.size()) {
            CourseIndex next = next_list[frame.neighbor_idx++];
            if (m.closure[next]) continue;

            if (color[next] == Color::Gray) {
                auto pos = std::find_if(dfs_stack.begin(), dfs_stack.end(),
                                        [next](const Frame& f) { return f.node == next; });
                std::vector<CourseIndex> cycle;
                for (auto it = pos; it != dfs_stack.end(); ++it) {
                    cycle.push_back(it->node);
                }
                // Report in `requires` order regardless of traversal direction.
                if (dir == TraversalDirection::Dependents) {
                    std::reverse(cycle.begin(), cycle.end());
                }
                auto codes = graph_.codes(canonical_cycle(std::move(cycle)));
                return Error{ErrorCode::CycleDetected,
                             "Prerequisite cycle reachable from " + graph_.code_of(root)
                                 + ": " + format_cycle(codes),
                             codes};
            }

            color[next] = Color::Gray;
            dfs_stack.push_back({next, 0});
            continue;
        }

        CourseIndex node = frame.node;
        std::vector<CourseIndex> acc;
        uint32_t depth = 0;
        for (auto next : next_list) {
            const auto& sub = *m.closure[next];
            acc.push_back(next);
            acc.insert(acc.end(), sub.begin(), sub.end());
            depth = std::max(depth, m.depth[next] + 1);
        }
        std::sort(acc.begin(), acc.end());
        acc.erase(std::unique(acc.begin(), acc.end()), acc.end());

        m.closure[node] = std::move(acc);
        m.depth[node] = depth;
        color[node] = Color::Black;
        dfs_stack.pop_back();
    }

    return {};
}

Result<std::vector<CourseIndex>> ReachabilityIndex::closure(TraversalDirection dir,
                                                            CourseIndex idx) const {
    if (auto ok = ensure(dir, idx); !ok) return ok.error();
    return *memo(dir).closure[idx];
}

Result<uint32_t> ReachabilityIndex::chain_depth(TraversalDirection dir, CourseIndex idx) const {
    if (auto ok = ensure(dir, idx); !ok) return ok.error();
    return memo(dir).depth[idx];
}

// ─────────────────────────────────────────────
// Depth-Bounded Layer Expansion
// ─────────────────────────────────────────────

std::vector<CourseIndex> ReachabilityIndex::bounded_closure(TraversalDirection dir,
                                                            CourseIndex idx,
                                                            uint32_t max_depth,
                                                            uint32_t* reached_depth,
                                                            bool* partial) const {
    std::vector<bool> seen(graph_.course_count(), false);
    std::vector<bool> in_layer(graph_.course_count(), false);
    std::vector<CourseIndex> layer{idx};
    std::vector<CourseIndex> result;
    uint32_t depth = 0;

    while (!layer.empty() && depth < max_depth) {
        std::vector<CourseIndex> next_layer;
        for (auto node : layer) {
            for (auto next : neighbors(dir, node)) {
                if (in_layer[next]) continue;
                in_layer[next] = true;
                next_layer.push_back(next);
                if (!seen[next] && next != idx) {
                    seen[next] = true;
                    result.push_back(next);
                }
            }
        }
        for (auto node : next_layer) in_layer[node] = false;
        if (next_layer.empty()) break;
        layer = std::move(next_layer);
        ++depth;
    }

    if (reached_depth) *reached_depth = depth;
    if (partial) {
        *partial = false;
        if (depth == max_depth) {
            for (auto node : layer) {
                if (!neighbors(dir, node).empty()) {
                    *partial = true;
                    break;
                }
            }
        }
    }

    std::sort(result.begin(), result.end());
    return result;
}

// ─────────────────────────────────────────────
// Code-Level Queries
// ─────────────────────────────────────────────

Result<Closure> ReachabilityIndex::query(TraversalDirection dir, const CourseCode& code,
                                         std::optional<uint32_t> max_depth) const {
    auto idx = graph_.index_of(code);
    if (!idx) return not_found("Course", code);

    Closure out;
    out.origin = code;

    if (max_depth) {
        auto indices = bounded_closure(dir, *idx, *max_depth, &out.chain_depth, &out.partial);
        out.courses = graph_.codes(indices);
        return out;
    }

    if (auto ok = ensure(dir, *idx); !ok) return ok.error();
    out.courses = graph_.codes(*memo(dir).closure[*idx]);
    out.chain_depth = memo(dir).depth[*idx];
    return out;
}

Result<Closure> ReachabilityIndex::transitive_prerequisites(
    const CourseCode& code, std::optional<uint32_t> max_depth) const {
    return query(TraversalDirection::Prerequisites, code, max_depth);
}

Result<Closure> ReachabilityIndex::transitive_dependents(
    const CourseCode& code, std::optional<uint32_t> max_depth) const {
    return query(TraversalDirection::Dependents, code, max_depth);
}

Result<uint32_t> ReachabilityIndex::prerequisite_depth(const CourseCode& code) const {
    auto idx = graph_.index_of(code);
    if (!idx) return not_found("Course", code);
    return chain_depth(TraversalDirection::Prerequisites, *idx);
}

Result<uint32_t> ReachabilityIndex::dependent_depth(const CourseCode& code) const {
    auto idx = graph_.index_of(code);
    if (!idx) return not_found("Course", code);
    return chain_depth(TraversalDirection::Dependents, *idx);
}

Result<std::vector<CourseCode>> ReachabilityIndex::critical_chain(const CourseCode& code) const {
    auto idx = graph_.index_of(code);
    if (!idx) return not_found("Course", code);
    if (auto ok = ensure(TraversalDirection::Prerequisites, *idx); !ok) return ok.error();

    const auto& m = prerequisite_memo_;
    std::vector<CourseIndex> chain{*idx};
    CourseIndex current = *idx;
    while (m.depth[current] > 0) {
        // Neighbor lists are sorted: the first deepest prerequisite wins ties.
        for (auto next : graph_.prerequisite_indices(current)) {
            if (m.depth[next] + 1 == m.depth[current]) {
                current = next;
                break;
            }
        }
        chain.push_back(current);
    }
    return graph_.codes(chain);
}

Result<std::vector<DepthLayer>> ReachabilityIndex::prerequisites_by_depth(
    const CourseCode& code, uint32_t min_depth) const {
    auto idx = graph_.index_of(code);
    if (!idx) return not_found("Course", code);
    if (auto ok = ensure(TraversalDirection::Prerequisites, *idx); !ok) return ok.error();

    std::vector<DepthLayer> layers;
    std::vector<bool> in_layer(graph_.course_count(), false);
    std::vector<CourseIndex> layer{*idx};

    for (uint32_t depth = 1; !layer.empty(); ++depth) {
        std::vector<CourseIndex> next_layer;
        for (auto node : layer) {
            for (auto next : graph_.prerequisite_indices(node)) {
                if (in_layer[next]) continue;
                in_layer[next] = true;
                next_layer.push_back(next);
            }
        }
        for (auto node : next_layer) in_layer[node] = false;
        if (next_layer.empty()) break;

        std::sort(next_layer.begin(), next_layer.end());
        if (depth >= min_depth) {
            layers.push_back(DepthLayer{.depth = depth, .courses = graph_.codes(next_layer)});
        }
        layer = std::move(next_layer);
    }

    return layers;
}

}  // namespace course_planner
