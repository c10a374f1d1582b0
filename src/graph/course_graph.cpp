/**
 * @file course_graph.cpp
 * @brief CourseGraph construction and neighbor queries.
 */

#include "graph/course_graph.hpp"

#include <algorithm>

namespace course_planner {

// ─────────────────────────────────────────────
// Construction
// ─────────────────────────────────────────────

Result<CourseGraph> CourseGraph::build(const CatalogSnapshot& snapshot) {
    CourseGraph graph;
    graph.courses_ = snapshot.courses;
    std::sort(graph.courses_.begin(), graph.courses_.end(),
              [](const Course& a, const Course& b) { return a.code < b.code; });

    graph.index_.reserve(graph.courses_.size());
    for (size_t i = 0; i < graph.courses_.size(); ++i) {
        const auto& code = graph.courses_[i].code;
        if (code.empty()) {
            return make_error<CourseGraph>(ErrorCode::MalformedGraph,
                                           "Course with empty code in catalog");
        }
        auto [_, inserted] = graph.index_.emplace(code, static_cast<CourseIndex>(i));
        if (!inserted) {
            return make_error<CourseGraph>(ErrorCode::MalformedGraph,
                                           "Duplicate course code in catalog: " + code, {code});
        }
    }

    graph.prerequisites_.resize(graph.courses_.size());
    graph.dependents_.resize(graph.courses_.size());

    for (const auto& edge : snapshot.edges) {
        auto from = graph.index_of(edge.course);
        auto to = graph.index_of(edge.prerequisite);
        if (!from || !to) {
            const auto& missing = !from ? edge.course : edge.prerequisite;
            return make_error<CourseGraph>(
                ErrorCode::MalformedGraph,
                "Prerequisite edge " + edge.course + " -> " + edge.prerequisite
                    + " references unknown course " + missing,
                {edge.course, edge.prerequisite});
        }
        graph.prerequisites_[*from].push_back(*to);
        graph.dependents_[*to].push_back(*from);
    }

    auto normalize = [](std::vector<CourseIndex>& list) {
        std::sort(list.begin(), list.end());
        list.erase(std::unique(list.begin(), list.end()), list.end());
    };
    for (auto& list : graph.prerequisites_) {
        normalize(list);
        graph.edge_count_ += list.size();
    }
    for (auto& list : graph.dependents_) {
        normalize(list);
    }

    return graph;
}

// ─────────────────────────────────────────────
// Lookup
// ─────────────────────────────────────────────

Result<Course> CourseGraph::course(const CourseCode& code) const {
    if (const auto* found = find(code)) {
        return *found;
    }
    return not_found("Course", code);
}

const Course* CourseGraph::find(const CourseCode& code) const noexcept {
    auto it = index_.find(code);
    if (it == index_.end()) return nullptr;
    return &courses_[it->second];
}

bool CourseGraph::contains(const CourseCode& code) const noexcept {
    return index_.contains(code);
}

std::optional<CourseIndex> CourseGraph::index_of(const CourseCode& code) const noexcept {
    auto it = index_.find(code);
    if (it == index_.end()) return std::nullopt;
    return it->second;
}

// ─────────────────────────────────────────────
// Neighbors
// ─────────────────────────────────────────────

Result<std::vector<CourseCode>> CourseGraph::prerequisites(const CourseCode& code) const {
    auto idx = index_of(code);
    if (!idx) return not_found("Course", code);
    return codes(prerequisites_[*idx]);
}

Result<std::vector<CourseCode>> CourseGraph::dependents(const CourseCode& code) const {
    auto idx = index_of(code);
    if (!idx) return not_found("Course", code);
    return codes(dependents_[*idx]);
}

bool CourseGraph::has_self_edge(CourseIndex idx) const {
    const auto& list = prerequisites_.at(idx);
    return std::binary_search(list.begin(), list.end(), idx);
}

std::vector<CourseCode> CourseGraph::codes(const std::vector<CourseIndex>& indices) const {
    std::vector<CourseCode> out;
    out.reserve(indices.size());
    for (auto idx : indices) {
        out.push_back(courses_[idx].code);
    }
    return out;
}

}  // namespace course_planner
