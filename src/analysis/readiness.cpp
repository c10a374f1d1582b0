/**
 * @file readiness.cpp
 * @brief ReadinessScorer implementation.
 */

#include "analysis/readiness.hpp"

#include <algorithm>
#include <iterator>

namespace course_planner {

uint32_t ReadinessScorer::compute_score(size_t required, size_t missing) noexcept {
    if (required == 0 || missing == 0) return 100;
    // Integer floor of 100 * (required - missing) / required.
    return static_cast<uint32_t>((100 * (required - missing)) / required);
}

ReadinessStatus ReadinessScorer::classify(uint32_t score) const noexcept {
    if (score == 100) return ReadinessStatus::ReadyNow;
    if (score >= almost_ready_threshold_) return ReadinessStatus::AlmostReady;
    return ReadinessStatus::NotReady;
}

Result<ReadinessReport> ReadinessScorer::score(const StudentState& student,
                                               const CourseCode& target) const {
    auto required = graph_.prerequisites(target);
    if (!required) return required.error();

    ReadinessReport report;
    report.course = target;
    report.required = std::move(*required);
    for (const auto& code : report.required) {
        if (!student.has_completed(code)) {
            report.missing.push_back(code);
        }
    }
    report.score = compute_score(report.required.size(), report.missing.size());
    report.status = classify(report.score);
    return report;
}

Result<EligibilityReport> ReadinessScorer::check_eligibility(
    const StudentState& student, const CourseCode& target,
    const ReachabilityIndex& reach) const {
    std::vector<CourseCode> completed(student.completed.begin(), student.completed.end());
    return validate_completed(target, completed, reach);
}

Result<EligibilityReport> ReadinessScorer::validate_completed(
    const CourseCode& target, const std::vector<CourseCode>& completed,
    const ReachabilityIndex& reach) const {
    auto closure = reach.transitive_prerequisites(target);
    if (!closure) return closure.error();

    EligibilityReport report;
    report.course = target;
    report.required = std::move(closure->courses);
    report.completed = completed;
    std::sort(report.completed.begin(), report.completed.end());
    report.completed.erase(std::unique(report.completed.begin(), report.completed.end()),
                           report.completed.end());

    std::set_difference(report.required.begin(), report.required.end(),
                        report.completed.begin(), report.completed.end(),
                        std::back_inserter(report.missing));

    report.can_take = report.missing.empty();
    report.reason = report.can_take ? EligibilityReason::Ok
                                    : EligibilityReason::MissingPrerequisites;
    return report;
}

Result<std::vector<Recommendation>> ReadinessScorer::recommend(
    const StudentState& student, const SemesterOffering& semester,
    const ReachabilityIndex& reach, uint32_t min_score, size_t limit,
    uint32_t unlock_horizon) const {
    std::vector<Recommendation> out;

    for (const auto& code : semester.offered) {
        auto idx = graph_.index_of(code);
        if (!idx) {
            return Error{ErrorCode::NotFound,
                         "Semester " + semester.id.label() + " offers unknown course " + code,
                         {code}};
        }
        if (student.has_completed(code)) continue;

        auto report = score(student, code);
        if (!report) return report.error();
        if (report->score < min_score) continue;

        Recommendation rec;
        rec.credits = graph_.at(*idx).credits;
        rec.unlocks = graph_.codes(
            reach.bounded_closure(TraversalDirection::Dependents, *idx, unlock_horizon));
        rec.readiness = std::move(*report);
        out.push_back(std::move(rec));
    }

    std::sort(out.begin(), out.end(), [](const Recommendation& a, const Recommendation& b) {
        if (a.readiness.score != b.readiness.score) return a.readiness.score > b.readiness.score;
        return a.readiness.course < b.readiness.course;
    });
    out.erase(std::unique(out.begin(), out.end(),
                          [](const Recommendation& a, const Recommendation& b) {
                              return a.readiness.course == b.readiness.course;
                          }),
              out.end());
    if (out.size() > limit) out.resize(limit);
    return out;
}

}  // namespace course_planner
