/**
 * @file planning_session.cpp
 * @brief PlanningSession implementation.
 */

#include "engine/planning_session.hpp"
#include "telemetry/json_sink.hpp"

namespace course_planner {

namespace {

std::string join_codes(const std::vector<CourseCode>& codes) {
    std::string out;
    for (size_t i = 0; i < codes.size(); ++i) {
        if (i > 0) out += ",";
        out += codes[i];
    }
    return out;
}

std::unique_ptr<ILogSink> sink_or_null(std::unique_ptr<ILogSink> sink) {
    if (!sink) return std::make_unique<NullSink>();
    return sink;
}

}  // anonymous namespace

PlanningSession::PlanningSession(Options opts)
    : config_(std::move(opts.config))
    , logger_(sink_or_null(std::move(opts.log_sink)), opts.log_level)
    , pool_(config_.executor.thread_count) {
}

// ─────────────────────────────────────────────
// Boundary helpers
// ─────────────────────────────────────────────

template <typename T>
Result<T> PlanningSession::checked(std::string_view operation, Result<T> result) {
    if (!result) {
        const auto& err = result.error();
        if (err.is(ErrorCode::CycleDetected)) {
            logger_.warn("Cycle blocks request", {
                {"operation", std::string{operation}},
                {"cycle", format_cycle(err.courses)}
            });
        } else {
            logger_.warn("Request rejected", {
                {"operation", std::string{operation}},
                {"code", std::string{to_string(err.code)}},
                {"error", err.message}
            });
        }
    }
    return result;
}

Result<std::shared_ptr<const PlanningSnapshot>> PlanningSession::require_snapshot(
    std::string_view operation) {
    auto snap = cache_.current();
    if (!snap) {
        return checked<std::shared_ptr<const PlanningSnapshot>>(
            operation, Error{ErrorCode::NotFound, "No catalog snapshot loaded"});
    }
    return snap;
}

Result<PlanningSession::StudentContext> PlanningSession::student_context(
    std::string_view operation, const StudentId& id, bool need_program) {
    auto snap = require_snapshot(operation);
    if (!snap) return snap.error();

    auto student = (*snap)->student(id);
    if (!student) return checked<StudentContext>(operation, student.error());

    StudentContext ctx{.snapshot = *snap, .student = std::move(*student), .program = std::nullopt};
    if (need_program) {
        auto program = ctx.snapshot->program_for(ctx.student);
        if (!program) return checked<StudentContext>(operation, program.error());
        ctx.program = std::move(*program);
    }
    return ctx;
}

ScheduleRequest PlanningSession::schedule_request(const StudentContext& ctx,
                                                 std::optional<SemesterId> after) const {
    return ScheduleRequest{
        .student = ctx.student,
        .required = ctx.program->required,
        .semesters = ctx.snapshot->semesters_after(after),
        .constraints = ScheduleConstraints::from_config(config_.schedule)
    };
}

uint64_t PlanningSession::publish(PlanningSnapshot snapshot, std::string_view source) {
    auto shared = std::make_shared<const PlanningSnapshot>(std::move(snapshot));
    const auto& graph = shared->graph;

    auto cycles = CycleDetector(graph).find_cycles();
    for (const auto& cycle : cycles) {
        logger_.warn("Prerequisite cycle in catalog", {{"cycle", format_cycle(cycle)}});
    }

    auto generation = cache_.replace(shared);
    logger_.info("Snapshot published", {
        {"source", std::string{source}},
        {"generation", std::to_string(generation)},
        {"courses", std::to_string(graph.course_count())},
        {"edges", std::to_string(graph.edge_count())},
        {"semesters", std::to_string(shared->semesters.size())},
        {"students", std::to_string(shared->students.size())},
        {"programs", std::to_string(shared->programs.size())},
        {"cycles", std::to_string(cycles.size())}
    });
    return generation;
}

// ─────────────────────────────────────────────
// Snapshot
// ─────────────────────────────────────────────

Result<uint64_t> PlanningSession::load(const std::filesystem::path& catalog_path) {
    auto snapshot = load_snapshot(catalog_path);
    if (!snapshot) return checked<uint64_t>("load", snapshot.error());
    return publish(std::move(*snapshot), catalog_path.string());
}

Result<uint64_t> PlanningSession::install(const CatalogDocument& document) {
    auto snapshot = build_snapshot(document);
    if (!snapshot) return checked<uint64_t>("install", snapshot.error());
    return publish(std::move(*snapshot), "memory");
}

// ─────────────────────────────────────────────
// Graph queries
// ─────────────────────────────────────────────

Result<std::vector<Cycle>> PlanningSession::cycles(bool enumerate_all) {
    auto snap = require_snapshot("cycles");
    if (!snap) return snap.error();

    CycleDetector detector((*snap)->graph);
    return checked<std::vector<Cycle>>(
        "cycles", enumerate_all ? detector.enumerate_cycles() : detector.find_cycles());
}

Result<std::vector<CourseCode>> PlanningSession::prerequisites(const CourseCode& code) {
    auto snap = require_snapshot("prerequisites");
    if (!snap) return snap.error();
    return checked("prerequisites", (*snap)->graph.prerequisites(code));
}

Result<std::vector<CourseCode>> PlanningSession::dependents(const CourseCode& code) {
    auto snap = require_snapshot("dependents");
    if (!snap) return snap.error();
    return checked("dependents", (*snap)->graph.dependents(code));
}

Result<Closure> PlanningSession::transitive_prerequisites(const CourseCode& code,
                                                          std::optional<uint32_t> max_depth) {
    auto snap = require_snapshot("transitive_prerequisites");
    if (!snap) return snap.error();

    if (!max_depth && config_.analysis.max_traversal_depth > 0) {
        max_depth = config_.analysis.max_traversal_depth;
    }
    ReachabilityIndex reach((*snap)->graph);
    return checked("transitive_prerequisites", reach.transitive_prerequisites(code, max_depth));
}

Result<Closure> PlanningSession::transitive_dependents(const CourseCode& code,
                                                       std::optional<uint32_t> max_depth) {
    auto snap = require_snapshot("transitive_dependents");
    if (!snap) return snap.error();

    if (!max_depth && config_.analysis.max_traversal_depth > 0) {
        max_depth = config_.analysis.max_traversal_depth;
    }
    ReachabilityIndex reach((*snap)->graph);
    return checked("transitive_dependents", reach.transitive_dependents(code, max_depth));
}

Result<std::vector<DepthLayer>> PlanningSession::deep_chains(const CourseCode& code,
                                                             std::optional<uint32_t> min_depth) {
    auto snap = require_snapshot("deep_chains");
    if (!snap) return snap.error();

    ReachabilityIndex reach((*snap)->graph);
    return checked("deep_chains", reach.prerequisites_by_depth(
                                      code, min_depth.value_or(config_.analysis.deep_chain_min_depth)));
}

Result<uint32_t> PlanningSession::prerequisite_depth(const CourseCode& code) {
    auto snap = require_snapshot("prerequisite_depth");
    if (!snap) return snap.error();

    ReachabilityIndex reach((*snap)->graph);
    return checked("prerequisite_depth", reach.prerequisite_depth(code));
}

// ─────────────────────────────────────────────
// Student analyses
// ─────────────────────────────────────────────

Result<ReadinessReport> PlanningSession::readiness(const StudentId& student,
                                                   const CourseCode& course) {
    auto ctx = student_context("readiness", student, false);
    if (!ctx) return ctx.error();

    ReadinessScorer scorer(ctx->snapshot->graph, config_.readiness.almost_ready_threshold);
    return checked("readiness", scorer.score(ctx->student, course));
}

Result<EligibilityReport> PlanningSession::eligibility(const StudentId& student,
                                                       const CourseCode& course) {
    auto ctx = student_context("eligibility", student, false);
    if (!ctx) return ctx.error();

    ReachabilityIndex reach(ctx->snapshot->graph);
    ReadinessScorer scorer(ctx->snapshot->graph, config_.readiness.almost_ready_threshold);
    return checked("eligibility", scorer.check_eligibility(ctx->student, course, reach));
}

Result<EligibilityReport> PlanningSession::validate_completed(
    const CourseCode& course, const std::vector<CourseCode>& completed) {
    auto snap = require_snapshot("validate_completed");
    if (!snap) return snap.error();

    ReachabilityIndex reach((*snap)->graph);
    ReadinessScorer scorer((*snap)->graph, config_.readiness.almost_ready_threshold);
    return checked("validate_completed", scorer.validate_completed(course, completed, reach));
}

Result<std::vector<Recommendation>> PlanningSession::recommend(const StudentId& student,
                                                               std::string_view semester) {
    auto ctx = student_context("recommend", student, false);
    if (!ctx) return ctx.error();

    auto offering = ctx->snapshot->semester(semester);
    if (!offering) return checked<std::vector<Recommendation>>("recommend", offering.error());

    const auto& rc = config_.readiness;
    ReachabilityIndex reach(ctx->snapshot->graph);
    ReadinessScorer scorer(ctx->snapshot->graph, rc.almost_ready_threshold);
    return checked("recommend", scorer.recommend(ctx->student, *offering, reach,
                                                 rc.recommendation_min_score,
                                                 rc.recommendation_limit, rc.unlock_horizon));
}

Result<RemainingBuckets> PlanningSession::buckets(const StudentId& student) {
    auto ctx = student_context("buckets", student, true);
    if (!ctx) return ctx.error();
    return checked("buckets", bucket_remaining(ctx->snapshot->graph, ctx->student, *ctx->program));
}

Result<std::vector<BottleneckEntry>> PlanningSession::bottlenecks() {
    auto snap = require_snapshot("bottlenecks");
    if (!snap) return snap.error();

    const auto& ac = config_.analysis;
    ReachabilityIndex reach((*snap)->graph);
    return checked<std::vector<BottleneckEntry>>(
        "bottlenecks", BottleneckAnalyzer(reach).rank(BottleneckCriteria{
                           .min_dependents = ac.bottleneck_min_dependents,
                           .min_prerequisites = ac.bottleneck_min_prerequisites,
                           .prerequisite_depth = ac.bottleneck_depth,
                           .limit = ac.bottleneck_limit
                       }));
}

Result<std::vector<CourseImpact>> PlanningSession::impact(std::string_view prefix) {
    auto snap = require_snapshot("impact");
    if (!snap) return snap.error();

    ReachabilityIndex reach((*snap)->graph);
    return checked("impact", BottleneckAnalyzer(reach).impact(prefix));
}

Result<std::vector<ProgressSummary>> PlanningSession::progress() {
    auto snap = require_snapshot("progress");
    if (!snap) return snap.error();

    std::vector<StudentState> students;
    students.reserve((*snap)->students.size());
    for (const auto& [_, s] : (*snap)->students) students.push_back(s);

    const Credits default_credits = config_.schedule.default_credits;
    auto shared = *snap;
    auto summaries = pool_.map_ordered(students, [shared, default_credits](const StudentState& s) {
        return summarize_progress(shared->graph, s, default_credits);
    });
    sort_by_progress(summaries);

    logger_.debug("Progress computed", {
        {"students", std::to_string(summaries.size())},
        {"workers", std::to_string(pool_.worker_count())},
        {"pool_completed", std::to_string(pool_.completed_count())}
    });
    return summaries;
}

// ─────────────────────────────────────────────
// Planning
// ─────────────────────────────────────────────

Result<DegreePlan> PlanningSession::degree_plan(const StudentId& student) {
    auto ctx = student_context("degree_plan", student, true);
    if (!ctx) return ctx.error();

    ReachabilityIndex reach(ctx->snapshot->graph);
    auto plan = checked("degree_plan", plan_degree(reach, ctx->student, ctx->program->required));
    if (plan) {
        logger_.info("Degree plan built", {
            {"student", student},
            {"remaining", std::to_string(plan->remaining.size())},
            {"semesters", std::to_string(plan->layers.size())}
        });
    }
    return plan;
}

Result<SchedulePlan> PlanningSession::schedule(const StudentId& student,
                                               std::optional<SemesterId> after) {
    auto ctx = student_context("schedule", student, true);
    if (!ctx) return ctx.error();

    auto policy = make_priority_policy(config_.schedule.priority);
    if (!policy) return checked<SchedulePlan>("schedule", policy.error());
    auto request = schedule_request(*ctx, after);

    ReachabilityIndex reach(ctx->snapshot->graph);
    ScheduleOptimizer optimizer(reach, *policy);
    auto plan = checked("schedule", optimizer.optimize(request));
    if (plan) {
        logger_.info("Schedule optimized", {
            {"student", student},
            {"policy", plan->policy},
            {"semesters", std::to_string(plan->semesters.size())},
            {"scheduled", std::to_string(plan->scheduled_count())},
            {"unscheduled", join_codes(plan->unscheduled)},
            {"unreachable", join_codes(plan->unreachable)}
        });
        for (const auto& warning : plan->warnings) {
            logger_.warn("Schedule warning", {{"student", student}, {"warning", warning}});
        }
    }
    return plan;
}

Result<std::vector<GraduationPath>> PlanningSession::paths(const StudentId& student,
                                                           std::optional<SemesterId> after) {
    auto ctx = student_context("paths", student, true);
    if (!ctx) return ctx.error();

    auto request = schedule_request(*ctx, after);

    ReachabilityIndex reach(ctx->snapshot->graph);
    GraduationPathExplorer explorer(reach);
    auto found = checked("paths", explorer.explore(request, PathExplorerOptions{
        .max_paths = config_.paths.max_paths,
        .exhaustive_limit = config_.paths.exhaustive_limit
    }));
    if (found) {
        logger_.info("Graduation paths explored", {
            {"student", student},
            {"paths", std::to_string(found->size())}
        });
    }
    return found;
}

}  // namespace course_planner
