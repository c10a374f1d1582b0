/**
 * @file main.cpp
 * @brief course_planner command-line entry point.
 *
 * Wires the modules into one request per invocation:
 *   Config → Logger → PlanningSession (snapshot load) → subcommand → stdout
 */

#include "core/config.hpp"
#include "core/logger.hpp"
#include "core/types.hpp"
#include "engine/planning_session.hpp"
#include "telemetry/json_sink.hpp"

#include <charconv>
#include <filesystem>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

using namespace course_planner;

namespace {

constexpr int kExitOk = 0;
constexpr int kExitFailure = 1;
constexpr int kExitUsage = 2;

struct CLIArgs {
    std::filesystem::path config_path = "config/default.toml";
    std::filesystem::path catalog_path = "data/sample_catalog.toml";
    std::string log_dir;
    bool log_stdout = false;
    bool transitive = false;
    bool all = false;
    std::optional<uint32_t> depth;
    std::optional<std::string> after;
    std::vector<std::string> completed;
    std::string command;
    std::vector<std::string> positional;
};

void print_usage() {
    std::cout
        << "Usage: course_planner [OPTIONS] <command> [ARGS]\n"
        << "\n"
        << "Commands:\n"
        << "  cycles [--all]                     Prerequisite cycles in the catalog\n"
        << "  prereqs <course> [--transitive]    Prerequisites (direct or transitive)\n"
        << "  dependents <course> [--transitive] Courses requiring a course\n"
        << "  chains <course> [--depth N]        Prerequisites N or more hops deep\n"
        << "  readiness <student> <course>       Direct-prerequisite readiness score\n"
        << "  eligibility <student> <course>     Transitive eligibility check\n"
        << "  eligibility --completed A,B <course>\n"
        << "  recommend <student> <semester>     Courses worth taking in a semester\n"
        << "  buckets <student>                  Remaining courses by readiness\n"
        << "  bottlenecks                        Courses that gate many others\n"
        << "  impact [prefix]                    Difficulty and impact per course\n"
        << "  progress                           Progress of every student\n"
        << "  degree-plan <student>              Unconstrained semester layering\n"
        << "  schedule <student> [--after T]     Optimized semester schedule\n"
        << "  paths <student> [--after T]        Alternative graduation orderings\n"
        << "\n"
        << "Options:\n"
        << "  --config <path>    Configuration file (default: config/default.toml)\n"
        << "  --catalog <path>   Catalog file (default: data/sample_catalog.toml)\n"
        << "  --log-dir <path>   Log output directory\n"
        << "  --log-stdout       Write log lines to stdout instead of a file\n"
        << "  --depth <n>        Depth bound for traversals and chains\n"
        << "  --after <YYYY-Tn>  Only plan semesters after this one\n"
        << "  --help, -h         Show this help message\n";
}

std::vector<std::string> split_codes(const std::string& text) {
    std::vector<std::string> out;
    size_t start = 0;
    while (start <= text.size()) {
        auto comma = text.find(',', start);
        if (comma == std::string::npos) comma = text.size();
        if (comma > start) out.push_back(text.substr(start, comma - start));
        start = comma + 1;
    }
    return out;
}

std::optional<uint32_t> parse_u32(const std::string& text) {
    uint32_t value = 0;
    auto [end, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc{} || end != text.data() + text.size()) return std::nullopt;
    return value;
}

Result<CLIArgs> parse_args(int argc, char* argv[]) {
    CLIArgs args;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        auto next = [&]() -> std::optional<std::string> {
            if (i + 1 >= argc) return std::nullopt;
            return std::string{argv[++i]};
        };

        if (arg == "--help" || arg == "-h") {
            args.command = "help";
            return args;
        }
        if (arg == "--transitive") {
            args.transitive = true;
        } else if (arg == "--all") {
            args.all = true;
        } else if (arg == "--log-stdout") {
            args.log_stdout = true;
        } else if (arg.starts_with("--")) {
            auto value = next();
            if (!value) return Error{ErrorCode::InvalidArgument, "Missing value for " + arg};
            if (arg == "--config") {
                args.config_path = *value;
            } else if (arg == "--catalog") {
                args.catalog_path = *value;
            } else if (arg == "--log-dir") {
                args.log_dir = *value;
            } else if (arg == "--depth") {
                args.depth = parse_u32(*value);
                if (!args.depth) return Error{ErrorCode::InvalidArgument, "Invalid depth: " + *value};
            } else if (arg == "--after") {
                args.after = *value;
            } else if (arg == "--completed") {
                args.completed = split_codes(*value);
            } else {
                return Error{ErrorCode::InvalidArgument, "Unknown option: " + arg};
            }
        } else if (args.command.empty()) {
            args.command = arg;
        } else {
            args.positional.push_back(arg);
        }
    }
    if (args.command.empty()) return Error{ErrorCode::InvalidArgument, "No command given"};
    return args;
}

// ─────────────────────────────────────────────
// Output
// ─────────────────────────────────────────────

std::string join(const std::vector<std::string>& items, std::string_view sep = ", ") {
    std::string out;
    for (size_t i = 0; i < items.size(); ++i) {
        if (i > 0) out += sep;
        out += items[i];
    }
    return out;
}

std::string listing(const std::vector<std::string>& items) {
    return items.empty() ? "(none)" : join(items);
}

int report_error(const Error& err) {
    std::cerr << "error [" << to_string(err.code) << "]: " << err.message << '\n';
    if (err.is(ErrorCode::CycleDetected) && !err.courses.empty()) {
        std::cerr << "  cycle: " << format_cycle(err.courses) << '\n';
    }
    return kExitFailure;
}

void print_schedule(const SchedulePlan& plan) {
    std::cout << "Policy: " << plan.policy << '\n';
    for (const auto& semester : plan.semesters) {
        std::cout << "  " << semester.id.label();
        if (!semester.name.empty() && semester.name != semester.id.label()) {
            std::cout << " (" << semester.name << ")";
        }
        std::cout << " [" << semester.total_credits << " cr]: "
                  << listing(semester.codes()) << '\n';
    }
    std::cout << "Unscheduled: " << listing(plan.unscheduled) << '\n';
    std::cout << "Unreachable: " << listing(plan.unreachable) << '\n';
    for (const auto& warning : plan.warnings) {
        std::cout << "Warning: " << warning << '\n';
    }
}

// ─────────────────────────────────────────────
// Commands
// ─────────────────────────────────────────────

bool need_args(const CLIArgs& args, size_t count) {
    if (args.positional.size() >= count) return true;
    std::cerr << "error: '" << args.command << "' needs " << count << " argument(s)\n";
    return false;
}

std::optional<SemesterId> after_semester(const CLIArgs& args, bool& ok) {
    ok = true;
    if (!args.after) return std::nullopt;
    auto id = parse_semester_label(*args.after);
    if (!id) {
        std::cerr << "error: --after expects YYYY-Tn, got " << *args.after << '\n';
        ok = false;
    }
    return id;
}

int run_command(PlanningSession& session, const CLIArgs& args) {
    const auto& cmd = args.command;
    const auto& pos = args.positional;

    if (cmd == "cycles") {
        auto cycles = session.cycles(args.all);
        if (!cycles) return report_error(cycles.error());
        if (cycles->empty()) std::cout << "No prerequisite cycles.\n";
        for (const auto& cycle : *cycles) std::cout << format_cycle(cycle) << '\n';
        return kExitOk;
    }

    if (cmd == "prereqs" || cmd == "dependents") {
        if (!need_args(args, 1)) return kExitUsage;
        const bool prereqs = cmd == "prereqs";
        if (!args.transitive) {
            auto direct = prereqs ? session.prerequisites(pos[0]) : session.dependents(pos[0]);
            if (!direct) return report_error(direct.error());
            std::cout << listing(*direct) << '\n';
            return kExitOk;
        }
        auto closure = prereqs ? session.transitive_prerequisites(pos[0], args.depth)
                               : session.transitive_dependents(pos[0], args.depth);
        if (!closure) return report_error(closure.error());
        std::cout << listing(closure->courses) << '\n'
                  << "Chain depth: " << closure->chain_depth
                  << (closure->partial ? " (cut at depth bound)" : "") << '\n';
        if (prereqs) {
            auto depth = session.prerequisite_depth(pos[0]);
            if (depth) std::cout << "Prerequisite depth: " << *depth << '\n';
        }
        return kExitOk;
    }

    if (cmd == "chains") {
        if (!need_args(args, 1)) return kExitUsage;
        auto layers = session.deep_chains(pos[0], args.depth);
        if (!layers) return report_error(layers.error());
        if (layers->empty()) std::cout << "No prerequisite chains that deep.\n";
        for (const auto& layer : *layers) {
            std::cout << "  depth " << layer.depth << ": " << listing(layer.courses) << '\n';
        }
        return kExitOk;
    }

    if (cmd == "readiness") {
        if (!need_args(args, 2)) return kExitUsage;
        auto report = session.readiness(pos[0], pos[1]);
        if (!report) return report_error(report.error());
        std::cout << report->course << ": " << report->score << " (" << to_string(report->status)
                  << ")\n  required: " << listing(report->required)
                  << "\n  missing:  " << listing(report->missing) << '\n';
        return kExitOk;
    }

    if (cmd == "eligibility") {
        Result<EligibilityReport> report = Error{ErrorCode::InvalidArgument, "unset"};
        if (!args.completed.empty()) {
            if (!need_args(args, 1)) return kExitUsage;
            report = session.validate_completed(pos[0], args.completed);
        } else {
            if (!need_args(args, 2)) return kExitUsage;
            report = session.eligibility(pos[0], pos[1]);
        }
        if (!report) return report_error(report.error());
        std::cout << report->course << ": " << (report->can_take ? "eligible" : "not eligible")
                  << " (" << to_string(report->reason) << ")\n"
                  << "  required: " << listing(report->required) << '\n'
                  << "  missing:  " << listing(report->missing) << '\n';
        return kExitOk;
    }

    if (cmd == "recommend") {
        if (!need_args(args, 2)) return kExitUsage;
        auto recs = session.recommend(pos[0], pos[1]);
        if (!recs) return report_error(recs.error());
        if (recs->empty()) std::cout << "No recommendations.\n";
        for (const auto& rec : *recs) {
            std::cout << "  " << rec.readiness.course << "  score " << rec.readiness.score
                      << "  unlocks " << listing(rec.unlocks) << '\n';
        }
        return kExitOk;
    }

    if (cmd == "buckets") {
        if (!need_args(args, 1)) return kExitUsage;
        auto buckets = session.buckets(pos[0]);
        if (!buckets) return report_error(buckets.error());
        for (const auto& [bucket, entries] : *buckets) {
            std::cout << to_string(bucket) << ":\n";
            for (const auto& entry : entries) {
                std::cout << "  " << entry.course;
                if (!entry.missing.empty()) std::cout << "  missing " << join(entry.missing);
                std::cout << '\n';
            }
        }
        return kExitOk;
    }

    if (cmd == "bottlenecks") {
        auto entries = session.bottlenecks();
        if (!entries) return report_error(entries.error());
        if (entries->empty()) std::cout << "No bottleneck courses.\n";
        for (const auto& e : *entries) {
            std::cout << "  " << e.course << "  unlocks " << e.unlocks << "  prereqs "
                      << e.total_prerequisites << "  -> " << listing(e.unlocked_courses) << '\n';
        }
        return kExitOk;
    }

    if (cmd == "impact") {
        auto items = session.impact(pos.empty() ? std::string_view{} : std::string_view{pos[0]});
        if (!items) return report_error(items.error());
        for (const auto& i : *items) {
            std::cout << "  " << i.course << "  " << to_string(i.type)
                      << "  difficulty " << i.difficulty << "  impact " << i.impact
                      << "  chain " << join(i.critical_chain, " -> ") << '\n';
        }
        return kExitOk;
    }

    if (cmd == "progress") {
        auto summaries = session.progress();
        if (!summaries) return report_error(summaries.error());
        for (const auto& s : *summaries) {
            std::cout << "  " << s.student << "  " << s.progress_percent << "%  completed "
                      << s.completed << " (" << s.completed_credits << " cr)  available "
                      << s.available << "  blocked " << s.blocked << '\n';
        }
        return kExitOk;
    }

    if (cmd == "degree-plan") {
        if (!need_args(args, 1)) return kExitUsage;
        auto plan = session.degree_plan(pos[0]);
        if (!plan) return report_error(plan.error());
        if (plan->remaining.empty()) std::cout << "All program requirements completed.\n";
        for (size_t i = 0; i < plan->layers.size(); ++i) {
            std::cout << "  Semester " << (i + 1) << ": " << join(plan->layers[i]) << '\n';
        }
        return kExitOk;
    }

    if (cmd == "schedule" || cmd == "paths") {
        if (!need_args(args, 1)) return kExitUsage;
        bool ok = true;
        auto after = after_semester(args, ok);
        if (!ok) return kExitUsage;

        if (cmd == "schedule") {
            auto plan = session.schedule(pos[0], after);
            if (!plan) return report_error(plan.error());
            print_schedule(*plan);
            return kExitOk;
        }

        auto paths = session.paths(pos[0], after);
        if (!paths) return report_error(paths.error());
        if (paths->empty()) std::cout << "All program requirements completed.\n";
        for (size_t i = 0; i < paths->size(); ++i) {
            const auto& path = (*paths)[i];
            std::cout << "Path " << (i + 1) << " [" << path.strategy << "]: "
                      << join(path.ordering, " -> ") << '\n';
        }
        return kExitOk;
    }

    std::cerr << "error: unknown command '" << cmd << "'\n";
    return kExitUsage;
}

}  // namespace

int main(int argc, char* argv[]) {
    auto parsed = parse_args(argc, argv);
    if (!parsed) {
        std::cerr << "error: " << parsed.error().message << "\n\n";
        print_usage();
        return kExitUsage;
    }
    auto args = std::move(*parsed);
    if (args.command == "help") {
        print_usage();
        return kExitOk;
    }

    // Load configuration
    Config config = default_config();
    if (std::filesystem::exists(args.config_path)) {
        auto config_result = load_config(args.config_path);
        if (!config_result) return report_error(config_result.error());
        config = *config_result;
    }
    if (!args.log_dir.empty()) config.telemetry.log_dir = args.log_dir;

    // ── Initialize Logger ────────────────────
    std::unique_ptr<ILogSink> log_sink;
    if (args.log_stdout) {
        log_sink = std::make_unique<StdoutSink>();
    } else {
        log_sink = std::make_unique<JsonFileSink>(config.telemetry.log_dir, "course_planner",
                                                  config.telemetry.max_file_size_mb,
                                                  config.telemetry.rotate_count);
    }
    auto level = parse_log_level(config.telemetry.log_level).value_or(LogLevel::Info);

    PlanningSession session(PlanningSession::Options{
        .config = config,
        .log_sink = std::move(log_sink),
        .log_level = level
    });
    session.logger().debug("Command", {{"command", args.command},
                                       {"catalog", args.catalog_path.string()}});

    auto loaded = session.load(args.catalog_path);
    if (!loaded) return report_error(loaded.error());

    int code = run_command(session, args);
    session.logger().flush();
    return code;
}
