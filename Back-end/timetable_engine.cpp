#include "timetable_engine.hpp"

#include "constraint_matcher.hpp"
#include "exact_solver.hpp"
#include "greedy_solver.hpp"
#include "grid_utils.hpp"
#include "local_improver.hpp"
#include "normalizer.hpp"
#include "validator.hpp"

#include <iostream>
#include <unordered_set>

namespace smart_timetable {

TimetableEngine::TimetableEngine(EngineOptions options)
    : options_(options),
      exact_(options.exact_solver ? std::make_unique<ExactSolver>() : nullptr),
      fallback_(std::make_unique<GreedySolver>()) {}

TimetableEngine::TimetableEngine(EngineOptions options, std::unique_ptr<ScheduleSolver> exact,
                                 std::unique_ptr<ScheduleSolver> fallback)
    : options_(options), exact_(std::move(exact)), fallback_(std::move(fallback)) {
    if (!fallback_) fallback_ = std::make_unique<GreedySolver>();
}

// ==================== REQUEST PREPARATION ====================
SolveContext TimetableEngine::prepare(const SolveRequest& request, SolverResult& result) const {
    if (request.courses.empty()) {
        throw InvalidRequestError("no courses supplied");
    }
    if (request.periods <= 0) {
        throw InvalidRequestError("periods must be positive, got " + std::to_string(request.periods));
    }
    if (request.time_limit < 0) {
        throw InvalidRequestError("time_limit must not be negative");
    }

    SolveContext ctx;
    ctx.periods = request.periods;
    ctx.lunch_idx = lunch_index(request.lunch, request.periods);
    ctx.time_limit = request.time_limit;
    ctx.seed = request.seed.value_or(options_.default_seed);
    ctx.verbose = options_.verbose;

    if (request.lunch != 0 && !ctx.lunch_idx) {
        result.add_warning("Lunch period " + std::to_string(request.lunch) + " is outside the grid; ignored");
    }

    std::unordered_set<int> seen_ids;
    for (const auto& course : request.courses) {
        if (!seen_ids.insert(course.id).second) {
            result.add_warning("Duplicate course id " + std::to_string(course.id) + " ignored");
            continue;
        }
        ctx.courses.push_back(normalize_course(course));
    }

    // Matching keeps the text as written; only grid checks see the display label.
    LabelMap labels = build_label_map(ctx.courses);
    for (const auto& raw : request.constraints) {
        const Constraint constraint = normalize_constraint(raw);
        ctx.constraints.push_back(constraint);

        Constraint check = constraint;
        auto it = labels.find(normalize_text(constraint.course_name));
        if (it != labels.end()) check.course_name = it->second;
        ctx.check_constraints.push_back(check);
    }

    if (options_.synthesize_unmatched) {
        add_synthetic_courses(ctx, labels, result);
    }
    return ctx;
}

void TimetableEngine::add_synthetic_courses(SolveContext& ctx, LabelMap& labels, SolverResult& result) const {
    int next_id = -1;
    for (const auto& course : ctx.courses) {
        if (course.id <= next_id) next_id = course.id - 1;
    }

    for (const auto& constraint : ctx.constraints) {
        if (constraint.course_name.empty()) continue;
        const std::string key = normalize_text(constraint.course_name);
        if (labels.count(key)) continue;
        if (!match_constraint(constraint, ctx.courses).empty()) continue;

        Course synthetic;
        synthetic.id = next_id--;
        synthetic.course_name = constraint.course_name;
        synthetic.course_code = constraint.course_name;
        synthetic.section = constraint.section;
        synthetic.synthetic = true;
        synthetic.credits = 1;
        if (constraint.is_exact()) {
            try {
                const PeriodRange range = parse_period_range(constraint.period_range);
                synthetic.credits = range.last - range.first + 1;
            } catch (const MalformedConstraintError&) {
                // The solvers report the malformed range; one credit is enough here.
            }
        }

        result.add_warning("No course matches '" + constraint.course_name + "'; added placeholder course " +
                           std::to_string(synthetic.id));
        labels[key] = synthetic.course_name;
        ctx.courses.push_back(synthetic);
        result.synthetic_courses++;
    }
}

// ==================== GENERATION ====================
EngineResult TimetableEngine::generate(const SolveRequest& request) const {
    EngineResult out;
    SolverResult& diag = out.diagnostics;
    const SolveContext ctx = prepare(request, diag);

    if (options_.verbose) {
        std::cout << "Starting timetable generation (" << ctx.courses.size() << " courses, "
                  << ctx.constraints.size() << " constraints, " << ctx.periods << " periods)" << std::endl;
    }

    std::optional<Grid> grid;
    if (exact_) {
        try {
            grid = exact_->solve(ctx, diag);
        } catch (const std::exception& e) {
            diag.fallback_reason = "error";
            diag.add_warning(exact_->name() + " solver failed: " + e.what());
        }
        if (grid && !grid_has_shape(*grid, ctx.periods)) {
            diag.fallback_reason = "error";
            diag.add_warning(exact_->name() + " solver returned a malformed grid; discarded");
            grid.reset();
        }
        if (grid) diag.path = SolvePath::Exact;
    } else {
        diag.fallback_reason = "unavailable";
    }

    if (!grid) {
        diag.path = SolvePath::Fallback;
        try {
            grid = fallback_->solve(ctx, diag);
        } catch (const std::exception& e) {
            diag.add_error(fallback_->name() + " solver failed: " + e.what());
        }
        if (grid && !grid_has_shape(*grid, ctx.periods)) {
            diag.add_error(fallback_->name() + " solver returned a malformed grid; discarded");
            grid.reset();
        }
    }

    if (!grid) {
        std::vector<std::string> labels;
        for (const auto& course : ctx.courses) labels.push_back(course_label(course));
        grid = build_placeholder_grid(labels, ctx.periods, request.lunch);
        diag.add_warning("No solver produced a grid; returning placeholder timetable");
    }

    if (ctx.lunch_idx) {
        for (auto& entry : *grid) entry.second[*ctx.lunch_idx] = kLunchLabel;
    }

    if (options_.verbose) std::cout << "Phase 3: Validating..." << std::endl;
    ValidationReport report = validate_grid(*grid, ctx.check_constraints, ctx.lunch_idx);
    diag.diversity_before = diversity_score(*grid);
    diag.diversity_after = diag.diversity_before;

    if (report.ok && options_.local_improvement) {
        if (options_.verbose) std::cout << "Phase 4: Improving variety..." << std::endl;
        LocalImprover improver(options_.improvement_iterations, options_.high_water_fraction, ctx.seed,
                               diag.path == SolvePath::Exact);
        ImprovementStats stats;
        Grid improved = improver.improve(*grid, ctx.check_constraints, ctx.lunch_idx, &stats);

        diag.improvement_iterations = stats.iterations;
        diag.accepted_swaps = stats.accepted_swaps;
        if (stats.score_after > stats.score_before) {
            grid = std::move(improved);
            diag.diversity_after = stats.score_after;
            report = validate_grid(*grid, ctx.check_constraints, ctx.lunch_idx);
        }
        if (options_.verbose) {
            std::cout << "  Made " << stats.accepted_swaps << " improvements (diversity "
                      << stats.score_before << " -> " << diag.diversity_after << ")" << std::endl;
        }
    }

    diag.valid = report.ok;
    diag.violations = report.violations;
    diag.success = true;
    diag.message = report.ok ? "Timetable generated successfully"
                             : "Timetable generated with unmet constraints";

    if (options_.verbose) {
        std::cout << (report.ok ? "✓ " : "⚠ ") << diag.message << " via " << to_string(diag.path)
                  << " path" << std::endl;
    }

    out.grid = std::move(*grid);
    return out;
}

}  // namespace smart_timetable
