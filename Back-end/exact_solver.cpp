#include "exact_solver.hpp"

#include "constraint_matcher.hpp"
#include "normalizer.hpp"

#include <iostream>
#include <map>
#include <string>
#include <vector>

#include "ortools/sat/cp_model.h"
#include "ortools/sat/cp_model.pb.h"
#include "ortools/sat/cp_model_solver.h"
#include "ortools/sat/model.h"
#include "ortools/sat/sat_parameters.pb.h"

namespace smart_timetable {

using operations_research::sat::BoolVar;
using operations_research::sat::CpModelBuilder;
using operations_research::sat::CpSolverResponse;
using operations_research::sat::CpSolverStatus;
using operations_research::sat::LinearExpr;
using operations_research::sat::Model;
using operations_research::sat::NewSatParameters;
using operations_research::sat::SatParameters;
using operations_research::sat::SolutionBooleanValue;
using operations_research::sat::SolveCpModel;

namespace {

constexpr int kDays = static_cast<int>(kWeekDays.size());

// x[course][day][period]
using VarCube = std::vector<std::vector<std::vector<BoolVar>>>;

void add_constraint_rules(const SolveContext& ctx, CpModelBuilder& builder, const VarCube& x,
                          const std::map<int, int>& index_of, SolverResult& result) {
    for (const auto& constraint : ctx.constraints) {
        if (constraint.course_name.empty()) continue;

        ConstraintWindow window;
        try {
            window = resolve_window(constraint, ctx.periods, ctx.lunch_idx);
        } catch (const MalformedConstraintError& e) {
            result.add_warning(std::string("Skipping constraint: ") + e.what());
            continue;
        }
        if (window.periods.empty()) continue;

        const MatchResult match = match_constraint(constraint, ctx.courses);
        if (match.empty()) {
            result.add_warning("No course matches '" + constraint.course_name + "'; constraint not enforced");
            continue;
        }

        std::vector<BoolVar> window_vars;
        for (int cid : match.course_ids) {
            const int c = index_of.at(cid);
            for (int p : window.periods) {
                window_vars.push_back(x[c][window.day_index][p]);
            }
        }

        const int required = static_cast<int>(window.periods.size());
        if (constraint.is_exact() && match.course_ids.size() == 1) {
            builder.AddEquality(LinearExpr::Sum(window_vars), required);
        } else if (constraint.is_exact()) {
            // Several candidates: only the aggregate count is enforced.
            builder.AddGreaterOrEqual(LinearExpr::Sum(window_vars), required);
        } else {
            builder.AddGreaterOrEqual(LinearExpr::Sum(window_vars), 1);
        }
    }
}

}  // namespace

std::optional<Grid> ExactSolver::solve(const SolveContext& ctx, SolverResult& result) {
    if (ctx.verbose) std::cout << "Phase 1: Exact model (CP-SAT)..." << std::endl;

    const int num_courses = static_cast<int>(ctx.courses.size());
    if (num_courses == 0 || ctx.periods <= 0) {
        result.fallback_reason = "invalid_model";
        return std::nullopt;
    }

    CpModelBuilder builder;
    VarCube x(num_courses, std::vector<std::vector<BoolVar>>(kDays, std::vector<BoolVar>(ctx.periods)));
    std::vector<BoolVar> all_vars;
    std::map<int, int> index_of;

    for (int c = 0; c < num_courses; ++c) {
        index_of[ctx.courses[c].id] = c;
        for (int d = 0; d < kDays; ++d) {
            for (int p = 0; p < ctx.periods; ++p) {
                x[c][d][p] = builder.NewBoolVar().WithName(
                    "x_c" + std::to_string(ctx.courses[c].id) + "_d" + std::to_string(d) + "_p" + std::to_string(p));
                all_vars.push_back(x[c][d][p]);
            }
        }
    }

    std::map<int, std::vector<int>> by_teacher;
    std::map<std::string, std::vector<int>> by_section;

    for (int c = 0; c < num_courses; ++c) {
        const Course& course = ctx.courses[c];

        std::vector<BoolVar> week;
        for (int d = 0; d < kDays; ++d) {
            builder.AddLessOrEqual(LinearExpr::Sum(x[c][d]), 1);
            week.insert(week.end(), x[c][d].begin(), x[c][d].end());
        }
        builder.AddGreaterOrEqual(LinearExpr::Sum(week), 1);

        if (course.teacher_id) by_teacher[*course.teacher_id].push_back(c);
        by_section[course.section.empty() ? kAllSections : course.section].push_back(c);

        if (ctx.lunch_idx) {
            for (int d = 0; d < kDays; ++d) {
                builder.AddEquality(x[c][d][*ctx.lunch_idx], 0);
            }
        }
    }

    auto add_group_conflicts = [&](const std::vector<int>& members) {
        if (members.size() < 2) return;
        for (int d = 0; d < kDays; ++d) {
            for (int p = 0; p < ctx.periods; ++p) {
                std::vector<BoolVar> cell;
                for (int c : members) cell.push_back(x[c][d][p]);
                builder.AddLessOrEqual(LinearExpr::Sum(cell), 1);
            }
        }
    };
    for (const auto& entry : by_teacher) add_group_conflicts(entry.second);
    for (const auto& entry : by_section) add_group_conflicts(entry.second);

    add_constraint_rules(ctx, builder, x, index_of, result);

    builder.Maximize(LinearExpr::Sum(all_vars));

    SatParameters parameters;
    parameters.set_max_time_in_seconds(ctx.time_limit);
    parameters.set_num_workers(1);
    parameters.set_random_seed(static_cast<int>(ctx.seed));

    Model model;
    model.Add(NewSatParameters(parameters));
    const CpSolverResponse response = SolveCpModel(builder.Build(), &model);

    switch (response.status()) {
        case CpSolverStatus::OPTIMAL:
        case CpSolverStatus::FEASIBLE:
            break;
        case CpSolverStatus::INFEASIBLE:
            result.fallback_reason = "infeasible";
            if (ctx.verbose) std::cout << "  ⚠ Exact model infeasible" << std::endl;
            return std::nullopt;
        case CpSolverStatus::MODEL_INVALID:
            result.fallback_reason = "invalid_model";
            result.add_warning("Exact model rejected as invalid");
            return std::nullopt;
        default:
            result.fallback_reason = "timeout";
            if (ctx.verbose) std::cout << "  ⚠ Exact solver hit its time budget" << std::endl;
            return std::nullopt;
    }

    Grid grid = make_empty_grid(ctx.periods, ctx.lunch_idx);
    for (int d = 0; d < kDays; ++d) {
        auto& row = grid[kWeekDays[d]];
        for (int p = 0; p < ctx.periods; ++p) {
            if (ctx.lunch_idx && p == *ctx.lunch_idx) continue;
            for (int c = 0; c < num_courses; ++c) {
                if (SolutionBooleanValue(response, x[c][d][p])) {
                    row[p] = course_label(ctx.courses[c]);
                    break;
                }
            }
        }
    }

    if (ctx.verbose) {
        std::cout << "  ✓ Exact solution found (objective " << response.objective_value() << ")" << std::endl;
    }
    return grid;
}

}  // namespace smart_timetable
