#include "greedy_solver.hpp"

#include "constraint_matcher.hpp"
#include "normalizer.hpp"

#include <algorithm>
#include <iostream>
#include <random>

namespace smart_timetable {

std::optional<Grid> GreedySolver::solve(const SolveContext& ctx, SolverResult& result) {
    if (ctx.verbose) std::cout << "Phase 2: Greedy placement..." << std::endl;

    Grid grid = make_empty_grid(ctx.periods, ctx.lunch_idx);
    place_constraints(ctx, grid, result);
    fill_remaining(ctx, grid);

    if (ctx.verbose) std::cout << "  ✓ Greedy grid complete" << std::endl;
    return grid;
}

void GreedySolver::place_constraints(const SolveContext& ctx, Grid& grid, SolverResult& result) const {
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

        auto& row = grid[window.day];
        auto first_free = std::find_if(window.periods.begin(), window.periods.end(),
                                       [&](int p) { return row[p].empty(); });

        const MatchResult match = match_constraint(constraint, ctx.courses);
        if (match.empty()) {
            // Unknown course: the literal text is the best label available.
            int target = first_free != window.periods.end() ? *first_free : window.periods.front();
            row[target] = constraint.course_name;
            result.add_warning("No course matches '" + constraint.course_name + "'; placed as literal label on " +
                               window.day);
            continue;
        }

        const Course* representative = find_course(ctx.courses, match.course_ids.front());
        const std::string label = representative ? course_label(*representative) : constraint.course_name;

        if (constraint.is_exact()) {
            for (int p : window.periods) {
                if (row[p].empty()) row[p] = label;
            }
        } else if (first_free != window.periods.end()) {
            row[*first_free] = label;
        } else {
            row[window.periods.front()] = label;
        }

        if (ctx.verbose) {
            std::cout << "  ✓ Placed " << label << " on " << window.day << " "
                      << constraint.period_range << std::endl;
        }
    }
}

void GreedySolver::fill_remaining(const SolveContext& ctx, Grid& grid) const {
    std::vector<std::string> labels;
    for (const auto& course : ctx.courses) {
        labels.push_back(course_label(course));
    }
    if (labels.empty()) labels.push_back("Free");

    std::mt19937 rng(ctx.seed);
    std::shuffle(labels.begin(), labels.end(), rng);

    size_t idx = 0;
    for (int p = 0; p < ctx.periods; ++p) {
        for (const auto& day : kWeekDays) {
            auto& cell = grid[day][p];
            if (ctx.lunch_idx && p == *ctx.lunch_idx) {
                cell = kLunchLabel;
                continue;
            }
            if (cell.empty()) {
                cell = labels[idx % labels.size()];
                idx++;
            }
        }
    }
}

}  // namespace smart_timetable
