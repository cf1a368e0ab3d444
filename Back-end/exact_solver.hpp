#pragma once

#include "schedule_solver.hpp"

namespace smart_timetable {

/**
 * @brief Exact model-based solver on top of OR-Tools CP-SAT.
 *
 * One boolean per (course, day, period). Always-on rules: every course at
 * least once in the week, at most once per day, at most one course per
 * teacher and per section in any cell, nothing in the lunch column. Each
 * well-formed constraint adds a Hard (at least one) or Exact (fill the
 * window) rule over its matched courses. The objective maximizes the number
 * of occupied cells.
 *
 * Runs single-threaded with a fixed seed and the request's time budget.
 * Returns std::nullopt on infeasibility or when the budget runs out, with
 * the reason stored in SolverResult::fallback_reason.
 */
class ExactSolver : public ScheduleSolver {
public:
    std::string name() const override { return "cp-sat"; }

    std::optional<Grid> solve(const SolveContext& ctx, SolverResult& result) override;
};

}  // namespace smart_timetable
