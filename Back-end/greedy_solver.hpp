#pragma once

#include "schedule_solver.hpp"

namespace smart_timetable {

/**
 * @brief Deterministic constructive fallback solver.
 *
 * Phase 1 places every constraint in input order (Exact fills its whole
 * window, Hard takes the first free cell or overwrites the first allowed
 * one). Phase 2 fills the remaining non-lunch cells round-robin from a
 * seeded shuffle of all course labels, scanning period by period.
 *
 * Always returns a fully populated grid. Phase 2 does not check teacher or
 * section conflicts and may repeat a course within a day.
 */
class GreedySolver : public ScheduleSolver {
public:
    std::string name() const override { return "greedy"; }

    std::optional<Grid> solve(const SolveContext& ctx, SolverResult& result) override;

private:
    void place_constraints(const SolveContext& ctx, Grid& grid, SolverResult& result) const;
    void fill_remaining(const SolveContext& ctx, Grid& grid) const;
};

}  // namespace smart_timetable
