#pragma once

#include "models.hpp"
#include "normalizer.hpp"
#include "schedule_solver.hpp"
#include "solver_result.hpp"

#include <memory>

namespace smart_timetable {

/**
 * @brief Capability descriptor fixed when the engine is built.
 */
struct EngineOptions {
    bool exact_solver{true};         ///< Try CP-SAT before the greedy fallback.
    bool local_improvement{true};    ///< Run swap hill-climbing on valid grids.
    int improvement_iterations{600};
    double high_water_fraction{0.7};
    bool synthesize_unmatched{true}; ///< Placeholder courses for unmatched constraints.
    unsigned int default_seed{1};    ///< Used when a request carries no seed.
    bool verbose{false};             ///< Phase progress on stdout.
};

struct EngineResult {
    Grid grid;
    SolverResult diagnostics;
};

/**
 * @brief Orchestrates one solve: exact solver, fallback, validation, improvement.
 *
 * Stateless between calls; concurrent generate() calls on one engine are safe.
 * Only a request that cannot be solved at all (no courses, no periods) throws
 * InvalidRequestError. Everything else is absorbed and reported in the
 * returned diagnostics, and a full grid is always produced.
 */
class TimetableEngine {
public:
    explicit TimetableEngine(EngineOptions options = EngineOptions());

    /// Explicit strategies; a null exact solver means the capability is absent.
    TimetableEngine(EngineOptions options, std::unique_ptr<ScheduleSolver> exact,
                    std::unique_ptr<ScheduleSolver> fallback);

    EngineResult generate(const SolveRequest& request) const;

    /// Normalized snapshot a solver would receive, synthetic courses included.
    SolveContext prepare(const SolveRequest& request, SolverResult& result) const;

    const EngineOptions& options() const { return options_; }
    bool has_exact_solver() const { return exact_ != nullptr; }

private:
    void add_synthetic_courses(SolveContext& ctx, LabelMap& labels, SolverResult& result) const;

    EngineOptions options_;
    std::unique_ptr<ScheduleSolver> exact_;
    std::unique_ptr<ScheduleSolver> fallback_;
};

}  // namespace smart_timetable
