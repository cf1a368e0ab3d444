#pragma once

#include "grid_utils.hpp"
#include "models.hpp"
#include "solver_result.hpp"

#include <optional>
#include <string>
#include <vector>

namespace smart_timetable {

/**
 * @brief Immutable snapshot handed to a solver for one request.
 *
 * Courses already include any synthetic placeholders, constraints are
 * whitespace-normalized and the lunch column is resolved to a 0-based index.
 */
struct SolveContext {
    std::vector<Course> courses;
    std::vector<Constraint> constraints;
    // Same constraints with the course text replaced by the display label of
    // the course it names, for checking grids whose cells carry labels.
    std::vector<Constraint> check_constraints;
    int periods{6};
    std::optional<int> lunch_idx;
    double time_limit{10.0};
    unsigned int seed{1};
    bool verbose{false};
};

/**
 * @brief Common interface for timetable solvers.
 *
 * An implementation either returns a complete grid or std::nullopt when it
 * cannot produce one under its own limits; recoverable issues go to result.
 */
class ScheduleSolver {
public:
    virtual ~ScheduleSolver() = default;

    virtual std::string name() const = 0;

    virtual std::optional<Grid> solve(const SolveContext& ctx, SolverResult& result) = 0;
};

}  // namespace smart_timetable
