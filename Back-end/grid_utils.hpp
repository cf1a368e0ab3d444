#pragma once

#include "models.hpp"

#include <optional>
#include <string>
#include <vector>

namespace smart_timetable {

// ==================== GRID HELPERS ====================
/// Five weekdays of `periods` empty cells, with the lunch column already blocked.
Grid make_empty_grid(int periods, std::optional<int> lunch_idx);

/**
 * @brief Week filled round-robin with labels around the lunch column.
 *
 * Shown while a solve is running and used as the last-resort answer when
 * both solvers fail unexpectedly. An empty label list falls back to "Free".
 */
Grid build_placeholder_grid(const std::vector<std::string>& labels, int periods, int lunch);

/// Canonicalizes any spelling of "lunch" to "LUNCH"; other cells are kept as-is.
Grid normalize_grid_labels(const Grid& grid);

/// Number of columns of the first day, 0 for an empty grid.
int grid_periods(const Grid& grid);

/// True when every weekday is present with exactly `periods` cells.
bool grid_has_shape(const Grid& grid, int periods);

}  // namespace smart_timetable
