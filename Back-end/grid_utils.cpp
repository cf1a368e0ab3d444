#include "grid_utils.hpp"

#include "normalizer.hpp"

namespace smart_timetable {

Grid make_empty_grid(int periods, std::optional<int> lunch_idx) {
    Grid grid;
    for (const auto& day : kWeekDays) {
        std::vector<std::string> row(periods > 0 ? periods : 0);
        if (lunch_idx && *lunch_idx >= 0 && *lunch_idx < periods) {
            row[*lunch_idx] = kLunchLabel;
        }
        grid[day] = row;
    }
    return grid;
}

Grid build_placeholder_grid(const std::vector<std::string>& labels, int periods, int lunch) {
    std::vector<std::string> pool;
    for (const auto& label : labels) {
        std::string cleaned = collapse_whitespace(label);
        if (!cleaned.empty()) pool.push_back(cleaned);
    }
    if (pool.empty()) pool.push_back("Free");

    const auto lunch_idx = lunch_index(lunch, periods);
    Grid grid = make_empty_grid(periods, lunch_idx);

    size_t idx = 0;
    for (const auto& day : kWeekDays) {
        auto& row = grid[day];
        for (int p = 0; p < periods; ++p) {
            if (lunch_idx && p == *lunch_idx) continue;
            row[p] = pool[idx % pool.size()];
            idx++;
        }
    }
    return grid;
}

Grid normalize_grid_labels(const Grid& grid) {
    Grid normalized;
    for (const auto& entry : grid) {
        std::vector<std::string> row;
        row.reserve(entry.second.size());
        for (const auto& cell : entry.second) {
            row.push_back(is_lunch_cell(cell) ? kLunchLabel : cell);
        }
        normalized[entry.first] = row;
    }
    return normalized;
}

int grid_periods(const Grid& grid) {
    if (grid.empty()) return 0;
    return static_cast<int>(grid.begin()->second.size());
}

bool grid_has_shape(const Grid& grid, int periods) {
    for (const auto& day : kWeekDays) {
        auto it = grid.find(day);
        if (it == grid.end() || static_cast<int>(it->second.size()) != periods) return false;
    }
    return true;
}

}  // namespace smart_timetable
