#include "local_improver.hpp"

#include "grid_utils.hpp"
#include "normalizer.hpp"
#include "validator.hpp"

#include <random>
#include <set>
#include <utility>

namespace smart_timetable {

int diversity_score(const Grid& grid) {
    const int periods = grid_periods(grid);
    int score = 0;
    for (int p = 0; p < periods; ++p) {
        std::set<std::string> seen;
        for (const auto& entry : grid) {
            if (p >= static_cast<int>(entry.second.size())) continue;
            const std::string& cell = entry.second[p];
            if (cell.empty() || is_lunch_cell(cell)) continue;
            seen.insert(to_lower(collapse_whitespace(cell)));
        }
        score += static_cast<int>(seen.size());
    }
    return score;
}

LocalImprover::LocalImprover(int max_iterations, double high_water_fraction, unsigned int seed,
                             bool daily_unique)
    : max_iterations_(max_iterations),
      high_water_fraction_(high_water_fraction),
      seed_(seed),
      daily_unique_(daily_unique) {}

// True when `label` already sits on the row somewhere other than `skip`.
static bool row_has_label(const std::vector<std::string>& row, const std::string& label, int skip) {
    if (label.empty()) return false;
    for (int p = 0; p < static_cast<int>(row.size()); ++p) {
        if (p != skip && row[p] == label) return true;
    }
    return false;
}

Grid LocalImprover::improve(const Grid& grid, const std::vector<Constraint>& constraints,
                            std::optional<int> lunch_idx, ImprovementStats* stats) const {
    Grid best = grid;
    int best_score = diversity_score(best);

    ImprovementStats local;
    local.score_before = best_score;

    std::vector<std::string> days;
    for (const auto& entry : best) days.push_back(entry.first);
    const int periods = grid_periods(best);

    std::vector<std::pair<int, int>> cells;  // (day, period)
    for (int d = 0; d < static_cast<int>(days.size()); ++d) {
        for (int p = 0; p < periods; ++p) {
            if (lunch_idx && p == *lunch_idx) continue;
            if (p >= static_cast<int>(best[days[d]].size())) continue;
            cells.emplace_back(d, p);
        }
    }

    const double high_water = high_water_fraction_ * static_cast<double>(cells.size());

    if (cells.size() >= 2) {
        std::mt19937 rng(seed_);
        std::uniform_int_distribution<size_t> pick(0, cells.size() - 1);

        for (int iter = 0; iter < max_iterations_ && best_score < high_water; ++iter) {
            local.iterations++;

            const size_t i = pick(rng);
            size_t j = pick(rng);
            while (j == i) j = pick(rng);

            auto& a = best[days[cells[i].first]][cells[i].second];
            auto& b = best[days[cells[j].first]][cells[j].second];
            if (a == b) continue;

            const int day_a = cells[i].first;
            const int day_b = cells[j].first;
            if (daily_unique_ && day_a != day_b &&
                (row_has_label(best[days[day_b]], a, cells[j].second) ||
                 row_has_label(best[days[day_a]], b, cells[i].second))) {
                continue;
            }

            std::swap(a, b);
            const int score = diversity_score(best);
            if (score > best_score && validate_grid(best, constraints, lunch_idx).ok) {
                best_score = score;
                local.accepted_swaps++;
            } else {
                std::swap(a, b);
            }
        }
    }

    local.score_after = best_score;
    if (stats) *stats = local;
    return best;
}

}  // namespace smart_timetable
