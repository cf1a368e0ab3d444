#pragma once

#include "models.hpp"

#include <optional>
#include <string>
#include <vector>

namespace smart_timetable {

struct ImprovementStats {
    int iterations{0};
    int accepted_swaps{0};
    int score_before{0};
    int score_after{0};
};

/**
 * Sum over period columns of the number of distinct labels in that column,
 * ignoring free cells and the lunch block. Labels compare case-insensitively.
 */
int diversity_score(const Grid& grid);

/**
 * @brief Randomized pairwise swap hill-climbing for schedule variety.
 *
 * Each iteration picks two distinct non-lunch cells; differing labels are
 * swapped tentatively and the swap is kept only if the grid still passes
 * validation against the constraints and the diversity score strictly
 * rises. Stops after max_iterations or once the score reaches
 * high_water_fraction of the number of non-lunch cells.
 *
 * With daily_unique set, a swap that would put a label twice on one day is
 * rejected as well.
 */
class LocalImprover {
public:
    LocalImprover(int max_iterations, double high_water_fraction, unsigned int seed,
                  bool daily_unique = false);

    Grid improve(const Grid& grid, const std::vector<Constraint>& constraints,
                 std::optional<int> lunch_idx, ImprovementStats* stats = nullptr) const;

private:
    int max_iterations_;
    double high_water_fraction_;
    unsigned int seed_;
    bool daily_unique_;
};

}  // namespace smart_timetable
