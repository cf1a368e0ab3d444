#pragma once

#include "models.hpp"

#include <optional>
#include <string>
#include <vector>

namespace smart_timetable {

struct ValidationReport {
    bool ok{true};
    std::vector<std::string> violations;
    std::vector<std::string> skipped;  // malformed constraints, not violations

    bool operator==(const ValidationReport& other) const {
        return ok == other.ok && violations == other.violations && skipped == other.skipped;
    }
};

/**
 * @brief Re-checks a grid against Hard and Exact constraints.
 *
 * A cell satisfies a constraint when its subject part (text before " - ")
 * and the constraint's course text, both normalized, are equal or one
 * contains the other. Exact needs every allowed period of the window to
 * match, Hard needs at least one. The lunch column is never required.
 *
 * When a section is given, constraints bound to another section are
 * ignored. The grid is never modified.
 */
ValidationReport validate_grid(const Grid& grid, const std::vector<Constraint>& constraints,
                               std::optional<int> lunch_idx = std::nullopt,
                               const std::string& section = "");

/// Subject part of a "Subject - Teacher" cell, normalized.
std::string cell_subject(const std::string& cell);

bool cell_matches(const std::string& cell, const std::string& course_text);

}  // namespace smart_timetable
