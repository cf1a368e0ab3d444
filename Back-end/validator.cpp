#include "validator.hpp"

#include "normalizer.hpp"
#include "solver_result.hpp"

#include <algorithm>

namespace smart_timetable {

std::string cell_subject(const std::string& cell) {
    const auto dash = cell.find(" - ");
    return normalize_text(dash == std::string::npos ? cell : cell.substr(0, dash));
}

bool cell_matches(const std::string& cell, const std::string& course_text) {
    const std::string subject = cell_subject(cell);
    const std::string target = normalize_text(course_text);
    if (subject.empty() || target.empty()) return false;
    return subject == target || subject.find(target) != std::string::npos ||
           target.find(subject) != std::string::npos;
}

static std::string describe_cells(const std::vector<std::string>& row, const std::vector<int>& periods) {
    std::string found = "[";
    for (size_t i = 0; i < periods.size(); ++i) {
        if (i > 0) found += ", ";
        found += "'" + row[periods[i]] + "'";
    }
    return found + "]";
}

ValidationReport validate_grid(const Grid& grid, const std::vector<Constraint>& constraints,
                               std::optional<int> lunch_idx, const std::string& section) {
    ValidationReport report;

    // Day keys of an edited grid may come back in any case.
    Grid by_day;
    for (const auto& entry : grid) {
        auto day = canonical_day(entry.first);
        by_day[day ? *day : entry.first] = entry.second;
    }

    const std::string wanted_section = collapse_whitespace(section);

    for (const auto& raw : constraints) {
        const Constraint constraint = normalize_constraint(raw);
        if (constraint.course_name.empty()) continue;

        if (!wanted_section.empty() && to_upper(constraint.section) != kAllSections &&
            constraint.section != wanted_section) {
            continue;
        }

        std::optional<std::string> day = canonical_day(constraint.day);
        PeriodRange range;
        try {
            if (!day) throw MalformedConstraintError("unknown day '" + constraint.day + "'");
            range = parse_period_range(constraint.period_range);
        } catch (const MalformedConstraintError& e) {
            report.skipped.push_back(std::string(e.what()) + " ('" + constraint.course_name + "')");
            continue;
        }

        const std::string where = *day + " (" + constraint.period_range + ")";
        auto row_it = by_day.find(*day);
        if (row_it == by_day.end()) {
            report.violations.push_back("Constraint for " + constraint.course_name + " on " + where + " - day missing");
            report.ok = false;
            continue;
        }
        const auto& row = row_it->second;

        std::vector<int> periods;
        for (int p = range.first; p <= range.last; ++p) {
            if (p < 0 || p >= static_cast<int>(row.size())) continue;
            if (lunch_idx && p == *lunch_idx) continue;
            if (is_lunch_cell(row[p])) continue;
            periods.push_back(p);
        }
        if (periods.empty()) continue;

        const auto matches = [&](int p) { return cell_matches(row[p], constraint.course_name); };

        if (constraint.is_exact()) {
            if (!std::all_of(periods.begin(), periods.end(), matches)) {
                report.violations.push_back("Exact constraint violated: '" + constraint.course_name +
                                            "' must fill " + where + ". Found: " + describe_cells(row, periods));
                report.ok = false;
            }
        } else if (std::none_of(periods.begin(), periods.end(), matches)) {
            report.violations.push_back("Hard constraint violated: '" + constraint.course_name + "' expected on " +
                                        where + ". Found: " + describe_cells(row, periods));
            report.ok = false;
        }
    }
    return report;
}

}  // namespace smart_timetable
