#pragma once

#include "models.hpp"

#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace smart_timetable {

// Normalized text -> canonical display label.
using LabelMap = std::unordered_map<std::string, std::string>;

// Inclusive, 0-based.
struct PeriodRange {
    int first{0};
    int last{0};
};

// A constraint resolved against one grid shape.
struct ConstraintWindow {
    std::string day;
    int day_index{0};
    PeriodRange range;
    std::vector<int> periods;  // in range, inside the grid, lunch excluded
};

// Trim and collapse internal whitespace, case preserved.
std::string collapse_whitespace(const std::string& text);

// Comparison key: collapsed whitespace, lower case.
std::string normalize_text(const std::string& text);

std::string to_lower(const std::string& text);
std::string to_upper(const std::string& text);

// "monday", " MONDAY " -> "Monday"; nullopt when not one of the five weekdays.
std::optional<std::string> canonical_day(const std::string& raw);
int day_index(const std::string& canonical);

bool is_lunch_cell(const std::string& cell);

std::string course_label(const Course& course);

// Keyed by label, name and code; courses with neither name nor code are skipped.
LabelMap build_label_map(const std::vector<Course>& courses);

// Accepts "P1-P3", "1-3", "P2". Throws MalformedConstraintError otherwise.
PeriodRange parse_period_range(const std::string& text);

// 0-based lunch column, or nullopt when lunch is 0 or outside the grid.
std::optional<int> lunch_index(int lunch, int periods);

std::vector<int> allowed_periods(const PeriodRange& range, int periods, std::optional<int> lunch_idx);

// Throws MalformedConstraintError for an unknown day or a bad range.
ConstraintWindow resolve_window(const Constraint& constraint, int periods, std::optional<int> lunch_idx);

Course normalize_course(const Course& course);
Constraint normalize_constraint(const Constraint& constraint);

}  // namespace smart_timetable
