#include "normalizer.hpp"

#include "solver_result.hpp"

#include <algorithm>
#include <cctype>
#include <sstream>

namespace smart_timetable {

// ==================== TEXT ====================
std::string collapse_whitespace(const std::string& text) {
    std::istringstream in(text);
    std::string word;
    std::string out;
    while (in >> word) {
        if (!out.empty()) out += ' ';
        out += word;
    }
    return out;
}

std::string to_lower(const std::string& text) {
    std::string out = text;
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

std::string to_upper(const std::string& text) {
    std::string out = text;
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return out;
}

std::string normalize_text(const std::string& text) {
    return to_lower(collapse_whitespace(text));
}

std::optional<std::string> canonical_day(const std::string& raw) {
    std::string day = to_lower(collapse_whitespace(raw));
    if (day.empty()) return std::nullopt;
    day[0] = static_cast<char>(std::toupper(static_cast<unsigned char>(day[0])));

    if (std::find(kWeekDays.begin(), kWeekDays.end(), day) == kWeekDays.end()) {
        return std::nullopt;
    }
    return day;
}

int day_index(const std::string& canonical) {
    auto it = std::find(kWeekDays.begin(), kWeekDays.end(), canonical);
    return it == kWeekDays.end() ? -1 : static_cast<int>(it - kWeekDays.begin());
}

bool is_lunch_cell(const std::string& cell) {
    return to_upper(collapse_whitespace(cell)) == kLunchLabel;
}

// ==================== COURSES ====================
std::string course_label(const Course& course) {
    std::string label = collapse_whitespace(course.course_name);
    if (label.empty()) label = collapse_whitespace(course.course_code);
    if (label.empty()) label = "C" + std::to_string(course.id);
    return label;
}

LabelMap build_label_map(const std::vector<Course>& courses) {
    LabelMap mapping;
    for (const auto& course : courses) {
        if (collapse_whitespace(course.course_name).empty() && collapse_whitespace(course.course_code).empty()) {
            continue;
        }
        const std::string label = course_label(course);
        mapping[normalize_text(label)] = label;

        const std::string code = normalize_text(course.course_code);
        const std::string name = normalize_text(course.course_name);
        if (!code.empty()) mapping[code] = label;
        if (!name.empty()) mapping[name] = label;
    }
    return mapping;
}

Course normalize_course(const Course& course) {
    Course out = course;
    out.course_name = collapse_whitespace(course.course_name);
    out.course_code = collapse_whitespace(course.course_code);
    out.section = collapse_whitespace(course.section);
    if (out.credits < 1) out.credits = 1;
    return out;
}

// ==================== CONSTRAINTS ====================
bool Constraint::is_exact() const {
    if (kind == ConstraintKind::Exact) return true;
    const std::string m = normalize_text(mode);
    return m == "block" || m == "full" || m.find("exact") != std::string::npos;
}

Constraint normalize_constraint(const Constraint& constraint) {
    Constraint out = constraint;
    out.course_name = collapse_whitespace(constraint.course_name);
    out.section = collapse_whitespace(constraint.section);
    if (out.section.empty()) out.section = kAllSections;
    out.period_range = collapse_whitespace(constraint.period_range);
    out.mode = collapse_whitespace(constraint.mode);

    auto day = canonical_day(constraint.day);
    out.day = day ? *day : collapse_whitespace(constraint.day);
    return out;
}

static int parse_period_number(const std::string& token, const std::string& original) {
    std::string digits = token;
    if (!digits.empty() && digits[0] == 'P') digits.erase(0, 1);
    if (digits.empty() || !std::all_of(digits.begin(), digits.end(),
                                       [](unsigned char c) { return std::isdigit(c) != 0; })) {
        throw MalformedConstraintError("bad period range '" + original + "'");
    }
    if (digits.size() > 6) {
        throw MalformedConstraintError("period out of range in '" + original + "'");
    }
    int value = std::stoi(digits);
    if (value < 1) {
        throw MalformedConstraintError("periods are 1-based in '" + original + "'");
    }
    return value;
}

PeriodRange parse_period_range(const std::string& text) {
    std::string token;
    for (char c : to_upper(text)) {
        if (!std::isspace(static_cast<unsigned char>(c))) token += c;
    }
    if (token.empty()) {
        throw MalformedConstraintError("empty period range");
    }

    PeriodRange range;
    auto dash = token.find('-');
    if (dash == std::string::npos) {
        range.first = range.last = parse_period_number(token, text) - 1;
        return range;
    }

    range.first = parse_period_number(token.substr(0, dash), text) - 1;
    range.last = parse_period_number(token.substr(dash + 1), text) - 1;
    if (range.first > range.last) std::swap(range.first, range.last);
    return range;
}

std::optional<int> lunch_index(int lunch, int periods) {
    if (lunch >= 1 && lunch <= periods) return lunch - 1;
    return std::nullopt;
}

std::vector<int> allowed_periods(const PeriodRange& range, int periods, std::optional<int> lunch_idx) {
    std::vector<int> indices;
    const int first = std::max(0, range.first);
    const int last = std::min(periods - 1, range.last);
    for (int p = first; p <= last; ++p) {
        if (lunch_idx && p == *lunch_idx) continue;
        indices.push_back(p);
    }
    return indices;
}

ConstraintWindow resolve_window(const Constraint& constraint, int periods, std::optional<int> lunch_idx) {
    auto day = canonical_day(constraint.day);
    if (!day) {
        throw MalformedConstraintError("unknown day '" + constraint.day + "' for '" + constraint.course_name + "'");
    }

    ConstraintWindow window;
    window.day = *day;
    window.day_index = day_index(*day);
    window.range = parse_period_range(constraint.period_range);
    window.periods = allowed_periods(window.range, periods, lunch_idx);
    return window;
}

}  // namespace smart_timetable
