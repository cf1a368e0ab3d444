#include "constraint_parser.hpp"

#include "normalizer.hpp"
#include "solver_result.hpp"

#include <sstream>

namespace smart_timetable {

static std::vector<std::string> split_fields(const std::string& line) {
    std::vector<std::string> parts;
    std::stringstream ss(line);
    std::string part;
    while (std::getline(ss, part, ',')) {
        parts.push_back(collapse_whitespace(part));
    }
    // getline drops a trailing empty field
    if (!line.empty() && line.back() == ',') parts.emplace_back();
    return parts;
}

static bool is_block_mode(const std::string& mode) {
    const std::string m = normalize_text(mode);
    return m == "exact" || m == "block" || m == "full";
}

Constraint parse_constraint_line(const std::string& line) {
    const std::vector<std::string> parts = split_fields(line);

    std::string course, section, day, range, mode;
    switch (parts.size()) {
        case 3:
            course = parts[0];
            day = parts[1];
            range = parts[2];
            break;
        case 4:
            if (canonical_day(parts[1])) {
                course = parts[0];
                day = parts[1];
                range = parts[2];
                mode = parts[3];
            } else {
                course = parts[0];
                section = parts[1];
                day = parts[2];
                range = parts[3];
            }
            break;
        case 5:
            course = parts[0];
            section = parts[1];
            day = parts[2];
            range = parts[3];
            mode = parts[4];
            break;
        default:
            throw InvalidRequestError("bad constraint format, expected 3 to 5 comma separated fields");
    }

    if (course.empty()) {
        throw InvalidRequestError("constraint line has no course");
    }

    Constraint constraint;
    constraint.course_name = course;
    constraint.section = section.empty() ? kAllSections : section;
    auto canonical = canonical_day(day);
    constraint.day = canonical ? *canonical : day;
    constraint.period_range = range;
    constraint.mode = mode;
    constraint.kind = is_block_mode(mode) ? ConstraintKind::Exact : ConstraintKind::Hard;
    return constraint;
}

ParsedConstraints parse_constraint_lines(const std::vector<std::string>& lines) {
    ParsedConstraints parsed;
    for (const auto& line : lines) {
        if (collapse_whitespace(line).empty()) continue;
        try {
            parsed.constraints.push_back(parse_constraint_line(line));
        } catch (const InvalidRequestError& e) {
            parsed.errors.push_back(line + " -> " + e.what());
        }
    }
    return parsed;
}

}  // namespace smart_timetable
