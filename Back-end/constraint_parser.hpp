#pragma once

#include "models.hpp"

#include <string>
#include <vector>

namespace smart_timetable {

/**
 * Parses one comma separated constraint line. Accepted forms:
 *   course, day, P1-P3
 *   course, day, P1-P3, mode
 *   course, section, day, P1-P3
 *   course, section, day, P1-P3, mode
 * A four token line whose second token is a weekday is read as the
 * day-first form. Throws InvalidRequestError on any other token count.
 */
Constraint parse_constraint_line(const std::string& line);

struct ParsedConstraints {
    std::vector<Constraint> constraints;
    std::vector<std::string> errors;  // "<line> -> <reason>"
};

/// Blank lines are skipped; a bad line is reported and the rest still parse.
ParsedConstraints parse_constraint_lines(const std::vector<std::string>& lines);

}  // namespace smart_timetable
