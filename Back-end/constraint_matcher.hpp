#pragma once

#include "models.hpp"

#include <vector>

namespace smart_timetable {

enum class MatchTier { None, Exact, Token, Affix };

struct MatchResult {
    MatchTier tier{MatchTier::None};
    std::vector<int> course_ids;  // in course order

    bool empty() const { return course_ids.empty(); }
};

/**
 * Resolves the free-text course reference of a constraint to course ids.
 *
 * Tiers are tried in order and the first non-empty one wins:
 *  1. exact: normalized text equals a course name or code,
 *  2. token: a token of the text (split on whitespace, '/', '-') contains or is
 *     contained in a course name or code,
 *  3. affix: the text is a prefix or suffix of a name or code, or the other way round.
 * A section filter other than "ALL" restricts every tier to courses of that section.
 */
MatchResult match_constraint(const Constraint& constraint, const std::vector<Course>& courses);

const char* to_string(MatchTier tier);

// nullptr when no course carries the id.
const Course* find_course(const std::vector<Course>& courses, int id);

}  // namespace smart_timetable
