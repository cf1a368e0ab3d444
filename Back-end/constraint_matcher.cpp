#include "constraint_matcher.hpp"

#include "normalizer.hpp"

#include <functional>

namespace smart_timetable {

namespace {

struct CourseKey {
    int id;
    std::string name;
    std::string code;
    std::string section;
};

bool starts_with(const std::string& text, const std::string& prefix) {
    return text.size() >= prefix.size() && text.compare(0, prefix.size(), prefix) == 0;
}

bool ends_with(const std::string& text, const std::string& suffix) {
    return text.size() >= suffix.size() &&
           text.compare(text.size() - suffix.size(), suffix.size(), suffix) == 0;
}

bool contains(const std::string& haystack, const std::string& needle) {
    return !needle.empty() && !haystack.empty() && haystack.find(needle) != std::string::npos;
}

std::vector<std::string> split_tokens(const std::string& text) {
    std::string spaced = text;
    for (auto& c : spaced) {
        if (c == '/' || c == '-') c = ' ';
    }
    std::vector<std::string> tokens;
    std::string token;
    for (char c : collapse_whitespace(spaced) + " ") {
        if (c == ' ') {
            if (!token.empty()) tokens.push_back(token);
            token.clear();
        } else {
            token += c;
        }
    }
    return tokens;
}

bool affix_match(const std::string& a, const std::string& b) {
    if (a.empty() || b.empty()) return false;
    return starts_with(a, b) || ends_with(a, b) || starts_with(b, a) || ends_with(b, a);
}

}  // namespace

const char* to_string(MatchTier tier) {
    switch (tier) {
        case MatchTier::Exact: return "exact";
        case MatchTier::Token: return "token";
        case MatchTier::Affix: return "affix";
        case MatchTier::None:  return "none";
    }
    return "none";
}

const Course* find_course(const std::vector<Course>& courses, int id) {
    for (const auto& course : courses) {
        if (course.id == id) return &course;
    }
    return nullptr;
}

MatchResult match_constraint(const Constraint& constraint, const std::vector<Course>& courses) {
    MatchResult result;
    const std::string target = normalize_text(constraint.course_name);
    if (target.empty()) return result;

    const std::string section_filter = collapse_whitespace(constraint.section);
    const bool any_section = section_filter.empty() || to_upper(section_filter) == kAllSections;

    std::vector<CourseKey> keys;
    keys.reserve(courses.size());
    for (const auto& course : courses) {
        std::string section = collapse_whitespace(course.section);
        if (section.empty()) section = kAllSections;
        if (!any_section && section != section_filter) continue;
        keys.push_back({course.id, normalize_text(course.course_name), normalize_text(course.course_code), section});
    }

    auto collect = [&](MatchTier tier, const std::function<bool(const CourseKey&)>& predicate) {
        for (const auto& key : keys) {
            if (predicate(key)) result.course_ids.push_back(key.id);
        }
        if (!result.course_ids.empty()) result.tier = tier;
        return !result.course_ids.empty();
    };

    if (collect(MatchTier::Exact, [&](const CourseKey& key) {
            return (!key.name.empty() && key.name == target) || (!key.code.empty() && key.code == target);
        })) {
        return result;
    }

    const auto tokens = split_tokens(target);
    if (collect(MatchTier::Token, [&](const CourseKey& key) {
            for (const auto& token : tokens) {
                if (contains(key.name, token) || contains(key.code, token) ||
                    contains(token, key.name) || contains(token, key.code)) {
                    return true;
                }
            }
            return false;
        })) {
        return result;
    }

    collect(MatchTier::Affix, [&](const CourseKey& key) {
        return affix_match(key.name, target) || affix_match(key.code, target);
    });
    return result;
}

}  // namespace smart_timetable
