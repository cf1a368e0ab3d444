#pragma once

#include <array>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace smart_timetable {

// ==================== DATA MODELS ====================
inline const std::array<std::string, 5> kWeekDays = {
    "Monday", "Tuesday", "Wednesday", "Thursday", "Friday"};

inline const std::string kLunchLabel = "LUNCH";
inline const std::string kAllSections = "ALL";

struct Course {
    int id{0};  // negative ids are synthetic
    std::string course_name;
    std::string course_code;
    int credits{1};
    std::string section;
    std::optional<int> teacher_id;
    bool synthetic{false};
};

enum class ConstraintKind { Hard, Exact };

struct Constraint {
    std::string course_name;
    std::string section{kAllSections};
    std::string day;
    std::string period_range;  // "P1-P3"
    ConstraintKind kind{ConstraintKind::Hard};
    std::string mode;

    // Exact either by kind or by a block-style mode annotation.
    bool is_exact() const;
};

// day name -> exactly `periods` cells; "" is free, "LUNCH" is blocked
using Grid = std::map<std::string, std::vector<std::string>>;

struct SolveRequest {
    std::vector<Course> courses;
    std::vector<Constraint> constraints;
    int periods{6};
    int lunch{0};  // 0 = no lunch block, else 1-based period
    double time_limit{10.0};
    std::optional<unsigned int> seed;
};

}  // namespace smart_timetable
