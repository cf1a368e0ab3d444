#pragma once

#include <stdexcept>
#include <string>
#include <vector>

namespace smart_timetable {

// ==================== ERROR AND WARNING SYSTEM ====================
class SolverError : public std::runtime_error {
public:
    explicit SolverError(const std::string& message) : std::runtime_error(message) {}
};

class InvalidRequestError : public SolverError {
public:
    explicit InvalidRequestError(const std::string& message) : SolverError("Invalid request: " + message) {}
};

class MalformedConstraintError : public SolverError {
public:
    explicit MalformedConstraintError(const std::string& message) : SolverError("Malformed constraint: " + message) {}
};

enum class SolvePath { Exact, Fallback };

struct SolverResult {
    bool success{false};
    bool valid{false};
    std::string message;
    std::vector<std::string> warnings;
    std::vector<std::string> errors;
    std::vector<std::string> violations;

    SolvePath path{SolvePath::Fallback};
    std::string fallback_reason;  // unavailable, infeasible, timeout, invalid_model, error

    int synthetic_courses{0};
    int improvement_iterations{0};
    int accepted_swaps{0};
    int diversity_before{0};
    int diversity_after{0};

    void add_warning(const std::string& warning) {
        warnings.push_back(warning);
    }

    void add_error(const std::string& error) {
        errors.push_back(error);
    }

    bool has_errors() const { return !errors.empty(); }
    bool has_warnings() const { return !warnings.empty(); }
};

inline const char* to_string(SolvePath path) {
    return path == SolvePath::Exact ? "exact" : "fallback";
}

}  // namespace smart_timetable
