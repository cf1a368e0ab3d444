#include "json_handler.hpp"

#include "grid_utils.hpp"
#include "normalizer.hpp"
#include "solver_result.hpp"

#include <fstream>

namespace smart_timetable {

// Accepts a string or null where a string is expected.
static std::string string_field(const json& input, const char* key, const std::string& fallback = "") {
    if (!input.contains(key) || input[key].is_null()) return fallback;
    if (input[key].is_string()) return input[key].get<std::string>();
    return input[key].dump();
}

// ==================== REQUEST ====================
bool JsonHandler::parse_request(const json& input, SolveRequest& request, std::vector<std::string>& errors) {
    try {
        errors.clear();
        if (!input.is_object()) {
            errors.push_back("Request must be a JSON object");
            return false;
        }

        if (input.contains("courses")) {
            if (!input["courses"].is_array()) {
                errors.push_back("'courses' must be an array");
            } else {
                int next_missing_id = -1;
                for (const auto& course_json : input["courses"]) {
                    if (!course_json.is_object()) {
                        errors.push_back("Course entry must be an object");
                        continue;
                    }
                    Course course;
                    if (course_json.contains("id") && !course_json["id"].is_null()) {
                        course.id = course_json["id"].get<int>();
                    } else {
                        course.id = next_missing_id--;
                    }
                    course.course_name = string_field(course_json, "course_name");
                    course.course_code = string_field(course_json, "course_code");
                    course.section = string_field(course_json, "section");
                    course.credits = course_json.contains("credits") && !course_json["credits"].is_null()
                                         ? course_json["credits"].get<int>()
                                         : 1;
                    if (course_json.contains("teacher_id") && !course_json["teacher_id"].is_null()) {
                        course.teacher_id = course_json["teacher_id"].get<int>();
                    }
                    request.courses.push_back(course);
                }
            }
        }

        if (input.contains("constraints") && !input["constraints"].is_null()) {
            if (!input["constraints"].is_array()) {
                errors.push_back("'constraints' must be an array");
            } else {
                for (const auto& cons_json : input["constraints"]) {
                    if (!cons_json.is_object()) {
                        errors.push_back("Constraint entry must be an object");
                        continue;
                    }
                    request.constraints.push_back(parse_constraint(cons_json));
                }
            }
        }

        request.periods = input.value("periods", 6);
        request.lunch = input.value("lunch", 0);
        request.time_limit = input.value("time_limit", 10.0);
        if (input.contains("seed") && !input["seed"].is_null()) {
            request.seed = input["seed"].get<unsigned int>();
        }

        return errors.empty();

    } catch (const std::exception& e) {
        errors.push_back(std::string("JSON parsing error: ") + e.what());
        return false;
    }
}

Constraint JsonHandler::parse_constraint(const json& input) {
    Constraint constraint;
    constraint.course_name = string_field(input, "course_name", string_field(input, "course"));
    constraint.section = string_field(input, "section", kAllSections);
    constraint.day = string_field(input, "day");
    constraint.period_range = string_field(input, "period_range", string_field(input, "periods"));
    constraint.mode = string_field(input, "mode");
    constraint.kind = normalize_text(string_field(input, "type", "Hard")) == "exact" ? ConstraintKind::Exact
                                                                                     : ConstraintKind::Hard;
    return constraint;
}

json JsonHandler::constraint_to_json(const Constraint& constraint) {
    json out;
    out["course_name"] = constraint.course_name;
    out["section"] = constraint.section;
    out["day"] = constraint.day;
    out["period_range"] = constraint.period_range;
    out["type"] = constraint.kind == ConstraintKind::Exact ? "Exact" : "Hard";
    if (constraint.mode.empty()) {
        out["mode"] = nullptr;
    } else {
        out["mode"] = constraint.mode;
    }
    return out;
}

// ==================== GRID ====================
json JsonHandler::grid_to_json(const Grid& grid) {
    json out = json::object();
    for (const auto& entry : grid) {
        out[entry.first] = entry.second;
    }
    return out;
}

Grid JsonHandler::grid_from_json(const json& input) {
    if (!input.is_object()) {
        throw InvalidRequestError("grid must be an object of day -> cells");
    }
    Grid grid;
    for (auto it = input.begin(); it != input.end(); ++it) {
        if (!it.value().is_array()) {
            throw InvalidRequestError("cells for '" + it.key() + "' must be an array");
        }
        std::vector<std::string> row;
        for (const auto& cell : it.value()) {
            if (cell.is_null()) {
                row.emplace_back();
            } else if (cell.is_string()) {
                row.push_back(cell.get<std::string>());
            } else {
                row.push_back(cell.dump());
            }
        }
        grid[it.key()] = row;
    }
    return normalize_grid_labels(grid);
}

// ==================== RESPONSES ====================
json JsonHandler::diagnostics_to_json(const SolverResult& result) {
    json out;
    out["success"] = result.success;
    out["valid"] = result.valid;
    out["message"] = result.message;
    out["path"] = to_string(result.path);
    if (!result.fallback_reason.empty()) {
        out["fallback_reason"] = result.fallback_reason;
    }
    out["warnings"] = result.warnings;
    out["errors"] = result.errors;
    out["violations"] = result.violations;
    out["synthetic_courses"] = result.synthetic_courses;
    out["improvement"] = {
        {"iterations", result.improvement_iterations},
        {"accepted_swaps", result.accepted_swaps},
        {"diversity_before", result.diversity_before},
        {"diversity_after", result.diversity_after}
    };
    return out;
}

json JsonHandler::create_response(const EngineResult& result) {
    json response;
    response["success"] = result.diagnostics.success;
    response["grid"] = grid_to_json(result.grid);
    response["diagnostics"] = diagnostics_to_json(result.diagnostics);
    return response;
}

json JsonHandler::validation_to_json(const ValidationReport& report) {
    json response;
    response["ok"] = report.ok;
    response["violations"] = report.violations;
    if (!report.skipped.empty()) {
        response["skipped"] = report.skipped;
    }
    return response;
}

json JsonHandler::parsed_constraints_to_json(const ParsedConstraints& parsed) {
    json response;
    json constraints = json::array();
    for (const auto& constraint : parsed.constraints) {
        constraints.push_back(constraint_to_json(constraint));
    }
    response["constraints"] = constraints;
    response["errors"] = parsed.errors;
    return response;
}

json JsonHandler::error_response(const std::string& message) {
    json response;
    response["success"] = false;
    response["error"] = message;
    return response;
}

// ==================== CONFIG ====================
ServerConfig JsonHandler::parse_config(const json& input) {
    ServerConfig config;
    config.host = input.value("host", config.host);
    config.port = input.value("port", config.port);
    config.watchdog_grace_seconds = input.value("watchdog_grace_seconds", config.watchdog_grace_seconds);

    if (input.contains("engine") && input["engine"].is_object()) {
        const json& engine = input["engine"];
        EngineOptions& options = config.engine;
        options.exact_solver = engine.value("exact_solver", options.exact_solver);
        options.local_improvement = engine.value("local_improvement", options.local_improvement);
        options.improvement_iterations = engine.value("improvement_iterations", options.improvement_iterations);
        options.high_water_fraction = engine.value("high_water_fraction", options.high_water_fraction);
        options.synthesize_unmatched = engine.value("synthesize_unmatched", options.synthesize_unmatched);
        options.default_seed = engine.value("default_seed", options.default_seed);
        options.verbose = engine.value("verbose", options.verbose);
    }
    return config;
}

ServerConfig JsonHandler::load_config(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        throw SolverError("Cannot open config file: " + path);
    }
    try {
        return parse_config(json::parse(in));
    } catch (const json::exception& e) {
        throw SolverError("Bad config file " + path + ": " + e.what());
    }
}

}  // namespace smart_timetable
