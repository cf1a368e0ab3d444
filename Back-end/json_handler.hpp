#pragma once

#include "constraint_parser.hpp"
#include "models.hpp"
#include "timetable_engine.hpp"
#include "validator.hpp"

#include <nlohmann/json.hpp>

#include <string>
#include <vector>

namespace smart_timetable {

using json = nlohmann::json;

// ==================== SERVER CONFIG ====================
struct ServerConfig {
    std::string host{"0.0.0.0"};
    int port{8080};
    double watchdog_grace_seconds{5.0};
    EngineOptions engine;
};

// ==================== JSON HANDLER ====================
class JsonHandler {
public:
    /**
     * Fills request from a solve request document. Courses without an id get
     * negative ids in input order. Returns false and fills errors when the
     * document has the wrong shape; semantic checks are left to the engine.
     */
    static bool parse_request(const json& input, SolveRequest& request, std::vector<std::string>& errors);

    static Constraint parse_constraint(const json& input);
    static json constraint_to_json(const Constraint& constraint);

    static json grid_to_json(const Grid& grid);
    // Null cells become "", lunch spellings become "LUNCH". Throws InvalidRequestError.
    static Grid grid_from_json(const json& input);

    static json diagnostics_to_json(const SolverResult& result);
    static json create_response(const EngineResult& result);
    static json validation_to_json(const ValidationReport& report);
    static json parsed_constraints_to_json(const ParsedConstraints& parsed);
    static json error_response(const std::string& message);

    // Missing keys keep their defaults.
    static ServerConfig parse_config(const json& input);
    // Throws SolverError when the file cannot be read or parsed.
    static ServerConfig load_config(const std::string& path);
};

}  // namespace smart_timetable
