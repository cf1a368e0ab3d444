#include "json_handler.hpp"
#include "constraint_parser.hpp"
#include "solve_job.hpp"
#include "timetable_engine.hpp"
#include "validator.hpp"

#include <httplib.h>
#include <nlohmann/json.hpp>

#include <ctime>
#include <memory>
#include <optional>
#include <iostream>
#include <string>
#include <vector>

using smart_timetable::json;
using smart_timetable::JsonHandler;

// ==================== HELPERS ====================
static void send_json(httplib::Response& res, const json& body, int status) {
    res.set_content(body.dump(2), "application/json");
    res.status = status;
    res.set_header("Access-Control-Allow-Origin", "*");
}

static void send_error(httplib::Response& res, const std::string& message, int status) {
    send_json(res, JsonHandler::error_response(message), status);
}

static void allow_preflight(httplib::Server& svr, const std::string& path) {
    svr.Options(path, [](const httplib::Request&, httplib::Response& res) {
        res.set_header("Access-Control-Allow-Origin", "*");
        res.set_header("Access-Control-Allow-Methods", "POST, OPTIONS");
        res.set_header("Access-Control-Allow-Headers", "Content-Type");
        res.status = 204;
    });
}

// ==================== MAIN SERVER ====================
int main(int argc, char** argv) {
    smart_timetable::ServerConfig config;
    config.engine.verbose = true;
    if (argc > 1) {
        try {
            config = JsonHandler::load_config(argv[1]);
        } catch (const smart_timetable::SolverError& e) {
            std::cerr << e.what() << std::endl;
            return 1;
        }
    }

    // Shared with solve workers that may outlive a timed-out request.
    const auto engine = std::make_shared<const smart_timetable::TimetableEngine>(config.engine);
    const double grace = config.watchdog_grace_seconds;

    httplib::Server svr;

    // Global error handler to prevent server crashes
    svr.set_exception_handler([](const httplib::Request&, httplib::Response& res, std::exception_ptr ep) {
        try {
            std::rethrow_exception(ep);
        } catch (const std::exception& e) {
            send_error(res, std::string("Server error: ") + e.what(), 500);
        } catch (...) {
            send_error(res, "Unknown server error", 500);
        }
    });

    // Schedule endpoint
    svr.Post("/api/schedule", [engine, grace](const httplib::Request& req, httplib::Response& res) {
        if (req.body.empty()) {
            send_error(res, "Empty request body", 400);
            return;
        }
        try {
            const json input = json::parse(req.body);

            smart_timetable::SolveRequest request;
            std::vector<std::string> parse_errors;
            if (!JsonHandler::parse_request(input, request, parse_errors)) {
                json error_response = JsonHandler::error_response("Invalid input data");
                error_response["parseErrors"] = parse_errors;
                send_json(res, error_response, 400);
                return;
            }

            smart_timetable::SolveJob job(engine, request, grace);
            job.start();
            const smart_timetable::JobOutcome outcome = job.wait();

            switch (outcome.kind) {
                case smart_timetable::JobOutcomeKind::Result:
                    send_json(res, JsonHandler::create_response(*outcome.result), 200);
                    break;
                case smart_timetable::JobOutcomeKind::Failed:
                    send_error(res, outcome.error, outcome.invalid_request ? 400 : 500);
                    break;
                case smart_timetable::JobOutcomeKind::Timeout:
                    send_error(res, "Solver timed out: " + outcome.error, 500);
                    break;
                case smart_timetable::JobOutcomeKind::Cancelled:
                    send_error(res, "Solve cancelled", 500);
                    break;
            }

        } catch (const json::parse_error& e) {
            send_error(res, std::string("JSON parse error: ") + e.what(), 400);
        } catch (const std::exception& e) {
            send_error(res, std::string("Processing error: ") + e.what(), 500);
        }
    });

    // Re-validation of a caller-edited grid
    svr.Post("/api/validate", [](const httplib::Request& req, httplib::Response& res) {
        try {
            const json input = json::parse(req.body);
            if (!input.is_object() || !input.contains("grid")) {
                send_error(res, "Request needs a 'grid' object", 400);
                return;
            }

            const smart_timetable::Grid grid = JsonHandler::grid_from_json(input["grid"]);
            std::vector<smart_timetable::Constraint> constraints;
            if (input.contains("constraints") && input["constraints"].is_array()) {
                for (const auto& cons_json : input["constraints"]) {
                    constraints.push_back(JsonHandler::parse_constraint(cons_json));
                }
            }

            std::optional<int> lunch_idx;
            const int lunch = input.value("lunch", 0);
            if (lunch > 0) lunch_idx = lunch - 1;

            const auto report = smart_timetable::validate_grid(grid, constraints, lunch_idx,
                                                               input.value("section", std::string()));
            send_json(res, JsonHandler::validation_to_json(report), 200);

        } catch (const json::exception& e) {
            send_error(res, std::string("JSON parse error: ") + e.what(), 400);
        } catch (const smart_timetable::InvalidRequestError& e) {
            send_error(res, e.what(), 400);
        } catch (const std::exception& e) {
            send_error(res, std::string("Processing error: ") + e.what(), 500);
        }
    });

    // Free-text constraint lines
    svr.Post("/api/constraints/parse", [](const httplib::Request& req, httplib::Response& res) {
        try {
            const json input = json::parse(req.body);
            if (!input.is_object() || !input.contains("lines") || !input["lines"].is_array()) {
                send_error(res, "Request needs a 'lines' array", 400);
                return;
            }
            const auto lines = input["lines"].get<std::vector<std::string>>();
            send_json(res, JsonHandler::parsed_constraints_to_json(smart_timetable::parse_constraint_lines(lines)),
                      200);

        } catch (const json::exception& e) {
            send_error(res, std::string("JSON parse error: ") + e.what(), 400);
        }
    });

    // CORS preflight
    allow_preflight(svr, "/api/schedule");
    allow_preflight(svr, "/api/validate");
    allow_preflight(svr, "/api/constraints/parse");

    // Health check
    svr.Get("/health", [engine](const httplib::Request&, httplib::Response& res) {
        json response;
        response["status"] = "healthy";
        response["service"] = "smart_timetable";
        response["exact_solver"] = engine->has_exact_solver();
        response["timestamp"] = std::to_string(std::time(nullptr));
        res.set_content(response.dump(2), "application/json");
    });

    // 404 handler
    svr.set_error_handler([](const httplib::Request& req, httplib::Response& res) {
        if (res.status != 404) return;
        send_error(res, "Endpoint not found: " + req.path, 404);
    });

    std::cout << "==========================================" << std::endl;
    std::cout << "  Smart Timetable Server  " << std::endl;
    std::cout << "==========================================" << std::endl;
    std::cout << "Server running on: http://" << config.host << ":" << config.port << std::endl;
    std::cout << "Endpoints:" << std::endl;
    std::cout << "  POST /api/schedule          - Generate timetable" << std::endl;
    std::cout << "  POST /api/validate          - Re-check an edited grid" << std::endl;
    std::cout << "  POST /api/constraints/parse - Parse constraint lines" << std::endl;
    std::cout << "  GET  /health                - Health check" << std::endl;
    std::cout << "==========================================" << std::endl;

    try {
        if (!svr.listen(config.host, config.port)) {
            std::cerr << "Server failed to bind " << config.host << ":" << config.port << std::endl;
            return 1;
        }
    } catch (const std::exception& e) {
        std::cerr << "Server failed to start: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
