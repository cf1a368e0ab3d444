#include "json_handler.hpp"
#include "timetable_engine.hpp"

#include <nlohmann/json.hpp>

#include <iostream>
#include <string>
#include <vector>

using smart_timetable::json;
using smart_timetable::JsonHandler;

// Reads one solve request from stdin and prints the grid as a single JSON line.
// Progress stays off so stdout carries nothing but the grid.
int main() {
    try {
        const json input = json::parse(std::cin);

        smart_timetable::SolveRequest request;
        std::vector<std::string> parse_errors;
        if (!JsonHandler::parse_request(input, request, parse_errors)) {
            for (const auto& error : parse_errors) std::cerr << error << std::endl;
            return 1;
        }

        const smart_timetable::TimetableEngine engine;
        const smart_timetable::EngineResult result = engine.generate(request);

        for (const auto& warning : result.diagnostics.warnings) {
            std::cerr << "warning: " << warning << std::endl;
        }
        std::cout << JsonHandler::grid_to_json(result.grid).dump() << std::endl;

    } catch (const json::parse_error& e) {
        std::cerr << "JSON parse error: " << e.what() << std::endl;
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Solver error: " << e.what() << std::endl;
        return 1;
    }
    return 0;
}
