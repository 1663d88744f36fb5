///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "sequential_selector.hpp"
#include "model.hpp"
#include "formatting.hpp"
#include "demo_instances.hpp"
#include "time_parser.hpp"
#include <iostream>
#include <chrono>
#include <stdexcept>
#include <string>


///////////////////////////
///     ENTRY POINT     ///
///////////////////////////
/**
 * @brief Demo entry point for the sequential course selector.
 *
 * Usage: sequential_demo [scenario] [seed]
 * Builds a demo request (basic, infeasible, field, busy or catalogue; the
 * catalogue by default), runs the single-threaded selector, measures its
 * runtime and prints the solutions found.
 */
int main(int argc, char** argv) {
    std::string scenarioName = argc > 1 ? argv[1] : "catalogue";
    auto scenario = parseDemoScenario(scenarioName);
    if (!scenario) {
        std::cerr << "Unknown scenario '" << scenarioName
                  << "' (expected basic, infeasible, field, busy or catalogue)\n";
        return 2;
    }

    SelectorOptions options;
    if (argc > 2) {
        try {
            options.seed = (std::uint32_t)std::stoul(argv[2]);
        } catch (const std::exception& e) {
            std::cerr << "Invalid seed '" << argv[2] << "': " << e.what() << "\n";
            return 2;
        }
    }

    DemoRequest req = makeDemoRequest(*scenario);
    SequentialSelector selector(options);

    // Measure wall-clock time of the three selection trials.
    std::vector<Solution> solutions;
    auto startSeq = std::chrono::high_resolution_clock::now();
    try {
        solutions = selector.selectCourses(req.candidates, req.constraints);
    } catch (const FormatError& e) {
        std::cerr << "Malformed course data: " << e.what() << "\n";
        return 1;
    } catch (const std::invalid_argument& e) {
        std::cerr << "Invalid request: " << e.what() << "\n";
        return 1;
    }
    auto endSeq = std::chrono::high_resolution_clock::now();
    double msSeq = std::chrono::duration<double, std::milli>(endSeq - startSeq).count();

    // High-level summary: scenario, pool size and how long the run took.
    std::cout << "========================================\n";
    std::cout << "SEQUENTIAL COURSE SELECTOR\n";
    std::cout << "Scenario: " << req.title << "\n";
    std::cout << "Candidates: " << req.candidates.size() << "\n";
    std::cout << "Seed: " << options.seed << "\n";
    std::cout << "Time: " << msSeq << " ms\n\n";

    printSolutions(std::cout, req.constraints, solutions);

    std::cout << "========================================\n";
    return 0;
}
