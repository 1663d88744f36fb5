///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "threaded_selector.hpp"
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
 * @brief Demo entry point for the threaded course selector.
 *
 * Usage: threaded_demo [scenario] [seed]
 * Same request as the sequential demo, with the selection trials running
 * concurrently on worker threads.
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

    // One worker per trial.
    int numThreads = options.trials;
    DemoRequest req = makeDemoRequest(*scenario);
    ThreadedSelector selector(options, numThreads);

    // Measure wall-clock time for the threaded selector.
    std::vector<Solution> solutions;
    auto startThr = std::chrono::high_resolution_clock::now();
    try {
        solutions = selector.selectCourses(req.candidates, req.constraints);
    } catch (const FormatError& e) {
        std::cerr << "Malformed course data: " << e.what() << "\n";
        return 1;
    } catch (const std::invalid_argument& e) {
        std::cerr << "Invalid request: " << e.what() << "\n";
        return 1;
    }
    auto endThr = std::chrono::high_resolution_clock::now();
    double msThr = std::chrono::duration<double, std::milli>(endThr - startThr).count();

    // High-level run summary.
    std::cout << "========================================\n";
    std::cout << "THREADED COURSE SELECTOR\n";
    std::cout << "Scenario: " << req.title << "\n";
    std::cout << "Candidates: " << req.candidates.size() << "\n";
    std::cout << "Threads: " << numThreads << "\n";
    std::cout << "Seed: " << options.seed << "\n";
    std::cout << "Time: " << msThr << " ms\n\n";

    printSolutions(std::cout, req.constraints, solutions);

    std::cout << "========================================\n";
    return 0;
}
