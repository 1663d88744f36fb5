///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "sequential_selector.hpp"
#include "selection.hpp"
#include <iostream>


///////////////////////////
///      SELECTORS      ///
///////////////////////////
SequentialSelector::SequentialSelector(const SelectorOptions& options)
        : options_(options), rng_(options.seed) {}

/**
 * @brief Prepare the request, run every trial in turn and assemble the
 * distinct solutions.
 */
std::vector<Solution> SequentialSelector::selectCourses(const std::vector<RawCourse>& candidates,
                                                        const Constraints& constraints) {
    SelectionContext ctx(candidates, constraints, options_);

    std::vector<std::uint32_t> seeds = drawTrialSeeds(rng_, options_.trials);

    std::vector<std::optional<std::vector<int>>> results;
    for (size_t t = 0; t < seeds.size(); ++t) {
        if (options_.verbose) std::cerr << "[select] trial " << t << "\n";
        results.push_back(ctx.runTrial(seeds[t]));
    }
    return ctx.assemble(results);
}
