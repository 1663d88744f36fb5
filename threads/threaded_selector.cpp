///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "threaded_selector.hpp"
#include "selection.hpp"
#include <algorithm>
#include <future>


///////////////////////////
///      SELECTORS      ///
///////////////////////////
ThreadedSelector::ThreadedSelector(const SelectorOptions& options, int numThreads)
        : options_(options),
          numThreads_(std::max(1, numThreads)),
          rng_(options.seed) {}

/**
 * @brief Prepare the request once, then run its trials on worker threads.
 *
 * Trials are launched in waves of at most numThreads_ async tasks. Results
 * are stored by trial index, so assembly sees them in the same order as the
 * sequential selector would. An exception thrown inside a trial is rethrown
 * here by future::get().
 */
std::vector<Solution> ThreadedSelector::selectCourses(const std::vector<RawCourse>& candidates,
                                                      const Constraints& constraints) {
    const SelectionContext ctx(candidates, constraints, options_);

    std::vector<std::uint32_t> seeds = drawTrialSeeds(rng_, options_.trials);
    std::vector<std::optional<std::vector<int>>> results(seeds.size());

    for (size_t waveStart = 0; waveStart < seeds.size(); waveStart += numThreads_) {
        size_t waveEnd = std::min(seeds.size(), waveStart + (size_t)numThreads_);

        std::vector<std::future<std::optional<std::vector<int>>>> tasks;
        for (size_t t = waveStart; t < waveEnd; ++t) {
            std::uint32_t seed = seeds[t];
            tasks.push_back(std::async(std::launch::async,
                                       [&ctx, seed]() { return ctx.runTrial(seed); }));
        }
        for (size_t i = 0; i < tasks.size(); ++i) {
            results[waveStart + i] = tasks[i].get();
        }
    }
    return ctx.assemble(results);
}
