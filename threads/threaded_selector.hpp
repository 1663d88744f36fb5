#pragma once

///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "model.hpp"
#include "config.hpp"
#include "selector_base.hpp"
#include <vector>


///////////////////////////
///      SELECTORS      ///
///////////////////////////
/**
 * @brief Multithreaded course selector.
 *
 * Runs the selection trials of a request concurrently, at most `numThreads`
 * at a time. Trials share only the read-only request context; each owns its
 * generator, its greedy trial state and its backtracking path. Per-trial
 * seeds are drawn up front exactly as in SequentialSelector, so both
 * selectors return identical solutions for identical options.
 */
class ThreadedSelector : public ISelector {
public:
    /**
     * @brief Create a threaded selector.
     *
     * @param options    Trial counts, stage-A target, search budget and seed.
     * @param numThreads Maximum number of trials running at once (>= 1).
     */
    ThreadedSelector(const SelectorOptions& options, int numThreads);

    using ISelector::selectCourses;

    std::vector<Solution> selectCourses(const std::vector<RawCourse>& candidates,
                                        const Constraints& constraints) override;

private:
    SelectorOptions options_;
    int numThreads_; ///< Number of worker threads.

    /// Source of per-trial seeds.
    Rng rng_;
};
