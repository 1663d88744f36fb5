///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "greedy_selector.hpp"
#include <algorithm>


///////////////////////////
///       SELECTOR      ///
///////////////////////////
GreedyRandomizedSelector::GreedyRandomizedSelector(const std::vector<Course>& courses,
                                                   const ConflictGraph& graph,
                                                   int trials)
        : courses_(courses), graph_(graph), trials_(trials) {}

/**
 * @brief Run the shuffled greedy trials and keep the best one.
 */
GreedyResult GreedyRandomizedSelector::approximate(std::vector<int> candidates,
                                                   int targetCredits,
                                                   Rng& rng) const {
    GreedyResult best;
    if (candidates.empty()) return best;

    for (int t = 0; t < trials_; ++t) {
        std::shuffle(candidates.begin(), candidates.end(), rng);

        GreedyResult trial;
        for (int idx : candidates) {
            // Conflicts are checked against this trial's accepted courses only.
            if (graph_.conflictsWithAny(idx, trial.chosen)) continue;

            int credit = courses_[idx].credit;
            if (trial.credits + credit > targetCredits) break;

            trial.chosen.push_back(idx);
            trial.credits += credit;
        }

        if (trial.credits > best.credits) {
            best = trial;
        }
    }
    return best;
}
