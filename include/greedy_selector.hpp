#pragma once

///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "model.hpp"
#include "conflicts.hpp"
#include "config.hpp"
#include <vector>


///////////////////////////
///        TYPES        ///
///////////////////////////
/**
 * @brief Outcome of a greedy approximation.
 */
struct GreedyResult {
    int credits = 0; ///< Credits reached by the chosen courses (<= target).
    std::vector<int> chosen; ///< Pool indices of the chosen courses, in acceptance order.
};


///////////////////////////
///       SELECTOR      ///
///////////////////////////
/**
 * @brief Randomized greedy approximation of a credit target.
 *
 * Each trial shuffles the candidates and walks them in that order,
 * accepting a course when it does not conflict with the courses accepted
 * so far in the trial and still fits under the target. The walk stops at
 * the first course that does not fit, which makes the result depend on the
 * order; several shuffled trials are therefore taken and the best kept.
 *
 * The selector holds only read-only references, so one instance can be
 * used from several threads as long as each passes its own generator.
 */
class GreedyRandomizedSelector {
public:
    /**
     * @param courses Normalized candidate pool (indices refer into it).
     * @param graph   Conflict relation over the same pool.
     * @param trials  Number of shuffled trials per approximation.
     */
    GreedyRandomizedSelector(const std::vector<Course>& courses,
                             const ConflictGraph& graph,
                             int trials = 10);

    /**
     * @brief Approximate `targetCredits` using courses from `candidates`.
     *
     * Returns the trial with the highest credit sum, ties going to the
     * earliest trial. Empty candidates give {0, {}} without touching `rng`.
     *
     * @param candidates    Pool indices to choose from (copied, then shuffled).
     * @param targetCredits Upper bound for the credit sum.
     * @param rng           Generator driving the shuffles.
     */
    GreedyResult approximate(std::vector<int> candidates, int targetCredits, Rng& rng) const;

private:
    const std::vector<Course>& courses_;
    const ConflictGraph& graph_;
    int trials_;
};
