#pragma once

///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include <cstdint>
#include <random>


///////////////////////////
///       CONFIG        ///
///////////////////////////
/// Pseudo-random source used for every shuffle; always passed explicitly.
using Rng = std::mt19937;

/**
 * @brief Tunable parameters of a course selector.
 *
 * Defaults: three trials, ten greedy shuffles, stage A aiming at half the
 * target (at least 3 credits) and no limit on the exact search.
 */
struct SelectorOptions {
    std::uint32_t seed = 5489u; ///< Seed of the selector's generator.
    int trials = 3; ///< Full pipeline passes per request (max distinct solutions).
    int greedyTrials = 10; ///< Shuffles per greedy approximation.
    int stageAMinimum = 3; ///< Lower bound of the stage-A credit target.
    double stageAFraction = 0.5; ///< Share of the target aimed at in stage A.

    /**
     * Maximum number of search nodes the exact solver may visit per call;
     * 0 disables the limit. An exhausted budget is reported as "no solution".
     */
    long long maxSearchSteps = 0;

    bool verbose = false; ///< Print per-trial stage summaries to std::cerr.
};
