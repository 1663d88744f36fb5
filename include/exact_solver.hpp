#pragma once

///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "model.hpp"
#include "conflicts.hpp"
#include <optional>
#include <vector>


///////////////////////////
///        TYPES        ///
///////////////////////////
/**
 * @brief Courses accepted on the current search path and their credit sum.
 *
 * Created and extended by value inside a single solveExact() call; never
 * stored in the solver.
 */
struct PartialSolution {
    std::vector<int> chosen; ///< Pool indices accepted so far, in path order.
    int credits = 0; ///< Sum of credits of `chosen`.
};


///////////////////////////
///       SOLVERS       ///
///////////////////////////
/**
 * @brief Depth-first search for a conflict-free subset with an exact credit sum.
 *
 * Candidates are visited in the given order. At every position the search
 * first tries to include the course, then to exclude it. A course that
 * conflicts with a course already on the path ends that branch. The search
 * is exponential in the number of candidates in the worst case; it is meant
 * to close the small credit gap left by the greedy stages.
 *
 * All search state lives in the call, so one solver object may serve
 * concurrent callers.
 */
class ExactBacktrackingSolver {
public:
    /**
     * @param courses  Normalized candidate pool.
     * @param graph    Conflict relation over the same pool.
     * @param maxSteps Maximum search nodes per call (0 = unlimited).
     */
    ExactBacktrackingSolver(const std::vector<Course>& courses,
                            const ConflictGraph& graph,
                            long long maxSteps = 0);

    /**
     * @brief Find courses among `candidates` whose credits sum to `targetCredits`.
     *
     * @return Pool indices of the subset, deepest search level first, or
     *         std::nullopt if none was found (or the step budget ran out).
     */
    std::optional<std::vector<int>> solveExact(const std::vector<int>& candidates,
                                               int targetCredits) const;

private:
    const std::vector<Course>& courses_;
    const ConflictGraph& graph_;
    long long maxSteps_;

    /// Per-call node counter.
    struct SearchBudget {
        long long limit;
        long long steps = 0;

        /// Count one node; false once the limit is exceeded.
        bool consume() { return limit <= 0 || ++steps <= limit; }
    };

    /**
     * @brief One level of the recursive search.
     *
     * @param candidates Candidate pool indices in search order.
     * @param target     Exact credit sum to reach.
     * @param partial    Path accepted above this level.
     * @param index      Position in `candidates` examined at this level.
     * @param budget     Node budget of the enclosing solveExact() call.
     */
    std::optional<std::vector<int>> search(const std::vector<int>& candidates,
                                           int target,
                                           const PartialSolution& partial,
                                           size_t index,
                                           SearchBudget& budget) const;
};
