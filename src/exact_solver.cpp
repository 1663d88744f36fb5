///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "exact_solver.hpp"


///////////////////////////
///       SOLVERS       ///
///////////////////////////
ExactBacktrackingSolver::ExactBacktrackingSolver(const std::vector<Course>& courses,
                                                 const ConflictGraph& graph,
                                                 long long maxSteps)
        : courses_(courses), graph_(graph), maxSteps_(maxSteps) {}

/**
 * @brief Start the recursive search from an empty path.
 *
 * A non-positive target can never be met by positive credits and fails
 * without searching.
 */
std::optional<std::vector<int>> ExactBacktrackingSolver::solveExact(const std::vector<int>& candidates,
                                                                    int targetCredits) const {
    if (targetCredits <= 0) return std::nullopt;

    SearchBudget budget{maxSteps_};
    PartialSolution empty;
    return search(candidates, targetCredits, empty, 0, budget);
}

/**
 * @brief Include-then-exclude recursion over candidates[index..].
 *
 * On success the returned list holds the course found at the deepest level
 * first; every level appends its own course while unwinding.
 */
std::optional<std::vector<int>> ExactBacktrackingSolver::search(const std::vector<int>& candidates,
                                                                int target,
                                                                const PartialSolution& partial,
                                                                size_t index,
                                                                SearchBudget& budget) const {
    if (!budget.consume()) return std::nullopt;

    // Ran out of candidates without an exact match.
    if (index >= candidates.size()) return std::nullopt;

    int cur = candidates[index];

    // A course clashing with the current path prunes the whole branch.
    if (graph_.conflictsWithAny(cur, partial.chosen)) return std::nullopt;

    // Option 1: include the current course.
    int withCur = partial.credits + courses_[cur].credit;
    if (withCur == target) {
        return std::vector<int>{cur};
    }
    // Credits are positive, so an overshoot can never come back to the target.
    if (withCur < target) {
        PartialSolution next = partial;
        next.chosen.push_back(cur);
        next.credits = withCur;
        auto found = search(candidates, target, next, index + 1, budget);
        if (found) {
            found->push_back(cur);
            return found;
        }
    }

    // Option 2: skip the current course.
    return search(candidates, target, partial, index + 1, budget);
}
