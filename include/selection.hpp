#pragma once

///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "model.hpp"
#include "config.hpp"
#include "conflicts.hpp"
#include "greedy_selector.hpp"
#include "exact_solver.hpp"
#include <cstdint>
#include <optional>
#include <set>
#include <vector>


///////////////////////////
///    NORMALIZATION    ///
///////////////////////////
/**
 * @brief Convert a credit given as text into a positive integer.
 *
 * @throws FormatError if the text is not a plain positive integer.
 */
int parseCredit(const std::string& text);

/**
 * @brief Turn upstream records into normalized courses.
 *
 * Parses every time pattern and credit; a later record with an already
 * seen name is dropped. Errors are reported with the course name.
 *
 * @throws FormatError for malformed dates or credits.
 */
std::vector<Course> normalizeCourses(const std::vector<RawCourse>& raw);

/**
 * @brief Keep the courses that fit under the credit target and do not
 * overlap the busy schedule, preserving their order.
 */
std::vector<Course> filterFeasibleCourses(const std::vector<Course>& courses,
                                          int targetCredits,
                                          const std::vector<Interval>& busy);

/**
 * @brief Draw one seed per trial from a selector's generator.
 *
 * Seeds are drawn before any trial runs so that sequential and concurrent
 * execution see the same per-trial streams.
 */
std::vector<std::uint32_t> drawTrialSeeds(Rng& master, int trials);


///////////////////////////
///      SELECTION      ///
///////////////////////////
/**
 * @brief Read-only state of one selection request.
 *
 * Holds the normalized and busy-filtered candidate pool, its conflict
 * graph, the preference matches and the two search stages built over them.
 * Trials only read from the context, so several trials may run on it at
 * the same time. The context refers to its own members and is therefore
 * neither copyable nor movable.
 */
class SelectionContext {
public:
    /**
     * @brief Prepare a request.
     *
     * @throws std::invalid_argument if constraints.targetCredits <= 0.
     * @throws FormatError for malformed course data or busy schedule.
     */
    SelectionContext(const std::vector<RawCourse>& raw,
                     const Constraints& constraints,
                     const SelectorOptions& options);

    SelectionContext(const SelectionContext&) = delete;
    SelectionContext& operator=(const SelectionContext&) = delete;

    /**
     * @brief One full trial: shuffle the pool order, then run selectOnce().
     *
     * @param seed Seed of the trial's private generator.
     * @return Pool indices of a complete selection, or std::nullopt.
     */
    std::optional<std::vector<int>> runTrial(std::uint32_t seed) const;

    /**
     * @brief Three-stage selection over candidates in the given order.
     *
     * Stage A approximates part of the target with courses matching both
     * preferences, stage B approximates the rest with courses matching at
     * least one preference, and stage C closes the remaining gap exactly
     * from the other candidates. Candidates clashing with an earlier stage's
     * picks are excluded from later stages. If stage C fails, the pass
     * yields nothing.
     *
     * @param order Pool indices in trial order.
     * @param rng   The trial's generator.
     */
    std::optional<std::vector<int>> selectOnce(const std::vector<int>& order, Rng& rng) const;

    /**
     * @brief Build the final solution list from per-trial results.
     *
     * Failed and empty results are dropped, results selecting the same set
     * of courses are kept once (first trial wins) and any result whose
     * credits do not sum exactly to the target, or that contains two
     * overlapping courses, is discarded.
     */
    std::vector<Solution> assemble(const std::vector<std::optional<std::vector<int>>>& results) const;

    const std::vector<Course>& courses() const { return courses_; }
    const ConflictGraph& graph() const { return graph_; }
    const std::set<int>& fieldMatches() const { return fieldMatches_; }
    const std::set<int>& formatMatches() const { return formatMatches_; }
    int targetCredits() const { return targetCredits_; }

private:
    int targetCredits_;
    SelectorOptions options_;

    // Declaration order matters: each member below is built from the ones above.
    std::vector<Course> courses_;
    ConflictGraph graph_;
    GreedyRandomizedSelector greedy_;
    ExactBacktrackingSolver exact_;

    std::set<int> fieldMatches_;  ///< Pool indices matching a preferred field.
    std::set<int> formatMatches_; ///< Pool indices matching a preferred format.
};
