#pragma once

///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "model.hpp"
#include "config.hpp"
#include <string>
#include <vector>


///////////////////////////
///      INTERFACE      ///
///////////////////////////
/**
 * @brief Common interface for course selectors.
 *
 * Implementations may run their trials sequentially or on several threads,
 * but all expose the same selectCourses() contract and, for the same
 * options and inputs, return the same solutions.
 */
class ISelector {
public:
    virtual ~ISelector() = default;

    /**
     * @brief Select up to `trials` distinct course sets meeting the constraints.
     *
     * Every returned solution sums exactly to constraints.targetCredits, has
     * no two overlapping courses and does not overlap the busy schedule. An
     * empty list means no such selection was found.
     *
     * @throws std::invalid_argument if the target is not positive.
     * @throws FormatError for malformed course data or busy schedule.
     */
    virtual std::vector<Solution> selectCourses(const std::vector<RawCourse>& candidates,
                                                const Constraints& constraints) = 0;

    /**
     * @brief Same as above with the busy schedule given separately.
     *
     * Overrides constraints.busySchedule.
     */
    std::vector<Solution> selectCourses(const std::vector<RawCourse>& candidates,
                                        const Constraints& constraints,
                                        const std::string& busySchedule) {
        Constraints withBusy = constraints;
        withBusy.busySchedule = busySchedule;
        return selectCourses(candidates, withBusy);
    }
};
