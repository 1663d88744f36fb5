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
 * @brief Single-threaded course selector.
 *
 * Runs the three-stage selection trials one after another on the calling
 * thread. The selector owns a seeded generator; each request draws its
 * per-trial seeds from it, so two selectors built with the same options
 * return the same solutions for the same sequence of requests.
 */
class SequentialSelector : public ISelector {
public:
    /**
     * @brief Construct a sequential selector.
     *
     * @param options Trial counts, stage-A target, search budget and seed.
     */
    explicit SequentialSelector(const SelectorOptions& options = SelectorOptions());

    using ISelector::selectCourses;

    std::vector<Solution> selectCourses(const std::vector<RawCourse>& candidates,
                                        const Constraints& constraints) override;

private:
    SelectorOptions options_;

    /// Source of per-trial seeds.
    Rng rng_;
};
