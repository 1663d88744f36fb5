#pragma once

///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "model.hpp"
#include <optional>
#include <string>
#include <vector>


///////////////////////////
///        DEMOS        ///
///////////////////////////
/**
 * @brief Built-in request scenarios used by the demo executables.
 */
enum class DemoScenario {
    BASIC,      ///< Three courses, two of them clashing, 6 credits.
    INFEASIBLE, ///< Same pool, 5 credits: no exact subset exists.
    FIELD,      ///< Basic pool plus two AI courses, AI preferred.
    BUSY,       ///< Basic pool with Monday morning blocked.
    CATALOGUE   ///< Semester-sized catalogue with both preferences and a busy schedule.
};

/**
 * @brief Candidate pool and request of one demo scenario.
 */
struct DemoRequest {
    std::string title; ///< Short description printed by the demos.
    std::vector<RawCourse> candidates; ///< Pool as delivered by the catalogue lookup.
    Constraints constraints; ///< Credit target, preferences and busy schedule.
};

/**
 * @brief Build the request for a scenario.
 */
DemoRequest makeDemoRequest(DemoScenario scenario);

/**
 * @brief Look up a scenario by its lower-case name ("basic", "catalogue", ...).
 */
std::optional<DemoScenario> parseDemoScenario(const std::string& name);
