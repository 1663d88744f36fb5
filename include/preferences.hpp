#pragma once

///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "model.hpp"
#include <set>
#include <string>
#include <vector>


///////////////////////////
///     PREFERENCES     ///
///////////////////////////
/**
 * @brief Course attribute a user preference applies to.
 */
enum class PreferenceSlot { FIELD, FORMAT };

/**
 * @brief Names of courses whose slot value contains any preference term.
 *
 * Matching is a case-insensitive substring test ("ai" matches "AI" and
 * "Applied AI"). An empty term set expresses no preference and yields an
 * empty result, not the whole pool. Blank terms are ignored.
 */
std::set<std::string> filterByPreference(const std::vector<Course>& courses,
                                         PreferenceSlot slot,
                                         const std::set<std::string>& terms);

/**
 * @brief Same filter with the slot given by name ("Field" / "Format").
 *
 * Any other slot name yields an empty set.
 */
std::set<std::string> filterByPreference(const std::vector<Course>& courses,
                                         const std::string& slot,
                                         const std::set<std::string>& terms);
