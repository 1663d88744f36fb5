#pragma once

///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "model.hpp"
#include <stdexcept>
#include <string>
#include <vector>


///////////////////////////
///       ERRORS        ///
///////////////////////////
/**
 * @brief Raised for malformed time patterns and credit values.
 */
class FormatError : public std::runtime_error {
public:
    explicit FormatError(const std::string& what) : std::runtime_error(what) {}
};


///////////////////////////
///       PARSING       ///
///////////////////////////
/**
 * @brief Map a day token ("mon", "TUE", "thur", ...) to its 0-based index.
 *
 * @throws FormatError for tokens outside mon/tue/wed/thur/fri/sat/sun.
 */
int dayIndex(const std::string& token);

/**
 * @brief Convert a clock value "hh:mm" (or "h:mm") to minutes since midnight.
 *
 * @throws FormatError if the value is not two integer fields separated by ':'
 *         or lies outside 00:00..24:00.
 */
int clockToMinutes(const std::string& clock);

/**
 * @brief Parse a weekly time pattern into display slots.
 *
 * The pattern is one or more ';'-separated entries "<day>. <hh:mm>-<hh:mm>".
 * Each entry becomes one TimeSlot whose interval is
 * [day * MINUTES_PER_DAY + start, day * MINUTES_PER_DAY + end].
 * Blank segments are skipped. No partial result is ever returned: the first
 * malformed entry aborts the whole parse.
 *
 * @param pattern       Time pattern text.
 * @param allowEmpty    If false, a pattern with no entries is a FormatError.
 * @throws FormatError on a missing '.' separator, unknown day, bad clock
 *         field or an entry whose end is not after its start.
 */
std::vector<TimeSlot> parseTimeSlots(const std::string& pattern, bool allowEmpty = false);

/**
 * @brief Parse a course time pattern into intervals (at least one).
 */
std::vector<Interval> parseTimePattern(const std::string& pattern);

/**
 * @brief Parse the user's busy schedule; an empty pattern means "no commitments".
 */
std::vector<Interval> parseBusySchedule(const std::string& pattern);

/**
 * @brief Render slots back as "mon. 09:00-10:30; wed. 09:00-10:30".
 */
std::string formatTimeSlots(const std::vector<TimeSlot>& slots);
