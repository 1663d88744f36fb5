#pragma once

///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include <set>
#include <string>
#include <vector>


///////////////////////////
///       MODELS        ///
///////////////////////////
// Week axis: 7 days of 24h, measured in minutes since Monday 00:00.
static constexpr int DAYS_PER_WEEK = 7;
static constexpr int MINUTES_PER_DAY = 24 * 60;
static constexpr int MINUTES_PER_WEEK = DAYS_PER_WEEK * MINUTES_PER_DAY;

/**
 * @brief Busy period [start, end] on the weekly minute axis.
 *
 * Two intervals conflict when they share more than zero minutes, so
 * back-to-back intervals (10:30 end / 10:30 start) do not conflict.
 */
struct Interval {
    int start = 0; ///< Minutes since week start.
    int end = 0;   ///< Minutes since week start, always > start.
};

/**
 * @brief One parsed entry of a time pattern, kept for display.
 */
struct TimeSlot {
    std::string day;      ///< Normalized day token ("mon", "thur", ...).
    std::string duration; ///< Normalized clock range ("09:00-10:30").
    Interval interval;    ///< Absolute position on the week axis.
};

/**
 * @brief Course record as delivered by the upstream catalogue lookup.
 *
 * All fields are raw text; the credit may be an integer or a numeric
 * string and the dates follow the "<day>. <hh:mm>-<hh:mm>;..." pattern.
 */
struct RawCourse {
    std::string name;   ///< Unique course name.
    std::string credit; ///< Credit value as text (e.g. "6").
    std::string field;  ///< Study field (e.g. "Artificial Intelligence").
    std::string format; ///< Teaching format (e.g. "Lecture", "Seminar").
    std::string dates;  ///< Weekly time pattern.
};

/**
 * @brief Normalized, immutable candidate course.
 *
 * Built once per candidate pool from a RawCourse; all solver stages refer
 * to courses by their index in the normalized pool.
 */
struct Course {
    std::string name; ///< Unique course name.
    int credit = 0; ///< Positive credit value.
    std::string field; ///< Study field.
    std::string format; ///< Teaching format.
    std::vector<Interval> intervals; ///< Weekly occupation, in pattern order.
    std::vector<TimeSlot> slots; ///< Same occupation, with display text.
};

/**
 * @brief User request: exact credit target, optional preferences and
 * personal busy schedule.
 */
struct Constraints {
    int targetCredits = 0; ///< Exact total credits every solution must reach.
    std::set<std::string> fields; ///< Preferred study fields (may be empty).
    std::set<std::string> formats; ///< Preferred teaching formats (may be empty).
    std::string busySchedule; ///< User's own commitments as a time pattern (may be empty).
};

/**
 * @brief One selected course inside a solution, with presentation data.
 */
struct SolutionEntry {
    std::string name; ///< Course name.
    std::string timeInfo; ///< Display time, e.g. "mon. 09:00-10:30; wed. 09:00-10:30".
    std::vector<TimeSlot> slots; ///< Structured time entries behind timeInfo.
    int credit = 0; ///< Course credit.
};

/**
 * @brief Complete course selection whose credits sum exactly to the target.
 */
struct Solution {
    std::vector<SolutionEntry> entries; ///< Selected courses in candidate order.
    int totalCredits = 0; ///< Sum of entry credits (== Constraints::targetCredits).

    /// Names of all selected courses.
    std::set<std::string> names() const {
        std::set<std::string> out;
        for (const SolutionEntry& e : entries) out.insert(e.name);
        return out;
    }
};
