///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "time_parser.hpp"
#include "text_utils.hpp"
#include <algorithm>
#include <array>
#include <cctype>
#include <iomanip>
#include <sstream>


///////////////////////////
///       HELPERS       ///
///////////////////////////
/**
 * @brief Day tokens in week order; the index is the day offset multiplier.
 */
static const std::array<std::string, DAYS_PER_WEEK> kDayTokens = {
        "mon", "tue", "wed", "thur", "fri", "sat", "sun"
};

static bool allDigits(const std::string& s) {
    if (s.empty() || s.size() > 2) return false;
    return std::all_of(s.begin(), s.end(), [](unsigned char c) { return std::isdigit(c) != 0; });
}

static std::string formatClock(int minutes) {
    std::ostringstream out;
    out << std::setw(2) << std::setfill('0') << minutes / 60
        << ':' << std::setw(2) << std::setfill('0') << minutes % 60;
    return out.str();
}


///////////////////////////
///       PARSING       ///
///////////////////////////
int dayIndex(const std::string& token) {
    std::string day = toLower(trim(token));
    for (int i = 0; i < DAYS_PER_WEEK; ++i) {
        if (kDayTokens[i] == day) return i;
    }
    throw FormatError("unknown day '" + token + "'");
}

int clockToMinutes(const std::string& clock) {
    std::string value = trim(clock);
    size_t colon = value.find(':');
    if (colon == std::string::npos || value.find(':', colon + 1) != std::string::npos) {
        throw FormatError("clock value '" + clock + "' is not hh:mm");
    }

    std::string hh = trim(value.substr(0, colon));
    std::string mm = trim(value.substr(colon + 1));
    if (!allDigits(hh) || !allDigits(mm)) {
        throw FormatError("clock value '" + clock + "' is not hh:mm");
    }

    int hours = std::stoi(hh);
    int minutes = std::stoi(mm);
    // 24:00 is accepted as end of day, anything past it is not.
    if (minutes > 59 || hours > 24 || (hours == 24 && minutes != 0)) {
        throw FormatError("clock value '" + clock + "' is out of range");
    }
    return hours * 60 + minutes;
}

/**
 * @brief Parse every ';'-separated entry of a time pattern.
 *
 * Entries are lower-cased and split on the first '.' into day and clock
 * range; the clock range is split on '-' into start and end.
 */
std::vector<TimeSlot> parseTimeSlots(const std::string& pattern, bool allowEmpty) {
    std::vector<TimeSlot> slots;

    std::stringstream ss(pattern);
    std::string entry;
    while (std::getline(ss, entry, ';')) {
        entry = toLower(trim(entry));
        if (entry.empty()) continue;

        size_t dot = entry.find('.');
        if (dot == std::string::npos) {
            throw FormatError("time entry '" + entry + "' has no '.' between day and time");
        }
        std::string day = trim(entry.substr(0, dot));
        std::string duration = trim(entry.substr(dot + 1));

        size_t dash = duration.find('-');
        if (dash == std::string::npos || duration.find('-', dash + 1) != std::string::npos) {
            throw FormatError("time entry '" + entry + "' has no hh:mm-hh:mm range");
        }

        int dayIdx = dayIndex(day);
        int offset = dayIdx * MINUTES_PER_DAY;
        int start = clockToMinutes(duration.substr(0, dash));
        int end = clockToMinutes(duration.substr(dash + 1));
        if (end <= start) {
            throw FormatError("time entry '" + entry + "' ends before it starts");
        }

        TimeSlot slot;
        slot.day = kDayTokens[dayIdx];
        slot.duration = formatClock(start) + "-" + formatClock(end);
        slot.interval = Interval{offset + start, offset + end};
        slots.push_back(slot);
    }

    if (slots.empty() && !allowEmpty) {
        throw FormatError("time pattern '" + pattern + "' has no entries");
    }
    return slots;
}

std::vector<Interval> parseTimePattern(const std::string& pattern) {
    std::vector<Interval> intervals;
    for (const TimeSlot& s : parseTimeSlots(pattern, false)) {
        intervals.push_back(s.interval);
    }
    return intervals;
}

std::vector<Interval> parseBusySchedule(const std::string& pattern) {
    std::vector<Interval> intervals;
    for (const TimeSlot& s : parseTimeSlots(pattern, true)) {
        intervals.push_back(s.interval);
    }
    return intervals;
}

std::string formatTimeSlots(const std::vector<TimeSlot>& slots) {
    std::string out;
    for (size_t i = 0; i < slots.size(); ++i) {
        if (i > 0) out += "; ";
        out += slots[i].day + ". " + slots[i].duration;
    }
    return out;
}
