// tests/test_time_parser.cpp
// Tests for weekly time-pattern parsing and formatting.

#include "time_parser.hpp"
#include <gtest/gtest.h>

// =============================================================================
// Clock and day tokens
// =============================================================================

TEST(ClockToMinutes, ParsesPaddedAndUnpaddedHours) {
    EXPECT_EQ(clockToMinutes("09:00"), 540);
    EXPECT_EQ(clockToMinutes("9:00"), 540);
    EXPECT_EQ(clockToMinutes(" 11:30 "), 690);
    EXPECT_EQ(clockToMinutes("00:00"), 0);
    EXPECT_EQ(clockToMinutes("24:00"), 1440);
}

TEST(ClockToMinutes, RejectsMalformedValues) {
    EXPECT_THROW(clockToMinutes("9am"), FormatError);
    EXPECT_THROW(clockToMinutes("09"), FormatError);
    EXPECT_THROW(clockToMinutes("09:00:00"), FormatError);
    EXPECT_THROW(clockToMinutes("ab:cd"), FormatError);
    EXPECT_THROW(clockToMinutes("09:60"), FormatError);
    EXPECT_THROW(clockToMinutes("25:00"), FormatError);
    EXPECT_THROW(clockToMinutes("24:30"), FormatError);
    EXPECT_THROW(clockToMinutes(""), FormatError);
}

TEST(DayIndex, MapsAllDaysCaseInsensitively) {
    EXPECT_EQ(dayIndex("mon"), 0);
    EXPECT_EQ(dayIndex("TUE"), 1);
    EXPECT_EQ(dayIndex("Wed"), 2);
    EXPECT_EQ(dayIndex("thur"), 3);
    EXPECT_EQ(dayIndex("fri"), 4);
    EXPECT_EQ(dayIndex("sat"), 5);
    EXPECT_EQ(dayIndex("sun"), 6);
    EXPECT_THROW(dayIndex("monday"), FormatError);
    EXPECT_THROW(dayIndex("xyz"), FormatError);
}

// =============================================================================
// Patterns
// =============================================================================

TEST(ParseTimePattern, SingleEntryUsesMinutesSinceWeekStart) {
    auto iv = parseTimePattern("mon. 09:00-10:30");
    ASSERT_EQ(iv.size(), 1u);
    EXPECT_EQ(iv[0].start, 540);
    EXPECT_EQ(iv[0].end, 630);
}

TEST(ParseTimePattern, DayOffsetIsOneDayOfMinutes) {
    auto iv = parseTimePattern("tue. 9:00-11:30");
    ASSERT_EQ(iv.size(), 1u);
    EXPECT_EQ(iv[0].start, 1440 + 540);
    EXPECT_EQ(iv[0].end, 1440 + 690);

    auto sun = parseTimePattern("sun. 23:00-24:00");
    ASSERT_EQ(sun.size(), 1u);
    EXPECT_EQ(sun[0].start, 6 * 1440 + 1380);
    EXPECT_EQ(sun[0].end, MINUTES_PER_WEEK);
}

TEST(ParseTimePattern, MultipleEntriesKeepOrder) {
    auto iv = parseTimePattern("Mon. 09:00-10:30; WED. 14:00-15:30");
    ASSERT_EQ(iv.size(), 2u);
    EXPECT_EQ(iv[0].start, 540);
    EXPECT_EQ(iv[0].end, 630);
    EXPECT_EQ(iv[1].start, 2 * 1440 + 840);
    EXPECT_EQ(iv[1].end, 2 * 1440 + 930);
}

TEST(ParseTimePattern, BlankSegmentsAreSkipped) {
    auto iv = parseTimePattern("mon. 09:00-10:30; ;");
    EXPECT_EQ(iv.size(), 1u);
}

TEST(ParseTimePattern, RejectsMalformedEntries) {
    EXPECT_THROW(parseTimePattern("mon 09:00-10:30"), FormatError);
    EXPECT_THROW(parseTimePattern("xyz. 09:00-10:30"), FormatError);
    EXPECT_THROW(parseTimePattern("mon. 09:00"), FormatError);
    EXPECT_THROW(parseTimePattern("mon. 9am-10:30"), FormatError);
    EXPECT_THROW(parseTimePattern("mon. 10:30-09:00"), FormatError);
    EXPECT_THROW(parseTimePattern("mon. 10:30-10:30"), FormatError);
}

TEST(ParseTimePattern, OneBadEntryFailsTheWholePattern) {
    EXPECT_THROW(parseTimePattern("mon. 09:00-10:30; wed 09:00-10:30"), FormatError);
}

TEST(ParseTimePattern, CoursePatternMustNotBeEmpty) {
    EXPECT_THROW(parseTimePattern(""), FormatError);
    EXPECT_THROW(parseTimePattern("  ; "), FormatError);
}

TEST(ParseBusySchedule, EmptyScheduleHasNoIntervals) {
    EXPECT_TRUE(parseBusySchedule("").empty());
    EXPECT_TRUE(parseBusySchedule("   ").empty());
    EXPECT_EQ(parseBusySchedule("fri. 13:00-18:00").size(), 1u);
    EXPECT_THROW(parseBusySchedule("fri 13:00-18:00"), FormatError);
}

TEST(FormatError, IsARuntimeError) {
    try {
        parseTimePattern("mon 09:00-10:30");
        FAIL() << "expected FormatError";
    } catch (const std::runtime_error& e) {
        EXPECT_NE(std::string(e.what()).find("mon 09:00-10:30"), std::string::npos);
    }
}

// =============================================================================
// Display slots
// =============================================================================

TEST(ParseTimeSlots, NormalizesDisplayText) {
    auto slots = parseTimeSlots("Tue. 9:00-11:30;THUR.14:00 - 15:30");
    ASSERT_EQ(slots.size(), 2u);
    EXPECT_EQ(slots[0].day, "tue");
    EXPECT_EQ(slots[0].duration, "09:00-11:30");
    EXPECT_EQ(slots[1].day, "thur");
    EXPECT_EQ(slots[1].duration, "14:00-15:30");
    EXPECT_EQ(slots[1].interval.start, 3 * 1440 + 840);
}

TEST(FormatTimeSlots, JoinsEntriesWithSemicolons) {
    auto slots = parseTimeSlots("mon. 9:00-10:30; wed. 09:00-10:30");
    EXPECT_EQ(formatTimeSlots(slots), "mon. 09:00-10:30; wed. 09:00-10:30");
    EXPECT_EQ(formatTimeSlots({}), "");
}
