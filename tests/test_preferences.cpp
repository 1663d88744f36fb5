// tests/test_preferences.cpp
// Tests for field/format preference matching.

#include "preferences.hpp"
#include "test_helpers.hpp"
#include <gtest/gtest.h>

class PreferenceFilterTest : public ::testing::Test {
protected:
    std::vector<Course> courses{
        makeCourse("Dialog Systems", 6, "tue. 09:45-11:15", "Artificial Intelligence", "Lecture"),
        makeCourse("Knowledge Graphs", 3, "wed. 11:30-13:00", "Artificial Intelligence", "Seminar"),
        makeCourse("Syntax Theory", 3, "thur. 11:30-13:00", "Computational Linguistics", "Seminar"),
        makeCourse("Statistics", 3, "mon. 11:30-13:00", "Mathematics", "Lecture"),
    };
};

TEST_F(PreferenceFilterTest, MatchesFieldSubstringCaseInsensitively) {
    auto m = filterByPreference(courses, PreferenceSlot::FIELD, {"intelligence"});
    EXPECT_EQ(m, (std::set<std::string>{"Dialog Systems", "Knowledge Graphs"}));
}

TEST_F(PreferenceFilterTest, AnyTermIsEnough) {
    auto m = filterByPreference(courses, PreferenceSlot::FIELD, {"LINGUISTICS", "math"});
    EXPECT_EQ(m, (std::set<std::string>{"Syntax Theory", "Statistics"}));
}

TEST_F(PreferenceFilterTest, MatchesFormat) {
    auto m = filterByPreference(courses, PreferenceSlot::FORMAT, {"seminar"});
    EXPECT_EQ(m, (std::set<std::string>{"Knowledge Graphs", "Syntax Theory"}));
}

TEST_F(PreferenceFilterTest, NoTermsMeansNoMatches) {
    EXPECT_TRUE(filterByPreference(courses, PreferenceSlot::FIELD, {}).empty());
    EXPECT_TRUE(filterByPreference(courses, PreferenceSlot::FORMAT, {}).empty());
}

TEST_F(PreferenceFilterTest, BlankTermsAreIgnored) {
    EXPECT_TRUE(filterByPreference(courses, PreferenceSlot::FIELD, {"", "  "}).empty());
    auto m = filterByPreference(courses, PreferenceSlot::FORMAT, {"", "lecture"});
    EXPECT_EQ(m, (std::set<std::string>{"Dialog Systems", "Statistics"}));
}

TEST_F(PreferenceFilterTest, UnmatchedTermGivesEmptySet) {
    EXPECT_TRUE(filterByPreference(courses, PreferenceSlot::FIELD, {"Chemistry"}).empty());
}

TEST_F(PreferenceFilterTest, SlotByName) {
    EXPECT_EQ(filterByPreference(courses, "Field", {"math"}),
              (std::set<std::string>{"Statistics"}));
    EXPECT_EQ(filterByPreference(courses, "format", {"seminar"}).size(), 2u);
    EXPECT_TRUE(filterByPreference(courses, "Semester", {"math"}).empty());
    EXPECT_TRUE(filterByPreference(courses, "", {"math"}).empty());
}
