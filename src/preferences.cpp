///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "preferences.hpp"
#include "text_utils.hpp"


///////////////////////////
///     PREFERENCES     ///
///////////////////////////
std::set<std::string> filterByPreference(const std::vector<Course>& courses,
                                         PreferenceSlot slot,
                                         const std::set<std::string>& terms) {
    std::set<std::string> matches;
    if (terms.empty()) return matches;

    std::vector<std::string> lowered;
    for (const std::string& t : terms) {
        if (!isBlank(t)) lowered.push_back(toLower(t));
    }

    for (const Course& c : courses) {
        std::string value = toLower(slot == PreferenceSlot::FIELD ? c.field : c.format);
        for (const std::string& t : lowered) {
            if (value.find(t) != std::string::npos) {
                matches.insert(c.name);
                break;
            }
        }
    }
    return matches;
}

std::set<std::string> filterByPreference(const std::vector<Course>& courses,
                                         const std::string& slot,
                                         const std::set<std::string>& terms) {
    std::string key = toLower(slot);
    if (key == "field") return filterByPreference(courses, PreferenceSlot::FIELD, terms);
    if (key == "format") return filterByPreference(courses, PreferenceSlot::FORMAT, terms);
    return {};
}
