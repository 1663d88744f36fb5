///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "selection.hpp"
#include "preferences.hpp"
#include "time_parser.hpp"
#include "text_utils.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <iostream>
#include <numeric>
#include <stdexcept>
#include <unordered_set>


///////////////////////////
///       HELPERS       ///
///////////////////////////
static int checkedTarget(int targetCredits) {
    if (targetCredits <= 0) {
        throw std::invalid_argument("target credits must be positive, got " +
                                    std::to_string(targetCredits));
    }
    return targetCredits;
}

static std::set<int> toIndices(const ConflictGraph& graph, const std::set<std::string>& names) {
    std::set<int> out;
    for (const std::string& n : names) out.insert(graph.indexOf(n));
    return out;
}

static void printIndices(const std::vector<Course>& courses, const std::vector<int>& indices) {
    std::cerr << "{";
    for (size_t i = 0; i < indices.size(); ++i) {
        if (i > 0) std::cerr << ", ";
        std::cerr << courses[indices[i]].name;
    }
    std::cerr << "}";
}


///////////////////////////
///    NORMALIZATION    ///
///////////////////////////
int parseCredit(const std::string& text) {
    std::string digits = trim(text);
    if (digits.empty()) {
        throw FormatError("credit value is empty");
    }
    bool numeric = std::all_of(digits.begin(), digits.end(),
                               [](unsigned char c) { return std::isdigit(c) != 0; });
    // More than 9 digits would not fit an int; no course is worth that much.
    if (!numeric || digits.size() > 9) {
        throw FormatError("credit value '" + text + "' is not an integer");
    }
    int credit = std::stoi(digits);
    if (credit <= 0) {
        throw FormatError("credit value '" + text + "' is not positive");
    }
    return credit;
}

std::vector<Course> normalizeCourses(const std::vector<RawCourse>& raw) {
    std::vector<Course> courses;
    std::unordered_set<std::string> seen;

    for (const RawCourse& r : raw) {
        if (!seen.insert(r.name).second) continue;

        Course c;
        c.name = r.name;
        c.field = r.field;
        c.format = r.format;
        try {
            c.credit = parseCredit(r.credit);
            c.slots = parseTimeSlots(r.dates, false);
        } catch (const FormatError& e) {
            throw FormatError("course '" + r.name + "': " + e.what());
        }
        for (const TimeSlot& s : c.slots) c.intervals.push_back(s.interval);
        courses.push_back(c);
    }
    return courses;
}

std::vector<Course> filterFeasibleCourses(const std::vector<Course>& courses,
                                          int targetCredits,
                                          const std::vector<Interval>& busy) {
    std::vector<Course> kept;
    for (const Course& c : courses) {
        if (c.credit > targetCredits) continue;
        if (intervalsOverlap(c.intervals, busy)) continue;
        kept.push_back(c);
    }
    return kept;
}

std::vector<std::uint32_t> drawTrialSeeds(Rng& master, int trials) {
    std::vector<std::uint32_t> seeds;
    for (int t = 0; t < trials; ++t) {
        seeds.push_back((std::uint32_t)master());
    }
    return seeds;
}


///////////////////////////
///      SELECTION      ///
///////////////////////////
/**
 * @brief Normalize the pool, drop busy-time clashes, build the conflict
 * graph and resolve the preference matches.
 */
SelectionContext::SelectionContext(const std::vector<RawCourse>& raw,
                                   const Constraints& constraints,
                                   const SelectorOptions& options)
        : targetCredits_(checkedTarget(constraints.targetCredits)),
          options_(options),
          courses_(filterFeasibleCourses(normalizeCourses(raw),
                                         targetCredits_,
                                         parseBusySchedule(constraints.busySchedule))),
          graph_(courses_),
          greedy_(courses_, graph_, options.greedyTrials),
          exact_(courses_, graph_, options.maxSearchSteps) {
    fieldMatches_ = toIndices(graph_, filterByPreference(courses_, PreferenceSlot::FIELD, constraints.fields));
    formatMatches_ = toIndices(graph_, filterByPreference(courses_, PreferenceSlot::FORMAT, constraints.formats));

    if (options_.verbose) {
        std::cerr << "[select] candidates=" << courses_.size() << " (of " << raw.size() << ")"
                  << " target=" << targetCredits_
                  << " fieldMatches=" << fieldMatches_.size()
                  << " formatMatches=" << formatMatches_.size() << "\n";
    }
}

std::optional<std::vector<int>> SelectionContext::runTrial(std::uint32_t seed) const {
    Rng rng(seed);
    std::vector<int> order(courses_.size());
    std::iota(order.begin(), order.end(), 0);
    std::shuffle(order.begin(), order.end(), rng);
    return selectOnce(order, rng);
}

/**
 * @brief Stage A (both preferences), stage B (either preference), stage C
 * (exact completion).
 *
 * Candidate lists of every stage keep the trial order given in `order`.
 */
std::optional<std::vector<int>> SelectionContext::selectOnce(const std::vector<int>& order, Rng& rng) const {
    // Stage A: courses matching both a preferred field and a preferred format.
    std::vector<int> interCandidates;
    for (int idx : order) {
        if (fieldMatches_.count(idx) && formatMatches_.count(idx)) interCandidates.push_back(idx);
    }
    int interTarget = std::max(options_.stageAMinimum,
                               (int)std::lround(options_.stageAFraction * targetCredits_));
    GreedyResult inter = greedy_.approximate(interCandidates, interTarget, rng);

    // Stage B: courses matching at least one preference, minus stage A's picks.
    // Courses clashing with a stage A pick can never join it and are left out.
    std::set<int> interChosen(inter.chosen.begin(), inter.chosen.end());
    std::vector<int> unionCandidates;
    for (int idx : order) {
        if (interChosen.count(idx)) continue;
        if (!fieldMatches_.count(idx) && !formatMatches_.count(idx)) continue;
        if (graph_.conflictsWithAny(idx, inter.chosen)) continue;
        unionCandidates.push_back(idx);
    }
    GreedyResult uni = greedy_.approximate(unionCandidates, std::max(0, targetCredits_ - inter.credits), rng);

    std::vector<int> chosen = inter.chosen;
    chosen.insert(chosen.end(), uni.chosen.begin(), uni.chosen.end());
    int remaining = targetCredits_ - inter.credits - uni.credits;

    if (options_.verbose) {
        std::cerr << "[select] stage A " << inter.credits << "/" << interTarget << " ";
        printIndices(courses_, inter.chosen);
        std::cerr << ", stage B " << uni.credits << " ";
        printIndices(courses_, uni.chosen);
        std::cerr << ", remaining " << remaining << "\n";
    }

    if (remaining == 0) return chosen;
    // Stage A may overshoot a target below its minimum; no exact completion exists then.
    if (remaining < 0) return std::nullopt;

    // Stage C: close the gap exactly from the courses not picked yet that fit
    // around the stage A and B picks.
    std::set<int> taken(chosen.begin(), chosen.end());
    std::vector<int> rest;
    for (int idx : order) {
        if (taken.count(idx) || graph_.conflictsWithAny(idx, chosen)) continue;
        rest.push_back(idx);
    }
    auto exact = exact_.solveExact(rest, remaining);
    if (!exact) {
        if (options_.verbose) std::cerr << "[select] stage C found no exact completion\n";
        return std::nullopt;
    }
    chosen.insert(chosen.end(), exact->begin(), exact->end());
    return chosen;
}

std::vector<Solution> SelectionContext::assemble(const std::vector<std::optional<std::vector<int>>>& results) const {
    std::vector<Solution> solutions;
    std::set<std::vector<int>> seen;

    for (const auto& result : results) {
        if (!result || result->empty()) continue;

        // Pool order gives a canonical form for duplicate detection and output.
        std::vector<int> sorted = *result;
        std::sort(sorted.begin(), sorted.end());
        if (!seen.insert(sorted).second) continue;

        Solution sol;
        for (int idx : sorted) {
            const Course& c = courses_[idx];
            sol.entries.push_back(SolutionEntry{c.name, formatTimeSlots(c.slots), c.slots, c.credit});
            sol.totalCredits += c.credit;
        }
        if (sol.totalCredits != targetCredits_) {
            if (options_.verbose) {
                std::cerr << "[select] discarding selection with " << sol.totalCredits << " credits\n";
            }
            continue;
        }
        bool clash = false;
        for (size_t i = 0; i < sorted.size() && !clash; ++i) {
            std::vector<int> earlier(sorted.begin(), sorted.begin() + i);
            clash = graph_.conflictsWithAny(sorted[i], earlier);
        }
        if (clash) {
            if (options_.verbose) std::cerr << "[select] discarding selection with a time conflict\n";
            continue;
        }
        solutions.push_back(sol);
    }
    return solutions;
}
