///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "formatting.hpp"
#include <algorithm>
#include <iomanip>
#include <string>

///////////////////////////
///       HELPERS       ///
///////////////////////////

/**
 * @brief Width of the course-name column: the longest name, at least 12.
 */
static size_t nameColumnWidth(const Solution& sol) {
    size_t width = 12;
    for (const SolutionEntry& e : sol.entries) {
        width = std::max(width, e.name.size());
    }
    return width;
}

/**
 * @brief Print the header row of a solution table.
 *
 * Uses fixed-width columns to align course, credits and time.
 */
static void printSolutionTableHeader(std::ostream& out, size_t nameWidth) {
    out << "    "
        << std::left << std::setw((int)nameWidth) << "Course"
        << " | " << std::left << std::setw(7) << "Credits"
        << " | " << "Time"
        << "\n";

    // Underline with a matching ASCII separator line.
    out << "    "
        << std::string(nameWidth, '-')
        << "-+-" << std::string(7, '-')
        << "-+-" << std::string(24, '-')
        << "\n";
}

/**
 * @brief Print every solution as a small table of its courses.
 *
 * Prints the apology line of the presentation layer when the list is
 * empty; otherwise one numbered table per solution with the course name,
 * its credits and its weekly time.
 */
void printSolutions(std::ostream& out, const Constraints& constraints, const std::vector<Solution>& solutions) {
    if (solutions.empty()) {
        out << "No selection reaches exactly " << constraints.targetCredits
            << " credits. Try again with fewer credits.\n";
        return;
    }

    out << "To get " << constraints.targetCredits << " credits, you may choose "
        << (solutions.size() == 1 ? "this selection" : "one of these selections") << ":\n";

    for (size_t i = 0; i < solutions.size(); ++i) {
        const Solution& sol = solutions[i];
        size_t nameWidth = nameColumnWidth(sol);

        out << "----------------------------------------\n";
        out << "Option " << (i + 1) << " (" << sol.totalCredits << " credits, "
            << sol.entries.size() << (sol.entries.size() == 1 ? " course" : " courses") << "):\n";
        printSolutionTableHeader(out, nameWidth);

        for (const SolutionEntry& e : sol.entries) {
            out << "    "
                << std::left << std::setw((int)nameWidth) << e.name
                << " | " << std::left << std::setw(7) << e.credit
                << " | " << e.timeInfo
                << "\n";
        }
        out << "\n";
    }
}
