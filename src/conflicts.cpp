///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "conflicts.hpp"
#include <algorithm>
#include <stdexcept>


///////////////////////////
///       OVERLAP       ///
///////////////////////////
bool intervalsOverlap(const std::vector<Interval>& a, const std::vector<Interval>& b) {
    for (const Interval& x : a) {
        for (const Interval& y : b) {
            int overlap = std::min(x.end, y.end) - std::max(x.start, y.start);
            if (overlap > 0) return true;
        }
    }
    return false;
}


///////////////////////////
///     CONFLICTS       ///
///////////////////////////
/**
 * @brief Compute the symmetric conflict matrix for a course pool.
 *
 * Only the upper triangle is evaluated; each result is mirrored into the
 * lower triangle.
 */
ConflictGraph::ConflictGraph(const std::vector<Course>& courses)
        : n_((int)courses.size()),
          matrix_((size_t)courses.size() * courses.size(), 0) {
    for (int i = 0; i < n_; ++i) {
        index_.emplace(courses[i].name, i);
        for (int j = i + 1; j < n_; ++j) {
            char overlap = intervalsOverlap(courses[i].intervals, courses[j].intervals) ? 1 : 0;
            matrix_[(size_t)i * n_ + j] = overlap;
            matrix_[(size_t)j * n_ + i] = overlap;
        }
    }
}

void ConflictGraph::checkIndex(int idx) const {
    if (idx < 0 || idx >= n_) {
        throw std::out_of_range("course index " + std::to_string(idx) + " not in conflict graph");
    }
}

bool ConflictGraph::conflicts(int a, int b) const {
    checkIndex(a);
    checkIndex(b);
    return matrix_[(size_t)a * n_ + b] != 0;
}

bool ConflictGraph::conflicts(const std::string& a, const std::string& b) const {
    return conflicts(indexOf(a), indexOf(b));
}

bool ConflictGraph::conflictsWithAny(int idx, const std::vector<int>& chosen) const {
    for (int other : chosen) {
        if (other != idx && conflicts(idx, other)) return true;
    }
    return false;
}

int ConflictGraph::indexOf(const std::string& name) const {
    auto it = index_.find(name);
    if (it == index_.end()) {
        throw std::out_of_range("course '" + name + "' not in conflict graph");
    }
    return it->second;
}
