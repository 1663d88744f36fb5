#pragma once

///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "model.hpp"
#include <string>
#include <unordered_map>
#include <vector>


///////////////////////////
///       OVERLAP       ///
///////////////////////////
/**
 * @brief Check whether two interval sets share more than zero minutes.
 *
 * Intervals a and b overlap iff min(a.end, b.end) - max(a.start, b.start) > 0.
 */
bool intervalsOverlap(const std::vector<Interval>& a, const std::vector<Interval>& b);


///////////////////////////
///     CONFLICTS       ///
///////////////////////////
/**
 * @brief Precomputed pairwise time-conflict relation over a course pool.
 *
 * Built once per normalized candidate pool in O(n^2) interval comparisons,
 * then queried in O(1) by course index. The relation is stored as a full
 * symmetric matrix, so conflicts(a, b) == conflicts(b, a) holds by
 * construction. A course never conflicts with itself.
 */
class ConflictGraph {
public:
    /**
     * @brief Build the relation for the given pool.
     *
     * The pool must outlive the graph only for name lookups; the matrix
     * itself is computed eagerly.
     */
    explicit ConflictGraph(const std::vector<Course>& courses);

    /**
     * @brief Check whether courses at pool indices a and b overlap.
     *
     * @throws std::out_of_range if an index is outside the pool.
     */
    bool conflicts(int a, int b) const;

    /**
     * @brief Name-keyed lookup of the same relation.
     *
     * @throws std::out_of_range if a name does not belong to the pool.
     */
    bool conflicts(const std::string& a, const std::string& b) const;

    /**
     * @brief Check whether course `idx` overlaps any course in `chosen`.
     */
    bool conflictsWithAny(int idx, const std::vector<int>& chosen) const;

    /**
     * @brief Pool index of a course name.
     *
     * @throws std::out_of_range for unknown names.
     */
    int indexOf(const std::string& name) const;

    /// Number of courses covered by the relation.
    int size() const { return n_; }

private:
    int n_;

    /// matrix_[a * n_ + b] != 0 iff courses a and b overlap.
    std::vector<char> matrix_;

    /// Course name to pool index.
    std::unordered_map<std::string, int> index_;

    void checkIndex(int idx) const;
};
