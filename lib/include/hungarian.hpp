#ifndef HUNGARIAN_HPP
#define HUNGARIAN_HPP

#include <vector>

// Minimum-cost assignment (Kuhn-Munkres) for a rows x cols cost matrix. Rectangular input is
// padded to square internally.
//
// rowToCol receives, for each row, the assigned column or -1. Returns false without touching
// rowToCol when the matrix is ragged or holds NaN; +inf entries are allowed and never assigned.
bool solveAssignment(const std::vector<std::vector<double>>& cost, std::vector<int>& rowToCol);

#endif  // HUNGARIAN_HPP
