#include "hungarian.hpp"

#include <algorithm>
#include <cmath>
#include <limits>

using namespace std;

bool solveAssignment(const vector<vector<double>>& cost, vector<int>& rowToCol) {
    const int rows = static_cast<int>(cost.size());
    const int cols = rows > 0 ? static_cast<int>(cost[0].size()) : 0;

    double maxFinite = 0.0;
    for (const auto& row : cost) {
        if (static_cast<int>(row.size()) != cols) return false;
        for (double c : row) {
            if (std::isnan(c)) return false;
            if (std::isfinite(c)) maxFinite = std::max(maxFinite, std::abs(c));
        }
    }

    if (rows == 0 || cols == 0) {
        rowToCol.assign(rows, -1);
        return true;
    }

    // Forbidden pairs become a cost no real assignment can reach; padding costs nothing.
    const int n = std::max(rows, cols);
    const double forbidden = (maxFinite + 1.0) * (n + 1);
    vector<vector<double>> square(n, vector<double>(n, 0.0));
    for (int i = 0; i < rows; ++i) {
        for (int j = 0; j < cols; ++j) {
            square[i][j] = std::isfinite(cost[i][j]) ? cost[i][j] : forbidden;
        }
    }

    vector<double> u(n + 1, 0.0), v(n + 1, 0.0);
    vector<int> p(n + 1, 0), way(n + 1, 0);
    for (int i = 1; i <= n; ++i) {
        p[0] = i;
        int j0 = 0;
        vector<double> minv(n + 1, numeric_limits<double>::infinity());
        vector<char> used(n + 1, false);
        do {
            used[j0] = true;
            int i0 = p[j0], j1 = 0;
            double delta = numeric_limits<double>::infinity();
            for (int j = 1; j <= n; ++j) {
                if (used[j]) continue;
                double cur = square[i0 - 1][j - 1] - u[i0] - v[j];
                if (cur < minv[j]) {
                    minv[j] = cur;
                    way[j] = j0;
                }
                if (minv[j] < delta) {
                    delta = minv[j];
                    j1 = j;
                }
            }
            for (int j = 0; j <= n; ++j) {
                if (used[j]) {
                    u[p[j]] += delta;
                    v[j] -= delta;
                } else {
                    minv[j] -= delta;
                }
            }
            j0 = j1;
        } while (p[j0] != 0);
        do {
            int j1 = way[j0];
            p[j0] = p[j1];
            j0 = j1;
        } while (j0);
    }

    rowToCol.assign(rows, -1);
    for (int j = 1; j <= n; ++j) {
        int row = p[j] - 1;
        int col = j - 1;
        if (row >= 0 && row < rows && col < cols && std::isfinite(cost[row][col])) {
            rowToCol[row] = col;
        }
    }
    return true;
}
