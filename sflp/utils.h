// utils.h
// Small numeric helpers shared by the Benders components

#ifndef SFLP_UTILS_H
#define SFLP_UTILS_H

#include <cmath>
#include <cstddef>
#include <numeric>
#include <vector>

// Row-major access into a flattened 2D array
inline size_t idx2(size_t i, size_t j, size_t ncols) { return i * ncols + j; }

// Absolute-tolerance comparison
inline bool is_close(double x, double y = 0.0, double tol = 1e-12)
{
    return std::abs(x - y) <= tol;
}

inline double dot(const std::vector<double> &a, const std::vector<double> &b)
{
    double s = 0.0;
    for (size_t i = 0; i < a.size(); ++i)
        s += a[i] * b[i];
    return s;
}

inline std::vector<int> range_int(int n)
{
    std::vector<int> v(n);
    std::iota(v.begin(), v.end(), 0);
    return v;
}

#endif // SFLP_UTILS_H
