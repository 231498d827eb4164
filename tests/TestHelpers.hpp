#pragma once
#include "MatrixBuilders.hpp"

#include <cmath>

inline bool nearlyEqual(const AffineMatrix& a, const AffineMatrix& b, double eps = 1e-9)
{
    for (int c = 0; c < 4; ++c)
        for (int r = 0; r < 4; ++r)
            if (std::fabs(a[c][r] - b[c][r]) > eps) return false;
    return true;
}

inline bool nearlyEqual(const Point3& a, const Point3& b, double eps = 1e-9)
{
    return std::fabs(a.x - b.x) <= eps && std::fabs(a.y - b.y) <= eps && std::fabs(a.z - b.z) <= eps;
}
