#pragma once
#include <Eigen/Dense>
#include <algorithm>
#include <cmath>

namespace geom {

// Axis-aligned box centred at the origin, described by its per-axis half extent
struct CenteredBox {
    Eigen::Vector3f half_extent;

    float min_half() const noexcept { return half_extent.minCoeff(); }
    // Interior usable by a sphere of radius r
    bool contains(const Eigen::Vector3f& p, float r) const noexcept {
        for (int axis = 0; axis < 3; ++axis) {
            if (p[axis] > half_extent[axis] - r || p[axis] < -half_extent[axis] + r) return false;
        }
        return true;
    }
};

} // namespace geom
