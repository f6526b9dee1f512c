#pragma once
#include "Bounds.hpp"
#include <Eigen/Dense>
#include <cstdint>

// Box containment for one particle. Each axis is resolved on its own.
class BoundaryCollision {
public:
    enum AxisBits : uint8_t {
        Axis_None = 0u,
        Axis_X    = 1u << 0,
        Axis_Y    = 1u << 1,
        Axis_Z    = 1u << 2,
    };

    // Clamps `pos` to [-half + r, half - r] and negates the velocity component
    // of every axis that was clamped. Returns the mask of clamped axes.
    static uint8_t resolve(Eigen::Vector3f& pos, Eigen::Vector3f& vel,
                           const geom::CenteredBox& box, float radius);

    // Recolor policy: at most once per step, never for a selected particle
    static bool should_recolor(uint8_t hit_mask, bool selected, bool recolor_enabled) {
        return hit_mask != Axis_None && !selected && recolor_enabled;
    }
};
