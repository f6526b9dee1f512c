#include "BoundaryCollision.h"

uint8_t BoundaryCollision::resolve(Eigen::Vector3f& pos, Eigen::Vector3f& vel,
                                   const geom::CenteredBox& box, float radius) {
    uint8_t mask = Axis_None;
    for (int axis = 0; axis < 3; ++axis) {
        const float limit = box.half_extent[axis] - radius;
        if (pos[axis] + radius > box.half_extent[axis]) {
            pos[axis] = limit;
            vel[axis] = -vel[axis];
            mask |= static_cast<uint8_t>(1u << axis);
        } else if (pos[axis] - radius < -box.half_extent[axis]) {
            pos[axis] = -limit;
            vel[axis] = -vel[axis];
            mask |= static_cast<uint8_t>(1u << axis);
        }
    }
    return mask;
}
