#pragma once
#include <cstdint>
#include "apps/nav/Geometry.hpp"

namespace nav {

enum class MatSide : uint8_t {
    LEFT = 0,
    RIGHT = 1,
};

// Human placement: "fromBottomMm from the bottom edge, fromSideMm from the
// left/right edge, facing headingDeg".
struct EdgeOffsets {
    MatSide side = MatSide::LEFT;
    double fromBottomMm = 0.0;
    double fromSideMm = 0.0;
    double headingDeg = 0.0;
};

// Edge offsets -> world pose of the robot's geometric centre.
//
// Convention: both offsets measure from the mat edge to the nearest edge of
// the robot's footprint, i.e. to the side of the world-axis-aligned box
// around the robot at the requested heading. Offsets of 0 put the robot
// flush against the edges.
//
// The result is clamped so the footprint stays inside the mat; on an axis
// where the robot is larger than the mat it is centred. Negative or
// non-finite offsets count as 0. geometry == nullptr treats the robot as a
// point.
Pose fromEdges(MatSide side, double fromBottomMm, double fromSideMm, double headingDeg,
               const RobotGeometry* geometry, double matWidthMm, double matHeightMm);

inline Pose fromEdges(const EdgeOffsets& e, const RobotGeometry* geometry, const MatDimensions& mat) {
    return fromEdges(e.side, e.fromBottomMm, e.fromSideMm, e.headingDeg,
                     geometry, mat.widthMm, mat.heightMm);
}

// Inverse of fromEdges() for display, measured from the nearer side edge
EdgeOffsets toEdges(const Pose& pose, const RobotGeometry* geometry, double matWidthMm);

const char* matSideName(MatSide side);

} // namespace nav
