#pragma once
#include "apps/nav/Geometry.hpp"

namespace nav {

// Where a ray cast from pose along its heading (or the opposite direction
// when reversed) first meets the mat rectangle [0, matWidthMm] x [0, matHeightMm].
//
// The returned pose carries the input heading. If the direction is
// degenerate, the mat is empty or nothing is hit (e.g. sitting on an edge
// and facing out of the mat), the input pose is returned unchanged; callers
// treat "same as input" as "no useful projection".
//
// Overlay guidance only; never feeds back into the pose model.
Pose projectToBoundary(const Pose& pose, double matWidthMm, double matHeightMm, bool reversed);

inline Pose projectToBoundary(const Pose& pose, const MatDimensions& mat, bool reversed) {
    return projectToBoundary(pose, mat.widthMm, mat.heightMm, reversed);
}

// True when projectToBoundary() produced no useful projection for pose
bool isNullProjection(const Pose& pose, const Pose& projection);

} // namespace nav
