#include "apps/nav/EdgePositionConverter.hpp"

#include <algorithm>
#include <cmath>

namespace nav {

namespace {

static inline double sanitiseOffset(double v) {
    return (std::isfinite(v) && v > 0.0) ? v : 0.0;
}

// Keep [c - half, c + half] inside [0, size]
static inline double clampAxis(double c, double half, double size) {
    if (2.0 * half >= size) return 0.5 * size;
    return std::min(std::max(c, half), size - half);
}

static inline FootprintExtents extentsFor(const RobotGeometry* geometry, double headingDeg) {
    if (!geometry) return {};
    return footprintHalfExtents(*geometry, headingDeg);
}

} // namespace

Pose fromEdges(MatSide side, double fromBottomMm, double fromSideMm, double headingDeg,
               const RobotGeometry* geometry, double matWidthMm, double matHeightMm) {
    const double W = (std::isfinite(matWidthMm) && matWidthMm > 0.0) ? matWidthMm : FLL_MAT_WIDTH_MM;
    const double H = (std::isfinite(matHeightMm) && matHeightMm > 0.0) ? matHeightMm : FLL_MAT_HEIGHT_MM;

    const double heading = normalizeHeading(headingDeg);
    const FootprintExtents e = extentsFor(geometry, heading);

    const double bottom = sanitiseOffset(fromBottomMm);
    const double lateral = sanitiseOffset(fromSideMm);

    Pose p;
    p.heading = heading;
    p.x = (side == MatSide::LEFT) ? (lateral + e.halfX) : (W - lateral - e.halfX);
    p.y = bottom + e.halfY;

    p.x = clampAxis(p.x, e.halfX, W);
    p.y = clampAxis(p.y, e.halfY, H);
    return p;
}

EdgeOffsets toEdges(const Pose& pose, const RobotGeometry* geometry, double matWidthMm) {
    EdgeOffsets out;
    out.headingDeg = normalizeHeading(pose.heading);

    const FootprintExtents e = extentsFor(geometry, out.headingDeg);
    const double leftGap = pose.x - e.halfX;
    const double rightGap = matWidthMm - pose.x - e.halfX;

    if (leftGap <= rightGap) {
        out.side = MatSide::LEFT;
        out.fromSideMm = leftGap;
    } else {
        out.side = MatSide::RIGHT;
        out.fromSideMm = rightGap;
    }
    out.fromBottomMm = pose.y - e.halfY;
    return out;
}

const char* matSideName(MatSide side) {
    switch (side) {
        case MatSide::LEFT: return "left";
        case MatSide::RIGHT: return "right";
        default: return "unknown";
    }
}

} // namespace nav
