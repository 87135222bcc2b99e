#include "apps/nav/TrajectoryProjector.hpp"

#include <algorithm>
#include <cmath>
#include <limits>

namespace nav {

namespace {

// Direction components below this are parallel to the edge
static constexpr double DIR_EPS = 1e-9;
// Hits closer than this are the edge the ray starts on
static constexpr double T_EPS = 1e-9;
// Slack when checking a hit lies on its edge segment
static constexpr double SEG_EPS_MM = 1e-6;

static inline double clamp(double v, double lo, double hi) {
    return std::min(std::max(v, lo), hi);
}

} // namespace

Pose projectToBoundary(const Pose& pose, double matWidthMm, double matHeightMm, bool reversed) {
    if (!isFinitePose(pose)) return pose;
    if (!std::isfinite(matWidthMm) || !std::isfinite(matHeightMm) ||
        matWidthMm <= 0.0 || matHeightMm <= 0.0) {
        return pose;
    }

    const double h = deg2rad(pose.heading);
    const double sign = reversed ? -1.0 : 1.0;
    double dx = sign * std::sin(h);
    double dy = sign * std::cos(h);

    // Snap near-axis directions so a ray along an edge stays on it
    if (std::fabs(dx) < DIR_EPS) dx = 0.0;
    if (std::fabs(dy) < DIR_EPS) dy = 0.0;
    if (dx == 0.0 && dy == 0.0) return pose;

    double best_t = std::numeric_limits<double>::infinity();

    auto consider = [&](double t, double other, double other_max) {
        if (!(t > T_EPS) || t >= best_t) return;
        if (other < -SEG_EPS_MM || other > other_max + SEG_EPS_MM) return;
        best_t = t;
    };

    // Vertical edges x = 0 and x = W, valid for y in [0, H]
    if (dx != 0.0) {
        const double t0 = (0.0 - pose.x) / dx;
        consider(t0, pose.y + t0 * dy, matHeightMm);
        const double t1 = (matWidthMm - pose.x) / dx;
        consider(t1, pose.y + t1 * dy, matHeightMm);
    }

    // Horizontal edges y = 0 and y = H, valid for x in [0, W]
    if (dy != 0.0) {
        const double t0 = (0.0 - pose.y) / dy;
        consider(t0, pose.x + t0 * dx, matWidthMm);
        const double t1 = (matHeightMm - pose.y) / dy;
        consider(t1, pose.x + t1 * dx, matWidthMm);
    }

    if (!std::isfinite(best_t)) return pose;

    Pose hit;
    hit.x = clamp(pose.x + best_t * dx, 0.0, matWidthMm);
    hit.y = clamp(pose.y + best_t * dy, 0.0, matHeightMm);
    hit.heading = pose.heading;
    return hit;
}

bool isNullProjection(const Pose& pose, const Pose& projection) {
    return pose.x == projection.x && pose.y == projection.y;
}

} // namespace nav
