#include "apps/nav/Geometry.hpp"

#include <cmath>

#include <Eigen/Core>
#include <Eigen/Geometry>

namespace nav {

double normalizeHeading(double deg) {
    if (!std::isfinite(deg)) return 0.0;

    double h = std::fmod(deg, 360.0);
    if (h < 0.0) h += 360.0;
    // fmod of a tiny negative value can round back up to exactly 360
    if (h >= 360.0) h -= 360.0;
    return h;
}

double shortestTurn(double fromDeg, double toDeg) {
    double d = normalizeHeading(toDeg - fromDeg); // [0, 360)
    if (d > 180.0) d -= 360.0;
    return d;
}

bool isFinitePose(const Pose& p) {
    return std::isfinite(p.x) && std::isfinite(p.y) && std::isfinite(p.heading);
}

RobotGeometry geometryFromConfig(const RobotConfig& cfg) {
    RobotGeometry g;
    g.widthMm = studsToMm(cfg.widthStuds);
    g.lengthMm = studsToMm(cfg.lengthStuds);

    // Builder coordinates: x from the left edge, y from the front edge (Y+ towards the back)
    g.centerOfRotationOffset.dx = studsToMm(cfg.corFromLeftStuds - 0.5 * cfg.widthStuds);
    g.centerOfRotationOffset.dy = studsToMm(0.5 * cfg.lengthStuds - cfg.corFromTopStuds);
    return g;
}

bool hasRotationOffset(const RobotGeometry* geometry) {
    if (!geometry) return false;
    const BodyOffset& o = geometry->centerOfRotationOffset;
    if (!std::isfinite(o.dx) || !std::isfinite(o.dy)) return false;
    return std::hypot(o.dx, o.dy) > OFFSET_EPS_MM;
}

Point2 bodyToWorld(const BodyOffset& v, double headingDeg) {
    // Clockwise heading == negative angle in the usual counter-clockwise convention
    const Eigen::Rotation2Dd R(-deg2rad(headingDeg));
    const Eigen::Vector2d w = R * Eigen::Vector2d(v.dx, v.dy);
    return {w.x(), w.y()};
}

FootprintExtents footprintHalfExtents(const RobotGeometry& geometry, double headingDeg) {
    const double hw = 0.5 * std::fabs(geometry.widthMm);
    const double hl = 0.5 * std::fabs(geometry.lengthMm);
    if (!std::isfinite(hw) || !std::isfinite(hl)) return {};

    const double h = deg2rad(headingDeg);
    const double c = std::fabs(std::cos(h));
    const double s = std::fabs(std::sin(h));

    FootprintExtents e;
    e.halfX = hw * c + hl * s;
    e.halfY = hw * s + hl * c;
    return e;
}

std::array<Point2, 4> footprintCorners(const Pose& pose, const RobotGeometry& geometry) {
    const double hw = 0.5 * geometry.widthMm;
    const double hl = 0.5 * geometry.lengthMm;

    const std::array<BodyOffset, 4> body = {{
        {-hw,  hl},  // front-left
        { hw,  hl},  // front-right
        { hw, -hl},  // back-right
        {-hw, -hl},  // back-left
    }};

    std::array<Point2, 4> out{};
    for (std::size_t i = 0; i < body.size(); ++i) {
        const Point2 w = bodyToWorld(body[i], pose.heading);
        out[i] = {pose.x + w.x, pose.y + w.y};
    }
    return out;
}

} // namespace nav
