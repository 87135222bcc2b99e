// Kinematics.cpp
#include "apps/nav/Kinematics.hpp"

#include <algorithm>
#include <cmath>

#include <Eigen/Core>
#include <Eigen/Geometry>

namespace{

using EVec2 = Eigen::Vector2d;

// Eigen Utils
static inline EVec2 toE(const nav::Pose& p){ return {p.x, p.y}; }
static inline EVec2 toE(const nav::Point2& p){ return {p.x, p.y}; }

static inline nav::Pose fromE(const EVec2& v, double heading){
    return {v.x(), v.y(), nav::normalizeHeading(heading)};
}

// Clockwise rotation by deg (world frame is y-up, heading clockwise)
static inline Eigen::Rotation2Dd cw(double deg){
    return Eigen::Rotation2Dd(-nav::deg2rad(deg));
}

static inline nav::Pose normalized(const nav::Pose& p){
    return {p.x, p.y, nav::normalizeHeading(p.heading)};
}

// Turning centre (axle midpoint) in world coordinates
static inline EVec2 turningCentre(const nav::Pose& p, const nav::RobotGeometry* g){
    if (!nav::hasRotationOffset(g)) return toE(p);
    return toE(p) + toE(nav::bodyToWorld(g->centerOfRotationOffset, p.heading));
}

// Geometric centre back from a turning centre at the given heading
static inline EVec2 geometricCentre(const EVec2& c, double heading, const nav::RobotGeometry* g){
    if (!nav::hasRotationOffset(g)) return c;
    return c - toE(nav::bodyToWorld(g->centerOfRotationOffset, heading));
}

} // namespace


namespace nav {

Pose applyDrive(const Pose& pose, double signedDistanceMm) {
    if (!isFinitePose(pose)) return pose;
    if (!std::isfinite(signedDistanceMm) || signedDistanceMm == 0.0) return normalized(pose);

    // heading 0 -> +y, heading 90 -> +x
    const double h = deg2rad(pose.heading);
    const EVec2 dir(std::sin(h), std::cos(h));
    return fromE(toE(pose) + signedDistanceMm * dir, pose.heading);
}

Pose applyTurn(const Pose& pose, const RobotGeometry* geometry, double angleDeg) {
    if (!isFinitePose(pose)) return pose;
    if (!std::isfinite(angleDeg) || std::fabs(angleDeg) < ANGLE_EPS_DEG) return normalized(pose);

    const double h1 = normalizeHeading(pose.heading + angleDeg);

    if (!hasRotationOffset(geometry)) {
        return {pose.x, pose.y, h1};
    }

    // The turning centre stays put; the geometric centre swings around it
    const EVec2 c = turningCentre(pose, geometry);
    return fromE(geometricCentre(c, h1, geometry), h1);
}

double arcHeadingChange(double sweepDeg, bool forward, bool left) {
    if (!std::isfinite(sweepDeg)) return 0.0;

    const bool travelForward = (sweepDeg < 0.0) ? !forward : forward;
    const double mag = std::fabs(sweepDeg);

    // Centre on the left: forward travel turns the robot anticlockwise
    if (left) return travelForward ? -mag : mag;
    return travelForward ? mag : -mag;
}

Pose applyArc(const Pose& pose, const RobotGeometry* geometry,
              double radiusMm, double sweepDeg, bool forward, bool left) {
    if (!isFinitePose(pose)) return pose;
    if (!std::isfinite(radiusMm) || !std::isfinite(sweepDeg)) return normalized(pose);
    if (std::fabs(sweepDeg) < ANGLE_EPS_DEG) return normalized(pose);

    const double r = std::max(radiusMm, MIN_ARC_RADIUS_MM);
    const double dh = arcHeadingChange(sweepDeg, forward, left);

    // Arc is traced by the turning centre
    const EVec2 c0 = turningCentre(pose, geometry);

    const BodyOffset side{left ? -r : r, 0.0};
    const EVec2 centre = c0 + toE(bodyToWorld(side, pose.heading));

    const EVec2 c1 = centre + (cw(dh) * (c0 - centre));
    const double h1 = normalizeHeading(pose.heading + dh);

    return fromE(geometricCentre(c1, h1, geometry), h1);
}

Pose applyMotion(const Pose& pose, const RobotGeometry* geometry, const Motion& motion) {
    switch (motion.type) {
        case MotionType::DRIVE:
            return applyDrive(pose, motion.backward ? -motion.distanceMm : motion.distanceMm);
        case MotionType::TURN:
            return applyTurn(pose, geometry, motion.angleDeg);
        case MotionType::ARC:
            return applyArc(pose, geometry, motion.radiusMm, motion.sweepDeg,
                            motion.forward, motion.left);
        default:
            return normalized(pose);
    }
}

bool isBackwardMotion(const Motion& motion) {
    switch (motion.type) {
        case MotionType::DRIVE:
            return motion.backward != (motion.distanceMm < 0.0);
        case MotionType::ARC:
            return (motion.sweepDeg < 0.0) ? motion.forward : !motion.forward;
        default:
            return false;
    }
}

} // namespace nav
