#pragma once
#include <cstdint>
#include "apps/nav/Geometry.hpp"

namespace nav {

enum class MotionType : uint8_t {
    DRIVE = 0,  // straight line along the current heading
    TURN  = 1,  // rotation in place (about the turning centre)
    ARC   = 2,  // constant-radius curve
};

// Smallest arc radius accepted; smaller (or non-positive) radii are clamped
static constexpr double MIN_ARC_RADIUS_MM = 1.0;

// Turns / sweeps below this are treated as zero
static constexpr double ANGLE_EPS_DEG = 1e-9;

// Tagged motion primitive. Only the fields of the active type are read.
struct Motion {
    MotionType type = MotionType::DRIVE;

    // DRIVE
    double distanceMm = 0.0;
    bool   backward = false;

    // TURN: right (clockwise) positive, left negative
    double angleDeg = 0.0;

    // ARC
    double radiusMm = 0.0;
    double sweepDeg = 0.0;
    bool   forward = true;
    bool   left = true;

    static Motion Drive(double distanceMm, bool backward = false) {
        Motion m;
        m.type = MotionType::DRIVE;
        m.distanceMm = distanceMm;
        m.backward = backward;
        return m;
    }

    static Motion Turn(double angleDeg) {
        Motion m;
        m.type = MotionType::TURN;
        m.angleDeg = angleDeg;
        return m;
    }

    static Motion Arc(double radiusMm, double sweepDeg, bool forward, bool left) {
        Motion m;
        m.type = MotionType::ARC;
        m.radiusMm = radiusMm;
        m.sweepDeg = sweepDeg;
        m.forward = forward;
        m.left = left;
        return m;
    }
};

// Resulting pose of executing motion from pose.
// geometry may be nullptr (no robot configured): turns then pivot on the
// geometric centre. Pure and total; degenerate input yields the input pose
// (heading normalised).
Pose applyMotion(const Pose& pose, const RobotGeometry* geometry, const Motion& motion);

// Straight line of signedDistanceMm (negative = backward) along pose.heading
Pose applyDrive(const Pose& pose, double signedDistanceMm);

// In-place turn of angleDeg (right positive) about the turning centre
Pose applyTurn(const Pose& pose, const RobotGeometry* geometry, double angleDeg);

// Arc about a centre radiusMm to the left/right of the turning centre
Pose applyArc(const Pose& pose, const RobotGeometry* geometry,
              double radiusMm, double sweepDeg, bool forward, bool left);

// Heading change (clockwise positive) produced by an arc:
//
//   left  | travel   | heading change
//   ------+----------+---------------
//   true  | forward  | -|sweep|
//   false | forward  | +|sweep|
//   true  | backward | +|sweep|
//   false | backward | -|sweep|
//
// travel is `forward`, inverted when sweepDeg < 0.
double arcHeadingChange(double sweepDeg, bool forward, bool left);

// True when the motion moves the robot backwards (drive or arc)
bool isBackwardMotion(const Motion& motion);

} // namespace nav
