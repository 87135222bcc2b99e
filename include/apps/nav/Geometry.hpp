#pragma once
#include <array>
#include <cstdint>

namespace nav {

// World (mat) frame:
// - x: mm rightward from the mat's left edge
// - y: mm upward from the mat's bottom edge
// - heading: deg clockwise from +y ("north", the mat's far edge), [0, 360)
//
// Body frame (robot):
// - dx: mm to the robot's right
// - dy: mm towards the robot's front

static constexpr double PI = 3.14159265358979323846;
static constexpr double DEG2RAD = PI / 180.0;
static constexpr double RAD2DEG = 180.0 / PI;

static constexpr double LEGO_STUD_SIZE_MM = 8.0;

// FLL standard mat
static constexpr double FLL_MAT_WIDTH_MM = 2356.0;
static constexpr double FLL_MAT_HEIGHT_MM = 1137.0;

// Offsets below this are treated as "no offset"
static constexpr double OFFSET_EPS_MM = 1e-6;

struct Pose {
    double x = 0.0;       // mm
    double y = 0.0;       // mm
    double heading = 0.0; // deg
};

struct Point2 {
    double x = 0.0;
    double y = 0.0;
};

struct BodyOffset {
    double dx = 0.0; // right-positive (mm)
    double dy = 0.0; // forward-positive (mm)
};

// Geometric centre -> turning centre (axle midpoint) in body frame.
// Defaults describe the stock 22 x 25 stud FLL robot.
struct RobotGeometry {
    double widthMm = 176.0;
    double lengthMm = 200.0;
    BodyOffset centerOfRotationOffset{0.0, 20.0};
};

// Robot as described in the robot builder (LEGO studs).
// "Top" is the robot's front edge.
struct RobotConfig {
    double widthStuds = 22.0;
    double lengthStuds = 25.0;
    double corFromLeftStuds = 11.0;
    double corFromTopStuds = 10.0;
};

struct MatDimensions {
    double widthMm = FLL_MAT_WIDTH_MM;
    double heightMm = FLL_MAT_HEIGHT_MM;
};

// Half sizes of the world-axis-aligned box around a rotated footprint
struct FootprintExtents {
    double halfX = 0.0;
    double halfY = 0.0;
};

inline double deg2rad(double deg) { return deg * DEG2RAD; }
inline double rad2deg(double rad) { return rad * RAD2DEG; }
inline double studsToMm(double studs) { return studs * LEGO_STUD_SIZE_MM; }

// Map any heading into [0, 360). Non-finite input maps to 0.
double normalizeHeading(double deg);

// Signed turn (right positive) taking fromDeg onto toDeg, in (-180, 180]
double shortestTurn(double fromDeg, double toDeg);

bool isFinitePose(const Pose& p);

RobotGeometry geometryFromConfig(const RobotConfig& cfg);

// nullptr (no robot configured) counts as "no offset"
bool hasRotationOffset(const RobotGeometry* geometry);

// Body-frame vector expressed in world axes at the given heading
Point2 bodyToWorld(const BodyOffset& v, double headingDeg);

FootprintExtents footprintHalfExtents(const RobotGeometry& geometry, double headingDeg);

// World-frame corners of the footprint centred on pose:
// front-left, front-right, back-right, back-left
std::array<Point2, 4> footprintCorners(const Pose& pose, const RobotGeometry& geometry);

} // namespace nav
