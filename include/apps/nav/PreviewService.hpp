#pragma once
#include <array>
#include <cstdint>

#include "apps/nav/Geometry.hpp"
#include "apps/nav/Kinematics.hpp"

namespace nav {

struct PreviewServiceConfig {
    MatDimensions mat{};
};

// Ghost pose plus where continuing along the same travel direction leaves the mat
struct PreviewResult {
    Pose end{};
    Pose projection{};
};

// Slider-hover previews shown side by side:
// DRIVE: primary = forward, secondary = backward
// TURN:  primary = left,    secondary = right
// ARC:   primary = left,    secondary = right (both forward)
struct DualPreview {
    PreviewResult primary{};
    PreviewResult secondary{};
};

// ---------------------------------------------------------------------------
//  PreviewService
// ---------------------------------------------------------------------------
// Hypothetical motions evaluated against a pose snapshot. Never touches a
// PoseModel; every call is a pure function of its arguments. The overloads
// without mat dimensions use the mat fixed at construction, so an instance
// may be shared between threads.
class PreviewService {
public:
    explicit PreviewService(const PreviewServiceConfig& cfg = {});

    const PreviewServiceConfig& getConfig() const { return m_cfg; }

    Pose preview(const Pose& pose, const Motion& motion, const RobotGeometry* geometry) const;

    // Projection is cast from the end pose, reversed for backward drives/arcs.
    // Non-positive or non-finite mat dimensions fall back to the FLL mat.
    static PreviewResult previewWithTrajectory(const Pose& pose, const Motion& motion,
                                               const RobotGeometry* geometry,
                                               double matWidthMm, double matHeightMm);
    PreviewResult previewWithTrajectory(const Pose& pose, const Motion& motion,
                                        const RobotGeometry* geometry) const;

    // amount: distance (mm) for DRIVE, angle (deg) for TURN, sweep (deg) for ARC.
    // arcRadiusMm is only read for ARC.
    static DualPreview dualPreview(const Pose& pose, MotionType kind, double amount,
                                   const RobotGeometry* geometry,
                                   double matWidthMm, double matHeightMm,
                                   double arcRadiusMm);
    DualPreview dualPreview(const Pose& pose, MotionType kind, double amount,
                            const RobotGeometry* geometry, double arcRadiusMm = 0.0) const;

    // Polyline for the overlay: start, motion end, boundary hit
    std::array<Pose, 3> trajectoryPath(const Pose& pose, const Motion& motion,
                                       const RobotGeometry* geometry) const;

private:
    const PreviewServiceConfig m_cfg;
};

} // namespace nav
