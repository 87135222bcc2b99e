#include "apps/nav/PreviewService.hpp"
#include "apps/nav/TrajectoryProjector.hpp"

#include <cmath>

namespace nav {

static inline PreviewServiceConfig sanitise(const PreviewServiceConfig& in) {
    PreviewServiceConfig cfg = in;

    if (!std::isfinite(cfg.mat.widthMm) || cfg.mat.widthMm <= 0.0) {
        cfg.mat.widthMm = FLL_MAT_WIDTH_MM;
    }
    if (!std::isfinite(cfg.mat.heightMm) || cfg.mat.heightMm <= 0.0) {
        cfg.mat.heightMm = FLL_MAT_HEIGHT_MM;
    }
    return cfg;
}

static inline MatDimensions matOf(double widthMm, double heightMm) {
    PreviewServiceConfig cfg;
    cfg.mat.widthMm = widthMm;
    cfg.mat.heightMm = heightMm;
    return sanitise(cfg).mat;
}

PreviewService::PreviewService(const PreviewServiceConfig& cfg)
    : m_cfg(sanitise(cfg)) {}

Pose PreviewService::preview(const Pose& pose, const Motion& motion,
                             const RobotGeometry* geometry) const {
    return applyMotion(pose, geometry, motion);
}

PreviewResult PreviewService::previewWithTrajectory(const Pose& pose, const Motion& motion,
                                                    const RobotGeometry* geometry,
                                                    double matWidthMm, double matHeightMm) {
    PreviewResult r;
    r.end = applyMotion(pose, geometry, motion);
    r.projection = projectToBoundary(r.end, matOf(matWidthMm, matHeightMm),
                                     isBackwardMotion(motion));
    return r;
}

PreviewResult PreviewService::previewWithTrajectory(const Pose& pose, const Motion& motion,
                                                    const RobotGeometry* geometry) const {
    return previewWithTrajectory(pose, motion, geometry, m_cfg.mat.widthMm, m_cfg.mat.heightMm);
}

DualPreview PreviewService::dualPreview(const Pose& pose, MotionType kind, double amount,
                                        const RobotGeometry* geometry, double arcRadiusMm) const {
    return dualPreview(pose, kind, amount, geometry,
                       m_cfg.mat.widthMm, m_cfg.mat.heightMm, arcRadiusMm);
}

DualPreview PreviewService::dualPreview(const Pose& pose, MotionType kind, double amount,
                                        const RobotGeometry* geometry,
                                        double matWidthMm, double matHeightMm,
                                        double arcRadiusMm) {
    const double a = std::fabs(amount);

    Motion primary;
    Motion secondary;
    switch (kind) {
        case MotionType::DRIVE:
            primary = Motion::Drive(a, false);
            secondary = Motion::Drive(a, true);
            break;
        case MotionType::TURN:
            primary = Motion::Turn(-a);
            secondary = Motion::Turn(a);
            break;
        case MotionType::ARC:
            primary = Motion::Arc(arcRadiusMm, a, true, true);
            secondary = Motion::Arc(arcRadiusMm, a, true, false);
            break;
    }

    DualPreview out;
    out.primary = previewWithTrajectory(pose, primary, geometry, matWidthMm, matHeightMm);
    out.secondary = previewWithTrajectory(pose, secondary, geometry, matWidthMm, matHeightMm);
    return out;
}

std::array<Pose, 3> PreviewService::trajectoryPath(const Pose& pose, const Motion& motion,
                                                   const RobotGeometry* geometry) const {
    const PreviewResult r = previewWithTrajectory(pose, motion, geometry);
    return {pose, r.end, r.projection};
}

} // namespace nav
