// test/nav_preview_test.cpp
//
// Previews never move the robot; they only evaluate motions on a snapshot.
// Exits non-zero on the first failure.

#include <cmath>
#include <iostream>

#include "apps/nav/PoseModel.hpp"
#include "apps/nav/PreviewService.hpp"

static constexpr double TOL = 1e-6;
static constexpr double W = nav::FLL_MAT_WIDTH_MM;
static constexpr double H = nav::FLL_MAT_HEIGHT_MM;

static bool expect_pose(const char* what, const nav::Pose& got, double x, double y, double heading) {
    const double dh = std::fabs(nav::shortestTurn(heading, got.heading));
    if (std::fabs(got.x - x) <= TOL && std::fabs(got.y - y) <= TOL && dh <= TOL) {
        std::cout << "[TEST] ok: " << what << "\n";
        return true;
    }
    std::cerr << "[TEST] FAIL: " << what << " got=(" << got.x << ", " << got.y << ", "
              << got.heading << ") want=(" << x << ", " << y << ", " << heading << ")\n";
    return false;
}

int main() {
    std::cout << "=== NAV PREVIEW TEST ===\n";

    const nav::PreviewService svc;
    const nav::Pose start{1178.0, 500.0, 0.0};
    bool ok = true;

    // Single previews
    ok &= expect_pose("drive preview",
                      svc.preview(start, nav::Motion::Drive(100.0), nullptr), 1178.0, 600.0, 0.0);

    const nav::PreviewResult fwd = svc.previewWithTrajectory(start, nav::Motion::Drive(100.0), nullptr);
    ok &= expect_pose("forward end", fwd.end, 1178.0, 600.0, 0.0);
    ok &= expect_pose("forward projection", fwd.projection, 1178.0, H, 0.0);

    const nav::PreviewResult back = svc.previewWithTrajectory(start, nav::Motion::Drive(100.0, true), nullptr);
    ok &= expect_pose("backward end", back.end, 1178.0, 400.0, 0.0);
    ok &= expect_pose("backward projection reversed", back.projection, 1178.0, 0.0, 0.0);

    const nav::PreviewResult arcBack =
        svc.previewWithTrajectory(start, nav::Motion::Arc(100.0, 90.0, false, true), nullptr);
    ok &= expect_pose("backward arc end", arcBack.end, 1078.0, 400.0, 90.0);
    ok &= expect_pose("backward arc projection reversed", arcBack.projection, 0.0, 400.0, 90.0);

    // Hover previews
    const nav::DualPreview drive = svc.dualPreview(start, nav::MotionType::DRIVE, 300.0, nullptr);
    ok &= expect_pose("dual drive primary", drive.primary.end, 1178.0, 800.0, 0.0);
    ok &= expect_pose("dual drive secondary", drive.secondary.end, 1178.0, 200.0, 0.0);
    ok &= expect_pose("dual drive secondary projection", drive.secondary.projection, 1178.0, 0.0, 0.0);

    const nav::DualPreview turn = svc.dualPreview(start, nav::MotionType::TURN, 90.0, nullptr);
    ok &= expect_pose("dual turn left", turn.primary.end, 1178.0, 500.0, 270.0);
    ok &= expect_pose("dual turn left projection", turn.primary.projection, 0.0, 500.0, 270.0);
    ok &= expect_pose("dual turn right", turn.secondary.end, 1178.0, 500.0, 90.0);
    ok &= expect_pose("dual turn right projection", turn.secondary.projection, W, 500.0, 90.0);

    const nav::DualPreview arc = svc.dualPreview(start, nav::MotionType::ARC, 90.0, nullptr, 100.0);
    ok &= expect_pose("dual arc left", arc.primary.end, 1078.0, 600.0, 270.0);
    ok &= expect_pose("dual arc right", arc.secondary.end, 1278.0, 600.0, 90.0);
    ok &= expect_pose("dual arc right projection", arc.secondary.projection, W, 600.0, 90.0);

    // Overlay polyline
    const auto path = svc.trajectoryPath(start, nav::Motion::Drive(100.0), nullptr);
    ok &= expect_pose("path start", path[0], 1178.0, 500.0, 0.0);
    ok &= expect_pose("path end", path[1], 1178.0, 600.0, 0.0);
    ok &= expect_pose("path hit", path[2], 1178.0, H, 0.0);

    // Preview on a snapshot leaves the live pose alone
    nav::PoseModel model(start);
    const nav::Pose snapshot = model.pose();
    svc.preview(snapshot, nav::Motion::Turn(45.0), model.geometry());
    ok &= expect_pose("model untouched", model.pose(), 1178.0, 500.0, 0.0);

    // Custom mat; invalid sizes fall back to the FLL mat
    nav::PreviewServiceConfig small{};
    small.mat = {1000.0, 800.0};
    const nav::PreviewService smallSvc(small);
    ok &= expect_pose("custom mat projection",
                      smallSvc.previewWithTrajectory({500.0, 100.0, 0.0}, nav::Motion::Drive(10.0), nullptr).projection,
                      500.0, 800.0, 0.0);

    // Mat passed per call; the service's own mat is not consulted
    const nav::PreviewResult explicitMat = nav::PreviewService::previewWithTrajectory(
        {500.0, 100.0, 90.0}, nav::Motion::Drive(10.0), nullptr, 1000.0, 800.0);
    ok &= expect_pose("explicit mat end", explicitMat.end, 510.0, 100.0, 90.0);
    ok &= expect_pose("explicit mat projection", explicitMat.projection, 1000.0, 100.0, 90.0);

    const nav::PreviewResult explicitBack = svc.previewWithTrajectory(
        {500.0, 100.0, 90.0}, nav::Motion::Drive(10.0, true), nullptr, 1000.0, 800.0);
    ok &= expect_pose("explicit mat backward projection", explicitBack.projection, 0.0, 100.0, 90.0);

    const nav::DualPreview explicitDual = nav::PreviewService::dualPreview(
        {500.0, 100.0, 0.0}, nav::MotionType::DRIVE, 50.0, nullptr, 1000.0, 800.0, 0.0);
    ok &= expect_pose("explicit mat dual primary projection", explicitDual.primary.projection, 500.0, 800.0, 0.0);
    ok &= expect_pose("explicit mat dual secondary projection", explicitDual.secondary.projection, 500.0, 0.0, 0.0);

    ok &= expect_pose("explicit invalid mat falls back",
                      nav::PreviewService::previewWithTrajectory({500.0, 100.0, 0.0}, nav::Motion::Drive(10.0),
                                                                 nullptr, NAN, 0.0).projection,
                      500.0, H, 0.0);

    nav::PreviewServiceConfig bad{};
    bad.mat = {0.0, -1.0};
    const nav::PreviewService badSvc(bad);
    ok &= (badSvc.getConfig().mat.widthMm == W && badSvc.getConfig().mat.heightMm == H);

    if (!ok) {
        std::cerr << "[TEST] FAIL: preview\n";
        return 1;
    }
    std::cout << "=== DONE ===\n";
    return 0;
}
