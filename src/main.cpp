// matnav: pose engine demo on a simulated drivebase
//
// Usage: matnav [config.yaml]
//
// Loads the robot/mat/start configuration, places the robot, then replays a
// short drivebase telemetry script through the PoseTask while the monitor
// prints the pose. Writes the run log to tools/data/tmp/matnav_history.csv.

#include <algorithm>
#include <atomic>
#include <cmath>
#include <iostream>
#include <string>
#include <vector>

#include "os/rtos.hpp"

#include "apps/config/ConfigLoader.hpp"
#include "apps/nav/EdgePositionConverter.hpp"
#include "apps/nav/PoseTask.hpp"
#include "apps/nav/PreviewService.hpp"
#include "apps/nav/TelemetryHistory.hpp"

#include "tools/matmonitor/MatMonitor.hpp"

static const char* DEFAULT_CONFIG = "../config/matnav.yaml";
static const char* HISTORY_CSV = "tools/data/tmp/matnav_history.csv";

static constexpr int SAMPLE_PERIOD_MS = 20; // hub telemetry rate (50 Hz)

// One scripted drivebase segment: both counters advance linearly
struct Segment {
    const char* name;
    double distance_mm; // added to the distance counter
    double angle_deg;   // added to the angle counter (clockwise positive)
    int duration_ms;
};

static bool Post(nav::PoseEventQueue& q, const msg::PoseEvent& ev) {
    if (q.send(ev, 1000)) return true;
    std::cerr << "[MAIN] Event queue stalled\n";
    return false;
}

// === Simulated drivebase ===
// Sends cumulative distance/angle counters the way the hub reports them
static bool SendSegment(nav::PoseEventQueue& q, const Segment& seg,
                        double& distance_mm, double& angle_deg) {
    const int steps = std::max(1, seg.duration_ms / SAMPLE_PERIOD_MS);
    const double d0 = distance_mm;
    const double a0 = angle_deg;

    std::cout << "[MAIN] " << seg.name << "\n";

    for (int i = 1; i <= steps; ++i) {
        const double f = double(i) / double(steps);

        msg::TelemetrySample s{};
        s.t_us = Rtos::NowUs();
        s.distance_mm = d0 + f * seg.distance_mm;
        s.angle_deg = a0 + f * seg.angle_deg;

        if (!Post(q, nav::MakeTelemetryEvent(s))) return false;
        Rtos::SleepMs(SAMPLE_PERIOD_MS);
    }

    distance_mm = d0 + seg.distance_mm;
    angle_deg = a0 + seg.angle_deg;
    return true;
}

static void PrintPreview(const char* label, const nav::PreviewResult& r) {
    std::cout << "[MAIN] preview " << label
              << " end=(" << r.end.x << ", " << r.end.y << ", " << r.end.heading << ")"
              << " hits edge at (" << r.projection.x << ", " << r.projection.y << ")\n";
}

int main(int argc, char** argv) {
    std::cout << "=== MATNAV ===\n";

    // ---- CONFIGURATION ----
    const std::string cfg_path = (argc > 1) ? argv[1] : DEFAULT_CONFIG;

    config::AppConfig app{};
    if (!config::LoadAppConfig(cfg_path, app)) {
        std::cerr << "[MAIN] Using built-in defaults\n";
        app = config::sanitise(app);
    }
    config::PrintAppConfig(app);

    const nav::RobotGeometry geometry = nav::geometryFromConfig(app.robot);

    nav::EdgeOffsets start{};
    start.side = app.start.side;
    start.fromBottomMm = app.start.from_bottom_mm;
    start.fromSideMm = app.start.from_side_mm;
    start.headingDeg = app.start.heading_deg;

    const nav::Pose start_pose = nav::fromEdges(start, &geometry, app.mat);
    std::cout << "[MAIN] start pose (" << start_pose.x << ", " << start_pose.y
              << ", " << start_pose.heading << ")\n";

    // ---- QUEUES ----
    nav::PoseEventQueue eventQueue(/*overwrite=*/false);
    nav::PoseStateQueue stateQueue(/*overwrite=*/true);

    // ---- MODULES ----
    nav::PoseTaskConfig pose_cfg{};
    pose_cfg.log_events = true;

    nav::PoseTask poseTask(start_pose, pose_cfg);
    nav::TelemetryHistory history;
    poseTask.attachHistory(&history);

    nav::PreviewServiceConfig prev_cfg{};
    prev_cfg.mat = app.mat;
    const nav::PreviewService previews(prev_cfg);

    // ---- TASK CONTEXTS ----
    nav::PoseTask::TaskCtx pose_ctx{};
    pose_ctx.self = &poseTask;
    pose_ctx.event_in = &eventQueue;
    pose_ctx.state_out = &stateQueue;

    std::atomic<bool> monitor_stop{false};

    monitor::MatMonitorCtx mon_ctx{};
    mon_ctx.state_in = &stateQueue;
    mon_ctx.stop = &monitor_stop;
    mon_ctx.cfg.mat = app.mat;
    mon_ctx.cfg.print_period_ms = 500;

    // ---- TASKS ----
    Rtos::Task PoseOwnerTask;
    Rtos::Task MonitorTask;

    if (!PoseOwnerTask.Create("PoseTask", &nav::PoseTask::TaskEntry, &pose_ctx)) {
        std::cerr << "[MAIN] Could not start PoseTask\n";
        return 1;
    }
    if (!MonitorTask.Create("Monitor", &monitor::TaskEntry, &mon_ctx)) {
        std::cerr << "[MAIN] Could not start Monitor\n";
        // The pose thread uses the queues and contexts on this stack
        poseTask.RequestStop();
        PoseOwnerTask.Join();
        return 1;
    }

    // Robot configuration first, then the placement resets the reference
    bool ok = Post(eventQueue, nav::MakeSetGeometryEvent(geometry)) &&
              Post(eventQueue, nav::MakeSetPoseEvent(start_pose));

    // Hover previews before moving
    const nav::DualPreview drive = previews.dualPreview(start_pose, nav::MotionType::DRIVE, 300.0, &geometry);
    PrintPreview("drive fwd", drive.primary);
    PrintPreview("drive back", drive.secondary);
    const nav::DualPreview turn = previews.dualPreview(start_pose, nav::MotionType::TURN, 90.0, &geometry);
    PrintPreview("turn left", turn.primary);
    PrintPreview("turn right", turn.secondary);

    // ---- DRIVEBASE SCRIPT ----
    const std::vector<Segment> script = {
        {"drive 400 mm",                400.0,  0.0, 1000},
        {"turn right 90 deg",             0.0, 90.0,  600},
        {"drive 600 mm",                600.0,  0.0, 1200},
        {"arc 200 mm radius, 90 deg",   200.0 * nav::PI * 0.5, -90.0, 1000},
        {"reverse 150 mm",             -150.0,  0.0,  500},
    };

    double distance_mm = 0.0;
    double angle_deg = 0.0;

    // Hub program start: counters at zero
    msg::TelemetrySample first{};
    first.t_us = Rtos::NowUs();
    ok = ok && Post(eventQueue, nav::MakeTelemetryEvent(first));

    for (const Segment& seg : script) {
        if (!ok) break;
        ok = SendSegment(eventQueue, seg, distance_mm, angle_deg);
    }

    // Driver corrects a small gyro drift, then puts the robot back in base
    if (ok) {
        ok = Post(eventQueue, nav::MakeNudgeHeadingEvent(-2.0));
        Rtos::SleepMs(200);
        ok = ok && Post(eventQueue, nav::MakeSetPoseEvent(start_pose));
        ok = ok && SendSegment(eventQueue, {"drive 250 mm after reset", 250.0, 0.0, 500},
                               distance_mm, angle_deg);
    }

    if (!Post(eventQueue, nav::MakeStopEvent())) {
        poseTask.RequestStop();
    }
    PoseOwnerTask.Join();

    monitor_stop.store(true);
    MonitorTask.Join();

    // PoseTask has stopped; the model is safe to read here
    const nav::Pose& end = poseTask.model().pose();
    std::cout << "[MAIN] final pose (" << end.x << ", " << end.y << ", " << end.heading << ")\n";

    if (!history.writeCsv(HISTORY_CSV)) {
        std::cerr << "[MAIN] Could not write run log\n";
        return 1;
    }

    return ok ? 0 : 1;
}
