#pragma once
#include <atomic>
#include <cstdint>

#include "os/rtos.hpp"
#include "msg/PoseEvent.hpp"
#include "msg/PoseState.hpp"

#include "apps/nav/PoseModel.hpp"
#include "apps/nav/TelemetryHistory.hpp"

namespace nav {

// ------------------------------
// Queue types
// ------------------------------
// Events must not be dropped or reordered: blocking FIFO.
using PoseEventQueue = Rtos::Queue<msg::PoseEvent, 32>;
// Snapshots: freshest wins (construct with overwrite = true).
using PoseStateQueue = Rtos::Queue<msg::PoseState, 1>;

struct PoseTaskConfig {
    // Minimum spacing between applied telemetry samples (µs).
    // 0 applies every sample. Closer samples are only recorded; the last of
    // them is applied once the queue stays idle for idle_timeout_ms.
    uint64_t min_sample_spacing_us = 0;

    // How long the run loop blocks on the event queue before re-checking the stop flag
    int idle_timeout_ms = 100;

    // Print every non-telemetry event
    bool log_events = false;

    PoseModelConfig model{};
};

// ------------------------------
// Event builders
// ------------------------------
msg::PoseEvent MakeTelemetryEvent(const msg::TelemetrySample& sample);
msg::PoseEvent MakeSetPoseEvent(const Pose& pose);
msg::PoseEvent MakeNudgeHeadingEvent(double deltaDeg);
msg::PoseEvent MakeSetGeometryEvent(const RobotGeometry& geometry);
msg::PoseEvent MakeClearGeometryEvent();
msg::PoseEvent MakeStopEvent();

// ---------------------------------------------------------------------------
//  PoseTask
// ---------------------------------------------------------------------------
// Sole owner of the PoseModel. Applies events from one FIFO in arrival order
// and publishes a PoseState snapshot after each one.
class PoseTask {
public:
    // Task entry wiring for OSAL (void* arg).
    // NOTE: The TaskCtx object must outlive the task (static or main-scope that never exits).
    struct TaskCtx {
        PoseTask* self = nullptr;
        PoseEventQueue* event_in = nullptr;
        PoseStateQueue* state_out = nullptr;
    };

public:
    explicit PoseTask(const Pose& initial = {}, const PoseTaskConfig& cfg = {});

    static void TaskEntry(void* arg);

    void setConfig(const PoseTaskConfig& cfg);

    // Record every applied sample (and the pose it produced) into history.
    // Call before the task starts; history is then owned by the task thread
    // until Join(). nullptr detaches.
    void attachHistory(TelemetryHistory* history);

    // Core API: apply one event, fill the resulting snapshot.
    // Returns false if the event was rejected (non-finite data).
    bool processEvent(const msg::PoseEvent& ev, msg::PoseState& out);

    // Apply the last throttled sample if no later sample has been applied.
    // Returns false (out untouched) when nothing is pending.
    bool flushPendingTelemetry(msg::PoseState& out);

    void RequestStop() { m_stop_requested.store(true); }
    bool StopRequested() const { return m_stop_requested.load(); }

    // Direct access for single-threaded use (tests, tools). Do not touch
    // while the task is running.
    const PoseModel& model() const { return m_model; }

private:
    PoseTaskConfig m_cfg{};
    PoseModel m_model;

    TelemetryHistory* m_history = nullptr;

    bool m_has_applied_sample = false;
    uint64_t m_last_applied_t_us = 0;
    bool m_has_pending_sample = false;

    uint32_t m_event_count = 0;
    uint32_t m_sample_count = 0;
    uint32_t m_throttled_count = 0;
    uint32_t m_rejected_count = 0;

    std::atomic<bool> m_stop_requested{false};

    // Run loop called by TaskEntry
    void Run(PoseEventQueue& event_in, PoseStateQueue& state_out);

    bool HandleTelemetry(const msg::TelemetrySample& sample);
    bool ApplySample(const msg::TelemetrySample& sample);
    void FillState(const msg::PoseEvent& ev, uint64_t t0_us, msg::PoseState& out) const;
};

} // namespace nav
