#pragma once
#include <cstdint>
#include <functional>
#include <vector>

#include "apps/nav/Geometry.hpp"
#include "msg/TelemetrySample.hpp"

namespace nav {

enum class TrackingState : uint8_t {
    UNINITIALIZED = 0, // no telemetry reference yet
    TRACKING = 1,
};

// Pose/telemetry pair every later delta is computed against.
// Reset on every explicit reposition.
struct TelemetryReference {
    double distanceAtReference = 0.0; // mm
    double angleAtReference = 0.0;    // deg
    Pose poseAtReference{};
};

struct PoseModelConfig {
    // Drivebase rotation (since the reference) above which the turning-centre
    // offset is applied before driving
    double turn_epsilon_deg = 1e-6;
};

// ---------------------------------------------------------------------------
//  PoseModel
// ---------------------------------------------------------------------------
// Dead-reckoned robot pose on the mat.
//
// Not thread-safe: exactly one owner (the event loop / PoseTask) mutates it.
// Readers on other threads consume the published snapshots instead.
class PoseModel {
public:
    using Observer = std::function<void(const Pose&)>;

    explicit PoseModel(const Pose& initial = {}, const PoseModelConfig& cfg = {});

    void setConfig(const PoseModelConfig& cfg);
    const PoseModelConfig& getConfig() const { return m_cfg; }

    // Robot configuration. Without geometry turns pivot on the geometric centre.
    void setGeometry(const RobotGeometry& geometry);
    void clearGeometry();
    const RobotGeometry* geometry() const { return m_has_geometry ? &m_geometry : nullptr; }

    // Hard reset: pose, fresh reference at the last known telemetry
    // (0/0 if none seen yet), manual adjustment zeroed.
    void setPose(const Pose& p);

    // Dead reckoning from the reference snapshot. The first sample without a
    // reference only seeds the reference. Returns false (pose held) for a
    // non-finite sample.
    bool applyTelemetry(const msg::TelemetrySample& sample);

    // Remember a sample as "last known" without moving the pose, so a later
    // setPose() references the right counters (used when samples are throttled).
    bool recordTelemetry(const msg::TelemetrySample& sample);

    // Heading nudge: accumulates into the manual adjustment and turns the live
    // pose immediately. Position and reference are untouched.
    void applyManualHeadingAdjustment(double deltaDeg);

    const Pose& pose() const { return m_pose; }
    TrackingState state() const { return m_state; }

    bool hasReference() const { return m_has_reference; }
    const TelemetryReference& reference() const { return m_reference; }
    double manualAdjustment() const { return m_manual_adj_deg; }

    bool hasTelemetry() const { return m_has_telemetry; }
    const msg::TelemetrySample& lastTelemetry() const { return m_last_sample; }

    // Observers are called synchronously after every pose change, on the
    // owner's thread. Returns an id for unsubscribe().
    uint32_t subscribe(Observer cb);
    bool unsubscribe(uint32_t id);

private:
    PoseModelConfig m_cfg{};

    Pose m_pose{};
    TrackingState m_state = TrackingState::UNINITIALIZED;

    bool m_has_reference = false;
    TelemetryReference m_reference{};
    double m_manual_adj_deg = 0.0;

    bool m_has_telemetry = false;
    msg::TelemetrySample m_last_sample{};

    bool m_has_geometry = false;
    RobotGeometry m_geometry{};

    struct Subscription {
        uint32_t id;
        Observer cb;
    };
    std::vector<Subscription> m_observers;
    uint32_t m_next_observer_id = 1;

    Pose computeFromReference(double deltaDistance, double deltaAngle) const;
    void notify();
};

} // namespace nav
