// PoseModel.cpp
#include "apps/nav/PoseModel.hpp"
#include "apps/nav/Kinematics.hpp"

#include <algorithm>
#include <cmath>
#include <iostream>

namespace nav {

// Internal sanitisation of config parameters
// not public API
static inline PoseModelConfig sanitise(const PoseModelConfig& in) {
    PoseModelConfig cfg = in;

    if (!std::isfinite(cfg.turn_epsilon_deg) || cfg.turn_epsilon_deg < 0.0) {
        cfg.turn_epsilon_deg = 1e-6;
    }
    return cfg;
}

static inline bool isFiniteSample(const msg::TelemetrySample& s) {
    return std::isfinite(s.distance_mm) && std::isfinite(s.angle_deg);
}

PoseModel::PoseModel(const Pose& initial, const PoseModelConfig& cfg)
    : m_cfg(sanitise(cfg)) {
    if (isFinitePose(initial)) {
        m_pose = {initial.x, initial.y, normalizeHeading(initial.heading)};
    } else {
        std::cerr << "[POSE] Non-finite initial pose, starting at origin\n";
    }
}

void PoseModel::setConfig(const PoseModelConfig& cfg) {
    m_cfg = sanitise(cfg);
}

void PoseModel::setGeometry(const RobotGeometry& geometry) {
    m_geometry = geometry;
    m_has_geometry = true;
}

void PoseModel::clearGeometry() {
    m_has_geometry = false;
}

void PoseModel::setPose(const Pose& p) {
    if (!isFinitePose(p)) {
        std::cerr << "[POSE] setPose ignored: non-finite pose\n";
        return;
    }

    m_pose = {p.x, p.y, normalizeHeading(p.heading)};

    m_reference.distanceAtReference = m_has_telemetry ? m_last_sample.distance_mm : 0.0;
    m_reference.angleAtReference = m_has_telemetry ? m_last_sample.angle_deg : 0.0;
    m_reference.poseAtReference = m_pose;
    m_has_reference = true;

    m_manual_adj_deg = 0.0;
    m_state = TrackingState::TRACKING;

    notify();
}

bool PoseModel::recordTelemetry(const msg::TelemetrySample& sample) {
    if (!isFiniteSample(sample)) return false;
    m_last_sample = sample;
    m_has_telemetry = true;
    return true;
}

bool PoseModel::applyTelemetry(const msg::TelemetrySample& sample) {
    if (!recordTelemetry(sample)) return false;

    // First sample: seed the reference from wherever the robot is now. The
    // live heading already carries any earlier nudge, so the adjustment
    // starts again from zero.
    if (!m_has_reference) {
        m_reference.distanceAtReference = sample.distance_mm;
        m_reference.angleAtReference = sample.angle_deg;
        m_reference.poseAtReference = m_pose;
        m_has_reference = true;
        m_manual_adj_deg = 0.0;
        m_state = TrackingState::TRACKING;
        return true;
    }

    const double deltaDistance = sample.distance_mm - m_reference.distanceAtReference;
    const double deltaAngle = sample.angle_deg - m_reference.angleAtReference;

    m_pose = computeFromReference(deltaDistance, deltaAngle);
    notify();
    return true;
}

Pose PoseModel::computeFromReference(double deltaDistance, double deltaAngle) const {
    const Pose& ref = m_reference.poseAtReference;

    // Manual nudges correct the reference heading; the drivebase rotation is
    // the only physical turn.
    const Pose start{ref.x, ref.y, normalizeHeading(ref.heading + m_manual_adj_deg)};
    const double newHeading = normalizeHeading(ref.heading + deltaAngle + m_manual_adj_deg);

    const RobotGeometry* g = geometry();

    // Turn first (about the turning centre), then drive the whole distance
    // along the final heading. Both steps start from the reference, so
    // replaying a sample reproduces the same pose.
    Pose intermediate = start;
    if (hasRotationOffset(g) && std::fabs(deltaAngle) > m_cfg.turn_epsilon_deg) {
        intermediate = applyTurn(start, g, deltaAngle);
    }
    intermediate.heading = newHeading;

    return applyDrive(intermediate, deltaDistance);
}

void PoseModel::applyManualHeadingAdjustment(double deltaDeg) {
    if (!std::isfinite(deltaDeg)) {
        std::cerr << "[POSE] Heading nudge ignored: non-finite delta\n";
        return;
    }

    m_manual_adj_deg += deltaDeg;
    m_pose.heading = normalizeHeading(m_pose.heading + deltaDeg);
    notify();
}

uint32_t PoseModel::subscribe(Observer cb) {
    const uint32_t id = m_next_observer_id++;
    m_observers.push_back({id, std::move(cb)});
    return id;
}

bool PoseModel::unsubscribe(uint32_t id) {
    auto it = std::find_if(m_observers.begin(), m_observers.end(),
                           [id](const Subscription& s) { return s.id == id; });
    if (it == m_observers.end()) return false;
    m_observers.erase(it);
    return true;
}

void PoseModel::notify() {
    // Copy so an observer may unsubscribe itself
    const std::vector<Subscription> observers = m_observers;
    for (const Subscription& s : observers) {
        if (s.cb) s.cb(m_pose);
    }
}

} // namespace nav
