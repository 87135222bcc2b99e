// PoseTask.cpp
#include "apps/nav/PoseTask.hpp"

#include <cmath>
#include <iostream>

namespace nav {

// Internal sanitisation of config parameters
// not public API
static inline PoseTaskConfig sanitise(const PoseTaskConfig& in) {
    PoseTaskConfig cfg = in;

    if (cfg.idle_timeout_ms <= 0) cfg.idle_timeout_ms = 100;
    return cfg;
}

static const char* eventName(msg::PoseEventType t) {
    switch (t) {
        case msg::PoseEventType::TELEMETRY: return "TELEMETRY";
        case msg::PoseEventType::SET_POSE: return "SET_POSE";
        case msg::PoseEventType::NUDGE_HEADING: return "NUDGE_HEADING";
        case msg::PoseEventType::SET_GEOMETRY: return "SET_GEOMETRY";
        case msg::PoseEventType::CLEAR_GEOMETRY: return "CLEAR_GEOMETRY";
        case msg::PoseEventType::STOP: return "STOP";
        default: return "UNKNOWN";
    }
}

// ------------------------------
// Event builders
// ------------------------------
static inline msg::PoseEvent blankEvent(msg::PoseEventType type) {
    msg::PoseEvent ev{};
    ev.type = type;
    ev.t_us = Rtos::NowUs();
    return ev;
}

msg::PoseEvent MakeTelemetryEvent(const msg::TelemetrySample& sample) {
    msg::PoseEvent ev = blankEvent(msg::PoseEventType::TELEMETRY);
    ev.sample = sample;
    if (ev.sample.t_us == 0) ev.sample.t_us = ev.t_us;
    return ev;
}

msg::PoseEvent MakeSetPoseEvent(const Pose& pose) {
    msg::PoseEvent ev = blankEvent(msg::PoseEventType::SET_POSE);
    ev.x_mm = pose.x;
    ev.y_mm = pose.y;
    ev.heading_deg = pose.heading;
    return ev;
}

msg::PoseEvent MakeNudgeHeadingEvent(double deltaDeg) {
    msg::PoseEvent ev = blankEvent(msg::PoseEventType::NUDGE_HEADING);
    ev.delta_deg = deltaDeg;
    return ev;
}

msg::PoseEvent MakeSetGeometryEvent(const RobotGeometry& geometry) {
    msg::PoseEvent ev = blankEvent(msg::PoseEventType::SET_GEOMETRY);
    ev.width_mm = geometry.widthMm;
    ev.length_mm = geometry.lengthMm;
    ev.cor_dx_mm = geometry.centerOfRotationOffset.dx;
    ev.cor_dy_mm = geometry.centerOfRotationOffset.dy;
    return ev;
}

msg::PoseEvent MakeClearGeometryEvent() {
    return blankEvent(msg::PoseEventType::CLEAR_GEOMETRY);
}

msg::PoseEvent MakeStopEvent() {
    return blankEvent(msg::PoseEventType::STOP);
}

// ---------------------------------------------------------------------------

PoseTask::PoseTask(const Pose& initial, const PoseTaskConfig& cfg)
    : m_cfg(sanitise(cfg)), m_model(initial, m_cfg.model) {}

void PoseTask::setConfig(const PoseTaskConfig& cfg) {
    m_cfg = sanitise(cfg);
    m_model.setConfig(m_cfg.model);
}

void PoseTask::attachHistory(TelemetryHistory* history) {
    m_history = history;
}

void PoseTask::TaskEntry(void* arg) {
    auto* ctx = static_cast<TaskCtx*>(arg);

    if (!ctx || !ctx->self || !ctx->event_in || !ctx->state_out) {
        std::cerr << "[POSETASK] Invalid task context\n";
        return;
    }

    ctx->self->Run(*ctx->event_in, *ctx->state_out);
}

void PoseTask::Run(PoseEventQueue& event_in, PoseStateQueue& state_out) {
    std::cout << "[POSETASK] started\n";

    msg::PoseEvent ev{};
    msg::PoseState state{};

    while (!StopRequested()) {
        // Wake up periodically so RequestStop() is honoured without an event
        if (!event_in.receive(ev, m_cfg.idle_timeout_ms)) {
            // Stream went quiet inside the spacing window: catch up
            if (flushPendingTelemetry(state)) {
                state_out.send(state, Rtos::MAX_TIMEOUT);
            }
            continue;
        }

        processEvent(ev, state);
        state_out.send(state, Rtos::MAX_TIMEOUT);

        if (ev.type == msg::PoseEventType::STOP) {
            RequestStop();
        }
    }

    std::cout << "[POSETASK] stopped after " << m_event_count << " events ("
              << m_sample_count << " samples, "
              << m_throttled_count << " throttled, "
              << m_rejected_count << " rejected)\n";
}

bool PoseTask::processEvent(const msg::PoseEvent& ev, msg::PoseState& out) {
    const uint64_t t0_us = Rtos::NowUs();
    bool ok = true;

    m_event_count++;

    switch (ev.type) {
        case msg::PoseEventType::TELEMETRY:
            ok = HandleTelemetry(ev.sample);
            break;

        case msg::PoseEventType::SET_POSE: {
            const Pose p{ev.x_mm, ev.y_mm, ev.heading_deg};
            ok = isFinitePose(p);
            if (ok) {
                // The new reference already sits at the held-back counters
                m_model.setPose(p);
                m_has_pending_sample = false;
            }
            break;
        }

        case msg::PoseEventType::NUDGE_HEADING:
            ok = std::isfinite(ev.delta_deg);
            if (ok) m_model.applyManualHeadingAdjustment(ev.delta_deg);
            break;

        case msg::PoseEventType::SET_GEOMETRY: {
            ok = std::isfinite(ev.width_mm) && std::isfinite(ev.length_mm) &&
                 std::isfinite(ev.cor_dx_mm) && std::isfinite(ev.cor_dy_mm) &&
                 ev.width_mm > 0.0 && ev.length_mm > 0.0;
            if (ok) {
                RobotGeometry g;
                g.widthMm = ev.width_mm;
                g.lengthMm = ev.length_mm;
                g.centerOfRotationOffset = {ev.cor_dx_mm, ev.cor_dy_mm};
                m_model.setGeometry(g);
            }
            break;
        }

        case msg::PoseEventType::CLEAR_GEOMETRY:
            m_model.clearGeometry();
            break;

        case msg::PoseEventType::STOP:
            break;

        default:
            ok = false;
            break;
    }

    if (!ok) {
        m_rejected_count++;
        std::cerr << "[POSETASK] Rejected " << eventName(ev.type) << " event\n";
    } else if (m_cfg.log_events && ev.type != msg::PoseEventType::TELEMETRY) {
        const Pose& p = m_model.pose();
        std::cout << "[POSETASK] " << eventName(ev.type)
                  << " -> (" << p.x << ", " << p.y << ", " << p.heading << ")\n";
    }

    FillState(ev, t0_us, out);
    return ok;
}

bool PoseTask::HandleTelemetry(const msg::TelemetrySample& sample) {
    // Throttled samples still become "last known telemetry" so a later
    // reposition references the right counters.
    if (m_cfg.min_sample_spacing_us > 0 && m_has_applied_sample &&
        sample.t_us >= m_last_applied_t_us &&
        sample.t_us - m_last_applied_t_us < m_cfg.min_sample_spacing_us) {
        if (!m_model.recordTelemetry(sample)) return false;
        m_throttled_count++;
        m_has_pending_sample = true;
        return true;
    }

    return ApplySample(sample);
}

bool PoseTask::flushPendingTelemetry(msg::PoseState& out) {
    if (!m_has_pending_sample) return false;

    const uint64_t t0_us = Rtos::NowUs();
    m_has_pending_sample = false;
    const msg::TelemetrySample sample = m_model.lastTelemetry();
    if (!ApplySample(sample)) return false;

    FillState(MakeTelemetryEvent(sample), t0_us, out);
    return true;
}

bool PoseTask::ApplySample(const msg::TelemetrySample& sample) {
    if (!m_model.applyTelemetry(sample)) return false;

    m_has_pending_sample = false;

    m_has_applied_sample = true;
    m_last_applied_t_us = sample.t_us;
    m_sample_count++;

    if (m_history) {
        const Pose& p = m_model.pose();
        TelemetryPoint pt;
        pt.t_us = sample.t_us;
        pt.distance_mm = sample.distance_mm;
        pt.angle_deg = sample.angle_deg;
        pt.x_mm = p.x;
        pt.y_mm = p.y;
        pt.heading_deg = p.heading;
        m_history->record(pt);
    }
    return true;
}

void PoseTask::FillState(const msg::PoseEvent& ev, uint64_t t0_us, msg::PoseState& out) const {
    const uint64_t t1_us = Rtos::NowUs();

    out.t_event_us = ev.t_us;
    out.t_pub_us = t1_us;
    out.exec_us = (t1_us >= t0_us) ? (t1_us - t0_us) : 0;

    const Pose& p = m_model.pose();
    out.x_mm = p.x;
    out.y_mm = p.y;
    out.heading_deg = p.heading;

    out.manual_adj_deg = m_model.manualAdjustment();
    out.ref_valid = m_model.hasReference() ? 1 : 0;
    out.ref_distance_mm = m_model.reference().distanceAtReference;
    out.ref_angle_deg = m_model.reference().angleAtReference;

    out.distance_mm = m_model.hasTelemetry() ? m_model.lastTelemetry().distance_mm : 0.0;
    out.angle_deg = m_model.hasTelemetry() ? m_model.lastTelemetry().angle_deg : 0.0;

    out.tracking = static_cast<uint8_t>(m_model.state());
    out.event_count = m_event_count;
    out.sample_count = m_sample_count;
    out.throttled_count = m_throttled_count;
    out.rejected_count = m_rejected_count;
}

} // namespace nav
