#pragma once
#include <cstdint>
#include "msg/TelemetrySample.hpp"

namespace msg {

enum class PoseEventType : uint8_t {
  TELEMETRY = 0,   // drivebase sample from the transport
  SET_POSE,        // explicit reposition / reset board
  NUDGE_HEADING,   // manual heading correction
  SET_GEOMETRY,    // robot configuration changed
  CLEAR_GEOMETRY,  // robot configuration removed
  STOP             // shut the owning task down
};

// Everything that may mutate the pose travels through one FIFO of these,
// so telemetry and UI actions are applied strictly in arrival order.
struct PoseEvent {
  PoseEventType type;
  uint64_t t_us;              // Enqueue time (µs, monotonic)

  // TELEMETRY
  TelemetrySample sample;

  // SET_POSE
  double x_mm;
  double y_mm;
  double heading_deg;

  // NUDGE_HEADING
  double delta_deg;

  // SET_GEOMETRY
  double width_mm;
  double length_mm;
  double cor_dx_mm;           // body frame, right-positive
  double cor_dy_mm;           // body frame, forward-positive
};

} // namespace msg
