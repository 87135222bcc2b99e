#pragma once
#include <cstdint>

namespace msg {

// Read-only pose snapshot published after every processed event.
struct PoseState {
  uint64_t t_event_us;  // Timestamp of the event that produced this snapshot
  uint64_t t_pub_us;    // Publication time
  uint64_t exec_us;     // Time spent applying the event

  double x_mm;          // mm from the mat's left edge
  double y_mm;          // mm from the mat's bottom edge
  double heading_deg;   // [0, 360), clockwise from north

  double manual_adj_deg;    // Manual heading adjustment since last reference
  uint8_t ref_valid;        // 1 once a telemetry reference exists
  double ref_distance_mm;
  double ref_angle_deg;

  double distance_mm;       // Last telemetry seen (0 if none)
  double angle_deg;

  uint8_t  tracking;        // 0 = UNINITIALIZED, 1 = TRACKING
  uint32_t event_count;     // Events processed
  uint32_t sample_count;    // Telemetry samples applied
  uint32_t throttled_count; // Telemetry samples recorded but not applied
  uint32_t rejected_count;  // Non-finite samples / commands ignored
};

} // namespace msg
