#pragma once
#include <cstdint>

namespace msg {

// One drivebase telemetry sample as delivered by the hub transport.
// Both counters accumulate since the robot program started; neither is wrapped.
struct TelemetrySample {
  uint64_t t_us;        // Receive timestamp (µs, monotonic). Last received wins.
  double   distance_mm; // Total driven distance (mm), signed.
  double   angle_deg;   // Total drivebase rotation (deg), clockwise positive.
};

} // namespace msg
