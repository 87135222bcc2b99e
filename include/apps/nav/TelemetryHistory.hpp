#pragma once
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace nav {

// One applied telemetry sample together with the pose it produced
struct TelemetryPoint {
    uint64_t t_us = 0;
    double distance_mm = 0.0;
    double angle_deg = 0.0;
    double x_mm = 0.0;
    double y_mm = 0.0;
    double heading_deg = 0.0;
};

// Bounded run log. Oldest points are overwritten once full.
// Single owner; not thread-safe.
class TelemetryHistory {
public:
    static constexpr size_t DEFAULT_CAPACITY = 5000;

    explicit TelemetryHistory(size_t capacity = DEFAULT_CAPACITY);

    void record(const TelemetryPoint& p);
    void clear();

    size_t size() const { return m_count; }
    size_t capacity() const { return m_buffer.size(); }

    // Oldest first
    std::vector<TelemetryPoint> points() const;

    // k,t_us,distance_mm,angle_deg,x_mm,y_mm,heading_deg
    // Parent directories are created. Returns false if the file can't be written.
    bool writeCsv(const std::string& path) const;

private:
    std::vector<TelemetryPoint> m_buffer;
    size_t m_head = 0;  // next write slot
    size_t m_count = 0;
};

} // namespace nav
