#include "apps/nav/TelemetryHistory.hpp"

#include <cerrno>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <system_error>

namespace nav {

TelemetryHistory::TelemetryHistory(size_t capacity)
    : m_buffer(capacity > 0 ? capacity : DEFAULT_CAPACITY) {}

void TelemetryHistory::record(const TelemetryPoint& p) {
    m_buffer[m_head] = p;
    m_head = (m_head + 1) % m_buffer.size();
    if (m_count < m_buffer.size()) m_count++;
}

void TelemetryHistory::clear() {
    m_head = 0;
    m_count = 0;
}

std::vector<TelemetryPoint> TelemetryHistory::points() const {
    std::vector<TelemetryPoint> out;
    out.reserve(m_count);

    const size_t cap = m_buffer.size();
    const size_t first = (m_head + cap - m_count) % cap;
    for (size_t i = 0; i < m_count; ++i) {
        out.push_back(m_buffer[(first + i) % cap]);
    }
    return out;
}

bool TelemetryHistory::writeCsv(const std::string& path) const {
    const std::filesystem::path p(path);
    if (p.has_parent_path()) {
        std::error_code ec;
        std::filesystem::create_directories(p.parent_path(), ec);
        if (ec) {
            std::cerr << "[HISTORY] ERROR: could not create " << p.parent_path()
                      << " (" << ec.message() << ")\n";
            return false;
        }
    }

    std::ofstream f(path, std::ios::out | std::ios::trunc);
    if (!f) {
        std::cerr << "[HISTORY] ERROR: could not open CSV: " << path
                  << " errno=" << errno << " (" << std::strerror(errno) << ")\n";
        return false;
    }

    f << "k,t_us,distance_mm,angle_deg,x_mm,y_mm,heading_deg\n";
    f << std::fixed << std::setprecision(3);

    size_t k = 0;
    for (const TelemetryPoint& pt : points()) {
        f << k++ << "," << pt.t_us << ","
          << pt.distance_mm << "," << pt.angle_deg << ","
          << pt.x_mm << "," << pt.y_mm << "," << pt.heading_deg << "\n";
    }

    f.flush();
    if (!f) {
        std::cerr << "[HISTORY] ERROR: write failed: " << path << "\n";
        return false;
    }

    std::cout << "[HISTORY] Wrote " << path << " (" << k << " rows)\n";
    return true;
}

} // namespace nav
