// test/telemetry_history_test.cpp
//
// Bounded run log + CSV export. Exits non-zero on the first failure.

#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>

#include "apps/nav/TelemetryHistory.hpp"

static nav::TelemetryPoint point(uint64_t t_us) {
    nav::TelemetryPoint p;
    p.t_us = t_us;
    p.distance_mm = double(t_us) * 10.0;
    p.angle_deg = 1.5;
    p.x_mm = 100.0;
    p.y_mm = 200.0;
    p.heading_deg = 90.0;
    return p;
}

static size_t count_lines(const std::string& path) {
    std::ifstream f(path);
    std::string line;
    size_t n = 0;
    while (std::getline(f, line)) n++;
    return n;
}

int main() {
    std::cout << "=== TELEMETRY HISTORY TEST ===\n";
    namespace fs = std::filesystem;

    nav::TelemetryHistory hist(3);
    if (hist.capacity() != 3 || hist.size() != 0) {
        std::cerr << "[TEST] FAIL: initial state\n";
        return 1;
    }

    for (uint64_t t = 1; t <= 5; ++t) hist.record(point(t));

    const auto pts = hist.points();
    if (hist.size() != 3 || pts.size() != 3 ||
        pts[0].t_us != 3 || pts[1].t_us != 4 || pts[2].t_us != 5) {
        std::cerr << "[TEST] FAIL: ring keeps the newest points oldest first\n";
        return 1;
    }
    std::cout << "[TEST] ok: ring order\n";

    const fs::path dir = fs::temp_directory_path() / "matnav_history_test";
    fs::remove_all(dir);

    // Parent directories are created on demand
    const std::string csv = (dir / "nested" / "history.csv").string();
    if (!hist.writeCsv(csv) || count_lines(csv) != 4) {
        std::cerr << "[TEST] FAIL: CSV export\n";
        return 1;
    }
    std::cout << "[TEST] ok: CSV export\n";

    // A file where a directory is needed
    {
        std::ofstream blocker(dir / "blocker");
        blocker << "x";
    }
    if (hist.writeCsv((dir / "blocker" / "history.csv").string())) {
        std::cerr << "[TEST] FAIL: write through a file should fail\n";
        return 1;
    }
    std::cout << "[TEST] ok: unwritable path reported\n";

    hist.clear();
    if (hist.size() != 0 || !hist.points().empty()) {
        std::cerr << "[TEST] FAIL: clear\n";
        return 1;
    }
    hist.record(point(42));
    if (hist.points().size() != 1 || hist.points()[0].t_us != 42) {
        std::cerr << "[TEST] FAIL: record after clear\n";
        return 1;
    }

    // Zero capacity falls back to the default
    nav::TelemetryHistory def(0);
    if (def.capacity() != nav::TelemetryHistory::DEFAULT_CAPACITY) {
        std::cerr << "[TEST] FAIL: default capacity\n";
        return 1;
    }

    fs::remove_all(dir);
    std::cout << "=== DONE ===\n";
    return 0;
}
