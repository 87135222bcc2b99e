// test/config_loader_test.cpp
//
// Robot / mat / start configuration through cv::FileStorage.
// Writes its fixtures to the system temp directory.

#include <cmath>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>

#include "apps/config/ConfigLoader.hpp"

namespace fs = std::filesystem;

static bool write_file(const fs::path& p, const std::string& text) {
    std::ofstream f(p, std::ios::out | std::ios::trunc);
    if (!f) {
        std::cerr << "[TEST] ERROR: could not write " << p << "\n";
        return false;
    }
    f << text;
    return true;
}

static bool near(double a, double b) { return std::fabs(a - b) <= 1e-9; }

int main() {
    std::cout << "=== CONFIG LOADER TEST ===\n";

    const fs::path dir = fs::temp_directory_path() / "matnav_config_test";
    fs::create_directories(dir);

    // ---- full YAML ----
    const fs::path full = dir / "full.yaml";
    if (!write_file(full,
        "%YAML:1.0\n"
        "---\n"
        "robot:\n"
        "  width_studs: 16\n"
        "  length_studs: 20\n"
        "  cor_from_left_studs: 8\n"
        "  cor_from_top_studs: 6.5\n"
        "mat:\n"
        "  width_mm: 2000\n"
        "  height_mm: 1000\n"
        "start:\n"
        "  side: \"right\"\n"
        "  from_bottom_mm: 40\n"
        "  from_side_mm: 60.5\n"
        "  heading_deg: -90\n")) {
        return 1;
    }

    config::AppConfig cfg{};
    if (!config::LoadAppConfig(full.string(), cfg)) {
        std::cerr << "[TEST] FAIL: full config not loaded\n";
        return 1;
    }
    if (!near(cfg.robot.widthStuds, 16) || !near(cfg.robot.lengthStuds, 20) ||
        !near(cfg.robot.corFromLeftStuds, 8) || !near(cfg.robot.corFromTopStuds, 6.5) ||
        !near(cfg.mat.widthMm, 2000) || !near(cfg.mat.heightMm, 1000) ||
        cfg.start.side != nav::MatSide::RIGHT ||
        !near(cfg.start.from_bottom_mm, 40) || !near(cfg.start.from_side_mm, 60.5) ||
        !near(cfg.start.heading_deg, 270)) {
        std::cerr << "[TEST] FAIL: full config values\n";
        config::PrintAppConfig(cfg);
        return 1;
    }

    const nav::RobotGeometry g = nav::geometryFromConfig(cfg.robot);
    if (!near(g.widthMm, 128) || !near(g.lengthMm, 160) ||
        !near(g.centerOfRotationOffset.dx, 0) || !near(g.centerOfRotationOffset.dy, 28)) {
        std::cerr << "[TEST] FAIL: geometry from loaded robot\n";
        return 1;
    }
    std::cout << "[TEST] ok: full YAML\n";

    // ---- partial JSON with bad values: defaults fill in ----
    const fs::path partial = dir / "partial.json";
    if (!write_file(partial,
        "{\n"
        "  \"robot\": { \"width_studs\": -3, \"cor_from_left_studs\": 99 },\n"
        "  \"mat\": { \"height_mm\": 0 },\n"
        "  \"start\": { \"side\": \"middle\", \"from_side_mm\": -10 }\n"
        "}\n")) {
        return 1;
    }

    config::AppConfig p{};
    if (!config::LoadAppConfig(partial.string(), p)) {
        std::cerr << "[TEST] FAIL: partial config not loaded\n";
        return 1;
    }
    const config::AppConfig def{};
    if (!near(p.robot.widthStuds, def.robot.widthStuds) ||
        !near(p.robot.lengthStuds, def.robot.lengthStuds) ||
        !near(p.robot.corFromLeftStuds, 0.5 * def.robot.widthStuds) ||
        !near(p.mat.widthMm, nav::FLL_MAT_WIDTH_MM) ||
        !near(p.mat.heightMm, nav::FLL_MAT_HEIGHT_MM) ||
        p.start.side != nav::MatSide::LEFT ||
        !near(p.start.from_side_mm, 0.0)) {
        std::cerr << "[TEST] FAIL: partial config sanitised\n";
        config::PrintAppConfig(p);
        return 1;
    }
    std::cout << "[TEST] ok: partial JSON sanitised\n";

    // ---- failures leave the output untouched ----
    config::AppConfig keep{};
    keep.mat.widthMm = 1234.0;

    if (config::LoadAppConfig((dir / "missing.yaml").string(), keep) || !near(keep.mat.widthMm, 1234.0)) {
        std::cerr << "[TEST] FAIL: missing file\n";
        return 1;
    }

    const fs::path broken = dir / "broken.json";
    if (!write_file(broken, "{ \"robot\": { \"width_studs\": 16, \n")) return 1;
    if (config::LoadAppConfig(broken.string(), keep) || !near(keep.mat.widthMm, 1234.0)) {
        std::cerr << "[TEST] FAIL: broken file\n";
        return 1;
    }
    std::cout << "[TEST] ok: failures reported\n";

    fs::remove_all(dir);
    std::cout << "=== DONE ===\n";
    return 0;
}
