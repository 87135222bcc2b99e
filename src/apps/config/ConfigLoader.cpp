#include "apps/config/ConfigLoader.hpp"

#include <cmath>
#include <iostream>

#include <opencv2/core.hpp>

namespace config {

namespace {

static inline bool positive(double v) {
    return std::isfinite(v) && v > 0.0;
}

static inline double nonNegative(double v) {
    return (std::isfinite(v) && v > 0.0) ? v : 0.0;
}

// Overwrite dst only when the key exists and holds a number
static inline void readReal(const cv::FileNode& parent, const char* key, double& dst) {
    const cv::FileNode n = parent[key];
    if (n.empty()) return;
    if (!n.isReal() && !n.isInt()) {
        std::cerr << "[CONFIG] Ignoring non-numeric " << parent.name() << "." << key << "\n";
        return;
    }
    dst = static_cast<double>(n);
}

static inline void readSide(const cv::FileNode& parent, const char* key, nav::MatSide& dst) {
    const cv::FileNode n = parent[key];
    if (n.empty()) return;
    if (!n.isString()) {
        std::cerr << "[CONFIG] Ignoring non-string " << parent.name() << "." << key << "\n";
        return;
    }

    const std::string s = static_cast<std::string>(n);
    if (s == "left" || s == "LEFT") {
        dst = nav::MatSide::LEFT;
    } else if (s == "right" || s == "RIGHT") {
        dst = nav::MatSide::RIGHT;
    } else {
        std::cerr << "[CONFIG] Unknown side '" << s << "', keeping "
                  << nav::matSideName(dst) << "\n";
    }
}

} // namespace

AppConfig sanitise(const AppConfig& in) {
    AppConfig cfg = in;
    const nav::RobotConfig def_robot{};
    const nav::MatDimensions def_mat{};

    if (!positive(cfg.robot.widthStuds)) cfg.robot.widthStuds = def_robot.widthStuds;
    if (!positive(cfg.robot.lengthStuds)) cfg.robot.lengthStuds = def_robot.lengthStuds;

    // Centre of rotation must sit on the footprint
    if (!std::isfinite(cfg.robot.corFromLeftStuds) || cfg.robot.corFromLeftStuds < 0.0 ||
        cfg.robot.corFromLeftStuds > cfg.robot.widthStuds) {
        cfg.robot.corFromLeftStuds = 0.5 * cfg.robot.widthStuds;
    }
    if (!std::isfinite(cfg.robot.corFromTopStuds) || cfg.robot.corFromTopStuds < 0.0 ||
        cfg.robot.corFromTopStuds > cfg.robot.lengthStuds) {
        cfg.robot.corFromTopStuds = 0.5 * cfg.robot.lengthStuds;
    }

    if (!positive(cfg.mat.widthMm)) cfg.mat.widthMm = def_mat.widthMm;
    if (!positive(cfg.mat.heightMm)) cfg.mat.heightMm = def_mat.heightMm;

    cfg.start.from_bottom_mm = nonNegative(cfg.start.from_bottom_mm);
    cfg.start.from_side_mm = nonNegative(cfg.start.from_side_mm);
    cfg.start.heading_deg = nav::normalizeHeading(cfg.start.heading_deg);

    return cfg;
}

bool LoadAppConfig(const std::string& path, AppConfig& out) {
    AppConfig cfg = out;

    try {
        cv::FileStorage fs(path, cv::FileStorage::READ);
        if (!fs.isOpened()) {
            std::cerr << "[CONFIG] ERROR: could not open " << path << "\n";
            return false;
        }

        const cv::FileNode robot = fs["robot"];
        if (!robot.empty()) {
            readReal(robot, "width_studs", cfg.robot.widthStuds);
            readReal(robot, "length_studs", cfg.robot.lengthStuds);
            readReal(robot, "cor_from_left_studs", cfg.robot.corFromLeftStuds);
            readReal(robot, "cor_from_top_studs", cfg.robot.corFromTopStuds);
        }

        const cv::FileNode mat = fs["mat"];
        if (!mat.empty()) {
            readReal(mat, "width_mm", cfg.mat.widthMm);
            readReal(mat, "height_mm", cfg.mat.heightMm);
        }

        const cv::FileNode start = fs["start"];
        if (!start.empty()) {
            readSide(start, "side", cfg.start.side);
            readReal(start, "from_bottom_mm", cfg.start.from_bottom_mm);
            readReal(start, "from_side_mm", cfg.start.from_side_mm);
            readReal(start, "heading_deg", cfg.start.heading_deg);
        }

        fs.release();
    } catch (const cv::Exception& e) {
        std::cerr << "[CONFIG] ERROR: could not parse " << path << ": " << e.what() << "\n";
        return false;
    }

    out = sanitise(cfg);
    std::cout << "[CONFIG] Loaded " << path << "\n";
    return true;
}

void PrintAppConfig(const AppConfig& cfg) {
    std::cout << "[CONFIG] robot " << cfg.robot.widthStuds << "x" << cfg.robot.lengthStuds
              << " studs, CoR " << cfg.robot.corFromLeftStuds << " from left, "
              << cfg.robot.corFromTopStuds << " from top\n";
    std::cout << "[CONFIG] mat " << cfg.mat.widthMm << "x" << cfg.mat.heightMm << " mm\n";
    std::cout << "[CONFIG] start " << nav::matSideName(cfg.start.side)
              << " side=" << cfg.start.from_side_mm << " mm"
              << " bottom=" << cfg.start.from_bottom_mm << " mm"
              << " heading=" << cfg.start.heading_deg << " deg\n";
}

} // namespace config
