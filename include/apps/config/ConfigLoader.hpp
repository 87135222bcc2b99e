#pragma once
#include <string>

#include "apps/nav/Geometry.hpp"
#include "apps/nav/EdgePositionConverter.hpp"

namespace config {

// Where the robot is put down at start-up, in edge terms
struct StartPlacement {
    nav::MatSide side = nav::MatSide::LEFT;
    double from_bottom_mm = 0.0;
    double from_side_mm = 0.0;
    double heading_deg = 0.0;
};

struct AppConfig {
    nav::RobotConfig robot{};
    nav::MatDimensions mat{};
    StartPlacement start{};
};

// Replace invalid values with defaults
AppConfig sanitise(const AppConfig& in);

// Read a YAML/JSON/XML file (format from the extension). Keys:
//
//   robot:  width_studs, length_studs, cor_from_left_studs, cor_from_top_studs
//   mat:    width_mm, height_mm
//   start:  side ("left"/"right"), from_bottom_mm, from_side_mm, heading_deg
//
// Missing keys keep the values already in out. Returns false (out untouched)
// if the file can't be opened or parsed.
bool LoadAppConfig(const std::string& path, AppConfig& out);

void PrintAppConfig(const AppConfig& cfg);

} // namespace config
