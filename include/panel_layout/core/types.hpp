#pragma once

#include <Eigen/Dense>
#include <filesystem>
#include <string>
#include <vector>

namespace panel_layout {

namespace fs = std::filesystem;

using VectorXf = Eigen::VectorXf;

// Panel bounding box in page pixel coordinates
struct Region {
    int x;       // Left edge
    int y;       // Top edge
    int width;
    int height;

    int right() const { return x + width; }
    int bottom() const { return y + height; }
    float center_x() const { return static_cast<float>(x) + 0.5f * static_cast<float>(width); }
    float center_y() const { return static_cast<float>(y) + 0.5f * static_cast<float>(height); }
};

inline bool operator==(const Region& a, const Region& b) {
    return a.x == b.x && a.y == b.y && a.width == b.width && a.height == b.height;
}

inline bool operator!=(const Region& a, const Region& b) {
    return !(a == b);
}

inline std::string region_to_string(const Region& r) {
    return "(" + std::to_string(r.x) + ", " + std::to_string(r.y) + ", " +
           std::to_string(r.width) + ", " + std::to_string(r.height) + ")";
}

// Run command enumeration
enum class Command {
    SORT,
    CLEAN_BORDER
};

inline std::string command_to_string(Command command) {
    switch (command) {
        case Command::SORT: return "sort";
        case Command::CLEAN_BORDER: return "clean-border";
        default: return "unknown";
    }
}

} // namespace panel_layout
