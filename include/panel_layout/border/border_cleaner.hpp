#pragma once

#include "panel_layout/vision/vision_backend.hpp"

#include <opencv2/core.hpp>
#include <optional>

namespace panel_layout::config {
struct BorderConfig;
}

namespace panel_layout::border {

struct BorderOptions {
    float search_zone_ratio = 0.25f; // fraction of panel size scanned from each edge
    int internal_padding = 5;        // pixels cleared inside the detected line
    int safety_margin = 15;          // white frame added before contour search
    int binary_threshold = 240;      // gray levels below count as ink
    int ring_erosion_iterations = 5;
    int min_input_size = 30;
    int min_output_size = 10;
    bool crop = true;
};

BorderOptions border_options_from_config(const config::BorderConfig& cfg);

// Inner rectangle left after removing the border line and padding, in
// input image coordinates. std::nullopt when no usable border was found.
std::optional<cv::Rect> locate_border(const cv::Mat& image,
                                      const BorderOptions& options = {},
                                      const vision::VisionBackend& backend = vision::default_backend());

// Crops to `inner`, or keeps the size and paints everything outside it
// white when `crop` is false.
cv::Mat remove_border_at(const cv::Mat& image, const cv::Rect& inner, bool crop = true);

// Returns a new image without the outer border line. When no border is
// found the result is an unchanged copy of the input.
cv::Mat remove_border(const cv::Mat& image,
                      const BorderOptions& options = {},
                      const vision::VisionBackend& backend = vision::default_backend());

cv::Mat remove_border(const cv::Mat& image, float search_zone_ratio, int internal_padding = 5);

} // namespace panel_layout::border
