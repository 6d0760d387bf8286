#pragma once

#include <opencv2/core.hpp>
#include <vector>

namespace panel_layout::vision {

using Contour = std::vector<cv::Point>;

// Boundary extraction and thinning used by the border cleaner. Tests
// substitute synthetic fixtures through this interface.
class VisionBackend {
public:
    virtual ~VisionBackend() = default;

    // Outer boundaries of the foreground (non-zero) blobs of an 8-bit mask.
    virtual std::vector<Contour> extract_boundaries(const cv::Mat& mask) const = 0;

    // One-pixel-wide skeleton of an 8-bit mask (0 / 255), same size as input.
    virtual cv::Mat skeletonize(const cv::Mat& mask) const = 0;
};

class OpenCvBackend : public VisionBackend {
public:
    std::vector<Contour> extract_boundaries(const cv::Mat& mask) const override;
    cv::Mat skeletonize(const cv::Mat& mask) const override;
};

const VisionBackend& default_backend();

// Zhang-Suen thinning of an 8-bit mask. Output is 0 / 255.
cv::Mat thin_zhang_suen(const cv::Mat& mask);

} // namespace panel_layout::vision
