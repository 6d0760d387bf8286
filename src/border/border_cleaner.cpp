#include "panel_layout/border/border_cleaner.hpp"
#include "panel_layout/config/configuration.hpp"
#include "panel_layout/core/errors.hpp"

#include <opencv2/imgproc.hpp>

#include <cstdlib>
#include <string>
#include <vector>

namespace panel_layout::border {

namespace {

enum class ScanAxis {
    ROWS,   // top / bottom borders
    COLS    // left / right borders
};

void check_options(const BorderOptions& options) {
    if (options.search_zone_ratio <= 0.0f || options.search_zone_ratio > 0.5f) {
        throw ValidationError("search_zone_ratio must be in (0,0.5]");
    }
    if (options.internal_padding < 0 || options.safety_margin < 0) {
        throw ValidationError("internal_padding and safety_margin must be >= 0");
    }
    if (options.ring_erosion_iterations < 1) {
        throw ValidationError("ring_erosion_iterations must be >= 1");
    }
}

cv::Mat to_gray(const cv::Mat& img) {
    if (img.depth() != CV_8U) {
        throw ValidationError("border removal expects an 8-bit image");
    }
    cv::Mat gray;
    switch (img.channels()) {
        case 1: gray = img.clone(); break;
        case 3: cv::cvtColor(img, gray, cv::COLOR_BGR2GRAY); break;
        case 4: cv::cvtColor(img, gray, cv::COLOR_BGRA2GRAY); break;
        default:
            throw ValidationError("unsupported channel count: " + std::to_string(img.channels()));
    }
    return gray;
}

// Scans from `start` towards `stop` (exclusive). Each line scores its
// skeleton pixel count, weighted up the further out it lies; the last best
// line wins.
int find_best_border_line(const cv::Mat& skeleton, ScanAxis axis, int start, int stop) {
    const int span = std::abs(stop - start);
    if (span == 0) return start;

    const int step = stop > start ? 1 : -1;
    int best = start;
    double max_score = -1.0;
    for (int i = start; i != stop; i += step) {
        const int continuity = axis == ScanAxis::ROWS ? cv::countNonZero(skeleton.row(i))
                                                      : cv::countNonZero(skeleton.col(i));
        const double position_weight = static_cast<double>(std::abs(i - start)) / span;
        const double score = continuity * (1.0 + position_weight);
        if (score >= max_score) {
            max_score = score;
            best = i;
        }
    }
    return best;
}

} // namespace

BorderOptions border_options_from_config(const config::BorderConfig& cfg) {
    BorderOptions opts;
    opts.search_zone_ratio = cfg.search_zone_ratio;
    opts.internal_padding = cfg.internal_padding;
    opts.safety_margin = cfg.safety_margin;
    opts.binary_threshold = cfg.binary_threshold;
    opts.ring_erosion_iterations = cfg.ring_erosion_iterations;
    opts.min_input_size = cfg.min_input_size;
    opts.min_output_size = cfg.min_output_size;
    opts.crop = cfg.crop;
    return opts;
}

std::optional<cv::Rect> locate_border(const cv::Mat& image,
                                      const BorderOptions& options,
                                      const vision::VisionBackend& backend) {
    check_options(options);
    if (image.empty() || image.rows < options.min_input_size || image.cols < options.min_input_size) {
        return std::nullopt;
    }

    // White margin keeps the frame clear of the image edge
    const int margin = options.safety_margin;
    cv::Mat padded;
    cv::copyMakeBorder(image, padded, margin, margin, margin, margin,
                       cv::BORDER_CONSTANT, cv::Scalar::all(255));

    cv::Mat gray = to_gray(padded);
    cv::Mat ink;
    cv::threshold(gray, ink, options.binary_threshold, 255, cv::THRESH_BINARY_INV);

    std::vector<vision::Contour> contours = backend.extract_boundaries(ink);
    if (contours.empty()) return std::nullopt;

    size_t largest = 0;
    double largest_area = -1.0;
    for (size_t i = 0; i < contours.size(); ++i) {
        const double area = cv::contourArea(contours[i]);
        if (area > largest_area) {
            largest_area = area;
            largest = i;
        }
    }

    const cv::Rect bbox = cv::boundingRect(contours[largest]) & cv::Rect(0, 0, gray.cols, gray.rows);
    if (bbox.width <= 0 || bbox.height <= 0) return std::nullopt;

    // The frame must reach into the search band along every image edge
    const int zone_x = static_cast<int>(image.cols * options.search_zone_ratio);
    const int zone_y = static_cast<int>(image.rows * options.search_zone_ratio);
    const int gap_left = bbox.x - margin;
    const int gap_top = bbox.y - margin;
    const int gap_right = image.cols - (bbox.x + bbox.width - margin);
    const int gap_bottom = image.rows - (bbox.y + bbox.height - margin);
    if (gap_left > zone_x || gap_right > zone_x || gap_top > zone_y || gap_bottom > zone_y) {
        return std::nullopt;
    }

    // Hollow ring along the panel outline, thinned to its centerline
    cv::Mat filled = cv::Mat::zeros(gray.size(), CV_8UC1);
    cv::drawContours(filled, contours, static_cast<int>(largest), cv::Scalar(255), cv::FILLED);
    cv::Mat eroded;
    cv::erode(filled, eroded, cv::Mat::ones(3, 3, CV_8UC1), cv::Point(-1, -1),
              options.ring_erosion_iterations);
    cv::Mat ring;
    cv::subtract(filled, eroded, ring);

    cv::Mat skeleton = backend.skeletonize(ring);
    if (skeleton.size() != ring.size() || skeleton.type() != CV_8UC1) {
        throw ValidationError("skeletonize must return an 8-bit mask of the input size");
    }
    const cv::Mat roi = skeleton(bbox);

    const int h = bbox.height;
    const int w = bbox.width;
    const int top_end = static_cast<int>(h * options.search_zone_ratio);
    const int left_end = static_cast<int>(w * options.search_zone_ratio);

    // Each side is scanned from the inner edge of the search zone outwards
    const int best_top = find_best_border_line(roi, ScanAxis::ROWS, top_end, -1);
    const int best_bottom = find_best_border_line(roi, ScanAxis::ROWS, h - top_end, h);
    const int best_left = find_best_border_line(roi, ScanAxis::COLS, left_end, -1);
    const int best_right = find_best_border_line(roi, ScanAxis::COLS, w - left_end, w);

    const int pad = options.internal_padding;
    const int x1 = bbox.x + best_left + pad - margin;
    const int y1 = bbox.y + best_top + pad - margin;
    const int x2 = bbox.x + best_right - pad - margin;
    const int y2 = bbox.y + best_bottom - pad - margin;
    if (x1 >= x2 || y1 >= y2) return std::nullopt;

    const cv::Rect inner = cv::Rect(x1, y1, x2 - x1, y2 - y1) & cv::Rect(0, 0, image.cols, image.rows);
    if (inner.width < options.min_output_size || inner.height < options.min_output_size) {
        return std::nullopt;
    }
    return inner;
}

cv::Mat remove_border(const cv::Mat& image,
                      const BorderOptions& options,
                      const vision::VisionBackend& backend) {
    const std::optional<cv::Rect> inner = locate_border(image, options, backend);
    if (!inner) return image.clone();
    return remove_border_at(image, *inner, options.crop);
}

cv::Mat remove_border_at(const cv::Mat& image, const cv::Rect& inner, bool crop) {
    const cv::Rect clipped = inner & cv::Rect(0, 0, image.cols, image.rows);
    if (clipped.width <= 0 || clipped.height <= 0) {
        throw ValidationError("border rectangle lies outside the image");
    }

    if (crop) {
        return image(clipped).clone();
    }

    cv::Mat keep = cv::Mat::zeros(image.size(), CV_8UC1);
    keep(clipped).setTo(255);
    cv::Mat outside;
    cv::bitwise_not(keep, outside);

    cv::Mat out = image.clone();
    out.setTo(cv::Scalar::all(255), outside);
    return out;
}

cv::Mat remove_border(const cv::Mat& image, float search_zone_ratio, int internal_padding) {
    BorderOptions opts;
    opts.search_zone_ratio = search_zone_ratio;
    opts.internal_padding = internal_padding;
    return remove_border(image, opts, vision::default_backend());
}

} // namespace panel_layout::border
