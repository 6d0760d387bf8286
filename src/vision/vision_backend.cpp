#include "panel_layout/vision/vision_backend.hpp"
#include "panel_layout/core/errors.hpp"

#include <opencv2/imgproc.hpp>

namespace panel_layout::vision {

namespace {

// One Zhang-Suen sub-iteration over a 0/1 image with a one-pixel zero frame.
// Returns the number of pixels removed.
int thinning_pass(cv::Mat& img, int step) {
    cv::Mat marker = cv::Mat::zeros(img.size(), CV_8UC1);

    for (int y = 1; y < img.rows - 1; ++y) {
        const uchar* above = img.ptr<uchar>(y - 1);
        const uchar* row = img.ptr<uchar>(y);
        const uchar* below = img.ptr<uchar>(y + 1);
        uchar* mark = marker.ptr<uchar>(y);

        for (int x = 1; x < img.cols - 1; ++x) {
            if (row[x] == 0) continue;

            // Neighbours clockwise from north
            const int p2 = above[x];
            const int p3 = above[x + 1];
            const int p4 = row[x + 1];
            const int p5 = below[x + 1];
            const int p6 = below[x];
            const int p7 = below[x - 1];
            const int p8 = row[x - 1];
            const int p9 = above[x - 1];

            const int transitions = (p2 == 0 && p3 == 1) + (p3 == 0 && p4 == 1) +
                                    (p4 == 0 && p5 == 1) + (p5 == 0 && p6 == 1) +
                                    (p6 == 0 && p7 == 1) + (p7 == 0 && p8 == 1) +
                                    (p8 == 0 && p9 == 1) + (p9 == 0 && p2 == 1);
            const int neighbours = p2 + p3 + p4 + p5 + p6 + p7 + p8 + p9;

            const int m1 = step == 0 ? (p2 * p4 * p6) : (p2 * p4 * p8);
            const int m2 = step == 0 ? (p4 * p6 * p8) : (p2 * p6 * p8);

            if (transitions == 1 && neighbours >= 2 && neighbours <= 6 && m1 == 0 && m2 == 0) {
                mark[x] = 1;
            }
        }
    }

    const int removed = cv::countNonZero(marker);
    img.setTo(0, marker);
    return removed;
}

} // namespace

cv::Mat thin_zhang_suen(const cv::Mat& mask) {
    if (mask.empty()) return cv::Mat();
    if (mask.type() != CV_8UC1) {
        throw ValidationError("thinning expects an 8-bit single channel mask");
    }

    cv::Mat work;
    cv::copyMakeBorder(mask, work, 1, 1, 1, 1, cv::BORDER_CONSTANT, cv::Scalar(0));
    work = work > 0;
    work /= 255;

    while (true) {
        int removed = thinning_pass(work, 0);
        removed += thinning_pass(work, 1);
        if (removed == 0) break;
    }

    cv::Mat out = work(cv::Rect(1, 1, mask.cols, mask.rows)).clone();
    out *= 255;
    return out;
}

std::vector<Contour> OpenCvBackend::extract_boundaries(const cv::Mat& mask) const {
    std::vector<Contour> contours;
    if (mask.empty()) return contours;

    cv::Mat work = mask.clone();
    cv::findContours(work, contours, cv::RETR_EXTERNAL, cv::CHAIN_APPROX_SIMPLE);
    return contours;
}

cv::Mat OpenCvBackend::skeletonize(const cv::Mat& mask) const {
    return thin_zhang_suen(mask);
}

const VisionBackend& default_backend() {
    static const OpenCvBackend backend;
    return backend;
}

} // namespace panel_layout::vision
