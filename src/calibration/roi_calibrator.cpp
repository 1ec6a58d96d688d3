#include "calibration/roi_calibrator.hpp"

#include <algorithm>
#include <cmath>
#include <iostream>

#include <opencv2/imgproc.hpp>

#include "core/math_utils.hpp"

namespace jugsync {

RoiSample sampleCircle(const AlignedFrame& frame, const cv::Point2f& center, float pixel_radius) {
    RoiSample out;
    if (frame.color_bgr.empty() || frame.color_bgr.type() != CV_8UC3 || pixel_radius <= 0.0F) {
        return out;
    }

    cv::Mat hsv;
    cv::cvtColor(frame.color_bgr, hsv, cv::COLOR_BGR2HSV);

    const bool has_depth = !frame.depth_m.empty() && frame.depth_m.type() == CV_32F &&
                           frame.depth_m.size() == frame.color_bgr.size();

    const int x0 = std::max(0, static_cast<int>(std::floor(center.x - pixel_radius)));
    const int y0 = std::max(0, static_cast<int>(std::floor(center.y - pixel_radius)));
    const int x1 = std::min(hsv.cols - 1, static_cast<int>(std::ceil(center.x + pixel_radius)));
    const int y1 = std::min(hsv.rows - 1, static_cast<int>(std::ceil(center.y + pixel_radius)));
    const float r2 = pixel_radius * pixel_radius;

    for (int y = y0; y <= y1; ++y) {
        const auto* hsv_row = hsv.ptr<cv::Vec3b>(y);
        const float* depth_row = has_depth ? frame.depth_m.ptr<float>(y) : nullptr;
        for (int x = x0; x <= x1; ++x) {
            const float dx = static_cast<float>(x) - center.x;
            const float dy = static_cast<float>(y) - center.y;
            if (dx * dx + dy * dy > r2) {
                continue;
            }
            const cv::Vec3b& p = hsv_row[x];
            out.hsv.emplace_back(p[0], p[1], p[2]);
            if (depth_row != nullptr && depth_row[x] > 0.0F && std::isfinite(depth_row[x])) {
                out.depth_m.push_back(static_cast<double>(depth_row[x]));
            }
        }
    }
    return out;
}

bool calibrateFromCircle(const AlignedFrame& frame,
                         const cv::Point2f& center,
                         float pixel_radius,
                         const std::optional<CameraIntrinsics>& intrinsics,
                         const ColorModelParams& params,
                         BallProfile& profile,
                         std::string& error) {
    const RoiSample sample = sampleCircle(frame, center, pixel_radius);
    if (!profile.deriveColorModel(sample.hsv, params)) {
        error = "no color pixels inside the calibration circle";
        return false;
    }

    if (sample.depth_m.empty()) {
        std::cerr << "calibration: no valid depth inside the circle, size model left unset for "
                  << profile.name() << "\n";
        error.clear();
        return true;
    }

    if (profile.recordDepthSamples(sample.depth_m) &&
        !profile.deriveSizeModel(pixel_radius, median(sample.depth_m), intrinsics)) {
        std::cerr << "calibration: size model left unset for " << profile.name() << "\n";
    }
    error.clear();
    return true;
}

}  // namespace jugsync
