#pragma once

#include <optional>
#include <string>
#include <vector>

#include <opencv2/core.hpp>

#include "calibration/ball_profile.hpp"
#include "core/types.hpp"

namespace jugsync {

struct RoiSample {
    std::vector<cv::Vec3d> hsv;
    std::vector<double> depth_m;
};

// Collects HSV and depth pixels inside a circle of an aligned frame.
RoiSample sampleCircle(const AlignedFrame& frame, const cv::Point2f& center, float pixel_radius);

// Populates all three models of `profile` from the circle. Depth derivations are
// skipped (with a warning) for color-only frames; color is still derived.
bool calibrateFromCircle(const AlignedFrame& frame,
                         const cv::Point2f& center,
                         float pixel_radius,
                         const std::optional<CameraIntrinsics>& intrinsics,
                         const ColorModelParams& params,
                         BallProfile& profile,
                         std::string& error);

}  // namespace jugsync
