#pragma once

#include <optional>
#include <string>
#include <vector>

#include <opencv2/core.hpp>

#include "calibration/ball_profile.hpp"
#include "core/types.hpp"

namespace jugsync {

struct Blob {
    std::vector<cv::Point> contour;
    cv::Point2f center{0.0F, 0.0F};
    float radius_px{0.0F};
};

struct IdentifiedBall {
    std::string profile_id;
    std::string name;
    cv::Point2f center{0.0F, 0.0F};
    float radius_px{0.0F};
    double depth_m{0.0};
    std::optional<cv::Point3d> position_m;  // camera frame, needs intrinsics
    cv::Scalar color_bgr;
};

class BallIdentifier {
public:
    static constexpr float kMinRadiusPx = 3.0F;

    explicit BallIdentifier(int min_blob_area_px = 30);

    // Candidate blobs for every profile's HSV range, merged into one mask.
    std::vector<Blob> detectBlobs(const cv::Mat& hsv, const std::vector<BallProfile>& profiles) const;

    // First profile whose color, radius band and circularity floor all accept the blob.
    std::vector<IdentifiedBall> identify(const std::vector<Blob>& blobs,
                                         const cv::Mat& hsv,
                                         const cv::Mat& depth_m,
                                         const std::optional<CameraIntrinsics>& intrinsics,
                                         const std::vector<BallProfile>& profiles) const;

    std::vector<IdentifiedBall> process(const AlignedFrame& frame,
                                        const std::optional<CameraIntrinsics>& intrinsics,
                                        const std::vector<BallProfile>& profiles) const;

    static std::optional<cv::Point3d> backProject(const cv::Point2f& pixel, double depth_m,
                                                  const CameraIntrinsics& intrinsics);

private:
    int min_blob_area_px_{30};
};

}  // namespace jugsync
