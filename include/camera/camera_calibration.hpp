#pragma once

#include <optional>
#include <string>

#include <opencv2/core.hpp>

#include "core/types.hpp"

namespace jugsync {

// Pinhole model from an OpenCV calibration file: K (3x3) and D (1xN, N >= 4).
// Accepts K/D or camera_matrix/dist_coeff, in FileStorage or plain-list YAML.
class CameraCalibration {
public:
    bool loadFromFile(const std::string& file_path, std::string& error);
    bool isValid() const;

    const cv::Mat& cameraMatrix() const { return K_; }
    const cv::Mat& distortion() const { return D_; }

    // Intrinsics for a stream of the given size, rescaled from the file's
    // image_width/image_height. Passing 0 keeps the calibrated size.
    std::optional<CameraIntrinsics> intrinsics(int width = 0, int height = 0) const;

private:
    cv::Mat K_;
    cv::Mat D_;
    int image_width_{0};
    int image_height_{0};
};

}  // namespace jugsync
