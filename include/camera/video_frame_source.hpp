#pragma once

#include <optional>
#include <string>

#include <opencv2/core.hpp>
#include <opencv2/videoio.hpp>

#include "camera/camera_calibration.hpp"
#include "camera/frame_source.hpp"
#include "core/config.hpp"

namespace jugsync {

// Color-only capture over cv::VideoCapture. Frames are undistorted when a
// calibration is set, so intrinsics() describes the delivered image.
class VideoFrameSource : public IFrameSource {
public:
    explicit VideoFrameSource(const CameraConfig& config);
    ~VideoFrameSource() override;

    void setCalibration(const CameraCalibration& calibration);

    bool open(std::string& error) override;
    bool grab(AlignedFrame& out, std::string& error) override;
    void close() override;
    bool isOpen() const override { return cap_.isOpened(); }
    std::optional<CameraIntrinsics> intrinsics() const override;
    std::string description() const override { return description_; }

private:
    CameraConfig config_;
    std::optional<CameraCalibration> calibration_;
    cv::VideoCapture cap_;
    cv::Size frame_size_;
    std::string description_;
};

}  // namespace jugsync
