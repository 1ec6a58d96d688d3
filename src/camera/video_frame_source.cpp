#include "camera/video_frame_source.hpp"

#include <opencv2/calib3d.hpp>

#include "core/time_utils.hpp"

#ifdef __linux__
#include <unistd.h>
#endif

namespace jugsync {

VideoFrameSource::VideoFrameSource(const CameraConfig& config)
    : config_(config) {}

VideoFrameSource::~VideoFrameSource() {
    close();
}

void VideoFrameSource::setCalibration(const CameraCalibration& calibration) {
    if (calibration.isValid()) {
        calibration_ = calibration;
    } else {
        calibration_.reset();
    }
}

bool VideoFrameSource::open(std::string& error) {
    close();

#ifdef __linux__
    const std::string dev = "/dev/video" + std::to_string(config_.device_index);
    if (::access(dev.c_str(), F_OK) != 0) {
        error = "camera device not found: " + dev + " (check --camera index / device permissions)";
        return false;
    }
    if (!cap_.open(config_.device_index, cv::CAP_V4L2) && !cap_.open(config_.device_index, cv::CAP_ANY)) {
        error = "failed to open camera " + dev + " (check --camera index / device permissions)";
        return false;
    }
    description_ = "v4l2:" + dev;
#else
    if (!cap_.open(config_.device_index, cv::CAP_ANY)) {
        error = "failed to open camera index " + std::to_string(config_.device_index) +
                " (check --camera index / device permissions)";
        return false;
    }
    description_ = "camera:" + std::to_string(config_.device_index);
#endif

    cap_.set(cv::CAP_PROP_FRAME_WIDTH, static_cast<double>(config_.width));
    cap_.set(cv::CAP_PROP_FRAME_HEIGHT, static_cast<double>(config_.height));
    cap_.set(cv::CAP_PROP_FPS, static_cast<double>(config_.fps));
    frame_size_ = cv::Size(static_cast<int>(cap_.get(cv::CAP_PROP_FRAME_WIDTH)),
                           static_cast<int>(cap_.get(cv::CAP_PROP_FRAME_HEIGHT)));

    error.clear();
    return true;
}

bool VideoFrameSource::grab(AlignedFrame& out, std::string& error) {
    if (!cap_.isOpened()) {
        error = "camera is not open";
        return false;
    }

    cv::Mat frame;
    if (!cap_.read(frame) || frame.empty()) {
        error = "failed to capture frame";
        return false;
    }
    frame_size_ = frame.size();

    out.timestamp_ns = nowWallNs();
    if (calibration_.has_value()) {
        cv::undistort(frame, out.color_bgr, calibration_->cameraMatrix(), calibration_->distortion());
    } else {
        out.color_bgr = frame;
    }
    out.depth_m.release();
    error.clear();
    return true;
}

void VideoFrameSource::close() {
    if (cap_.isOpened()) {
        cap_.release();
    }
    description_.clear();
}

std::optional<CameraIntrinsics> VideoFrameSource::intrinsics() const {
    if (!calibration_.has_value()) {
        return std::nullopt;
    }
    return calibration_->intrinsics(frame_size_.width, frame_size_.height);
}

}  // namespace jugsync
