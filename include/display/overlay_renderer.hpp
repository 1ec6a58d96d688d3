#pragma once

#include <optional>
#include <string>
#include <vector>

#include <opencv2/core.hpp>

#include "calibration/ball_identifier.hpp"
#include "core/config.hpp"
#include "core/types.hpp"
#include "motion/motion_detector.hpp"

namespace jugsync {

struct RecordingOverlayStatus {
    bool recording{false};
    std::string token;
    int clips_recorded{0};
};

struct DeviceOverlayLine {
    std::string name;
    bool connected{false};
    std::optional<TelemetrySample> latest;
    double age_s{0.0};
};

class OverlayRenderer {
public:
    static void renderRecordingStatus(cv::Mat& bgr_frame, const RecordingOverlayStatus& status);
    // Top-right panel: motion bar with the stillness and arming thresholds.
    static void renderMotionStatus(cv::Mat& bgr_frame, const MotionReading& reading, const MotionConfig& config);
    static void renderDevices(cv::Mat& bgr_frame, const std::vector<DeviceOverlayLine>& devices);
    static void renderBalls(cv::Mat& bgr_frame, const std::vector<IdentifiedBall>& balls);
    static void renderCalibrationRoi(cv::Mat& bgr_frame, const cv::Point2f& center, float radius_px,
                                     const std::string& label);
};

}  // namespace jugsync
