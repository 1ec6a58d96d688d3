#include "display/overlay_renderer.hpp"

#include <algorithm>
#include <cstdio>

#include <opencv2/imgproc.hpp>

namespace jugsync {

namespace {

const cv::Scalar kPanel(20, 20, 20);
const cv::Scalar kText(220, 220, 220);
const cv::Scalar kOk(60, 200, 60);
const cv::Scalar kBad(40, 40, 220);
const cv::Scalar kWarn(30, 180, 240);

void label(cv::Mat& frame, const std::string& text, const cv::Point& at, const cv::Scalar& color) {
    cv::putText(frame, text, at, cv::FONT_HERSHEY_SIMPLEX, 0.5, color, 1, cv::LINE_AA);
}

std::string fixed(double v, int decimals) {
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%.*f", decimals, v);
    return buf;
}

}  // namespace

void OverlayRenderer::renderRecordingStatus(cv::Mat& bgr_frame, const RecordingOverlayStatus& status) {
    if (bgr_frame.empty()) {
        return;
    }

    cv::rectangle(bgr_frame, cv::Rect(8, 8, 300, 52), kPanel, cv::FILLED);
    if (status.recording) {
        cv::circle(bgr_frame, cv::Point(22, 26), 7, kBad, cv::FILLED, cv::LINE_AA);
        label(bgr_frame, "REC " + status.token, cv::Point(36, 31), kBad);
    } else {
        label(bgr_frame, "IDLE - SPACE to record", cv::Point(16, 31), kText);
    }
    label(bgr_frame, "Clips: " + std::to_string(status.clips_recorded), cv::Point(16, 52), kText);
}

void OverlayRenderer::renderMotionStatus(cv::Mat& bgr_frame, const MotionReading& reading,
                                         const MotionConfig& config) {
    if (bgr_frame.empty()) {
        return;
    }

    const int width = 220;
    const int left = std::max(0, bgr_frame.cols - width - 8);
    cv::rectangle(bgr_frame, cv::Rect(left, 8, width, 62), kPanel, cv::FILLED);

    std::string state = "waiting for motion";
    cv::Scalar color = kText;
    if (reading.triggered) {
        state = "still - clip saved";
        color = kOk;
    } else if (reading.still_for_s > 0.0) {
        state = "still " + fixed(reading.still_for_s, 1) + "/" + fixed(config.stillness_duration_s, 1) + "s";
        color = kWarn;
    } else if (reading.armed) {
        state = "armed";
        color = kOk;
    }
    label(bgr_frame, "Motion: " + fixed(reading.value, 0), cv::Point(left + 8, 26), kText);
    label(bgr_frame, state, cv::Point(left + 8, 46), color);

    // Bar spans 0..2x motion_threshold.
    const int bar_w = width - 16;
    const double full_scale = std::max(1.0, config.motion_threshold * 2.0);
    const auto px = [&](double v) { return static_cast<int>(std::min(1.0, v / full_scale) * bar_w); };
    const cv::Rect bar(left + 8, 54, bar_w, 8);
    cv::rectangle(bgr_frame, bar, kText, 1);
    cv::rectangle(bgr_frame, cv::Rect(bar.x, bar.y, px(reading.value), bar.height),
                  reading.value > config.stillness_threshold ? kBad : kOk, cv::FILLED);
    cv::line(bgr_frame, cv::Point(bar.x + px(config.stillness_threshold), bar.y - 2),
             cv::Point(bar.x + px(config.stillness_threshold), bar.y + bar.height + 2), kOk, 1);
    cv::line(bgr_frame, cv::Point(bar.x + px(config.motion_threshold), bar.y - 2),
             cv::Point(bar.x + px(config.motion_threshold), bar.y + bar.height + 2), kBad, 1);
}

void OverlayRenderer::renderDevices(cv::Mat& bgr_frame, const std::vector<DeviceOverlayLine>& devices) {
    if (bgr_frame.empty() || devices.empty()) {
        return;
    }

    const int line_h = 20;
    const int height = 12 + line_h * static_cast<int>(devices.size());
    const int top = std::max(0, bgr_frame.rows - height - 8);
    cv::rectangle(bgr_frame, cv::Rect(8, top, 360, height), kPanel, cv::FILLED);

    int y = top + 20;
    for (const auto& device : devices) {
        std::string text = device.name + ": ";
        cv::Scalar color = kText;
        if (!device.connected) {
            text += "disconnected";
            color = kBad;
        } else if (!device.latest.has_value()) {
            text += "waiting";
            color = kWarn;
        } else {
            text += "|a|=" + fixed(device.latest->accel_magnitude, 2) +
                    " |g|=" + fixed(device.latest->gyro_magnitude, 2) +
                    " age=" + fixed(device.age_s, 2) + "s";
            color = device.age_s > 1.0 ? kWarn : kOk;
        }
        label(bgr_frame, text, cv::Point(16, y), color);
        y += line_h;
    }
}

void OverlayRenderer::renderBalls(cv::Mat& bgr_frame, const std::vector<IdentifiedBall>& balls) {
    if (bgr_frame.empty()) {
        return;
    }

    for (const auto& ball : balls) {
        const cv::Point center(cvRound(ball.center.x), cvRound(ball.center.y));
        cv::circle(bgr_frame, center, std::max(1, cvRound(ball.radius_px)), ball.color_bgr, 2, cv::LINE_AA);
        cv::circle(bgr_frame, center, 2, ball.color_bgr, cv::FILLED);

        std::string text = ball.name;
        if (ball.position_m.has_value()) {
            text += " (" + fixed(ball.position_m->x, 2) + ", " + fixed(ball.position_m->y, 2) + ", " +
                    fixed(ball.position_m->z, 2) + ")m";
        }
        label(bgr_frame, text, center + cv::Point(cvRound(ball.radius_px) + 4, 0), ball.color_bgr);
    }
}

void OverlayRenderer::renderCalibrationRoi(cv::Mat& bgr_frame, const cv::Point2f& center, float radius_px,
                                           const std::string& text) {
    if (bgr_frame.empty()) {
        return;
    }
    const cv::Point c(cvRound(center.x), cvRound(center.y));
    cv::circle(bgr_frame, c, std::max(1, cvRound(radius_px)), kOk, 2, cv::LINE_AA);
    cv::line(bgr_frame, c - cv::Point(6, 0), c + cv::Point(6, 0), kOk, 1);
    cv::line(bgr_frame, c - cv::Point(0, 6), c + cv::Point(0, 6), kOk, 1);
    label(bgr_frame, text, cv::Point(16, bgr_frame.rows - 16), kText);
}

}  // namespace jugsync
