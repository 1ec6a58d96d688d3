#pragma once

#include <cstdint>
#include <deque>
#include <optional>

#include <opencv2/core.hpp>

#include "core/config.hpp"

namespace jugsync {

// curr - prev as CV_16S. Both inputs CV_8UC1 of equal size.
void computeSignedDiff(const cv::Mat& prev_gray, const cv::Mat& curr_gray, cv::Mat& out_signed_diff_16s);
cv::Mat computeSignedDiff(const cv::Mat& prev_gray, const cv::Mat& curr_gray);
// Zeroes every |d| <= threshold.
void applyMotionDeadzoneInPlace(cv::Mat& signed_diff_16s, int threshold);
cv::Mat applyMotionDeadzone(const cv::Mat& signed_diff_16s, int threshold);
// Pixels left after the deadzone, cleaned with a 5x5 open then close.
double countMotionPixels(const cv::Mat& signed_diff_16s);

struct MotionReading {
    double value{0.0};
    bool armed{false};
    double still_for_s{0.0};
    bool triggered{false};          // true on exactly one frame per still period
    int64_t stillness_start_ns{0};  // valid while still_for_s > 0
};

class MotionDetector {
public:
    explicit MotionDetector(const MotionConfig& config);

    // Blurred frame differencing against the previous frame. The first frame,
    // or one with a new size, only primes the detector and measures 0.
    double measure(const cv::Mat& frame_bgr);

    // Stillness state machine over one motion value. timestamp_ns must not go
    // backwards between calls.
    MotionReading observe(double motion_value, int64_t timestamp_ns);

    MotionReading update(const cv::Mat& frame_bgr, int64_t timestamp_ns) {
        return observe(measure(frame_bgr), timestamp_ns);
    }

    // Forgets the previous frame and the stillness state; arming is kept.
    void reset();
    bool armed() const { return armed_; }
    double averageMotion() const;

private:
    MotionConfig config_;
    cv::Mat prev_gray_;
    bool armed_{false};
    bool fired_{false};
    std::optional<int64_t> still_since_ns_;
    std::deque<double> history_;
};

}  // namespace jugsync
