#include "motion/motion_detector.hpp"

#include <cmath>
#include <cstdint>
#include <numeric>

#include <opencv2/imgproc.hpp>

namespace jugsync {

namespace {

constexpr std::size_t kHistoryLength = 100;

}  // namespace

void computeSignedDiff(const cv::Mat& prev_gray, const cv::Mat& curr_gray, cv::Mat& out_signed_diff_16s) {
    CV_Assert(!prev_gray.empty() && !curr_gray.empty());
    CV_Assert(prev_gray.type() == CV_8UC1 && curr_gray.type() == CV_8UC1);
    CV_Assert(prev_gray.size() == curr_gray.size());

    cv::Mat prev_16s;
    cv::Mat curr_16s;
    prev_gray.convertTo(prev_16s, CV_16S);
    curr_gray.convertTo(curr_16s, CV_16S);
    cv::subtract(curr_16s, prev_16s, out_signed_diff_16s, cv::noArray(), CV_16S);
}

cv::Mat computeSignedDiff(const cv::Mat& prev_gray, const cv::Mat& curr_gray) {
    cv::Mat diff;
    computeSignedDiff(prev_gray, curr_gray, diff);
    return diff;
}

void applyMotionDeadzoneInPlace(cv::Mat& signed_diff_16s, int threshold) {
    CV_Assert(signed_diff_16s.type() == CV_16S);
    for (int y = 0; y < signed_diff_16s.rows; ++y) {
        auto* row = signed_diff_16s.ptr<int16_t>(y);
        for (int x = 0; x < signed_diff_16s.cols; ++x) {
            if (std::abs(row[x]) <= threshold) {
                row[x] = 0;
            }
        }
    }
}

cv::Mat applyMotionDeadzone(const cv::Mat& signed_diff_16s, int threshold) {
    cv::Mat output = signed_diff_16s.clone();
    applyMotionDeadzoneInPlace(output, threshold);
    return output;
}

double countMotionPixels(const cv::Mat& signed_diff_16s) {
    CV_Assert(signed_diff_16s.type() == CV_16S);
    cv::Mat mask = signed_diff_16s != 0;
    const cv::Mat kernel = cv::getStructuringElement(cv::MORPH_ELLIPSE, cv::Size(5, 5));
    cv::morphologyEx(mask, mask, cv::MORPH_OPEN, kernel);
    cv::morphologyEx(mask, mask, cv::MORPH_CLOSE, kernel);
    return static_cast<double>(cv::countNonZero(mask));
}

MotionDetector::MotionDetector(const MotionConfig& config) : config_(config) {}

double MotionDetector::measure(const cv::Mat& frame_bgr) {
    if (frame_bgr.empty()) {
        return 0.0;
    }
    cv::Mat gray;
    if (frame_bgr.channels() == 3) {
        cv::cvtColor(frame_bgr, gray, cv::COLOR_BGR2GRAY);
    } else {
        gray = frame_bgr.clone();
    }
    if (config_.blur_kernel > 1) {
        cv::GaussianBlur(gray, gray, cv::Size(config_.blur_kernel, config_.blur_kernel), 0);
    }

    double value = 0.0;
    if (!prev_gray_.empty() && prev_gray_.size() == gray.size()) {
        cv::Mat diff;
        computeSignedDiff(prev_gray_, gray, diff);
        applyMotionDeadzoneInPlace(diff, config_.diff_threshold);
        value = countMotionPixels(diff);
    }
    prev_gray_ = gray;

    history_.push_back(value);
    if (history_.size() > kHistoryLength) {
        history_.pop_front();
    }
    return value;
}

MotionReading MotionDetector::observe(double motion_value, int64_t timestamp_ns) {
    MotionReading reading;
    reading.value = motion_value;

    if (motion_value > config_.motion_threshold) {
        armed_ = true;
    }
    reading.armed = armed_;
    if (!armed_) {
        return reading;
    }

    if (motion_value > config_.stillness_threshold) {
        still_since_ns_.reset();
        fired_ = false;
        return reading;
    }

    if (!still_since_ns_.has_value()) {
        still_since_ns_ = timestamp_ns;
    }
    reading.stillness_start_ns = *still_since_ns_;
    reading.still_for_s = static_cast<double>(timestamp_ns - *still_since_ns_) * 1e-9;
    if (!fired_ && reading.still_for_s >= config_.stillness_duration_s) {
        fired_ = true;
        reading.triggered = true;
    }
    return reading;
}

void MotionDetector::reset() {
    prev_gray_.release();
    still_since_ns_.reset();
    fired_ = false;
    history_.clear();
}

double MotionDetector::averageMotion() const {
    if (history_.empty()) {
        return 0.0;
    }
    return std::accumulate(history_.begin(), history_.end(), 0.0) / static_cast<double>(history_.size());
}

}  // namespace jugsync
