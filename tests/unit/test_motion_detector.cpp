#include "motion/motion_detector.hpp"

#include <iostream>

#include <opencv2/core.hpp>
#include <opencv2/imgproc.hpp>

int main() {
    cv::Mat diff = (cv::Mat_<int16_t>(1, 5) << -40, -20, 0, 20, 40);
    const cv::Mat out = jugsync::applyMotionDeadzone(diff, 30);
    if (out.at<int16_t>(0, 0) != -40 || out.at<int16_t>(0, 1) != 0 || out.at<int16_t>(0, 3) != 0 ||
        out.at<int16_t>(0, 4) != 40) {
        std::cerr << "deadzone should zero |d| <= 30 only\n";
        return 1;
    }

    cv::Mat prev = (cv::Mat_<uint8_t>(1, 3) << 100, 100, 100);
    cv::Mat curr = (cv::Mat_<uint8_t>(1, 3) << 80, 100, 140);
    const cv::Mat signed_diff = jugsync::computeSignedDiff(prev, curr);
    if (signed_diff.at<int16_t>(0, 0) != -20 || signed_diff.at<int16_t>(0, 1) != 0 ||
        signed_diff.at<int16_t>(0, 2) != 40) {
        std::cerr << "signed diff should be curr - prev\n";
        return 1;
    }

    // A solid block survives the morphology, a lone pixel does not.
    cv::Mat block(60, 60, CV_16S, cv::Scalar(0));
    block(cv::Rect(20, 20, 20, 20)).setTo(cv::Scalar(80));
    block.at<int16_t>(5, 5) = 80;
    const double pixels = jugsync::countMotionPixels(block);
    if (pixels < 300.0 || pixels > 400.0) {
        std::cerr << "20x20 block should count about 400 pixels, got " << pixels << "\n";
        return 1;
    }
    cv::Mat speck(60, 60, CV_16S, cv::Scalar(0));
    speck.at<int16_t>(30, 30) = 200;
    if (jugsync::countMotionPixels(speck) != 0.0) {
        std::cerr << "isolated pixel should be removed by the opening\n";
        return 1;
    }

    jugsync::MotionConfig config;
    jugsync::MotionDetector detector(config);
    const cv::Mat black(240, 320, CV_8UC3, cv::Scalar::all(0));
    cv::Mat square = black.clone();
    cv::rectangle(square, cv::Rect(100, 80, 80, 80), cv::Scalar::all(255), cv::FILLED);

    if (detector.measure(black) != 0.0 || detector.measure(black) != 0.0) {
        std::cerr << "first and unchanged frames should measure zero\n";
        return 1;
    }
    const double moved = detector.measure(square);
    if (moved < config.motion_threshold) {
        std::cerr << "an 80x80 change should exceed motion_threshold, got " << moved << "\n";
        return 1;
    }
    if (detector.measure(cv::Mat(120, 160, CV_8UC3, cv::Scalar::all(255))) != 0.0) {
        std::cerr << "a resized frame should re-prime instead of diffing\n";
        return 1;
    }
    if (detector.averageMotion() <= 0.0) {
        std::cerr << "average motion should include the measured change\n";
        return 1;
    }

    // Stillness state machine, timestamps in ns.
    constexpr int64_t kS = 1000000000LL;
    jugsync::MotionDetector still(config);
    jugsync::MotionReading r = still.observe(0.0, 0);
    if (r.armed || r.triggered || r.still_for_s != 0.0) {
        std::cerr << "a quiet scene before any motion must not count as stillness\n";
        return 1;
    }
    still.observe(800.0, 1 * kS);
    if (still.armed()) {
        std::cerr << "values at or below motion_threshold must not arm\n";
        return 1;
    }
    if (!still.observe(2000.0, 2 * kS).armed) {
        std::cerr << "motion above threshold should arm\n";
        return 1;
    }
    r = still.observe(100.0, 3 * kS);
    if (r.triggered || r.stillness_start_ns != 3 * kS) {
        std::cerr << "stillness should start at the first quiet frame\n";
        return 1;
    }
    r = still.observe(100.0, 5 * kS);
    if (r.triggered || r.still_for_s < 1.9) {
        std::cerr << "2 s of stillness is short of the 3 s duration\n";
        return 1;
    }
    r = still.observe(100.0, 6 * kS + kS / 10);
    if (!r.triggered || r.stillness_start_ns != 3 * kS) {
        std::cerr << "3.1 s of stillness should trigger once with the original start\n";
        return 1;
    }
    if (still.observe(100.0, 8 * kS).triggered) {
        std::cerr << "a still period triggers only once\n";
        return 1;
    }

    // Mid-range motion resets the timer but keeps the detector armed.
    r = still.observe(700.0, 9 * kS);
    if (!r.armed || r.still_for_s != 0.0) {
        std::cerr << "motion above stillness_threshold should reset the stillness timer\n";
        return 1;
    }
    still.observe(0.0, 10 * kS);
    if (!still.observe(0.0, 13 * kS + kS / 10).triggered) {
        std::cerr << "a new still period should trigger again\n";
        return 1;
    }
    return 0;
}
