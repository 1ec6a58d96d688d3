#include "pose/pose_detector.hpp"

#include <iostream>

int main() {
    std::string error;
    auto detector = jugsync::createPoseDetector("none", error);
    if (!detector || detector->name() != "none") {
        std::cerr << "'none' backend should yield the null detector\n";
        return 1;
    }

    const cv::Mat frame(48, 64, CV_8UC3, cv::Scalar(10, 20, 30));
    if (detector->detect(frame).has_value()) {
        std::cerr << "null detector must not report landmarks\n";
        return 1;
    }
    const jugsync::HandPositions hands = detector->handPositions({}, frame.size());
    if (hands.left.has_value() || hands.right.has_value()) {
        std::cerr << "null detector must not report hands\n";
        return 1;
    }
    const cv::Mat drawn = detector->drawHands(frame, hands);
    if (drawn.size() != frame.size() || cv::norm(drawn, frame, cv::NORM_INF) != 0.0) {
        std::cerr << "null detector should leave frames untouched\n";
        return 1;
    }

    auto missing = jugsync::createPoseDetector("mediapipe", error);
    if (missing || error.empty()) {
        std::cerr << "unknown backend should fail with an error\n";
        return 1;
    }
    return 0;
}
