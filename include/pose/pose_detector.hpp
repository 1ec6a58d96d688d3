#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <opencv2/core.hpp>

namespace jugsync {

// Normalized image coordinates (x, y in [0,1]) plus relative depth and visibility.
struct PoseLandmark {
    float x{0.0F};
    float y{0.0F};
    float z{0.0F};
    float visibility{0.0F};
};

using PoseLandmarks = std::vector<PoseLandmark>;

struct HandPositions {
    std::optional<cv::Point> left;
    std::optional<cv::Point> right;
};

class IPoseDetector {
public:
    virtual ~IPoseDetector() = default;

    virtual std::optional<PoseLandmarks> detect(const cv::Mat& bgr_frame) = 0;
    virtual HandPositions handPositions(const PoseLandmarks& landmarks, const cv::Size& frame_size) const = 0;
    virtual cv::Mat drawLandmarks(const cv::Mat& bgr_frame, const PoseLandmarks& landmarks) const = 0;
    virtual cv::Mat drawHands(const cv::Mat& bgr_frame, const HandPositions& hands) const = 0;
    virtual std::string name() const = 0;
};

// Used when no landmark model is available: detects nothing and leaves frames untouched.
class NullPoseDetector : public IPoseDetector {
public:
    std::optional<PoseLandmarks> detect(const cv::Mat&) override { return std::nullopt; }
    HandPositions handPositions(const PoseLandmarks&, const cv::Size&) const override { return {}; }
    cv::Mat drawLandmarks(const cv::Mat& bgr_frame, const PoseLandmarks&) const override { return bgr_frame; }
    cv::Mat drawHands(const cv::Mat& bgr_frame, const HandPositions&) const override { return bgr_frame; }
    std::string name() const override { return "none"; }
};

std::unique_ptr<IPoseDetector> createPoseDetector(const std::string& backend, std::string& error);

}  // namespace jugsync
