#pragma once

#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>
#include <opencv2/core.hpp>

#include "core/types.hpp"

namespace jugsync {

struct ColorModelParams {
    double std_multiplier{2.0};
    int saturation_floor{30};
    int value_floor{30};
};

// Appearance and size model of one ball. Color is OpenCV HSV (H in [0,179]).
class BallProfile {
public:
    static constexpr double kDefaultRadiusConfidence = 1.5;
    static constexpr double kDefaultCircularityMin = 0.7;

    explicit BallProfile(std::string name = "Unnamed Ball", std::string profile_id = {});

    const std::string& id() const { return id_; }
    const std::string& name() const { return name_; }
    void setName(const std::string& name) { name_ = name; }

    bool deriveColorModel(const std::vector<cv::Vec3d>& hsv_samples,
                          const ColorModelParams& params = ColorModelParams{});
    bool deriveSizeModel(double pixel_radius, double depth_m, const std::optional<CameraIntrinsics>& intrinsics);
    bool recordDepthSamples(const std::vector<double>& depth_values_m);

    // Recomputes thresholds from the retained raw samples.
    bool rederiveColorModel(const ColorModelParams& params);

    bool hasColorModel() const { return hsv_low_.has_value() && hsv_high_.has_value(); }
    bool hasSizeModel() const { return radius_m_.has_value(); }

    const std::optional<cv::Vec3d>& hsvMean() const { return hsv_mean_; }
    const std::optional<cv::Vec3d>& hsvStd() const { return hsv_std_; }
    const std::optional<cv::Vec3i>& hsvLow() const { return hsv_low_; }
    const std::optional<cv::Vec3i>& hsvHigh() const { return hsv_high_; }
    const std::optional<double>& radiusM() const { return radius_m_; }
    const std::optional<double>& calibrationDepthM() const { return calibration_depth_m_; }
    const ColorModelParams& colorParams() const { return color_params_; }
    double radiusConfidence() const { return radius_confidence_; }
    double circularityMin() const { return circularity_min_; }
    const std::vector<cv::Vec3d>& rawHsvSamples() const { return raw_hsv_; }
    const std::vector<double>& rawDepthSamples() const { return raw_depth_; }

    void setRadiusConfidence(double factor) { radius_confidence_ = factor; }
    void setCircularityMin(double value) { circularity_min_ = value; }

    bool matchesColor(const cv::Vec3d& hsv) const;
    // Lenient (true) when no size model exists or the inputs cannot project.
    bool acceptsPixelRadius(double pixel_radius, double depth_m, double fx) const;
    bool acceptsCircularity(double value) const { return value >= circularity_min_; }

    nlohmann::json toJson() const;
    static std::optional<BallProfile> fromJson(const nlohmann::json& record, std::string& error);

private:
    std::string id_;
    std::string name_;

    std::optional<cv::Vec3d> hsv_mean_;
    std::optional<cv::Vec3d> hsv_std_;
    std::optional<cv::Vec3i> hsv_low_;
    std::optional<cv::Vec3i> hsv_high_;
    ColorModelParams color_params_;

    std::optional<double> radius_m_;
    double radius_confidence_{kDefaultRadiusConfidence};
    std::optional<double> calibration_depth_m_;
    double circularity_min_{kDefaultCircularityMin};

    std::vector<cv::Vec3d> raw_hsv_;
    std::vector<double> raw_depth_;
};

std::string generateProfileId();

}  // namespace jugsync
