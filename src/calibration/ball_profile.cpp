#include "calibration/ball_profile.hpp"

#include <algorithm>
#include <cstdint>
#include <cstdio>
#include <iostream>
#include <random>

#include "core/math_utils.hpp"

namespace jugsync {

namespace {

// OpenCV 8-bit HSV channel maxima.
constexpr int kChannelMax[3] = {179, 255, 255};

int clampChannel(double v, int channel) {
    const double clamped = std::min(std::max(v, 0.0), static_cast<double>(kChannelMax[channel]));
    return static_cast<int>(clamped);
}

void deriveThresholds(const cv::Vec3d& mean, const cv::Vec3d& stddev, const ColorModelParams& params,
                      cv::Vec3i& low, cv::Vec3i& high) {
    for (int c = 0; c < 3; ++c) {
        low[c] = clampChannel(mean[c] - params.std_multiplier * stddev[c], c);
        high[c] = clampChannel(mean[c] + params.std_multiplier * stddev[c], c);
    }
    // Reject near-black and desaturated pixels whatever the statistics say.
    low[1] = std::max(low[1], params.saturation_floor);
    low[2] = std::max(low[2], params.value_floor);
}

nlohmann::json vecToJson(const cv::Vec3d& v) {
    return nlohmann::json::array({v[0], v[1], v[2]});
}

nlohmann::json vecToJson(const cv::Vec3i& v) {
    return nlohmann::json::array({v[0], v[1], v[2]});
}

template <typename Vec>
bool readVec3(const nlohmann::json& record, const char* key, std::optional<Vec>& out, std::string& error) {
    out.reset();
    const auto it = record.find(key);
    if (it == record.end() || it->is_null()) {
        return true;
    }
    if (!it->is_array() || it->size() != 3) {
        error = std::string("'") + key + "' must be a 3-element array";
        return false;
    }
    Vec v;
    for (int c = 0; c < 3; ++c) {
        if (!(*it)[c].is_number()) {
            error = std::string("'") + key + "' must contain numbers";
            return false;
        }
        (*it)[c].get_to(v[c]);
    }
    out = v;
    return true;
}

bool readOptionalNumber(const nlohmann::json& record, const char* key, std::optional<double>& out, std::string& error) {
    out.reset();
    const auto it = record.find(key);
    if (it == record.end() || it->is_null()) {
        return true;
    }
    if (!it->is_number()) {
        error = std::string("'") + key + "' must be a number or null";
        return false;
    }
    out = it->get<double>();
    return true;
}

}  // namespace

std::string generateProfileId() {
    std::random_device rd;
    std::mt19937_64 gen(rd());
    std::uniform_int_distribution<uint64_t> dist;
    uint64_t hi = dist(gen);
    uint64_t lo = dist(gen);

    // RFC 4122 version 4, variant 10xx
    hi = (hi & 0xFFFFFFFFFFFF0FFFULL) | 0x0000000000004000ULL;
    lo = (lo & 0x3FFFFFFFFFFFFFFFULL) | 0x8000000000000000ULL;

    char buf[40];
    std::snprintf(buf, sizeof(buf), "%08x-%04x-%04x-%04x-%012llx",
                  static_cast<unsigned>(hi >> 32),
                  static_cast<unsigned>((hi >> 16) & 0xFFFFU),
                  static_cast<unsigned>(hi & 0xFFFFU),
                  static_cast<unsigned>(lo >> 48),
                  static_cast<unsigned long long>(lo & 0xFFFFFFFFFFFFULL));
    return buf;
}

BallProfile::BallProfile(std::string name, std::string profile_id)
    : id_(profile_id.empty() ? generateProfileId() : std::move(profile_id)),
      name_(std::move(name)) {}

bool BallProfile::deriveColorModel(const std::vector<cv::Vec3d>& hsv_samples, const ColorModelParams& params) {
    if (hsv_samples.empty()) {
        std::cerr << "calibration: no HSV samples provided for profile " << id_ << ", color model unchanged\n";
        return false;
    }
    raw_hsv_ = hsv_samples;
    return rederiveColorModel(params);
}

bool BallProfile::rederiveColorModel(const ColorModelParams& params) {
    if (raw_hsv_.empty()) {
        std::cerr << "calibration: profile " << id_ << " has no raw HSV samples to derive from\n";
        return false;
    }

    cv::Vec3d mean;
    cv::Vec3d stddev;
    meanStdPerChannel(raw_hsv_, mean, stddev);

    cv::Vec3i low;
    cv::Vec3i high;
    deriveThresholds(mean, stddev, params, low, high);

    hsv_mean_ = mean;
    hsv_std_ = stddev;
    hsv_low_ = low;
    hsv_high_ = high;
    color_params_ = params;
    return true;
}

bool BallProfile::deriveSizeModel(double pixel_radius, double depth_m, const std::optional<CameraIntrinsics>& intrinsics) {
    if (!intrinsics.has_value() || intrinsics->fx <= 0.0 || depth_m <= 0.0) {
        std::cerr << "calibration: cannot set size for " << id_ << ", missing intrinsics or invalid depth\n";
        radius_m_.reset();
        return false;
    }

    radius_m_ = pixel_radius * depth_m / intrinsics->fx;
    // A radius calibrated close to the camera projects less accurately far away;
    // callers re-derive per working distance when that matters.
    calibration_depth_m_ = depth_m;
    std::cout << "calibration: profile " << name_ << " radius=" << *radius_m_
              << "m at depth=" << depth_m << "m\n";
    return true;
}

bool BallProfile::recordDepthSamples(const std::vector<double>& depth_values_m) {
    if (depth_values_m.empty()) {
        std::cerr << "calibration: no depth values provided for profile " << id_ << "\n";
        return false;
    }
    raw_depth_ = depth_values_m;
    return true;
}

bool BallProfile::matchesColor(const cv::Vec3d& hsv) const {
    if (!hasColorModel()) {
        return false;
    }
    for (int c = 0; c < 3; ++c) {
        if (hsv[c] < (*hsv_low_)[c] || hsv[c] > (*hsv_high_)[c]) {
            return false;
        }
    }
    return true;
}

bool BallProfile::acceptsPixelRadius(double pixel_radius, double depth_m, double fx) const {
    if (!radius_m_.has_value() || fx <= 0.0 || depth_m <= 0.0) {
        return true;
    }
    const double expected = (*radius_m_ * fx) / depth_m;
    return pixel_radius >= expected / radius_confidence_ && pixel_radius <= expected * radius_confidence_;
}

nlohmann::json BallProfile::toJson() const {
    nlohmann::json j;
    j["profile_id"] = id_;
    j["name"] = name_;
    j["hsv_mean"] = hsv_mean_ ? vecToJson(*hsv_mean_) : nlohmann::json(nullptr);
    j["hsv_std"] = hsv_std_ ? vecToJson(*hsv_std_) : nlohmann::json(nullptr);
    j["hsv_low"] = hsv_low_ ? vecToJson(*hsv_low_) : nlohmann::json(nullptr);
    j["hsv_high"] = hsv_high_ ? vecToJson(*hsv_high_) : nlohmann::json(nullptr);
    j["std_multiplier"] = color_params_.std_multiplier;
    j["saturation_floor"] = color_params_.saturation_floor;
    j["value_floor"] = color_params_.value_floor;
    j["real_world_radius_m"] = radius_m_ ? nlohmann::json(*radius_m_) : nlohmann::json(nullptr);
    j["radius_confidence_factor"] = radius_confidence_;
    j["calibration_depth_m"] = calibration_depth_m_ ? nlohmann::json(*calibration_depth_m_) : nlohmann::json(nullptr);
    j["circularity_min"] = circularity_min_;

    nlohmann::json raw_hsv = nlohmann::json::array();
    for (const auto& v : raw_hsv_) {
        raw_hsv.push_back(vecToJson(v));
    }
    j["raw_hsv_values"] = raw_hsv;
    j["raw_depth_values"] = raw_depth_;
    return j;
}

std::optional<BallProfile> BallProfile::fromJson(const nlohmann::json& record, std::string& error) {
    if (!record.is_object()) {
        error = "profile record must be a JSON object";
        return std::nullopt;
    }
    const auto id_it = record.find("profile_id");
    if (id_it == record.end() || !id_it->is_string() || id_it->get<std::string>().empty()) {
        error = "profile record is missing 'profile_id'";
        return std::nullopt;
    }

    try {
        BallProfile profile(record.value("name", std::string("Unnamed Ball")), id_it->get<std::string>());

        if (!readVec3(record, "hsv_mean", profile.hsv_mean_, error) ||
            !readVec3(record, "hsv_std", profile.hsv_std_, error) ||
            !readVec3(record, "hsv_low", profile.hsv_low_, error) ||
            !readVec3(record, "hsv_high", profile.hsv_high_, error) ||
            !readOptionalNumber(record, "real_world_radius_m", profile.radius_m_, error) ||
            !readOptionalNumber(record, "calibration_depth_m", profile.calibration_depth_m_, error)) {
            return std::nullopt;
        }

        profile.color_params_.std_multiplier = record.value("std_multiplier", 2.0);
        profile.color_params_.saturation_floor = record.value("saturation_floor", 30);
        profile.color_params_.value_floor = record.value("value_floor", 30);
        profile.radius_confidence_ = record.value("radius_confidence_factor", kDefaultRadiusConfidence);
        profile.circularity_min_ = record.value("circularity_min", kDefaultCircularityMin);

        const auto raw_hsv = record.find("raw_hsv_values");
        if (raw_hsv != record.end() && raw_hsv->is_array()) {
            for (const auto& entry : *raw_hsv) {
                if (!entry.is_array() || entry.size() != 3) {
                    error = "'raw_hsv_values' entries must be 3-element arrays";
                    return std::nullopt;
                }
                profile.raw_hsv_.emplace_back(entry[0].get<double>(), entry[1].get<double>(), entry[2].get<double>());
            }
        }
        const auto raw_depth = record.find("raw_depth_values");
        if (raw_depth != record.end() && raw_depth->is_array()) {
            profile.raw_depth_ = raw_depth->get<std::vector<double>>();
        }

        // Thresholds follow mean/std; stored bounds are only trusted for records
        // that carry no statistics.
        if (profile.hsv_mean_ && profile.hsv_std_) {
            cv::Vec3i low;
            cv::Vec3i high;
            deriveThresholds(*profile.hsv_mean_, *profile.hsv_std_, profile.color_params_, low, high);
            profile.hsv_low_ = low;
            profile.hsv_high_ = high;
        }

        error.clear();
        return profile;
    } catch (const nlohmann::json::exception& e) {
        error = std::string("malformed profile record: ") + e.what();
        return std::nullopt;
    }
}

}  // namespace jugsync
