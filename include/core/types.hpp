#pragma once

#include <cstdint>
#include <string>

#include <opencv2/core.hpp>

namespace jugsync {

struct CameraIntrinsics {
    double fx{0.0};
    double fy{0.0};
    double cx{0.0};
    double cy{0.0};
    int width{0};
    int height{0};

    bool valid() const { return fx > 0.0 && fy > 0.0; }
};

// Color and depth are pixel-aligned; depth_m is CV_32F meters and may be empty
// for color-only sources.
struct AlignedFrame {
    int64_t timestamp_ns{0};
    cv::Mat color_bgr;
    cv::Mat depth_m;

    AlignedFrame clone() const { return AlignedFrame{timestamp_ns, color_bgr.clone(), depth_m.clone()}; }
};

enum class ImuGroup {
    Accel,
    Gyro,
};

struct ImuFragment {
    ImuGroup group{ImuGroup::Accel};
    cv::Vec3d axes{0.0, 0.0, 0.0};
    int64_t device_timestamp_ns{0};
    int64_t receipt_ns{0};    // wall clock, becomes the sample timestamp
    int64_t monotonic_ns{0};  // steady clock, staleness only
};

struct TelemetrySample {
    std::string device;
    cv::Vec3d accel{0.0, 0.0, 0.0};
    cv::Vec3d gyro{0.0, 0.0, 0.0};
    double accel_magnitude{0.0};
    double gyro_magnitude{0.0};
    int64_t timestamp_ns{0};         // receipt time, wall clock
    int64_t device_timestamp_ns{0};  // 0 when the device sent none
    uint64_t sequence{0};

    double ageSeconds(int64_t now_ns) const {
        return static_cast<double>(now_ns - timestamp_ns) * 1e-9;
    }
};

}  // namespace jugsync
