#pragma once

#include <string>
#include <vector>

namespace jugsync {

struct CameraConfig {
    int device_index{0};
    int width{640};
    int height{480};
    int fps{30};
    std::string calibration_file{"config/camera_calibration.yaml"};
    int max_grab_failures{30};  // consecutive, before the run gives up
};

struct DeviceConfig {
    std::string name;
    std::string host;
    int port{8081};
    std::string path{"/imu"};
};

struct StreamConfig {
    int queue_capacity{100};
    int receive_timeout_ms{100};
    int connect_timeout_ms{2000};
    int backoff_initial_ms{500};
    int backoff_max_ms{5000};
    int stale_window_ms{100};
};

struct RecordingConfig {
    std::string output_dir{"recordings"};
    double video_fps{30.0};
    std::string video_fourcc{"mp4v"};
    int flush_every{50};
};

// Stillness-triggered clips: once motion has exceeded motion_threshold, a
// stillness_duration_s stretch at or below stillness_threshold writes the
// record_duration_s that preceded it.
struct MotionConfig {
    double motion_threshold{1000.0};
    double stillness_threshold{500.0};
    double stillness_duration_s{3.0};
    double record_duration_s{10.0};
    int diff_threshold{25};
    int blur_kernel{21};
};

struct CalibrationConfig {
    double std_multiplier{2.0};
    int saturation_floor{30};
    int value_floor{30};
    double radius_confidence_factor{1.5};
    double circularity_min{0.7};
    std::string profiles_dir{"config"};
};

struct PoseConfig {
    std::string backend{"none"};  // none
};

struct AppConfig {
    CameraConfig camera;
    std::vector<DeviceConfig> devices;
    StreamConfig stream;
    RecordingConfig recording;
    MotionConfig motion;
    CalibrationConfig calibration;
    PoseConfig pose;
};

bool loadConfig(const std::string& path, AppConfig& out, std::string& error);
bool validateConfig(const AppConfig& cfg, std::string& error);

// "name=host" or "name=host:port"; used by the --device flag.
bool parseDeviceSpec(const std::string& spec, DeviceConfig& out, std::string& error);

}  // namespace jugsync
