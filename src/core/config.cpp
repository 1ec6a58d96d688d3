#include "core/config.hpp"

#include <fstream>
#include <set>

#include <opencv2/core.hpp>

namespace jugsync {

namespace {

template <typename T>
void readOrDefault(const cv::FileNode& node, const char* key, T& out) {
    const cv::FileNode child = node[key];
    if (!child.empty()) {
        child >> out;
    }
}

std::string trim(const std::string& s) {
    const auto b = s.find_first_not_of(" \t\r\n");
    if (b == std::string::npos) {
        return {};
    }
    const auto e = s.find_last_not_of(" \t\r\n");
    return s.substr(b, e - b + 1);
}

std::string unquote(std::string v) {
    v = trim(v);
    if (v.size() >= 2) {
        if ((v.front() == '"' && v.back() == '"') || (v.front() == '\'' && v.back() == '\'')) {
            v = v.substr(1, v.size() - 2);
        }
    }
    return v;
}

void readDevices(const cv::FileNode& node, std::vector<DeviceConfig>& out) {
    if (node.empty() || node.type() != cv::FileNode::SEQ) {
        return;
    }
    out.clear();
    for (auto it = node.begin(); it != node.end(); ++it) {
        const cv::FileNode entry = *it;
        DeviceConfig device;
        readOrDefault(entry, "name", device.name);
        readOrDefault(entry, "host", device.host);
        readOrDefault(entry, "port", device.port);
        readOrDefault(entry, "path", device.path);
        out.push_back(device);
    }
}

bool loadConfigPlainYaml(const std::string& path, AppConfig& out, std::string& error) {
    std::ifstream ifs(path);
    if (!ifs.is_open()) {
        error = "failed to open config file: " + path;
        return false;
    }

    bool devices_seen = false;
    std::string section;
    std::string line;
    while (std::getline(ifs, line)) {
        std::string t = trim(line);
        if (t.empty() || t[0] == '#' || t[0] == '%') {
            continue;
        }

        // section header, e.g. "stream:"
        if (t.back() == ':' && t.find(' ') == std::string::npos) {
            section = t.substr(0, t.size() - 1);
            continue;
        }

        const auto colon = t.find(':');
        if (colon == std::string::npos || section.empty()) {
            continue;
        }

        const std::string key = unquote(t.substr(0, colon));
        std::string value = trim(t.substr(colon + 1));
        const auto hash = value.find(" #");
        if (hash != std::string::npos) {
            value = trim(value.substr(0, hash));
        }
        value = unquote(value);

        try {
            if (section == "camera") {
                if (key == "device_index") out.camera.device_index = std::stoi(value);
                else if (key == "width") out.camera.width = std::stoi(value);
                else if (key == "height") out.camera.height = std::stoi(value);
                else if (key == "fps") out.camera.fps = std::stoi(value);
                else if (key == "calibration_file") out.camera.calibration_file = value;
                else if (key == "max_grab_failures") out.camera.max_grab_failures = std::stoi(value);
            } else if (section == "devices") {
                // plain form: "<name>: <host>[:port]"
                if (!devices_seen) {
                    out.devices.clear();
                    devices_seen = true;
                }
                DeviceConfig device;
                std::string device_error;
                if (parseDeviceSpec(key + "=" + value, device, device_error)) {
                    out.devices.push_back(device);
                }
            } else if (section == "stream") {
                if (key == "queue_capacity") out.stream.queue_capacity = std::stoi(value);
                else if (key == "receive_timeout_ms") out.stream.receive_timeout_ms = std::stoi(value);
                else if (key == "connect_timeout_ms") out.stream.connect_timeout_ms = std::stoi(value);
                else if (key == "backoff_initial_ms") out.stream.backoff_initial_ms = std::stoi(value);
                else if (key == "backoff_max_ms") out.stream.backoff_max_ms = std::stoi(value);
                else if (key == "stale_window_ms") out.stream.stale_window_ms = std::stoi(value);
            } else if (section == "recording") {
                if (key == "output_dir") out.recording.output_dir = value;
                else if (key == "video_fps") out.recording.video_fps = std::stod(value);
                else if (key == "video_fourcc") out.recording.video_fourcc = value;
                else if (key == "flush_every") out.recording.flush_every = std::stoi(value);
            } else if (section == "motion") {
                if (key == "motion_threshold") out.motion.motion_threshold = std::stod(value);
                else if (key == "stillness_threshold") out.motion.stillness_threshold = std::stod(value);
                else if (key == "stillness_duration_s") out.motion.stillness_duration_s = std::stod(value);
                else if (key == "record_duration_s") out.motion.record_duration_s = std::stod(value);
                else if (key == "diff_threshold") out.motion.diff_threshold = std::stoi(value);
                else if (key == "blur_kernel") out.motion.blur_kernel = std::stoi(value);
            } else if (section == "calibration") {
                if (key == "std_multiplier") out.calibration.std_multiplier = std::stod(value);
                else if (key == "saturation_floor") out.calibration.saturation_floor = std::stoi(value);
                else if (key == "value_floor") out.calibration.value_floor = std::stoi(value);
                else if (key == "radius_confidence_factor") out.calibration.radius_confidence_factor = std::stod(value);
                else if (key == "circularity_min") out.calibration.circularity_min = std::stod(value);
                else if (key == "profiles_dir") out.calibration.profiles_dir = value;
            } else if (section == "pose") {
                if (key == "backend") out.pose.backend = value;
            }
        } catch (const std::exception&) {
            // keep defaults/previous values on parse failure
        }
    }

    return validateConfig(out, error);
}

}  // namespace

bool parseDeviceSpec(const std::string& spec, DeviceConfig& out, std::string& error) {
    const auto eq = spec.find('=');
    if (eq == std::string::npos || eq == 0 || eq + 1 >= spec.size()) {
        error = "device spec must be name=host[:port], got '" + spec + "'";
        return false;
    }

    DeviceConfig device;
    device.name = trim(spec.substr(0, eq));
    std::string host = trim(spec.substr(eq + 1));
    const auto colon = host.rfind(':');
    if (colon != std::string::npos) {
        try {
            device.port = std::stoi(host.substr(colon + 1));
        } catch (const std::exception&) {
            error = "invalid port in device spec '" + spec + "'";
            return false;
        }
        host = host.substr(0, colon);
    }
    device.host = host;
    if (device.name.empty() || device.host.empty()) {
        error = "device spec must be name=host[:port], got '" + spec + "'";
        return false;
    }

    out = device;
    error.clear();
    return true;
}

bool validateConfig(const AppConfig& cfg, std::string& error) {
    if (cfg.camera.device_index < 0) {
        error = "camera.device_index must be >= 0";
        return false;
    }
    if (cfg.camera.width <= 0 || cfg.camera.height <= 0 || cfg.camera.fps <= 0) {
        error = "camera dimensions/fps must be > 0";
        return false;
    }
    if (cfg.camera.max_grab_failures <= 0) {
        error = "camera.max_grab_failures must be > 0";
        return false;
    }

    std::set<std::string> names;
    for (const auto& device : cfg.devices) {
        if (device.name.empty() || device.host.empty()) {
            error = "devices entries need a name and a host";
            return false;
        }
        if (device.port <= 0 || device.port > 65535) {
            error = "device '" + device.name + "' port must be in [1, 65535]";
            return false;
        }
        if (device.path.empty() || device.path[0] != '/') {
            error = "device '" + device.name + "' path must start with '/'";
            return false;
        }
        // device names end up in file names
        if (device.name.find_first_of("/\\ ") != std::string::npos) {
            error = "device name '" + device.name + "' must not contain '/', '\\' or spaces";
            return false;
        }
        if (!names.insert(device.name).second) {
            error = "duplicate device name '" + device.name + "'";
            return false;
        }
    }

    if (cfg.stream.queue_capacity <= 0) {
        error = "stream.queue_capacity must be > 0";
        return false;
    }
    if (cfg.stream.receive_timeout_ms <= 0 || cfg.stream.connect_timeout_ms <= 0) {
        error = "stream timeouts must be > 0";
        return false;
    }
    if (cfg.stream.backoff_initial_ms <= 0 || cfg.stream.backoff_max_ms < cfg.stream.backoff_initial_ms) {
        error = "stream backoff must satisfy 0 < backoff_initial_ms <= backoff_max_ms";
        return false;
    }
    if (cfg.stream.stale_window_ms <= 0) {
        error = "stream.stale_window_ms must be > 0";
        return false;
    }

    if (cfg.recording.output_dir.empty()) {
        error = "recording.output_dir must not be empty";
        return false;
    }
    if (cfg.recording.video_fps <= 0.0) {
        error = "recording.video_fps must be > 0";
        return false;
    }
    if (cfg.recording.video_fourcc.size() != 4) {
        error = "recording.video_fourcc must be exactly 4 characters";
        return false;
    }
    if (cfg.recording.flush_every <= 0) {
        error = "recording.flush_every must be > 0";
        return false;
    }

    if (cfg.motion.motion_threshold < 0.0 || cfg.motion.stillness_threshold < 0.0 ||
        cfg.motion.stillness_threshold > cfg.motion.motion_threshold) {
        error = "motion thresholds must satisfy 0 <= stillness_threshold <= motion_threshold";
        return false;
    }
    if (cfg.motion.stillness_duration_s <= 0.0 || cfg.motion.record_duration_s <= 0.0) {
        error = "motion durations must be > 0";
        return false;
    }
    if (cfg.motion.diff_threshold < 0 || cfg.motion.diff_threshold > 255) {
        error = "motion.diff_threshold must be in [0,255]";
        return false;
    }
    if (cfg.motion.blur_kernel < 1 || cfg.motion.blur_kernel % 2 == 0) {
        error = "motion.blur_kernel must be odd and >= 1";
        return false;
    }

    if (cfg.calibration.std_multiplier <= 0.0) {
        error = "calibration.std_multiplier must be > 0";
        return false;
    }
    auto inByteRange = [](int v) { return v >= 0 && v <= 255; };
    if (!inByteRange(cfg.calibration.saturation_floor) || !inByteRange(cfg.calibration.value_floor)) {
        error = "calibration saturation/value floors must be in [0,255]";
        return false;
    }
    if (cfg.calibration.radius_confidence_factor < 1.0) {
        error = "calibration.radius_confidence_factor must be >= 1";
        return false;
    }
    if (cfg.calibration.circularity_min < 0.0 || cfg.calibration.circularity_min > 1.0) {
        error = "calibration.circularity_min must be in [0,1]";
        return false;
    }

    if (cfg.pose.backend != "none") {
        error = "pose.backend must be 'none'";
        return false;
    }
    error.clear();
    return true;
}

bool loadConfig(const std::string& path, AppConfig& out, std::string& error) {
    try {
        const cv::FileStorage fs(path, cv::FileStorage::READ);
        if (fs.isOpened()) {
            const cv::FileNode camera = fs["camera"];
            const cv::FileNode stream = fs["stream"];
            const cv::FileNode recording = fs["recording"];
            const cv::FileNode motion = fs["motion"];
            const cv::FileNode calibration = fs["calibration"];
            const cv::FileNode pose = fs["pose"];

            readOrDefault(camera, "device_index", out.camera.device_index);
            readOrDefault(camera, "width", out.camera.width);
            readOrDefault(camera, "height", out.camera.height);
            readOrDefault(camera, "fps", out.camera.fps);
            readOrDefault(camera, "calibration_file", out.camera.calibration_file);
            readOrDefault(camera, "max_grab_failures", out.camera.max_grab_failures);

            readDevices(fs["devices"], out.devices);

            readOrDefault(stream, "queue_capacity", out.stream.queue_capacity);
            readOrDefault(stream, "receive_timeout_ms", out.stream.receive_timeout_ms);
            readOrDefault(stream, "connect_timeout_ms", out.stream.connect_timeout_ms);
            readOrDefault(stream, "backoff_initial_ms", out.stream.backoff_initial_ms);
            readOrDefault(stream, "backoff_max_ms", out.stream.backoff_max_ms);
            readOrDefault(stream, "stale_window_ms", out.stream.stale_window_ms);

            readOrDefault(recording, "output_dir", out.recording.output_dir);
            readOrDefault(recording, "video_fps", out.recording.video_fps);
            readOrDefault(recording, "video_fourcc", out.recording.video_fourcc);
            readOrDefault(recording, "flush_every", out.recording.flush_every);

            readOrDefault(motion, "motion_threshold", out.motion.motion_threshold);
            readOrDefault(motion, "stillness_threshold", out.motion.stillness_threshold);
            readOrDefault(motion, "stillness_duration_s", out.motion.stillness_duration_s);
            readOrDefault(motion, "record_duration_s", out.motion.record_duration_s);
            readOrDefault(motion, "diff_threshold", out.motion.diff_threshold);
            readOrDefault(motion, "blur_kernel", out.motion.blur_kernel);

            readOrDefault(calibration, "std_multiplier", out.calibration.std_multiplier);
            readOrDefault(calibration, "saturation_floor", out.calibration.saturation_floor);
            readOrDefault(calibration, "value_floor", out.calibration.value_floor);
            readOrDefault(calibration, "radius_confidence_factor", out.calibration.radius_confidence_factor);
            readOrDefault(calibration, "circularity_min", out.calibration.circularity_min);
            readOrDefault(calibration, "profiles_dir", out.calibration.profiles_dir);

            readOrDefault(pose, "backend", out.pose.backend);

            return validateConfig(out, error);
        }
    } catch (const cv::Exception&) {
        // fall through to plain YAML parser below
    }

    return loadConfigPlainYaml(path, out, error);
}

}  // namespace jugsync
