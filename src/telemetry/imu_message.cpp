#include "telemetry/imu_message.hpp"

#include <cmath>

#include <nlohmann/json.hpp>

namespace jugsync {

namespace {

std::optional<ImuGroup> groupFromTag(const std::string& tag) {
    if (tag == "accel" || tag == "acceleration" || tag == "accelerometer") {
        return ImuGroup::Accel;
    }
    if (tag == "gyro" || tag == "rotation" || tag == "gyroscope") {
        return ImuGroup::Gyro;
    }
    return std::nullopt;
}

bool readAxis(const nlohmann::json& msg, const char* key, double& out) {
    const auto it = msg.find(key);
    if (it == msg.end() || !it->is_number()) {
        return false;
    }
    out = it->get<double>();
    return std::isfinite(out);
}

}  // namespace

const char* imuGroupName(ImuGroup group) {
    switch (group) {
        case ImuGroup::Accel:
            return "accel";
        case ImuGroup::Gyro:
            return "gyro";
    }
    return "unknown";
}

std::optional<ImuFragment> parseImuMessage(const std::string& raw, int64_t receipt_ns, std::string& error) {
    const nlohmann::json msg = nlohmann::json::parse(raw, nullptr, false);
    if (msg.is_discarded()) {
        error = "not valid JSON";
        return std::nullopt;
    }
    if (!msg.is_object()) {
        error = "message is not a JSON object";
        return std::nullopt;
    }

    const auto type_it = msg.find("type");
    if (type_it == msg.end() || !type_it->is_string()) {
        error = "missing 'type'";
        return std::nullopt;
    }
    const auto group = groupFromTag(type_it->get<std::string>());
    if (!group.has_value()) {
        error = "unknown type '" + type_it->get<std::string>() + "'";
        return std::nullopt;
    }

    ImuFragment fragment;
    fragment.group = *group;
    fragment.receipt_ns = receipt_ns;
    if (!readAxis(msg, "x", fragment.axes[0]) ||
        !readAxis(msg, "y", fragment.axes[1]) ||
        !readAxis(msg, "z", fragment.axes[2])) {
        error = "missing or non-numeric axis value";
        return std::nullopt;
    }

    const auto ts_it = msg.find("timestamp_ns");
    if (ts_it != msg.end() && ts_it->is_number_integer()) {
        fragment.device_timestamp_ns = ts_it->get<int64_t>();
    } else if (ts_it != msg.end() && ts_it->is_number_float()) {
        fragment.device_timestamp_ns = static_cast<int64_t>(ts_it->get<double>());
    }

    error.clear();
    return fragment;
}

}  // namespace jugsync
