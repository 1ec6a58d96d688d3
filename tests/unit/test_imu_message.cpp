#include "telemetry/imu_message.hpp"

#include <iostream>

int main() {
    std::string error;

    const auto accel = jugsync::parseImuMessage(
        R"({"watch_id":"left","type":"accel","timestamp_ns":123456789,"x":1.0,"y":-2.5,"z":9.81})", 42, error);
    if (!accel.has_value() || accel->group != jugsync::ImuGroup::Accel || accel->axes[1] != -2.5 ||
        accel->device_timestamp_ns != 123456789 || accel->receipt_ns != 42) {
        std::cerr << "accel message parse mismatch: " << error << "\n";
        return 1;
    }

    const char* gyro_tags[] = {"gyro", "rotation", "gyroscope"};
    for (const char* tag : gyro_tags) {
        const auto gyro = jugsync::parseImuMessage(
            std::string(R"({"type":")") + tag + R"(","x":0,"y":0,"z":1})", 0, error);
        if (!gyro.has_value() || gyro->group != jugsync::ImuGroup::Gyro || gyro->device_timestamp_ns != 0) {
            std::cerr << "gyro alias '" << tag << "' not accepted\n";
            return 1;
        }
    }
    if (!jugsync::parseImuMessage(R"({"type":"accelerometer","x":1,"y":2,"z":3})", 0, error).has_value() ||
        !jugsync::parseImuMessage(R"({"type":"acceleration","x":1,"y":2,"z":3})", 0, error).has_value()) {
        std::cerr << "accel aliases not accepted\n";
        return 1;
    }

    const char* malformed[] = {
        "",
        "not json",
        "[1,2,3]",
        R"({"x":1,"y":2,"z":3})",
        R"({"type":"magnetometer","x":1,"y":2,"z":3})",
        R"({"type":"accel","x":1,"y":2})",
        R"({"type":"accel","x":"1","y":2,"z":3})",
        R"({"type":7,"x":1,"y":2,"z":3})",
        R"({"type":"accel","x":1,"y":2,"z":3)",
    };
    for (const char* raw : malformed) {
        error.clear();
        if (jugsync::parseImuMessage(raw, 0, error).has_value() || error.empty()) {
            std::cerr << "malformed message accepted: " << raw << "\n";
            return 1;
        }
    }

    if (std::string(jugsync::imuGroupName(jugsync::ImuGroup::Gyro)) != "gyro") {
        std::cerr << "group name mismatch\n";
        return 1;
    }
    return 0;
}
