#pragma once

#include <optional>
#include <string>

#include "core/types.hpp"

namespace jugsync {

const char* imuGroupName(ImuGroup group);

// Parses one device message, e.g.
//   {"type":"accel","x":1.0,"y":2.0,"z":3.0,"timestamp_ns":123,"watch_id":"left"}
// Accepted tags: accel/acceleration/accelerometer and gyro/rotation/gyroscope.
std::optional<ImuFragment> parseImuMessage(const std::string& raw, int64_t receipt_ns, std::string& error);

}  // namespace jugsync
