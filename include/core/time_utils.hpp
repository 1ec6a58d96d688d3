#pragma once

#include <chrono>
#include <cstdint>
#include <string>

namespace jugsync {

int64_t nowSteadyNs();
int64_t nowWallNs();

// Local-time "YYYYmmdd_HHMMSS", the token shared by every file of one clip.
std::string formatTimestampToken(std::chrono::system_clock::time_point tp);

}  // namespace jugsync
