#include "camera/capture_watchdog.hpp"

#include <algorithm>
#include <iostream>

namespace jugsync {

CaptureWatchdog::CaptureWatchdog(int max_consecutive_failures)
    : max_failures_(std::max(1, max_consecutive_failures)) {}

bool CaptureWatchdog::onFailure(const std::string& error) {
    streak_ += 1;
    last_error_ = error;
    if (streak_ == 1 || (streak_ % 10) == 0) {
        std::cerr << "camera: grab failed (" << error << "), streak=" << streak_ << "/" << max_failures_ << "\n";
    }
    return !exhausted();
}

std::string CaptureWatchdog::fatalMessage() const {
    return "camera stopped delivering frames after " + std::to_string(streak_) +
           " consecutive failures (last: " + last_error_ + "); check --camera index / device permissions";
}

}  // namespace jugsync
