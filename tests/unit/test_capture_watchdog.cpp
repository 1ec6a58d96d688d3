#include "camera/capture_watchdog.hpp"

#include <iostream>

int main() {
    jugsync::CaptureWatchdog watchdog(3);
    if (!watchdog.onFailure("timeout") || !watchdog.onFailure("timeout") || watchdog.exhausted()) {
        std::cerr << "failures below the limit should keep retrying\n";
        return 1;
    }

    // A good frame clears the streak.
    watchdog.onSuccess();
    if (watchdog.streak() != 0) {
        std::cerr << "success should reset the streak\n";
        return 1;
    }
    if (!watchdog.onFailure("a") || !watchdog.onFailure("b")) {
        std::cerr << "streak should restart from zero after a success\n";
        return 1;
    }
    if (watchdog.onFailure("device gone") || !watchdog.exhausted() || watchdog.streak() != 3) {
        std::cerr << "third consecutive failure should exhaust a limit of 3\n";
        return 1;
    }
    if (watchdog.lastError() != "device gone") {
        std::cerr << "last error mismatch\n";
        return 1;
    }
    const std::string message = watchdog.fatalMessage();
    if (message.find("3 consecutive failures") == std::string::npos ||
        message.find("device gone") == std::string::npos || message.find("--camera") == std::string::npos) {
        std::cerr << "fatal message should name the streak, the last error and the --camera hint: " << message
                  << "\n";
        return 1;
    }

    // Non-positive limits are clamped so the first failure is fatal.
    jugsync::CaptureWatchdog strict(0);
    if (strict.onFailure("x")) {
        std::cerr << "limit 0 should be clamped to 1\n";
        return 1;
    }

    jugsync::CaptureWatchdog defaults;
    for (int i = 1; i < jugsync::CaptureWatchdog::kDefaultMaxFailures; ++i) {
        if (!defaults.onFailure("x")) {
            std::cerr << "default limit exhausted early at " << i << "\n";
            return 1;
        }
    }
    if (defaults.onFailure("x")) {
        std::cerr << "default limit should be reached at " << jugsync::CaptureWatchdog::kDefaultMaxFailures << "\n";
        return 1;
    }
    return 0;
}
