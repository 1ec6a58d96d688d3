#pragma once

#include <string>

namespace jugsync {

// Consecutive grab failure streak. Past the limit the capture source is treated
// as lost instead of being retried forever.
class CaptureWatchdog {
public:
    static constexpr int kDefaultMaxFailures = 30;

    explicit CaptureWatchdog(int max_consecutive_failures = kDefaultMaxFailures);

    // Returns false once the streak reaches the limit.
    bool onFailure(const std::string& error);
    void onSuccess() { streak_ = 0; }

    bool exhausted() const { return streak_ >= max_failures_; }
    int streak() const { return streak_; }
    const std::string& lastError() const { return last_error_; }
    std::string fatalMessage() const;

private:
    int max_failures_;
    int streak_{0};
    std::string last_error_;
};

}  // namespace jugsync
