#pragma once

#include <atomic>
#include <cstdint>

namespace jugsync {

struct StreamStatsSnapshot {
    uint64_t received{0};
    uint64_t parse_errors{0};
    uint64_t completed{0};
    uint64_t stale_dropped{0};
    uint64_t queue_dropped{0};
    uint64_t reconnects{0};
};

class StreamStats {
public:
    void addReceived() { received_.fetch_add(1, std::memory_order_relaxed); }
    void addParseError() { parse_errors_.fetch_add(1, std::memory_order_relaxed); }
    void addCompleted() { completed_.fetch_add(1, std::memory_order_relaxed); }
    void addStaleDropped() { stale_dropped_.fetch_add(1, std::memory_order_relaxed); }
    void addQueueDropped() { queue_dropped_.fetch_add(1, std::memory_order_relaxed); }
    void addReconnect() { reconnects_.fetch_add(1, std::memory_order_relaxed); }

    StreamStatsSnapshot snapshot() const;

private:
    std::atomic<uint64_t> received_{0};
    std::atomic<uint64_t> parse_errors_{0};
    std::atomic<uint64_t> completed_{0};
    std::atomic<uint64_t> stale_dropped_{0};
    std::atomic<uint64_t> queue_dropped_{0};
    std::atomic<uint64_t> reconnects_{0};
};

}  // namespace jugsync
