#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>

#include "core/stream_stats.hpp"
#include "core/types.hpp"

namespace jugsync {

struct ReassemblerConfig {
    int64_t stale_window_ns{100000000};  // 100 ms
    uint64_t parse_error_log_every{100};
};

// Merges the accel and gyro fragments of one device into complete samples.
//
// Fragments are paired by device only: the wire format carries no shared sequence
// id, so a sample is the most recent unpaired fragment of each group. Under
// reordering the two halves may come from neighbouring readings; the receipt-time
// skew between them is bounded by stale_window_ns because an older half is
// dropped rather than paired.
class TelemetryReassembler {
public:
    explicit TelemetryReassembler(const ReassemblerConfig& config = ReassemblerConfig{});

    std::optional<TelemetrySample> ingest(const std::string& device, const std::string& raw);
    // Replay form: one clock serves as both receipt and staleness time.
    std::optional<TelemetrySample> ingest(const std::string& device, const std::string& raw, int64_t receipt_ns);
    std::optional<TelemetrySample> ingest(const std::string& device, const std::string& raw, int64_t receipt_ns,
                                          int64_t monotonic_ns);
    std::optional<TelemetrySample> ingestFragment(const std::string& device, const ImuFragment& fragment);

    // Drops pending halves older than the staleness window; returns how many slots were cleared.
    // now_ns is on the monotonic clock the fragments were stamped with.
    std::size_t evictStale(int64_t now_ns);

    bool hasPending(const std::string& device) const;
    void reset();

    const StreamStats& stats() const { return stats_; }

private:
    struct DeviceSlot {
        std::optional<ImuFragment> accel;
        std::optional<ImuFragment> gyro;
        uint64_t next_sequence{0};
        uint64_t parse_errors{0};

        bool empty() const { return !accel.has_value() && !gyro.has_value(); }
        int64_t oldestMonotonicNs() const;
        void clear() {
            accel.reset();
            gyro.reset();
        }
    };

    static std::optional<TelemetrySample> merge(const std::string& device, DeviceSlot& slot, const ImuFragment& fragment);
    bool dropIfStale(DeviceSlot& slot, int64_t now_ns);

    ReassemblerConfig config_;
    std::unordered_map<std::string, DeviceSlot> slots_;
    StreamStats stats_;
};

}  // namespace jugsync
