#include "telemetry/reassembler.hpp"

#include <algorithm>
#include <iostream>

#include "core/math_utils.hpp"
#include "core/time_utils.hpp"
#include "telemetry/imu_message.hpp"

namespace jugsync {

int64_t TelemetryReassembler::DeviceSlot::oldestMonotonicNs() const {
    if (accel.has_value() && gyro.has_value()) {
        return std::min(accel->monotonic_ns, gyro->monotonic_ns);
    }
    if (accel.has_value()) {
        return accel->monotonic_ns;
    }
    if (gyro.has_value()) {
        return gyro->monotonic_ns;
    }
    return 0;
}

TelemetryReassembler::TelemetryReassembler(const ReassemblerConfig& config)
    : config_(config) {}

std::optional<TelemetrySample> TelemetryReassembler::ingest(const std::string& device, const std::string& raw) {
    return ingest(device, raw, nowWallNs(), nowSteadyNs());
}

std::optional<TelemetrySample> TelemetryReassembler::ingest(const std::string& device, const std::string& raw, int64_t receipt_ns) {
    return ingest(device, raw, receipt_ns, receipt_ns);
}

std::optional<TelemetrySample> TelemetryReassembler::ingest(const std::string& device, const std::string& raw,
                                                            int64_t receipt_ns, int64_t monotonic_ns) {
    stats_.addReceived();

    std::string error;
    auto fragment = parseImuMessage(raw, receipt_ns, error);
    if (!fragment.has_value()) {
        stats_.addParseError();
        DeviceSlot& slot = slots_[device];
        slot.parse_errors += 1;
        const uint64_t every = std::max<uint64_t>(1, config_.parse_error_log_every);
        if (slot.parse_errors == 1 || (slot.parse_errors % every) == 0) {
            std::cerr << "telemetry: " << device << ": skipped malformed message (" << error
                      << "), total=" << slot.parse_errors << "\n";
        }
        return std::nullopt;
    }
    fragment->monotonic_ns = monotonic_ns;
    return ingestFragment(device, *fragment);
}

std::optional<TelemetrySample> TelemetryReassembler::ingestFragment(const std::string& device, const ImuFragment& fragment) {
    DeviceSlot& slot = slots_[device];
    (void)dropIfStale(slot, fragment.monotonic_ns);

    auto sample = merge(device, slot, fragment);
    if (sample.has_value()) {
        stats_.addCompleted();
    }
    return sample;
}

std::optional<TelemetrySample> TelemetryReassembler::merge(const std::string& device, DeviceSlot& slot, const ImuFragment& fragment) {
    // A newer half of the same group replaces the unpaired older one.
    if (fragment.group == ImuGroup::Accel) {
        slot.accel = fragment;
    } else {
        slot.gyro = fragment;
    }
    if (!slot.accel.has_value() || !slot.gyro.has_value()) {
        return std::nullopt;
    }

    TelemetrySample sample;
    sample.device = device;
    sample.accel = slot.accel->axes;
    sample.gyro = slot.gyro->axes;
    sample.accel_magnitude = norm3(sample.accel);
    sample.gyro_magnitude = norm3(sample.gyro);
    sample.timestamp_ns = fragment.receipt_ns;
    sample.device_timestamp_ns = fragment.device_timestamp_ns != 0
        ? fragment.device_timestamp_ns
        : std::max(slot.accel->device_timestamp_ns, slot.gyro->device_timestamp_ns);
    sample.sequence = slot.next_sequence++;

    slot.clear();
    return sample;
}

bool TelemetryReassembler::dropIfStale(DeviceSlot& slot, int64_t now_ns) {
    if (slot.empty()) {
        return false;
    }
    if (now_ns - slot.oldestMonotonicNs() <= config_.stale_window_ns) {
        return false;
    }
    slot.clear();
    stats_.addStaleDropped();
    return true;
}

std::size_t TelemetryReassembler::evictStale(int64_t now_ns) {
    std::size_t cleared = 0;
    for (auto& entry : slots_) {
        if (dropIfStale(entry.second, now_ns)) {
            cleared += 1;
        }
    }
    return cleared;
}

bool TelemetryReassembler::hasPending(const std::string& device) const {
    const auto it = slots_.find(device);
    return it != slots_.end() && !it->second.empty();
}

void TelemetryReassembler::reset() {
    for (auto& entry : slots_) {
        entry.second.clear();
    }
}

}  // namespace jugsync
