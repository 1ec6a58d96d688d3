#include "telemetry/reassembler.hpp"

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <iostream>
#include <string>
#include <vector>

// Parse + pair cost per message for a two-device stream.
int main() {
    using Clock = std::chrono::steady_clock;
    constexpr int kIters = 200000;

    jugsync::TelemetryReassembler reassembler;
    const std::string accel = "{\"type\":\"accel\",\"x\":0.12,\"y\":-0.40,\"z\":9.79,\"timestamp_ns\":1000}";
    const std::string gyro = "{\"type\":\"gyro\",\"x\":0.01,\"y\":0.02,\"z\":-0.03,\"timestamp_ns\":1001}";

    std::vector<int64_t> lat_ns;
    lat_ns.reserve(kIters);

    int64_t receipt_ns = 1;
    uint64_t completed = 0;
    for (int i = 0; i < kIters; ++i) {
        const char* device = (i / 2) % 2 == 0 ? "left" : "right";
        const auto t0 = Clock::now();
        const auto sample = reassembler.ingest(device, (i % 2) == 0 ? accel : gyro, receipt_ns);
        const auto t1 = Clock::now();
        receipt_ns += 1000000;
        completed += sample.has_value() ? 1U : 0U;
        lat_ns.push_back(std::chrono::duration_cast<std::chrono::nanoseconds>(t1 - t0).count());
    }

    std::sort(lat_ns.begin(), lat_ns.end());
    auto pct = [&](double p) -> int64_t {
        const std::size_t idx = static_cast<std::size_t>(p * static_cast<double>(lat_ns.size() - 1));
        return lat_ns[idx];
    };

    const jugsync::StreamStatsSnapshot stats = reassembler.stats().snapshot();
    std::cout << "bench_reassembler_messages " << kIters << "\n";
    std::cout << "latency_ns_p50 " << pct(0.50) << "\n";
    std::cout << "latency_ns_p95 " << pct(0.95) << "\n";
    std::cout << "latency_ns_p99 " << pct(0.99) << "\n";
    std::cout << "completed " << completed << "\n";
    std::cout << "stale_dropped " << stats.stale_dropped << "\n";
    return 0;
}
