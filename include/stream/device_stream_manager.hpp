#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "core/config.hpp"
#include "core/stream_stats.hpp"
#include "core/types.hpp"
#include "ipc/sample_queue.hpp"
#include "net/message_transport.hpp"

namespace jugsync {

struct DeviceEndpoint {
    std::string name;
    std::string host;
    uint16_t port{8081};
    std::string path{"/imu"};

    std::string url() const { return "ws://" + host + ":" + std::to_string(port) + path; }
};

DeviceEndpoint endpointFromConfig(const DeviceConfig& device);

struct DeviceStatus {
    std::string name;
    std::string url;
    bool connected{false};
    uint64_t reconnects{0};
    std::string last_error;
    StreamStatsSnapshot stats;
};

struct StreamManagerOptions {
    std::size_t queue_capacity{100};
    int receive_timeout_ms{100};
    int connect_timeout_ms{2000};
    int backoff_initial_ms{500};
    int backoff_max_ms{5000};
    int64_t stale_window_ns{100000000};
};

StreamManagerOptions streamOptionsFromConfig(const StreamConfig& config);

using TransportFactory = std::function<net::TransportPtr(const DeviceEndpoint&)>;

// Owns one reader thread per device. Readers reconnect on their own with
// exponential backoff; a dead device never stalls the others. Completed samples
// land in one bounded drop-oldest queue drained by a single consumer.
class DeviceStreamManager {
public:
    explicit DeviceStreamManager(const StreamManagerOptions& options = StreamManagerOptions{},
                                 TransportFactory factory = TransportFactory{});
    ~DeviceStreamManager();

    DeviceStreamManager(const DeviceStreamManager&) = delete;
    DeviceStreamManager& operator=(const DeviceStreamManager&) = delete;

    bool start(const std::vector<DeviceEndpoint>& endpoints, std::string& error);
    // Signals and joins the readers. Each reader closes its own transport before
    // exiting, so no connection is open once stop() returns.
    void stop();
    bool running() const { return running_.load(); }

    std::optional<TelemetrySample> latestFor(const std::string& device) const;
    std::vector<TelemetrySample> drain();
    std::vector<TelemetrySample> waitAndDrain(std::chrono::milliseconds timeout);

    std::vector<std::string> deviceNames() const;
    std::vector<DeviceStatus> deviceStatus() const;
    StreamStatsSnapshot totals() const;
    uint64_t queueDropCount() const { return queue_.dropCount(); }

private:
    class DeviceReader;

    void publish(TelemetrySample sample);
    // Returns true when stop was requested before the delay elapsed.
    bool waitForStop(std::chrono::milliseconds delay);
    bool stopRequested() const { return stop_requested_.load(); }

    StreamManagerOptions options_;
    TransportFactory factory_;
    std::vector<std::unique_ptr<DeviceReader>> readers_;
    ipc::SampleQueue<TelemetrySample> queue_;

    mutable std::mutex latest_mutex_;
    std::unordered_map<std::string, TelemetrySample> latest_;

    std::atomic<bool> running_{false};
    std::atomic<bool> stop_requested_{false};
    std::mutex stop_mutex_;
    std::condition_variable stop_cv_;
};

}  // namespace jugsync
