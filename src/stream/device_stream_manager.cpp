#include "stream/device_stream_manager.hpp"

#include <algorithm>
#include <iostream>
#include <set>
#include <thread>

#include "core/time_utils.hpp"
#include "net/websocket_client.hpp"
#include "telemetry/reassembler.hpp"

namespace jugsync {

namespace {

constexpr uint64_t kQueueDropLogEvery = 100;

net::TransportPtr makeWebSocketTransport(const DeviceEndpoint&) {
    return std::make_unique<net::WebSocketClient>();
}

}  // namespace

DeviceEndpoint endpointFromConfig(const DeviceConfig& device) {
    DeviceEndpoint endpoint;
    endpoint.name = device.name;
    endpoint.host = device.host;
    endpoint.port = static_cast<uint16_t>(device.port);
    endpoint.path = device.path;
    return endpoint;
}

StreamManagerOptions streamOptionsFromConfig(const StreamConfig& config) {
    StreamManagerOptions options;
    options.queue_capacity = static_cast<std::size_t>(config.queue_capacity);
    options.receive_timeout_ms = config.receive_timeout_ms;
    options.connect_timeout_ms = config.connect_timeout_ms;
    options.backoff_initial_ms = config.backoff_initial_ms;
    options.backoff_max_ms = config.backoff_max_ms;
    options.stale_window_ns = static_cast<int64_t>(config.stale_window_ms) * 1000000LL;
    return options;
}

class DeviceStreamManager::DeviceReader {
public:
    DeviceReader(DeviceStreamManager& owner, DeviceEndpoint endpoint)
        : owner_(owner),
          endpoint_(std::move(endpoint)),
          reassembler_(ReassemblerConfig{owner.options_.stale_window_ns, 100}) {}

    ~DeviceReader() { join(); }

    void start() { thread_ = std::thread(&DeviceReader::run, this); }

    void join() {
        if (thread_.joinable()) {
            thread_.join();
        }
    }

    const DeviceEndpoint& endpoint() const { return endpoint_; }

    DeviceStatus status() const {
        DeviceStatus status;
        status.name = endpoint_.name;
        status.url = endpoint_.url();
        status.connected = connected_.load();
        status.reconnects = reconnects_.load();
        status.stats = reassembler_.stats().snapshot();
        status.stats.reconnects = status.reconnects;
        std::lock_guard<std::mutex> lock(error_mutex_);
        status.last_error = last_error_;
        return status;
    }

private:
    void setError(const std::string& error) {
        std::lock_guard<std::mutex> lock(error_mutex_);
        last_error_ = error;
    }

    void run() {
        const auto& opts = owner_.options_;
        int backoff_ms = opts.backoff_initial_ms;
        bool first_attempt = true;

        while (!owner_.stopRequested()) {
            if (!transport_) {
                transport_ = owner_.factory_(endpoint_);
                if (!transport_) {
                    setError("transport factory returned no transport");
                    std::cerr << "stream: " << endpoint_.name << ": no transport available, reader exiting\n";
                    return;
                }
            }

            if (!first_attempt) {
                reconnects_.fetch_add(1);
            }
            first_attempt = false;

            std::string error;
            if (!transport_->connect(endpoint_.host, endpoint_.port, endpoint_.path, opts.connect_timeout_ms, error)) {
                setError(error);
                std::cerr << "stream: " << endpoint_.name << " connect to " << endpoint_.url() << " failed ("
                          << error << "), retry in " << backoff_ms << "ms\n";
                if (owner_.waitForStop(std::chrono::milliseconds(backoff_ms))) {
                    break;
                }
                backoff_ms = std::min(backoff_ms * 2, opts.backoff_max_ms);
                continue;
            }

            backoff_ms = opts.backoff_initial_ms;
            connected_.store(true);
            setError({});
            std::cout << "stream: " << endpoint_.name << " connected to " << endpoint_.url() << "\n";

            readUntilDisconnect();

            connected_.store(false);
            transport_->close();
            // Halves from the previous connection never pair with new ones.
            reassembler_.reset();
            if (owner_.stopRequested()) {
                break;
            }
            std::cerr << "stream: " << endpoint_.name << " disconnected, retry in " << backoff_ms << "ms\n";
            if (owner_.waitForStop(std::chrono::milliseconds(backoff_ms))) {
                break;
            }
            backoff_ms = std::min(backoff_ms * 2, opts.backoff_max_ms);
        }

        if (transport_) {
            transport_->close();
        }
        connected_.store(false);
    }

    void readUntilDisconnect() {
        const int timeout_ms = owner_.options_.receive_timeout_ms;
        std::string message;
        std::string error;
        while (!owner_.stopRequested()) {
            const net::ReceiveStatus status = transport_->receive(message, timeout_ms, error);
            switch (status) {
                case net::ReceiveStatus::Message: {
                    auto sample = reassembler_.ingest(endpoint_.name, message);
                    if (sample.has_value()) {
                        owner_.publish(std::move(*sample));
                    }
                    break;
                }
                case net::ReceiveStatus::Timeout:
                    reassembler_.evictStale(nowSteadyNs());
                    break;
                case net::ReceiveStatus::Closed:
                case net::ReceiveStatus::Error:
                    setError(error.empty() ? net::receiveStatusName(status) : error);
                    return;
            }
        }
    }

    DeviceStreamManager& owner_;
    DeviceEndpoint endpoint_;
    net::TransportPtr transport_;
    TelemetryReassembler reassembler_;
    std::thread thread_;

    std::atomic<bool> connected_{false};
    std::atomic<uint64_t> reconnects_{0};
    mutable std::mutex error_mutex_;
    std::string last_error_;
};

DeviceStreamManager::DeviceStreamManager(const StreamManagerOptions& options, TransportFactory factory)
    : options_(options),
      factory_(factory ? std::move(factory) : TransportFactory(makeWebSocketTransport)),
      queue_(options.queue_capacity) {}

DeviceStreamManager::~DeviceStreamManager() {
    stop();
}

bool DeviceStreamManager::start(const std::vector<DeviceEndpoint>& endpoints, std::string& error) {
    if (running_.load()) {
        error = "stream manager already running";
        return false;
    }
    if (!queue_.valid()) {
        error = "sample queue capacity must be > 0";
        return false;
    }

    std::set<std::string> names;
    for (const auto& endpoint : endpoints) {
        if (endpoint.name.empty() || endpoint.host.empty()) {
            error = "device endpoints need a name and a host";
            return false;
        }
        if (!names.insert(endpoint.name).second) {
            error = "duplicate device name '" + endpoint.name + "'";
            return false;
        }
    }

    readers_.clear();
    queue_.clear();
    {
        std::lock_guard<std::mutex> lock(latest_mutex_);
        latest_.clear();
    }
    {
        std::lock_guard<std::mutex> lock(stop_mutex_);
        stop_requested_.store(false);
    }

    running_.store(true);
    for (const auto& endpoint : endpoints) {
        readers_.push_back(std::make_unique<DeviceReader>(*this, endpoint));
    }
    for (auto& reader : readers_) {
        reader->start();
    }
    std::cout << "stream: started " << readers_.size() << " device reader(s)\n";
    return true;
}

void DeviceStreamManager::stop() {
    if (!running_.exchange(false)) {
        return;
    }
    {
        std::lock_guard<std::mutex> lock(stop_mutex_);
        stop_requested_.store(true);
    }
    stop_cv_.notify_all();
    queue_.wakeAll();

    for (auto& reader : readers_) {
        reader->join();
    }
    std::cout << "stream: stopped\n";
}

bool DeviceStreamManager::waitForStop(std::chrono::milliseconds delay) {
    std::unique_lock<std::mutex> lock(stop_mutex_);
    return stop_cv_.wait_for(lock, delay, [this] { return stop_requested_.load(); });
}

void DeviceStreamManager::publish(TelemetrySample sample) {
    {
        std::lock_guard<std::mutex> lock(latest_mutex_);
        latest_[sample.device] = sample;
    }
    if (queue_.pushDropOldest(std::move(sample)) == ipc::PushResult::DroppedOldest) {
        const uint64_t dropped = queue_.dropCount();
        if (dropped == 1 || (dropped % kQueueDropLogEvery) == 0) {
            std::cerr << "stream: sample queue full, dropped oldest (total=" << dropped << ")\n";
        }
    }
}

std::optional<TelemetrySample> DeviceStreamManager::latestFor(const std::string& device) const {
    std::lock_guard<std::mutex> lock(latest_mutex_);
    const auto it = latest_.find(device);
    if (it == latest_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<TelemetrySample> DeviceStreamManager::drain() {
    return queue_.drain();
}

std::vector<TelemetrySample> DeviceStreamManager::waitAndDrain(std::chrono::milliseconds timeout) {
    return queue_.waitAndDrain(timeout);
}

std::vector<std::string> DeviceStreamManager::deviceNames() const {
    std::vector<std::string> names;
    names.reserve(readers_.size());
    for (const auto& reader : readers_) {
        names.push_back(reader->endpoint().name);
    }
    return names;
}

std::vector<DeviceStatus> DeviceStreamManager::deviceStatus() const {
    std::vector<DeviceStatus> out;
    out.reserve(readers_.size());
    for (const auto& reader : readers_) {
        out.push_back(reader->status());
    }
    return out;
}

StreamStatsSnapshot DeviceStreamManager::totals() const {
    StreamStatsSnapshot total;
    for (const auto& reader : readers_) {
        const StreamStatsSnapshot s = reader->status().stats;
        total.received += s.received;
        total.parse_errors += s.parse_errors;
        total.completed += s.completed;
        total.stale_dropped += s.stale_dropped;
        total.reconnects += s.reconnects;
    }
    total.queue_dropped = queue_.dropCount();
    return total;
}

}  // namespace jugsync
