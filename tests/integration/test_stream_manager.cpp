#include "stream/device_stream_manager.hpp"

#include <atomic>
#include <chrono>
#include <iostream>
#include <memory>
#include <thread>

namespace {

struct FakeBehavior {
    bool refuse_connect{false};
    int messages_per_connection{-1};  // -1: never closes
    std::atomic<int> connects{0};
    std::atomic<int> open_transports{0};
};

// Emits alternating accel/gyro messages; optionally drops the connection.
class FakeTransport : public jugsync::net::IMessageTransport {
public:
    explicit FakeTransport(FakeBehavior& behavior) : behavior_(behavior) {}

    bool connect(const std::string&, uint16_t, const std::string&, int, std::string& error) override {
        if (behavior_.refuse_connect) {
            error = "connection refused";
            return false;
        }
        behavior_.connects.fetch_add(1);
        behavior_.open_transports.fetch_add(1);
        open_ = true;
        sent_ = 0;
        return true;
    }

    jugsync::net::ReceiveStatus receive(std::string& out, int timeout_ms, std::string& error) override {
        if (!open_) {
            error = "not connected";
            return jugsync::net::ReceiveStatus::Error;
        }
        if (behavior_.messages_per_connection >= 0 && sent_ >= behavior_.messages_per_connection) {
            markClosed();
            return jugsync::net::ReceiveStatus::Closed;
        }
        if (sent_ % 50 == 49) {
            std::this_thread::sleep_for(std::chrono::milliseconds(timeout_ms));
            ++sent_;
            return jugsync::net::ReceiveStatus::Timeout;
        }
        const bool accel = (sent_ % 2) == 0;
        out = std::string("{\"type\":\"") + (accel ? "accel" : "gyro") + "\",\"x\":0.1,\"y\":0.2,\"z\":" +
              (accel ? "9.81" : "0.5") + "}";
        ++sent_;
        std::this_thread::sleep_for(std::chrono::microseconds(200));
        return jugsync::net::ReceiveStatus::Message;
    }

    void close() override { markClosed(); }
    bool isOpen() const override { return open_; }

private:
    void markClosed() {
        if (open_) {
            open_ = false;
            behavior_.open_transports.fetch_sub(1);
        }
    }

    FakeBehavior& behavior_;
    bool open_{false};
    int sent_{0};
};

jugsync::StreamManagerOptions fastOptions(std::size_t capacity) {
    jugsync::StreamManagerOptions options;
    options.queue_capacity = capacity;
    options.receive_timeout_ms = 20;
    options.connect_timeout_ms = 50;
    options.backoff_initial_ms = 10;
    options.backoff_max_ms = 40;
    return options;
}

const jugsync::DeviceStatus* findStatus(const std::vector<jugsync::DeviceStatus>& all, const std::string& name) {
    for (const auto& s : all) {
        if (s.name == name) {
            return &s;
        }
    }
    return nullptr;
}

}  // namespace

int main() {
    FakeBehavior healthy;
    FakeBehavior dead;
    dead.refuse_connect = true;
    FakeBehavior flaky;
    flaky.messages_per_connection = 40;

    auto factory = [&](const jugsync::DeviceEndpoint& endpoint) -> jugsync::net::TransportPtr {
        if (endpoint.name == "left") {
            return std::make_unique<FakeTransport>(healthy);
        }
        if (endpoint.name == "dead") {
            return std::make_unique<FakeTransport>(dead);
        }
        return std::make_unique<FakeTransport>(flaky);
    };

    std::string error;
    {
        jugsync::DeviceStreamManager duplicate(fastOptions(8), factory);
        if (duplicate.start({{"left", "a", 1, "/imu"}, {"left", "b", 1, "/imu"}}, error)) {
            std::cerr << "duplicate device names should be rejected\n";
            return 1;
        }
    }

    jugsync::DeviceStreamManager manager(fastOptions(16), factory);
    const std::vector<jugsync::DeviceEndpoint> endpoints = {
        {"left", "10.0.0.1", 8081, "/imu"},
        {"dead", "10.0.0.2", 8081, "/imu"},
        {"right", "10.0.0.3", 8081, "/imu"},
    };
    if (!manager.start(endpoints, error)) {
        std::cerr << "start failed: " << error << "\n";
        return 1;
    }
    if (manager.start(endpoints, error)) {
        std::cerr << "second start should be rejected while running\n";
        return 1;
    }

    // A device that never connects must not starve the others.
    bool saw_left = false;
    bool saw_right = false;
    const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(3);
    while ((!saw_left || !saw_right) && std::chrono::steady_clock::now() < deadline) {
        for (const auto& sample : manager.waitAndDrain(std::chrono::milliseconds(50))) {
            if (sample.device == "dead") {
                std::cerr << "dead device produced a sample\n";
                return 1;
            }
            if (sample.accel_magnitude <= 9.0 || sample.gyro_magnitude <= 0.0) {
                std::cerr << "sample magnitudes not computed\n";
                return 1;
            }
            saw_left = saw_left || sample.device == "left";
            saw_right = saw_right || sample.device == "right";
        }
    }
    if (!saw_left || !saw_right) {
        std::cerr << "healthy devices did not deliver samples\n";
        return 1;
    }

    // Let the queue overflow without draining, and let the flaky device cycle.
    std::this_thread::sleep_for(std::chrono::milliseconds(400));

    const auto stop_start = std::chrono::steady_clock::now();
    manager.stop();
    const auto stop_ms =
        std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - stop_start).count();
    if (stop_ms > 1000) {
        std::cerr << "stop took too long (" << stop_ms << "ms)\n";
        return 1;
    }
    if (manager.running()) {
        std::cerr << "manager should report stopped\n";
        return 1;
    }
    if (healthy.open_transports.load() != 0 || flaky.open_transports.load() != 0) {
        std::cerr << "every transport must be closed once stop returns\n";
        return 1;
    }

    const auto statuses = manager.deviceStatus();
    const jugsync::DeviceStatus* dead_status = findStatus(statuses, "dead");
    const jugsync::DeviceStatus* right_status = findStatus(statuses, "right");
    if (dead_status == nullptr || right_status == nullptr) {
        std::cerr << "device status missing\n";
        return 1;
    }
    if (dead_status->reconnects == 0 || dead_status->last_error.empty() || dead_status->stats.completed != 0) {
        std::cerr << "dead device should keep retrying and report its error\n";
        return 1;
    }
    if (flaky.connects.load() < 2 || right_status->reconnects == 0) {
        std::cerr << "flaky device should reconnect after the peer closes\n";
        return 1;
    }
    if (dead.connects.load() != 0) {
        std::cerr << "refused connects should not count as connections\n";
        return 1;
    }

    const std::vector<jugsync::TelemetrySample> remaining = manager.drain();
    if (remaining.size() > 16U || manager.queueDropCount() == 0U) {
        std::cerr << "bounded queue should hold at most its capacity and count drops\n";
        return 1;
    }
    // Drop-oldest keeps the newest sample of each device.
    for (const char* name : {"left", "right"}) {
        const auto latest = manager.latestFor(name);
        uint64_t newest_queued = 0;
        bool found = false;
        for (const auto& s : remaining) {
            if (s.device == name) {
                newest_queued = s.sequence;
                found = true;
            }
        }
        if (!latest.has_value() || (found && newest_queued != latest->sequence)) {
            std::cerr << "queue lost the newest sample for " << name << "\n";
            return 1;
        }
    }

    const jugsync::StreamStatsSnapshot totals = manager.totals();
    if (totals.completed == 0 || totals.queue_dropped != manager.queueDropCount()) {
        std::cerr << "totals mismatch\n";
        return 1;
    }
    return 0;
}
