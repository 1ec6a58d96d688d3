#include "ipc/sample_queue.hpp"

#include <chrono>
#include <iostream>
#include <thread>

int main() {
    jugsync::ipc::SampleQueue<int> invalid_queue(0);
    if (invalid_queue.valid() || invalid_queue.pushDropOldest(1) != jugsync::ipc::PushResult::Full) {
        std::cerr << "zero-capacity queue must be invalid\n";
        return 1;
    }

    jugsync::ipc::SampleQueue<int> queue(4);
    for (int i = 0; i < 4; ++i) {
        if (queue.pushDropOldest(i) != jugsync::ipc::PushResult::Ok) {
            std::cerr << "initial fill should not drop\n";
            return 1;
        }
    }
    if (queue.size() != 4U) {
        std::cerr << "queue size after fill mismatch\n";
        return 1;
    }

    if (queue.pushDropOldest(4) != jugsync::ipc::PushResult::DroppedOldest ||
        queue.pushDropOldest(5) != jugsync::ipc::PushResult::DroppedOldest) {
        std::cerr << "overflow push should drop oldest\n";
        return 1;
    }
    if (queue.dropCount() != 2U || queue.pushCount() != 6U) {
        std::cerr << "queue push/drop counters mismatch\n";
        return 1;
    }

    const auto drained = queue.drain();
    if (drained.size() != 4U || drained.front() != 2 || drained.back() != 5) {
        std::cerr << "drain must return the newest items in push order\n";
        return 1;
    }
    for (std::size_t i = 1; i < drained.size(); ++i) {
        if (drained[i] != drained[i - 1] + 1) {
            std::cerr << "drain order mismatch\n";
            return 1;
        }
    }
    if (!queue.drain().empty()) {
        std::cerr << "items must be delivered at most once\n";
        return 1;
    }

    int v = -1;
    if (queue.pop(v)) {
        std::cerr << "queue should be empty\n";
        return 1;
    }

    // waitAndDrain times out empty, then wakes on a push from another thread.
    const auto t0 = std::chrono::steady_clock::now();
    if (!queue.waitAndDrain(std::chrono::milliseconds(30)).empty()) {
        std::cerr << "waitAndDrain on empty queue should return nothing\n";
        return 1;
    }
    if (std::chrono::steady_clock::now() - t0 < std::chrono::milliseconds(25)) {
        std::cerr << "waitAndDrain returned before its timeout\n";
        return 1;
    }

    std::thread producer([&queue]() {
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
        (void)queue.pushDropOldest(42);
    });
    const auto woken = queue.waitAndDrain(std::chrono::milliseconds(2000));
    producer.join();
    if (woken.size() != 1U || woken.front() != 42) {
        std::cerr << "waitAndDrain should return the pushed item\n";
        return 1;
    }

    std::thread waker([&queue]() {
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
        queue.wakeAll();
    });
    const auto t1 = std::chrono::steady_clock::now();
    const auto none = queue.waitAndDrain(std::chrono::milliseconds(5000));
    waker.join();
    if (!none.empty() || std::chrono::steady_clock::now() - t1 > std::chrono::milliseconds(2000)) {
        std::cerr << "wakeAll should release a waiting consumer\n";
        return 1;
    }

    return 0;
}
