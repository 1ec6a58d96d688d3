#include "ipc/sample_queue.hpp"

#include <atomic>
#include <chrono>
#include <iostream>
#include <thread>
#include <vector>

int main() {
    jugsync::ipc::SampleQueue<int> queue(64);
    if (!queue.valid()) {
        std::cerr << "queue invalid\n";
        return 1;
    }

    // Two producers (one per device) against one slow consumer.
    constexpr int kPerProducer = 25000;
    std::atomic<int> finished{0};
    auto produce = [&](int base) {
        for (int i = 0; i < kPerProducer; ++i) {
            (void)queue.pushDropOldest(base + i);
        }
        finished.fetch_add(1);
    };
    std::thread left(produce, 0);
    std::thread right(produce, 1000000);

    int consumed = 0;
    int last_left = -1;
    int last_right = -1;
    bool ordered = true;
    while (finished.load() < 2 || queue.size() > 0U) {
        const std::vector<int> batch = queue.waitAndDrain(std::chrono::milliseconds(5));
        for (int v : batch) {
            int& last = v >= 1000000 ? last_right : last_left;
            if (v <= last) {
                ordered = false;
            }
            last = v;
            consumed++;
        }
        std::this_thread::sleep_for(std::chrono::microseconds(200));
    }
    left.join();
    right.join();

    if (queue.dropCount() == 0U) {
        std::cerr << "expected drops under overload\n";
        return 1;
    }
    if (!ordered) {
        std::cerr << "per-producer order not preserved\n";
        return 1;
    }
    if (last_left != kPerProducer - 1 || last_right != 1000000 + kPerProducer - 1) {
        std::cerr << "drop-oldest policy lost the newest samples (left=" << last_left << " right=" << last_right
                  << ")\n";
        return 1;
    }
    if (queue.pushCount() != static_cast<uint64_t>(2 * kPerProducer) ||
        static_cast<uint64_t>(consumed) + queue.dropCount() != queue.pushCount()) {
        std::cerr << "consumed + dropped should account for every push\n";
        return 1;
    }
    return 0;
}
