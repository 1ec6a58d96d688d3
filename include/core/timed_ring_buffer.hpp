#pragma once

#include <cstddef>
#include <cstdint>
#include <deque>
#include <utility>
#include <vector>

namespace jugsync {

// Keeps the items of the last max_age_ns (measured from the newest push) and
// never more than max_items. Pushes must arrive in timestamp order.
template <typename T>
class TimedRingBuffer {
public:
    using Entry = std::pair<int64_t, T>;

    TimedRingBuffer(int64_t max_age_ns, std::size_t max_items)
        : max_age_ns_(max_age_ns), max_items_(max_items < 1 ? 1 : max_items) {}

    void push(int64_t timestamp_ns, T value) {
        items_.emplace_back(timestamp_ns, std::move(value));
        while (items_.size() > max_items_) {
            items_.pop_front();
            evicted_ += 1;
        }
        while (!items_.empty() && timestamp_ns - items_.front().first > max_age_ns_) {
            items_.pop_front();
            evicted_ += 1;
        }
    }

    // Items with start_ns <= t <= end_ns, oldest first.
    std::vector<Entry> between(int64_t start_ns, int64_t end_ns) const {
        std::vector<Entry> out;
        for (const auto& item : items_) {
            if (item.first >= start_ns && item.first <= end_ns) {
                out.push_back(item);
            }
        }
        return out;
    }

    void clear() { items_.clear(); }
    bool empty() const { return items_.empty(); }
    std::size_t size() const { return items_.size(); }
    std::size_t maxItems() const { return max_items_; }
    uint64_t evicted() const { return evicted_; }
    int64_t oldestNs() const { return items_.empty() ? 0 : items_.front().first; }
    int64_t newestNs() const { return items_.empty() ? 0 : items_.back().first; }

private:
    int64_t max_age_ns_;
    std::size_t max_items_;
    std::deque<Entry> items_;
    uint64_t evicted_{0};
};

}  // namespace jugsync
