#pragma once
#include "event.hpp"
#include <cstddef>
#include <cstdint>
#include <deque>
#include <mutex>
#include <vector>

namespace toolrelay {

class EventBus;

// Bounded, append-only record of DebugEvents. Oldest entries are evicted
// once capacity is reached.
class DebugLog {
public:
    explicit DebugLog(size_t capacity = 1000);
    ~DebugLog();

    DebugLog(const DebugLog&) = delete;
    DebugLog& operator=(const DebugLog&) = delete;

    // Record every DebugEvent published on bus until detach()
    void attach(EventBus& bus);
    void detach();

    void append(const DebugEvent& event);

    std::vector<DebugEvent> snapshot() const;
    std::vector<DebugEvent> recent(size_t count) const;
    std::vector<DebugEvent> by_category(const std::string& category) const;

    size_t size() const;
    size_t capacity() const { return capacity_; }
    void clear();

    // [{timestamp, category, message, data}, ...] oldest first
    nlohmann::json to_json() const;

private:
    size_t capacity_;
    mutable std::mutex mutex_;
    std::deque<DebugEvent> events_;
    EventBus* bus_ = nullptr;
    uint64_t subscription_ = 0;
};

} // namespace toolrelay
