#include "debug_log.hpp"
#include "event_bus.hpp"
#include <algorithm>

namespace toolrelay {

DebugLog::DebugLog(size_t capacity)
    : capacity_(capacity == 0 ? 1 : capacity) {}

DebugLog::~DebugLog() {
    detach();
}

void DebugLog::attach(EventBus& bus) {
    detach();
    bus_ = &bus;
    subscription_ = subscribe<DebugEvent>(bus, [this](const DebugEvent& ev) {
        append(ev);
    });
}

void DebugLog::detach() {
    if (bus_) {
        bus_->unsubscribe(subscription_);
        bus_ = nullptr;
        subscription_ = 0;
    }
}

void DebugLog::append(const DebugEvent& event) {
    std::lock_guard<std::mutex> lock(mutex_);
    events_.push_back(event);
    while (events_.size() > capacity_) {
        events_.pop_front();
    }
}

std::vector<DebugEvent> DebugLog::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return std::vector<DebugEvent>(events_.begin(), events_.end());
}

std::vector<DebugEvent> DebugLog::recent(size_t count) const {
    std::lock_guard<std::mutex> lock(mutex_);
    size_t n = std::min(count, events_.size());
    return std::vector<DebugEvent>(events_.end() - static_cast<std::ptrdiff_t>(n),
                                   events_.end());
}

std::vector<DebugEvent> DebugLog::by_category(const std::string& category) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<DebugEvent> out;
    for (const auto& ev : events_) {
        if (ev.category == category) out.push_back(ev);
    }
    return out;
}

size_t DebugLog::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return events_.size();
}

void DebugLog::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    events_.clear();
}

nlohmann::json DebugLog::to_json() const {
    std::lock_guard<std::mutex> lock(mutex_);
    nlohmann::json arr = nlohmann::json::array();
    for (const auto& ev : events_) {
        arr.push_back({
            {"timestamp", ev.timestamp},
            {"category", ev.category},
            {"message", ev.message},
            {"data", ev.data}
        });
    }
    return arr;
}

} // namespace toolrelay
