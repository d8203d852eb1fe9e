#include "event_bus.hpp"
#include <iostream>
#include <stdexcept>

namespace autoship {

uint64_t EventBus::subscribe(const std::string& tag, EventHandler handler) {
    std::lock_guard<std::mutex> lock(mutex_);
    uint64_t id = next_id_++;
    handlers_[tag].push_back(Entry{id, std::move(handler)});
    return id;
}

bool EventBus::unsubscribe(uint64_t id) {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto it = handlers_.begin(); it != handlers_.end(); ++it) {
        auto& entries = it->second;
        for (auto e = entries.begin(); e != entries.end(); ++e) {
            if (e->id != id) continue;
            entries.erase(e);
            if (entries.empty()) handlers_.erase(it);
            return true;
        }
    }
    return false;
}

void EventBus::publish(const Event& event) {
    std::vector<EventHandler> snapshot;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = handlers_.find(event.type_tag);
        if (it == handlers_.end()) return;
        for (const auto& entry : it->second) {
            snapshot.push_back(entry.handler);
        }
    }

    for (const auto& handler : snapshot) {
        try {
            handler(event);
        } catch (const std::exception& e) {
            std::cerr << "[events] Handler for " << event.type_tag
                      << " failed: " << e.what() << "\n";
            std::lock_guard<std::mutex> lock(mutex_);
            ++handler_failures_;
        }
    }
}

size_t EventBus::subscriber_count(const std::string& tag) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = handlers_.find(tag);
    return it == handlers_.end() ? 0 : it->second.size();
}

uint64_t EventBus::handler_failures() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return handler_failures_;
}

Subscription::Subscription(Subscription&& other) noexcept
    : bus_(other.bus_), id_(other.id_) {
    other.bus_ = nullptr;
    other.id_ = 0;
}

Subscription& Subscription::operator=(Subscription&& other) noexcept {
    if (this != &other) {
        reset();
        bus_ = other.bus_;
        id_ = other.id_;
        other.bus_ = nullptr;
        other.id_ = 0;
    }
    return *this;
}

void Subscription::reset() {
    if (bus_) {
        bus_->unsubscribe(id_);
        bus_ = nullptr;
        id_ = 0;
    }
}

} // namespace autoship
