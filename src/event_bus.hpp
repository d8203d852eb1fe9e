#pragma once
#include "event.hpp"
#include <string>
#include <vector>
#include <functional>
#include <unordered_map>
#include <mutex>
#include <cstdint>

namespace autoship {

using EventHandler = std::function<void(const Event&)>;

// Synchronous fan-out of run progress. The agent publishes; reporters listen.
class EventBus {
public:
    // Returns an id for unsubscribe(). Handlers for one tag run in
    // subscription order on the publishing thread.
    uint64_t subscribe(const std::string& tag, EventHandler handler);

    bool unsubscribe(uint64_t id);

    // Handlers are snapshotted first, so a handler may unsubscribe itself.
    // A handler that throws is logged and skipped; the rest still run.
    void publish(const Event& event);

    size_t subscriber_count(const std::string& tag) const;

    // Number of handler exceptions swallowed by publish().
    uint64_t handler_failures() const;

private:
    struct Entry {
        uint64_t id;
        EventHandler handler;
    };

    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::vector<Entry>> handlers_;
    uint64_t next_id_ = 1;
    uint64_t handler_failures_ = 0;
};

// Move-only handle that unsubscribes when it goes out of scope.
class Subscription {
public:
    Subscription() = default;
    Subscription(EventBus& bus, uint64_t id) : bus_(&bus), id_(id) {}
    ~Subscription() { reset(); }

    Subscription(Subscription&& other) noexcept;
    Subscription& operator=(Subscription&& other) noexcept;
    Subscription(const Subscription&) = delete;
    Subscription& operator=(const Subscription&) = delete;

    void reset();
    bool active() const { return bus_ != nullptr; }
    uint64_t id() const { return id_; }

private:
    EventBus* bus_ = nullptr;
    uint64_t id_ = 0;
};

// Subscribes to E::TAG and hands the handler the concrete event type.
template<typename E>
uint64_t subscribe(EventBus& bus, std::function<void(const E&)> handler) {
    return bus.subscribe(E::TAG, [h = std::move(handler)](const Event& e) {
        h(static_cast<const E&>(e));
    });
}

template<typename E>
Subscription scoped_subscribe(EventBus& bus, std::function<void(const E&)> handler) {
    return Subscription(bus, subscribe<E>(bus, std::move(handler)));
}

} // namespace autoship
