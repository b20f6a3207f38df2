#pragma once
#include "event.hpp"
#include <string>
#include <vector>
#include <functional>
#include <map>
#include <mutex>
#include <cstdint>

namespace npcmem {

using EventHandler = std::function<void(const Event&)>;

// Synchronous pub/sub for memory mutation and retrieval events.
// The store and retriever publish; audit trails, logging and tests subscribe.
class EventBus {
public:
    // Subscribe to events with a given tag. Returns a subscription ID.
    uint64_t subscribe(const std::string& tag, EventHandler handler);

    // Subscribe to every event regardless of tag (audit/log sinks).
    uint64_t subscribe_all(EventHandler handler);

    // Unsubscribe by ID. Returns true if found and removed.
    bool unsubscribe(uint64_t id);

    // Publish an event synchronously. Tag handlers run in registration order,
    // then wildcard handlers. The mutex is released before calling handlers.
    void publish(const Event& event);

    // True when publishing `tag` would reach at least one handler.
    bool has_subscribers(const std::string& tag) const;

    // Remove all subscriptions.
    void clear();

    // Number of subscriptions for a given tag (0 if none), wildcards excluded.
    size_t subscriber_count(const std::string& tag) const;

private:
    struct Subscription {
        uint64_t id;
        EventHandler handler;
    };

    mutable std::mutex mutex_;
    std::map<std::string, std::vector<Subscription>> handlers_;
    std::vector<Subscription> wildcard_;
    uint64_t next_id_ = 1;
};

// Type-safe subscribe helper: auto-casts Event& to the concrete type.
template<typename E>
uint64_t subscribe(EventBus& bus, std::function<void(const E&)> handler) {
    return bus.subscribe(E::TAG, [h = std::move(handler)](const Event& e) {
        h(static_cast<const E&>(e));
    });
}

} // namespace npcmem
