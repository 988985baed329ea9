/**
 * @file event_bus.hpp
 * @brief Synchronous publish/subscribe between the upload pipeline and its observers
 *
 * The controller and the chunk uploader only emit; what happens with an
 * event is decided by whoever subscribed (LoggerComponent prints progress,
 * MetricsComponent counts, tests record).
 *
 * EXAMPLE:
 * EventBus bus;
 * auto id = bus.subscribe<ChunkAcceptedEvent>([](const ChunkAcceptedEvent& e) { ... });
 * bus.emit(ChunkAcceptedEvent{0, 99, 300, 100, false});
 * bus.unsubscribe<ChunkAcceptedEvent>(id);
 */

#pragma once

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cstddef>
#include <exception>
#include <functional>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <typeindex>
#include <unordered_map>
#include <utility>
#include <vector>

namespace chunkup::events {

using SubscriptionId = std::size_t;

/**
 * @brief Routes each event to the handlers registered for its exact type
 *
 * THREAD SAFETY:
 * - subscribe/unsubscribe/emit may be called from any thread
 * - Handlers run synchronously on the emitting thread, outside the lock,
 *   so a handler may itself subscribe or emit
 */
class EventBus {
public:
    EventBus() = default;

    EventBus(const EventBus&) = delete;
    EventBus& operator=(const EventBus&) = delete;

    template<typename EventType>
    SubscriptionId subscribe(std::function<void(const EventType&)> handler) {
        auto erased = std::make_shared<const ErasedHandler>(
            [fn = std::move(handler)](const void* event) {
                fn(*static_cast<const EventType*>(event));
            });

        std::unique_lock lock(mutex_);
        const SubscriptionId id = ++last_id_;
        routes_[key<EventType>()].push_back(Subscription{id, std::move(erased)});
        return id;
    }

    /// Unknown ids are ignored.
    template<typename EventType>
    void unsubscribe(SubscriptionId id) {
        std::unique_lock lock(mutex_);
        auto route = routes_.find(key<EventType>());
        if (route == routes_.end()) {
            return;
        }
        auto& subs = route->second;
        subs.erase(std::remove_if(subs.begin(), subs.end(),
                                  [id](const Subscription& s) { return s.id == id; }),
                   subs.end());
    }

    /**
     * @brief Deliver `event` to every current subscriber, in subscription order
     *
     * An observer that throws is logged and skipped; it never aborts the
     * upload that emitted the event.
     */
    template<typename EventType>
    void emit(const EventType& event) const {
        const auto targets = snapshot(key<EventType>());
        for (const auto& handler : targets) {
            try {
                (*handler)(&event);
            } catch (const std::exception& e) {
                spdlog::error("Observer of {} threw: {}", typeid(EventType).name(), e.what());
            }
        }
    }

    template<typename EventType>
    std::size_t subscriber_count() const {
        std::shared_lock lock(mutex_);
        auto route = routes_.find(key<EventType>());
        return route == routes_.end() ? 0 : route->second.size();
    }

    void clear() {
        std::unique_lock lock(mutex_);
        routes_.clear();
    }

private:
    using ErasedHandler = std::function<void(const void*)>;

    struct Subscription {
        SubscriptionId id;
        std::shared_ptr<const ErasedHandler> handler;
    };

    template<typename EventType>
    static std::type_index key() {
        return std::type_index(typeid(EventType));
    }

    std::vector<std::shared_ptr<const ErasedHandler>> snapshot(std::type_index type) const {
        std::vector<std::shared_ptr<const ErasedHandler>> out;
        std::shared_lock lock(mutex_);
        auto route = routes_.find(type);
        if (route != routes_.end()) {
            out.reserve(route->second.size());
            for (const auto& sub : route->second) {
                out.push_back(sub.handler);
            }
        }
        return out;
    }

    std::unordered_map<std::type_index, std::vector<Subscription>> routes_;
    mutable std::shared_mutex mutex_;
    SubscriptionId last_id_ = 0;
};

} // namespace chunkup::events
