/**
 * @file event_bus.hpp
 * @brief Type-safe event bus carrying the engine's outbound messages
 *
 * The transfer engine never talks to the orchestration service directly.
 * It emits typed events here; whoever hosts the engine (the JSON bridge,
 * a test double, a GUI shell) subscribes and forwards them.
 *
 * EXAMPLE:
 * EventBus bus;
 * auto id = bus.subscribe<BlockCompleted>([](const BlockCompleted& e) { ... });
 * bus.emit(BlockCompleted{...});
 * bus.unsubscribe<BlockCompleted>(id);
 */

#pragma once

#include <spdlog/spdlog.h>

#include <cstddef>
#include <exception>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <typeindex>
#include <unordered_map>

namespace cirrus::events {

using SubscriptionId = std::size_t;

/**
 * @brief Type-safe publish/subscribe bus
 *
 * THREAD SAFETY:
 * - emit() may be called from any thread, concurrently with subscribe()
 * - Handlers run synchronously on the emitting thread, in subscription order
 * - Dispatch works on a snapshot of the channel, so a handler may emit,
 *   subscribe or unsubscribe without deadlocking
 */
class EventBus {
public:
    EventBus() = default;

    EventBus(const EventBus&) = delete;
    EventBus& operator=(const EventBus&) = delete;

    template<typename EventType>
    SubscriptionId subscribe(std::function<void(const EventType&)> handler) {
        // Erase the event type; a channel only ever sees its own type
        auto erased = std::make_shared<const Handler>(
            [fn = std::move(handler)](const void* event) {
                fn(*static_cast<const EventType*>(event));
            });

        std::unique_lock lock(mutex_);
        const SubscriptionId id = ++last_id_;
        channels_[key<EventType>()].emplace(id, std::move(erased));
        return id;
    }

    template<typename EventType>
    void unsubscribe(SubscriptionId id) {
        std::unique_lock lock(mutex_);
        auto it = channels_.find(key<EventType>());
        if (it == channels_.end()) {
            return;
        }
        it->second.erase(id);
        if (it->second.empty()) {
            channels_.erase(it);
        }
    }

    /**
     * @brief Deliver event to every subscriber of its type
     *
     * A throwing handler is logged and skipped; the exception never
     * reaches the emitter.
     */
    template<typename EventType>
    void emit(const EventType& event) const {
        Channel snapshot;
        {
            std::shared_lock lock(mutex_);
            auto it = channels_.find(key<EventType>());
            if (it == channels_.end()) {
                return;
            }
            snapshot = it->second;
        }

        for (const auto& [id, handler] : snapshot) {
            try {
                (*handler)(&event);
            } catch (const std::exception& e) {
                spdlog::error("[EventBus] subscriber {} for {} threw: {}", id, typeid(EventType).name(), e.what());
            }
        }
    }

    template<typename EventType>
    std::size_t subscriber_count() const {
        std::shared_lock lock(mutex_);
        auto it = channels_.find(key<EventType>());
        return it == channels_.end() ? 0 : it->second.size();
    }

    void clear() {
        std::unique_lock lock(mutex_);
        channels_.clear();
    }

private:
    using Handler = std::function<void(const void*)>;
    using Channel = std::map<SubscriptionId, std::shared_ptr<const Handler>>;

    template<typename EventType>
    static std::type_index key() {
        return std::type_index(typeid(EventType));
    }

    std::unordered_map<std::type_index, Channel> channels_;
    mutable std::shared_mutex mutex_;
    SubscriptionId last_id_ = 0;
};

} // namespace cirrus::events
