/**
 * @file event_bus.hpp
 * @brief Type-indexed publish/subscribe hub
 *
 * WHY THIS FILE EXISTS:
 * The scheduler, run coordinator and transfer executor report what they do
 * without knowing who listens. Logging, run statistics and notification
 * delivery subscribe here instead of being wired into the core classes.
 *
 * EXAMPLE:
 * EventBus bus;
 * bus.subscribe<JobFinishedEvent>([](const JobFinishedEvent& e) { ... });
 * bus.emit(JobFinishedEvent{job, result});
 */

#pragma once

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cstddef>
#include <exception>
#include <functional>
#include <memory>
#include <shared_mutex>
#include <typeindex>
#include <unordered_map>
#include <utility>
#include <vector>

namespace tsync::events {

/**
 * @brief Synchronous, thread-safe event bus
 *
 * THREAD SAFETY:
 * - emit() may be called from any worker thread concurrently
 * - Handlers run on the emitting thread, outside the registry lock, so a
 *   handler may subscribe or emit without deadlocking
 * - A throwing handler is logged and the remaining handlers still run
 */
class EventBus {
public:
    using HandlerId = std::size_t;

    EventBus() = default;

    EventBus(const EventBus&) = delete;
    EventBus& operator=(const EventBus&) = delete;

    template<typename EventType>
    HandlerId subscribe(std::function<void(const EventType&)> handler) {
        std::unique_lock lock(mutex_);
        const HandlerId id = next_handler_id_++;
        handlers_[std::type_index(typeid(EventType))].emplace_back(
            id, std::make_shared<HandlerImpl<EventType>>(std::move(handler)));
        return id;
    }

    template<typename EventType>
    void unsubscribe(HandlerId id) {
        std::unique_lock lock(mutex_);
        auto it = handlers_.find(std::type_index(typeid(EventType)));
        if (it == handlers_.end()) {
            return;
        }
        auto& list = it->second;
        list.erase(std::remove_if(list.begin(), list.end(),
                                  [id](const auto& entry) { return entry.first == id; }),
                   list.end());
    }

    template<typename EventType>
    void emit(const EventType& event) const {
        std::vector<std::shared_ptr<HandlerBase>> snapshot;
        {
            std::shared_lock lock(mutex_);
            auto it = handlers_.find(std::type_index(typeid(EventType)));
            if (it == handlers_.end()) {
                return;
            }
            for (const auto& [id, handler] : it->second) {
                snapshot.push_back(handler);
            }
        }

        for (const auto& handler : snapshot) {
            try {
                handler->call(&event);
            } catch (const std::exception& e) {
                spdlog::error("Event handler for {} threw: {}", typeid(EventType).name(), e.what());
            }
        }
    }

    template<typename EventType>
    std::size_t subscriber_count() const {
        std::shared_lock lock(mutex_);
        auto it = handlers_.find(std::type_index(typeid(EventType)));
        return it != handlers_.end() ? it->second.size() : 0;
    }

    void clear() {
        std::unique_lock lock(mutex_);
        handlers_.clear();
    }

private:
    struct HandlerBase {
        virtual ~HandlerBase() = default;
        virtual void call(const void* event) = 0;
    };

    template<typename EventType>
    struct HandlerImpl : HandlerBase {
        std::function<void(const EventType&)> func;

        explicit HandlerImpl(std::function<void(const EventType&)> f) : func(std::move(f)) {}

        void call(const void* event) override {
            func(*static_cast<const EventType*>(event));
        }
    };

    std::unordered_map<std::type_index,
                       std::vector<std::pair<HandlerId, std::shared_ptr<HandlerBase>>>> handlers_;
    mutable std::shared_mutex mutex_;
    HandlerId next_handler_id_ = 0;
};

/// Emit through an optional bus; core classes accept a null bus.
template<typename EventType>
void publish(const EventBus* bus, const EventType& event) {
    if (bus != nullptr) {
        bus->emit(event);
    }
}

} // namespace tsync::events
