/**
 * @file event_bus.hpp
 * @brief Type-safe synchronous event bus
 *
 * Split and join report progress by emitting events; the CLI decides what
 * to do with them (log lines, counters) by subscribing components.
 * Operations take an optional EventBus* and stay silent when it is null.
 *
 * EXAMPLE:
 * EventBus bus;
 * bus.subscribe<ChunkWrittenEvent>([](const ChunkWrittenEvent& e) { ... });
 * bus.emit(ChunkWrittenEvent{...});
 */

#pragma once

#include <spdlog/spdlog.h>

#include <algorithm>
#include <exception>
#include <functional>
#include <memory>
#include <typeindex>
#include <unordered_map>
#include <utility>
#include <vector>

namespace textsplit::events {

/**
 * @brief Single-threaded type-safe event bus
 *
 * Handlers run synchronously on the emitting thread, in subscription order.
 * A handler may subscribe or unsubscribe while an event is being delivered;
 * the change takes effect from the next emit().
 */
class EventBus {
public:
    EventBus() = default;

    // Non-copyable (would duplicate handlers)
    EventBus(const EventBus&) = delete;
    EventBus& operator=(const EventBus&) = delete;

    EventBus(EventBus&&) = default;
    EventBus& operator=(EventBus&&) = default;

    /**
     * @brief Subscribe to events of type EventType
     *
     * RETURNS:
     * Subscription ID for unsubscribe()
     */
    template<typename EventType>
    std::size_t subscribe(std::function<void(const EventType&)> handler) {
        auto wrapper = std::make_shared<HandlerImpl<EventType>>(std::move(handler));
        const std::size_t handler_id = next_handler_id_++;
        handlers_[std::type_index(typeid(EventType))].push_back({handler_id, wrapper});
        return handler_id;
    }

    template<typename EventType>
    void unsubscribe(std::size_t handler_id) {
        auto it = handlers_.find(std::type_index(typeid(EventType)));
        if (it == handlers_.end()) {
            return;
        }
        auto& handler_list = it->second;
        handler_list.erase(
            std::remove_if(handler_list.begin(), handler_list.end(),
                [handler_id](const auto& pair) {
                    return pair.first == handler_id;
                }),
            handler_list.end());
    }

    /**
     * @brief Deliver @p event to every subscriber of its type
     *
     * A handler that throws is logged and skipped; remaining handlers
     * still run. Progress reporting never aborts a split or join.
     *
     * RETURNS:
     * Number of handlers invoked
     */
    template<typename EventType>
    std::size_t emit(const EventType& event) {
        auto it = handlers_.find(std::type_index(typeid(EventType)));
        if (it == handlers_.end()) {
            return 0;
        }

        // Copy so handlers may (un)subscribe during delivery
        std::vector<std::shared_ptr<HandlerBase>> snapshot;
        snapshot.reserve(it->second.size());
        for (const auto& [id, handler] : it->second) {
            snapshot.push_back(handler);
        }

        for (auto& handler : snapshot) {
            try {
                handler->call(&event);
            } catch (const std::exception& e) {
                spdlog::error("Event handler for {} threw: {}", typeid(EventType).name(), e.what());
            }
        }
        return snapshot.size();
    }

    template<typename EventType>
    std::size_t subscriber_count() const {
        auto it = handlers_.find(std::type_index(typeid(EventType)));
        return it != handlers_.end() ? it->second.size() : 0;
    }

    void clear() {
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

        explicit HandlerImpl(std::function<void(const EventType&)> f)
            : func(std::move(f)) {}

        void call(const void* event) override {
            // Only EventType handlers are stored under typeid(EventType)
            func(*static_cast<const EventType*>(event));
        }
    };

    std::unordered_map<
        std::type_index,
        std::vector<std::pair<std::size_t, std::shared_ptr<HandlerBase>>>
    > handlers_;

    std::size_t next_handler_id_ = 0;
};

/**
 * @brief Emit through an optional bus
 */
template<typename EventType>
void publish(EventBus* bus, const EventType& event) {
    if (bus != nullptr) {
        bus->emit(event);
    }
}

} // namespace textsplit::events
