/**
 * @file event_bus.hpp
 * @brief Typed publish/subscribe channel for reassembly observers
 *
 * Transfers publish chunk-state and progress events here; the UI layer,
 * loggers and metrics subscribe without the engine knowing about them.
 *
 * EXAMPLE:
 * EventBus bus;
 * auto id = bus.subscribe<ChunkStateChangedEvent>([](const auto& e) { ... });
 * bus.emit(ChunkStateChangedEvent{"t1", 0, ChunkState::Requested});
 * bus.unsubscribe<ChunkStateChangedEvent>(id);
 */

#pragma once

#include <spdlog/spdlog.h>

#include <algorithm>
#include <exception>
#include <functional>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <typeindex>
#include <unordered_map>
#include <utility>
#include <vector>

namespace reasm::events {

/**
 * @brief Type-indexed observer lists
 *
 * DELIVERY:
 * - Synchronous, in the emitting thread
 * - Handlers of one event type run in registration order
 * - Exactly one call per handler per emit()
 *
 * A handler that throws is logged and skipped; the rest still run.
 * Subscribing or unsubscribing from inside a handler is allowed and takes
 * effect from the next emit().
 */
class EventBus {
public:
    using HandlerId = std::size_t;

    EventBus() = default;
    ~EventBus() = default;

    EventBus(const EventBus&) = delete;
    EventBus& operator=(const EventBus&) = delete;

    template<typename EventType>
    HandlerId subscribe(std::function<void(const EventType&)> handler) {
        std::unique_lock lock(mutex_);

        auto wrapper = std::make_shared<HandlerImpl<EventType>>(std::move(handler));
        const HandlerId handler_id = next_handler_id_++;
        handlers_[std::type_index(typeid(EventType))].emplace_back(handler_id, std::move(wrapper));
        return handler_id;
    }

    template<typename EventType>
    void unsubscribe(HandlerId handler_id) {
        std::unique_lock lock(mutex_);

        auto it = handlers_.find(std::type_index(typeid(EventType)));
        if (it == handlers_.end()) {
            return;
        }
        auto& handler_list = it->second;
        handler_list.erase(
            std::remove_if(handler_list.begin(), handler_list.end(),
                [handler_id](const auto& entry) { return entry.first == handler_id; }),
            handler_list.end());
    }

    template<typename EventType>
    void emit(const EventType& event) {
        // Copy so handlers may (un)subscribe without deadlocking
        std::vector<std::shared_ptr<HandlerBase>> snapshot;
        {
            std::shared_lock lock(mutex_);
            auto it = handlers_.find(std::type_index(typeid(EventType)));
            if (it == handlers_.end()) {
                return;
            }
            snapshot.reserve(it->second.size());
            for (const auto& [id, handler] : it->second) {
                snapshot.push_back(handler);
            }
        }

        for (auto& handler : snapshot) {
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

        explicit HandlerImpl(std::function<void(const EventType&)> f)
            : func(std::move(f)) {}

        void call(const void* event) override {
            func(*static_cast<const EventType*>(event));
        }
    };

    std::unordered_map<
        std::type_index,
        std::vector<std::pair<HandlerId, std::shared_ptr<HandlerBase>>>
    > handlers_;

    mutable std::shared_mutex mutex_;
    HandlerId next_handler_id_ = 0;
};

} // namespace reasm::events
