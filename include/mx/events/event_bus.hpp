/**
 * @file event_bus.hpp
 * @brief Type-safe event bus connecting the upload pipeline to its observers
 *
 * WHY THIS FILE EXISTS:
 * Upload workers publish what happens to each file without knowing who
 * renders it. The reporter, logger and statistics components subscribe
 * without knowing which worker produced an event.
 *
 * EXAMPLE:
 * EventBus bus;
 * bus.subscribe<UploadSucceededEvent>([](const UploadSucceededEvent& e) { ... });
 * bus.emit(UploadSucceededEvent{...});
 */

#pragma once

#include <spdlog/spdlog.h>

#include <algorithm>
#include <functional>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <typeindex>
#include <unordered_map>
#include <vector>

namespace mx::events {

/**
 * @brief Type-safe event bus
 *
 * THREAD SAFETY:
 * - Multiple threads can emit events concurrently
 * - Multiple threads can subscribe concurrently
 * - Handlers are called synchronously in the emitting thread, so a handler
 *   fed by several upload workers must guard its own state
 */
class EventBus {
public:
    EventBus() = default;
    ~EventBus() = default;

    EventBus(const EventBus&) = delete;
    EventBus& operator=(const EventBus&) = delete;

    /**
     * @brief Subscribe to events of a specific type
     *
     * RETURNS:
     * Subscription ID for unsubscribe()
     */
    template<typename EventType>
    size_t subscribe(std::function<void(const EventType&)> handler) {
        std::unique_lock lock(mutex_);

        auto type_id = std::type_index(typeid(EventType));
        auto wrapper = std::make_shared<HandlerImpl<EventType>>(std::move(handler));
        size_t handler_id = next_handler_id_++;

        handlers_[type_id].push_back({handler_id, wrapper});

        return handler_id;
    }

    template<typename EventType>
    void unsubscribe(size_t handler_id) {
        std::unique_lock lock(mutex_);

        auto type_id = std::type_index(typeid(EventType));
        auto it = handlers_.find(type_id);

        if (it != handlers_.end()) {
            auto& handler_list = it->second;
            handler_list.erase(
                std::remove_if(handler_list.begin(), handler_list.end(),
                    [handler_id](const auto& pair) {
                        return pair.first == handler_id;
                    }),
                handler_list.end()
            );
        }
    }

    /**
     * @brief Emit an event to all subscribers
     *
     * EXCEPTION SAFETY:
     * A handler that throws is logged; the remaining handlers still run and
     * the emitting upload worker is unaffected.
     */
    template<typename EventType>
    void emit(const EventType& event) {
        // Copy so a handler may subscribe/unsubscribe without deadlocking
        std::vector<std::shared_ptr<HandlerBase>> handlers_copy;
        {
            std::shared_lock lock(mutex_);
            auto it = handlers_.find(std::type_index(typeid(EventType)));

            if (it == handlers_.end()) {
                return;
            }

            for (const auto& [id, handler] : it->second) {
                handlers_copy.push_back(handler);
            }
        }

        for (auto& handler : handlers_copy) {
            try {
                handler->call(&event);
            } catch (const std::exception& e) {
                spdlog::error("Event handler for {} threw: {}", typeid(EventType).name(), e.what());
            }
        }
    }

    template<typename EventType>
    size_t subscriber_count() const {
        std::shared_lock lock(mutex_);
        auto it = handlers_.find(std::type_index(typeid(EventType)));
        return it != handlers_.end() ? it->second.size() : 0;
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
            // Only EventType* is ever stored under EventType's type_index
            func(*static_cast<const EventType*>(event));
        }
    };

    std::unordered_map<
        std::type_index,
        std::vector<std::pair<size_t, std::shared_ptr<HandlerBase>>>
    > handlers_;

    mutable std::shared_mutex mutex_;
    size_t next_handler_id_ = 0;
};

} // namespace mx::events
