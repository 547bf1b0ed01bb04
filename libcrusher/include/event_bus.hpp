/**
 * @file event_bus.hpp
 * @brief Defines a simple, thread-safe publish/subscribe event bus.
 */

#ifndef CRUSHER_EVENT_BUS_HPP
#define CRUSHER_EVENT_BUS_HPP

#include <functional>
#include <mutex>
#include <typeindex>
#include <unordered_map>
#include <vector>

namespace crusher {

    /**
     * @brief Type-safe publish/subscribe event bus.
     *
     * @details The worker pool publishes events from whichever thread observes
     * them (the caller of send() or kill(), or a reply reader). Handlers are
     * called on that thread.
     *
     * Handlers run with the bus locked: they must not subscribe, and must not
     * publish on the same bus.
     */
    class EventBus {
    public:
        EventBus() = default;

        /**
         * @brief Subscribe a handler to a specific event type.
         * @tparam Event The event struct type (e.g., TaskDispatchedEvent).
         * @param handler Function invoked with each published event of this type.
         */
        template <typename Event>
        void subscribe(std::function<void(const Event&)> handler) {
            std::lock_guard lock(mtx_);
            auto& vec = subscribers_[std::type_index(typeid(Event))];
            vec.push_back([handler = std::move(handler)](const void* e) {
                handler(*static_cast<const Event*>(e));
            });
        }

        /**
         * @brief Publish an event to all subscribers of its type.
         */
        template <typename Event>
        void publish(const Event& event) {
            std::lock_guard lock(mtx_);
            const auto it = subscribers_.find(std::type_index(typeid(Event)));
            if (it != subscribers_.end()) {
                for (const auto& fn : it->second) {
                    fn(&event);
                }
            }
        }

        /// Remove every subscription.
        void clear() {
            std::lock_guard lock(mtx_);
            subscribers_.clear();
        }

    private:
        using Callback = std::function<void(const void*)>;
        std::unordered_map<std::type_index, std::vector<Callback>> subscribers_;
        std::mutex mtx_;
    };

} // namespace crusher

#endif // CRUSHER_EVENT_BUS_HPP
