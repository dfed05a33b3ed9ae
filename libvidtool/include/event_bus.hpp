/**
 * @file event_bus.hpp
 * @brief Thread-safe publish/subscribe bus for batch events.
 */

#ifndef VIDTOOL_EVENT_BUS_HPP
#define VIDTOOL_EVENT_BUS_HPP

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <mutex>
#include <typeindex>
#include <unordered_map>
#include <vector>

namespace vidtool {

    /// Handle returned by EventBus::subscribe, used to detach the handler later.
    using SubscriptionId = std::uint64_t;

    /**
     * @brief Type-keyed publish/subscribe bus.
     *
     * @details Producers (Selector, JobOrchestrator) broadcast events without
     * knowing who is listening. Consumers (CLI progress bar, report
     * collector, EventLog) subscribe to the event types they need and may
     * unsubscribe again, e.g. when they are destroyed before the bus.
     *
     * Publication holds the bus mutex while handlers run, so handlers of
     * one bus never run concurrently. A handler must not publish on, or
     * (un)subscribe to, the same bus.
     */
    class EventBus {
    public:
        EventBus() = default;
        EventBus(const EventBus&) = delete;
        EventBus& operator=(const EventBus&) = delete;

        /**
         * @brief Register @p handler for events of type @p Event.
         * @return Id to pass to unsubscribe().
         */
        template <typename Event>
        SubscriptionId subscribe(std::function<void(const Event&)> handler) {
            std::lock_guard lock(mtx_);
            const SubscriptionId id = ++last_id_;
            handlers_[std::type_index(typeid(Event))].push_back(
                {id, [handler = std::move(handler)](const void* e) { handler(*static_cast<const Event*>(e)); }});
            return id;
        }

        /**
         * @brief Remove a handler registered by subscribe().
         * @return false when @p id is unknown or already removed.
         */
        bool unsubscribe(const SubscriptionId id) {
            std::lock_guard lock(mtx_);
            for (auto& [type, entries] : handlers_) {
                const auto it = std::ranges::find(entries, id, &Entry::id);
                if (it != entries.end()) {
                    entries.erase(it);
                    return true;
                }
            }
            return false;
        }

        /**
         * @brief Deliver @p event to every handler of its type, in subscription order.
         */
        template <typename Event>
        void publish(const Event& event) {
            std::lock_guard lock(mtx_);
            const auto it = handlers_.find(std::type_index(typeid(Event)));
            if (it == handlers_.end()) return;
            for (const auto& entry : it->second) {
                entry.fn(&event);
            }
        }

        /// @return Number of handlers currently registered for @p Event.
        template <typename Event>
        [[nodiscard]] std::size_t subscriber_count() const {
            std::lock_guard lock(mtx_);
            const auto it = handlers_.find(std::type_index(typeid(Event)));
            return it == handlers_.end() ? 0 : it->second.size();
        }

    private:
        struct Entry {
            SubscriptionId id;
            std::function<void(const void*)> fn;
        };

        std::unordered_map<std::type_index, std::vector<Entry>> handlers_;
        SubscriptionId last_id_{0};
        mutable std::mutex mtx_;
    };

} // namespace vidtool

#endif // VIDTOOL_EVENT_BUS_HPP
