/**
 * @file event_log.hpp
 * @brief Append-only, snapshot-readable record of batch events.
 */

#ifndef VIDTOOL_EVENT_LOG_HPP
#define VIDTOOL_EVENT_LOG_HPP

#include "event_bus.hpp"
#include "events.hpp"
#include <cstddef>
#include <mutex>
#include <variant>
#include <vector>

namespace vidtool {

using BatchEvent = std::variant<SelectionWarningEvent,
                                BatchStartEvent,
                                JobStartEvent,
                                JobProgressEvent,
                                JobCompleteEvent,
                                BatchProgressEvent,
                                BatchCompleteEvent>;

/**
 * @brief Ordered event sequence that any thread may read while a batch runs.
 *
 * @details Entries are only ever appended. Readers copy a prefix with
 * snapshot() or since(), so they never see a half-updated entry and never
 * touch state owned by the orchestrator.
 */
class EventLog {
public:
    EventLog() = default;
    EventLog(const EventLog&) = delete;
    EventLog& operator=(const EventLog&) = delete;

    /**
     * @brief Subscribe this log to every batch event type on @p bus.
     *
     * The log must be detached before it is destroyed if the bus outlives it.
     */
    void attach(EventBus& bus) {
        detach();
        bus_ = &bus;
        subscriptions_ = {
            bus.subscribe<SelectionWarningEvent>([this](const SelectionWarningEvent& e) { append(e); }),
            bus.subscribe<BatchStartEvent>([this](const BatchStartEvent& e) { append(e); }),
            bus.subscribe<JobStartEvent>([this](const JobStartEvent& e) { append(e); }),
            bus.subscribe<JobProgressEvent>([this](const JobProgressEvent& e) { append(e); }),
            bus.subscribe<JobCompleteEvent>([this](const JobCompleteEvent& e) { append(e); }),
            bus.subscribe<BatchProgressEvent>([this](const BatchProgressEvent& e) { append(e); }),
            bus.subscribe<BatchCompleteEvent>([this](const BatchCompleteEvent& e) { append(e); }),
        };
    }

    /// Stop recording events from the attached bus, if any.
    void detach() {
        if (!bus_) return;
        for (const SubscriptionId id : subscriptions_) bus_->unsubscribe(id);
        subscriptions_.clear();
        bus_ = nullptr;
    }

    ~EventLog() { detach(); }

    void append(BatchEvent event) {
        std::lock_guard lock(mtx_);
        events_.push_back(std::move(event));
    }

    [[nodiscard]] std::vector<BatchEvent> snapshot() const {
        std::lock_guard lock(mtx_);
        return events_;
    }

    /**
     * @brief Copy of the events appended at or after position @p first.
     *
     * Lets a polling reader consume the log incrementally.
     */
    [[nodiscard]] std::vector<BatchEvent> since(const std::size_t first) const {
        std::lock_guard lock(mtx_);
        if (first >= events_.size()) return {};
        return {events_.begin() + static_cast<std::ptrdiff_t>(first), events_.end()};
    }

    [[nodiscard]] std::size_t size() const {
        std::lock_guard lock(mtx_);
        return events_.size();
    }

private:
    mutable std::mutex mtx_;
    std::vector<BatchEvent> events_;
    EventBus* bus_{nullptr};
    std::vector<SubscriptionId> subscriptions_;
};

} // namespace vidtool

#endif // VIDTOOL_EVENT_LOG_HPP
