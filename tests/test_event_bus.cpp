#include <gtest/gtest.h>

#include "event_bus.hpp"
#include "event_log.hpp"
#include "events.hpp"

#include <memory>
#include <variant>
#include <vector>

namespace vidtool::tests
{
    TEST(EventBus, deliversByTypeInSubscriptionOrder)
    {
        EventBus bus;
        std::vector<int> calls;
        bus.subscribe<BatchStartEvent>([&calls](const BatchStartEvent& e) { calls.push_back(static_cast<int>(e.total)); });
        bus.subscribe<BatchStartEvent>([&calls](const BatchStartEvent& e) { calls.push_back(-static_cast<int>(e.total)); });
        bus.subscribe<JobStartEvent>([&calls](const JobStartEvent&) { calls.push_back(100); });

        bus.publish(BatchStartEvent{ 3 });
        EXPECT_EQ(calls, (std::vector<int>{ 3, -3 }));

        // no subscriber for this type
        bus.publish(BatchCompleteEvent{});
        EXPECT_EQ(calls.size(), 2u);
    }

    TEST(EventBus, unsubscribe)
    {
        EventBus bus;
        int calls{};
        const SubscriptionId first{ bus.subscribe<BatchStartEvent>([&calls](const BatchStartEvent&) { ++calls; }) };
        const SubscriptionId second{ bus.subscribe<BatchStartEvent>([&calls](const BatchStartEvent&) { calls += 10; }) };
        EXPECT_NE(first, second);
        EXPECT_EQ(bus.subscriber_count<BatchStartEvent>(), 2u);

        EXPECT_TRUE(bus.unsubscribe(first));
        EXPECT_FALSE(bus.unsubscribe(first));
        EXPECT_EQ(bus.subscriber_count<BatchStartEvent>(), 1u);

        bus.publish(BatchStartEvent{ 1 });
        EXPECT_EQ(calls, 10);
    }

    TEST(EventLog, recordsAttachedBus)
    {
        EventBus bus;
        EventLog log;
        log.attach(bus);

        bus.publish(BatchStartEvent{ 2 });
        bus.publish(JobStartEvent{ 0, "/in/a.mkv", "/out/a.mkv", "ffmpeg -i /in/a.mkv" });
        bus.publish(JobProgressEvent{ 0, 50.0, std::chrono::milliseconds{ 1000 } });

        ASSERT_EQ(log.size(), 3u);
        const auto events{ log.snapshot() };
        EXPECT_TRUE(std::holds_alternative<BatchStartEvent>(events[0]));
        EXPECT_TRUE(std::holds_alternative<JobStartEvent>(events[1]));
        EXPECT_TRUE(std::holds_alternative<JobProgressEvent>(events[2]));

        const auto tail{ log.since(2) };
        ASSERT_EQ(tail.size(), 1u);
        EXPECT_DOUBLE_EQ(std::get<JobProgressEvent>(tail[0]).percent, 50.0);
        EXPECT_TRUE(log.since(3).empty());
        EXPECT_TRUE(log.since(42).empty());
    }

    TEST(EventLog, detachesOnDestruction)
    {
        EventBus bus;
        {
            auto log{ std::make_unique<EventLog>() };
            log->attach(bus);
            EXPECT_EQ(bus.subscriber_count<JobCompleteEvent>(), 1u);

            log->detach();
            bus.publish(BatchStartEvent{ 1 });
            EXPECT_EQ(log->size(), 0u);

            log->attach(bus);
        }
        EXPECT_EQ(bus.subscriber_count<JobCompleteEvent>(), 0u);
        EXPECT_EQ(bus.subscriber_count<SelectionWarningEvent>(), 0u);

        // publishing after the log is gone must not touch it
        bus.publish(BatchStartEvent{ 1 });
    }
} // namespace vidtool::tests
