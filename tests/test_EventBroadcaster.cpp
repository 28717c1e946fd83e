#include <gtest/gtest.h>
#include "EventBroadcaster.hpp"
#include "TestRecords.hpp"

namespace hubscope {
namespace testing {

namespace {

TopologyEvent addedEvent(const std::string& address) {
    TopologyEvent event;
    event.kind = EventKind::DeviceAdded;
    event.address = address;
    event.timestamp = std::chrono::system_clock::now();
    return event;
}

std::vector<std::string> addressesOf(const std::vector<TopologyEvent>& events) {
    std::vector<std::string> addresses;
    for (const auto& event : events) {
        if (event.kind == EventKind::DeviceAdded) {
            addresses.push_back(event.address);
        }
    }
    return addresses;
}

} // namespace

class EventBroadcasterTest : public QtTest {
protected:
    void SetUp() override {
        QtTest::SetUp();
        snapshot = std::make_shared<const TopologySnapshot>(
            buildSnapshot({makeRootHub("usb1"), makeRecord("1-1")}));
        broadcaster = std::make_unique<EventBroadcaster>(4);
        broadcaster->setSnapshotProvider([this]() { return snapshot; });
    }

    void TearDown() override {
        broadcaster.reset();
        QtTest::TearDown();
    }

    SnapshotPtr snapshot;
    std::unique_ptr<EventBroadcaster> broadcaster;
};

TEST_F(EventBroadcasterTest, SubscriptionStartsWithFullTree) {
    SubscriptionHandle subscription = broadcaster->subscribe();

    auto events = subscription->drain();
    ASSERT_EQ(events.size(), 1u);
    EXPECT_EQ(events[0].kind, EventKind::FullTree);
    EXPECT_EQ(events[0].snapshot, snapshot);
}

TEST_F(EventBroadcasterTest, EventsArriveInPublishOrder) {
    SubscriptionHandle subscription = broadcaster->subscribe();
    subscription->drain();

    broadcaster->publish(addedEvent("1-1"));
    broadcaster->publish(addedEvent("1-2"));

    auto events = subscription->drain();
    ASSERT_EQ(events.size(), 2u);
    EXPECT_EQ(events[0].address, "1-1");
    EXPECT_EQ(events[1].address, "1-2");
}

TEST_F(EventBroadcasterTest, OverflowDropsOldestAndMarksResync) {
    SubscriptionHandle slow = broadcaster->subscribe();
    SubscriptionHandle fast = broadcaster->subscribe();
    fast->drain();

    for (int i = 1; i <= 6; ++i) {
        broadcaster->publish(addedEvent("1-" + std::to_string(i)));
        fast->drain();
    }

    EXPECT_EQ(slow->droppedCount(), 3u);
    EXPECT_EQ(fast->droppedCount(), 0u);

    auto events = slow->drain();
    ASSERT_EQ(events.size(), 5u);
    EXPECT_EQ(events[0].kind, EventKind::Resync);
    EXPECT_EQ(events[1].address, "1-3");
    EXPECT_EQ(events[4].address, "1-6");

    // The marker is delivered once
    broadcaster->publish(addedEvent("1-7"));
    events = slow->drain();
    ASSERT_EQ(events.size(), 1u);
    EXPECT_EQ(events[0].kind, EventKind::DeviceAdded);
}

TEST_F(EventBroadcasterTest, SubscribersSeeTheSameOrder) {
    SubscriptionHandle first = broadcaster->subscribe();
    SubscriptionHandle second = broadcaster->subscribe();
    first->drain();
    second->drain();

    std::vector<std::string> firstSeen;
    for (int i = 1; i <= 3; ++i) {
        broadcaster->publish(addedEvent("1-" + std::to_string(i)));
        auto events = addressesOf(first->drain());
        firstSeen.insert(firstSeen.end(), events.begin(), events.end());
    }

    EXPECT_EQ(firstSeen, (std::vector<std::string>{"1-1", "1-2", "1-3"}));
    EXPECT_EQ(addressesOf(second->drain()), firstSeen);
}

TEST_F(EventBroadcasterTest, SlowSubscriberKeepsRelativeOrder) {
    SubscriptionHandle slow = broadcaster->subscribe();
    SubscriptionHandle fast = broadcaster->subscribe();
    slow->drain();
    fast->drain();

    std::vector<std::string> fastSeen;
    for (int i = 1; i <= 9; ++i) {
        broadcaster->publish(addedEvent("1-" + std::to_string(i)));
        auto events = addressesOf(fast->drain());
        fastSeen.insert(fastSeen.end(), events.begin(), events.end());
    }
    ASSERT_EQ(fastSeen.size(), 9u);

    // After the drops the slow viewer holds the newest events, in the fast viewer's order
    std::vector<std::string> slowSeen = addressesOf(slow->drain());
    ASSERT_FALSE(slowSeen.empty());
    std::vector<std::string> tail(fastSeen.end() - static_cast<std::ptrdiff_t>(slowSeen.size()),
                                  fastSeen.end());
    EXPECT_EQ(slowSeen, tail);
}

TEST_F(EventBroadcasterTest, DrainHonoursBatchLimit) {
    SubscriptionHandle subscription = broadcaster->subscribe();
    broadcaster->publish(addedEvent("1-1"));
    broadcaster->publish(addedEvent("1-2"));

    EXPECT_EQ(subscription->drain(2).size(), 2u);
    EXPECT_EQ(subscription->pending(), 1u);
}

TEST_F(EventBroadcasterTest, UnsubscribedViewerStopsReceiving) {
    SubscriptionHandle subscription = broadcaster->subscribe();
    subscription->drain();
    broadcaster->unsubscribe(subscription);

    broadcaster->publish(addedEvent("1-1"));
    EXPECT_EQ(subscription->pending(), 0u);
    EXPECT_EQ(broadcaster->subscriberCount(), 0u);
}

TEST_F(EventBroadcasterTest, SignalsWhenEventsAreQueued) {
    std::vector<quint64> notified;
    QObject::connect(broadcaster.get(), &EventBroadcaster::eventsAvailable,
                     [&notified](quint64 id) { notified.push_back(id); });

    SubscriptionHandle subscription = broadcaster->subscribe();
    broadcaster->publish(addedEvent("1-1"));

    EXPECT_EQ(notified, (std::vector<quint64>{subscription->id(), subscription->id()}));
}

} // namespace testing
} // namespace hubscope
