#include <gtest/gtest.h>
#include "SnapshotDiffer.hpp"
#include "TestRecords.hpp"
#include <set>

namespace hubscope {
namespace testing {

namespace {

using Clock = std::chrono::system_clock;
using std::chrono::milliseconds;

std::vector<std::string> addressesOf(const std::vector<TopologyEvent>& events, EventKind kind) {
    std::vector<std::string> addresses;
    for (const auto& event : events) {
        if (event.kind == kind) {
            addresses.push_back(event.address);
        }
    }
    return addresses;
}

TopologyEvent removal(const std::string& address) {
    TopologyEvent event;
    event.kind = EventKind::DeviceRemoved;
    event.address = address;
    event.record = makeRecord(address);
    return event;
}

TopologyEvent addition(const std::string& address, std::vector<std::string> errors = {}) {
    TopologyEvent event;
    event.kind = EventKind::DeviceAdded;
    event.address = address;
    event.record = makeRecord(address);
    event.record->errors = std::move(errors);
    return event;
}

std::set<std::string> addressSet(const TopologySnapshot& snapshot) {
    std::set<std::string> addresses;
    for (const auto& [address, record] : snapshot.devices) {
        addresses.insert(address);
    }
    return addresses;
}

// Applies add/remove events to the address set of before
std::set<std::string> replay(const TopologySnapshot& before, const std::vector<TopologyEvent>& events) {
    std::set<std::string> addresses = addressSet(before);
    for (const auto& event : events) {
        if (event.kind == EventKind::DeviceRemoved) {
            EXPECT_EQ(addresses.erase(event.address), 1u) << event.address;
        } else if (event.kind == EventKind::DeviceAdded) {
            EXPECT_TRUE(addresses.insert(event.address).second) << event.address;
        }
    }
    return addresses;
}

} // namespace

TEST(SnapshotDifferTest, InitialDiffAddsParentsFirst) {
    TopologySnapshot current = buildSnapshot({
        makeRootHub("usb1"), makeHub("1-1"), makeRecord("1-1.2"),
    });

    auto events = SnapshotDiffer::diff(nullptr, current, Clock::now());
    EXPECT_EQ(addressesOf(events, EventKind::DeviceAdded),
              (std::vector<std::string>{"usb1", "1-1", "1-1.2"}));
}

TEST(SnapshotDifferTest, RemovedSubtreeIsReportedDeepestFirst) {
    TopologySnapshot before = buildSnapshot({
        makeRootHub("usb1"), makeHub("1-1"), makeHub("1-1.1"),
        makeRecord("1-1.1.3"), makeRecord("1-1.2"), makeRecord("1-2"),
    });
    TopologySnapshot after = buildSnapshot({makeRootHub("usb1"), makeRecord("1-2")});

    auto events = SnapshotDiffer::diff(&before, after, Clock::now());
    EXPECT_EQ(addressesOf(events, EventKind::DeviceRemoved),
              (std::vector<std::string>{"1-1.1.3", "1-1.1", "1-1.2", "1-1"}));
    EXPECT_TRUE(addressesOf(events, EventKind::DeviceAdded).empty());
    ASSERT_TRUE(events.front().record.has_value());
    EXPECT_EQ(events.front().record->address, "1-1.1.3");
}

TEST(SnapshotDifferTest, IdentityChangeIsRemoveThenAdd) {
    TopologySnapshot before = buildSnapshot({
        makeRootHub("usb1"), makeRecord("1-1", DeviceClass::Storage, "0781", "5581", 4),
    });
    TopologySnapshot after = buildSnapshot({
        makeRootHub("usb1"), makeRecord("1-1", DeviceClass::HidMouse, "046d", "c077", 5),
    });

    auto events = SnapshotDiffer::diff(&before, after, Clock::now());
    ASSERT_EQ(events.size(), 2u);
    EXPECT_EQ(events[0].kind, EventKind::DeviceRemoved);
    EXPECT_EQ(events[0].record->vendorId, "0781");
    EXPECT_EQ(events[1].kind, EventKind::DeviceAdded);
    EXPECT_EQ(events[1].record->vendorId, "046d");
}

TEST(SnapshotDifferTest, ErrorChangesProduceErrorEvents) {
    DeviceRecord quiet = makeRecord("1-1");
    DeviceRecord noisy = quiet;
    noisy.errors = {"[ERROR] Device descriptor read failed"};

    TopologySnapshot before = buildSnapshot({makeRootHub("usb1"), quiet});
    TopologySnapshot after = buildSnapshot({makeRootHub("usb1"), noisy});

    auto events = SnapshotDiffer::diff(&before, after, Clock::now());
    ASSERT_EQ(events.size(), 1u);
    EXPECT_EQ(events[0].kind, EventKind::ErrorsUpdated);
    EXPECT_EQ(events[0].errors, noisy.errors);
}

TEST(SnapshotDifferTest, IdenticalSnapshotsProduceNothing) {
    TopologySnapshot snapshot = buildSnapshot({makeRootHub("usb1"), makeRecord("1-1")});
    EXPECT_TRUE(SnapshotDiffer::diff(&snapshot, snapshot, Clock::now()).empty());
}

TEST(SnapshotDifferTest, ReplayingDiffReachesNewTopology) {
    TopologySnapshot before = buildSnapshot({
        makeRootHub("usb1"), makeRootHub("usb2"),
        makeHub("1-1"), makeHub("1-1.1"), makeRecord("1-1.1.3"), makeRecord("1-1.2"),
        makeRecord("1-2", DeviceClass::Storage, "0781", "5581", 4),
        makeRecord("2-1"),
    });
    TopologySnapshot after = buildSnapshot({
        makeRootHub("usb1"), makeRootHub("usb2"), makeRootHub("usb3"),
        makeHub("1-1"), makeRecord("1-1.2"),
        makeRecord("1-2", DeviceClass::Storage, "0781", "5581", 9),
        makeRecord("2-1"), makeHub("2-4"), makeRecord("2-4.1"),
        makeRecord("3-1"),
    });

    auto events = SnapshotDiffer::diff(&before, after, Clock::now());
    EXPECT_EQ(replay(before, events), addressSet(after));

    events = SnapshotDiffer::diff(&after, before, Clock::now());
    EXPECT_EQ(replay(after, events), addressSet(before));

    TopologySnapshot empty;
    EXPECT_EQ(replay(empty, SnapshotDiffer::diff(nullptr, after, Clock::now())), addressSet(after));
    EXPECT_TRUE(replay(after, SnapshotDiffer::diff(&after, empty, Clock::now())).empty());
}

TEST(EventCoalescerTest, HoldsRemovalUntilWindowLapses) {
    EventCoalescer coalescer(milliseconds(300));
    auto t0 = Clock::now();

    auto ready = coalescer.submit({removal("1-1")}, t0);
    EXPECT_TRUE(ready.empty());
    EXPECT_TRUE(coalescer.isPending("1-1"));
    ASSERT_TRUE(coalescer.nextDeadline().has_value());
    EXPECT_EQ(*coalescer.nextDeadline(), t0 + milliseconds(300));

    EXPECT_TRUE(coalescer.releaseExpired(t0 + milliseconds(299)).empty());
    ready = coalescer.releaseExpired(t0 + milliseconds(300));
    ASSERT_EQ(ready.size(), 1u);
    EXPECT_EQ(ready[0].kind, EventKind::DeviceRemoved);
    EXPECT_EQ(coalescer.pendingCount(), 0u);
}

TEST(EventCoalescerTest, QuickReconnectBecomesRecovery) {
    EventCoalescer coalescer(milliseconds(300));
    auto t0 = Clock::now();

    coalescer.submit({removal("1-1")}, t0);
    auto ready = coalescer.submit({addition("1-1", {"[ERROR] Port disabled by hub"})},
                                  t0 + milliseconds(120));

    ASSERT_EQ(ready.size(), 1u);
    EXPECT_EQ(ready[0].kind, EventKind::DeviceAdded);
    EXPECT_TRUE(ready[0].recovered);
    EXPECT_TRUE(ready[0].record->errors.empty());
    EXPECT_EQ(coalescer.pendingCount(), 0u);
}

TEST(EventCoalescerTest, LateReconnectIsPlainAdd) {
    EventCoalescer coalescer(milliseconds(300));
    auto t0 = Clock::now();

    coalescer.submit({removal("1-1")}, t0);
    auto ready = coalescer.submit({addition("1-1")}, t0 + milliseconds(500));

    ASSERT_EQ(ready.size(), 2u);
    EXPECT_EQ(ready[0].kind, EventKind::DeviceRemoved);
    EXPECT_EQ(ready[1].kind, EventKind::DeviceAdded);
    EXPECT_FALSE(ready[1].recovered);
}

TEST(EventCoalescerTest, ZeroWindowPassesEverythingThrough) {
    EventCoalescer coalescer(milliseconds(0));
    auto ready = coalescer.submit({removal("1-1"), addition("1-2")}, Clock::now());
    ASSERT_EQ(ready.size(), 2u);
    EXPECT_EQ(ready[0].kind, EventKind::DeviceRemoved);
    EXPECT_FALSE(coalescer.nextDeadline().has_value());
}

TEST(EventCoalescerTest, ReleaseAllFlushesPending) {
    EventCoalescer coalescer(milliseconds(300));
    coalescer.submit({removal("1-1.2"), removal("1-1")}, Clock::now());

    auto ready = coalescer.releaseAll();
    EXPECT_EQ(addressesOf(ready, EventKind::DeviceRemoved),
              (std::vector<std::string>{"1-1.2", "1-1"}));
    EXPECT_EQ(coalescer.pendingCount(), 0u);
}

} // namespace testing
} // namespace hubscope
