#include <gtest/gtest.h>
#include "FakeDeviceSource.hpp"
#include "EventBroadcaster.hpp"
#include "LabelStore.hpp"
#include "TestRecords.hpp"
#include "TopologyService.hpp"
#include <hubscope/Constants.hpp>
#include <QElapsedTimer>
#include <QThread>

namespace hubscope {
namespace testing {

namespace {

using std::chrono::milliseconds;

void waitFor(int milliseconds) {
    QElapsedTimer timer;
    timer.start();
    while (timer.elapsed() < milliseconds) {
        QCoreApplication::processEvents(QEventLoop::AllEvents, 5);
        QThread::msleep(1);
    }
}

std::vector<EventKind> kindsOf(const std::vector<TopologyEvent>& events) {
    std::vector<EventKind> kinds;
    for (const auto& event : events) {
        kinds.push_back(event.kind);
    }
    return kinds;
}

} // namespace

class TopologyServiceTest : public QtTest {
protected:
    void SetUp() override {
        QtTest::SetUp();
        source = std::make_unique<FakeDeviceSource>();
        source->records = {
            makeRootHub("usb1"),
            makeHub("1-1"),
            makeHub("1-1.1"),
            makeRecord("1-1.1.2", DeviceClass::HidKeyboard, "046d", "c31c"),
            makeRecord("1-2", DeviceClass::Storage, "0781", "5581"),
        };
        labels = std::make_unique<LabelStore>();
        service = std::make_unique<TopologyService>(source.get(), labels.get());
        service->setDebounceWindow(milliseconds(0));
        ASSERT_TRUE(service->start());

        viewer = service->broadcaster()->subscribe();
        viewer->drain();
    }

    void TearDown() override {
        viewer.reset();
        service.reset();
        labels.reset();
        source.reset();
        QtTest::TearDown();
    }

    std::unique_ptr<FakeDeviceSource> source;
    std::unique_ptr<LabelStore> labels;
    std::unique_ptr<TopologyService> service;
    SubscriptionHandle viewer;
};

TEST_F(TopologyServiceTest, StartPublishesInitialTopology) {
    EXPECT_EQ(service->snapshot()->size(), 5u);

    SubscriptionHandle late = service->broadcaster()->subscribe();
    auto events = late->drain();
    ASSERT_EQ(events.size(), 1u);
    EXPECT_EQ(events[0].kind, EventKind::FullTree);
    EXPECT_EQ(events[0].snapshot->size(), 5u);
}

TEST_F(TopologyServiceTest, UnplugPublishesRemovalsDeepestFirst) {
    source->unplug("1-1");
    service->rescan();

    auto events = viewer->drain();
    ASSERT_EQ(events.size(), 3u);
    EXPECT_EQ(events[0].address, "1-1.1.2");
    EXPECT_EQ(events[1].address, "1-1.1");
    EXPECT_EQ(events[2].address, "1-1");
    EXPECT_FALSE(service->device("1-1").has_value());
}

TEST_F(TopologyServiceTest, FailedScanKeepsTopology) {
    EXPECT_TRUE(service->sourceAvailable());
    source->failNext = true;
    service->rescan();

    EXPECT_FALSE(service->sourceAvailable());
    EXPECT_EQ(service->snapshot()->size(), 5u);
    EXPECT_TRUE(viewer->drain().empty());

    source->unplug("1-2");
    service->rescan();
    EXPECT_TRUE(service->sourceAvailable());
    EXPECT_EQ(service->snapshot()->size(), 4u);
}

TEST_F(TopologyServiceTest, QuickReconnectIsRecovery) {
    service->setDebounceWindow(milliseconds(500));
    auto saved = source->records;

    source->unplug("1-2");
    service->rescan();
    EXPECT_TRUE(viewer->drain().empty());
    EXPECT_FALSE(service->device("1-2").has_value());

    source->records = saved;
    service->rescan();
    auto events = viewer->drain();
    ASSERT_EQ(events.size(), 1u);
    EXPECT_EQ(events[0].kind, EventKind::DeviceAdded);
    EXPECT_TRUE(events[0].recovered);
}

TEST_F(TopologyServiceTest, LapsedRemovalIsReleasedByTimer) {
    service->setDebounceWindow(milliseconds(30));
    source->unplug("1-2");
    service->rescan();
    EXPECT_TRUE(viewer->drain().empty());

    waitFor(120);
    auto events = viewer->drain();
    ASSERT_EQ(events.size(), 1u);
    EXPECT_EQ(events[0].kind, EventKind::DeviceRemoved);
    EXPECT_EQ(events[0].address, "1-2");
}

TEST_F(TopologyServiceTest, ErrorsApplyToDescendants) {
    service->reportError("1-1.1", "[ERROR] Port error");

    EXPECT_TRUE(service->device("1-1.1")->hasErrors());
    EXPECT_TRUE(service->device("1-1.1.2")->hasErrors());
    EXPECT_FALSE(service->device("1-1")->hasErrors());

    auto events = viewer->drain();
    EXPECT_EQ(kindsOf(events),
              (std::vector<EventKind>{EventKind::ErrorsUpdated, EventKind::ErrorsUpdated}));

    // Repeated messages are kept once per record
    service->reportError("1-1.1", "[ERROR] Port error");
    EXPECT_EQ(service->device("1-1.1")->errors.size(), 1u);
    EXPECT_EQ(service->errors().size(), 2u);
}

TEST_F(TopologyServiceTest, RecoveryClearsErrors) {
    service->setDebounceWindow(milliseconds(500));
    service->reportError("1-2", "[ERROR] Device descriptor read failed");
    auto saved = source->records;
    viewer->drain();

    source->unplug("1-2");
    service->rescan();
    source->records = saved;
    service->rescan();

    EXPECT_FALSE(service->device("1-2")->hasErrors());
    viewer->drain();

    // Later rescans do not bring the old error back
    service->rescan();
    EXPECT_FALSE(service->device("1-2")->hasErrors());
    EXPECT_TRUE(viewer->drain().empty());
}

TEST_F(TopologyServiceTest, RemovalForgetsErrors) {
    service->reportError("1-2", "[ERROR] Over-current detected");
    ASSERT_EQ(service->errors().size(), 1u);

    auto saved = source->records;
    source->unplug("1-2");
    service->rescan();
    EXPECT_TRUE(service->errors().empty());

    source->records = saved;
    service->rescan();
    EXPECT_FALSE(service->device("1-2")->hasErrors());
}

TEST_F(TopologyServiceTest, BurstOfNotificationsCausesOneRescan) {
    service->setRescanSettle(20);
    int before = source->enumerations;

    for (int i = 0; i < 5; ++i) {
        emit source->devicesChanged();
    }
    waitFor(100);

    EXPECT_EQ(source->enumerations, before + 1);
}

TEST_F(TopologyServiceTest, CustomNameIsAppliedAndAnnounced) {
    service->setCustomName("046d", "c31c", "Desk keyboard");

    EXPECT_EQ(service->device("1-1.1.2")->displayName(), "Desk keyboard");
    auto events = viewer->drain();
    ASSERT_EQ(events.size(), 1u);
    EXPECT_EQ(events[0].kind, EventKind::NameUpdated);
    EXPECT_TRUE(events[0].success);
}

TEST_F(TopologyServiceTest, ResetUnknownDeviceFails) {
    EXPECT_EQ(service->resetDevice("9-9"), ErrorCodes::DEVICE_NOT_FOUND);
    EXPECT_TRUE(source->resets.empty());
}

TEST_F(TopologyServiceTest, ResetResultIsPublished) {
    source->resetSucceeds = false;
    EXPECT_EQ(service->resetDevice("1-2"), ErrorCodes::SUCCESS);

    auto events = viewer->drain();
    ASSERT_EQ(events.size(), 1u);
    EXPECT_EQ(events[0].kind, EventKind::ResetResult);
    EXPECT_EQ(events[0].address, "1-2");
    EXPECT_FALSE(events[0].success);
}

TEST_F(TopologyServiceTest, LearningSavesDetectedGroup) {
    LearningStartResult start = service->startLearning();
    ASSERT_TRUE(start.started);
    EXPECT_EQ(start.storageDevices.size(), 1u);
    EXPECT_EQ(service->learningStatus().state, LearningState::Armed);

    source->unplug("1-1");
    service->rescan();
    EXPECT_TRUE(service->previewLearning().detected);

    LearningStopResult stop = service->stopLearning(true, "", "Under desk");
    ASSERT_TRUE(stop.detection.detected);
    ASSERT_TRUE(stop.savedGroup.has_value());
    EXPECT_EQ(stop.savedGroup->label, "Under desk");
    EXPECT_EQ(stop.savedGroup->members, (std::vector<std::string>{"1-1.1", "1-1"}));

    auto stored = labels->physicalGroup(stop.savedGroup->name);
    ASSERT_TRUE(stored.has_value());
    EXPECT_EQ(service->confirmedGroups().size(), 1u);

    auto kinds = kindsOf(viewer->drain());
    EXPECT_EQ(kinds.front(), EventKind::LearningStarted);
    EXPECT_EQ(kinds.back(), EventKind::LearningStopped);
    EXPECT_EQ(service->learningStatus().state, LearningState::Idle);
}

TEST_F(TopologyServiceTest, IdenticalDocksGetSeparateGroups) {
    source->records.push_back(makeHub("1-3"));
    source->records.push_back(makeHub("1-3.1"));
    service->rescan();
    auto attached = source->records;

    ASSERT_TRUE(service->startLearning().started);
    source->unplug("1-1");
    service->rescan();
    LearningStopResult first = service->stopLearning(true);
    ASSERT_TRUE(first.savedGroup.has_value());

    source->records = attached;
    service->rescan();

    ASSERT_TRUE(service->startLearning().started);
    source->unplug("1-3");
    service->rescan();
    LearningStopResult second = service->stopLearning(true);
    ASSERT_TRUE(second.savedGroup.has_value());

    EXPECT_EQ(second.savedGroup->name, first.savedGroup->name + " 2");
    EXPECT_EQ(second.savedGroup->members, (std::vector<std::string>{"1-3.1", "1-3"}));
    ASSERT_EQ(service->confirmedGroups().size(), 2u);
    EXPECT_EQ(labels->physicalGroup(first.savedGroup->name)->members,
              (std::vector<std::string>{"1-1.1", "1-1"}));
}

TEST_F(TopologyServiceTest, LearningKeepsExistingGroupOnNameClash) {
    labels->addPhysicalGroup("Dock", {"2-1"});

    ASSERT_TRUE(service->startLearning().started);
    source->unplug("1-1");
    service->rescan();
    LearningStopResult stop = service->stopLearning(true, "Dock");

    EXPECT_TRUE(stop.detection.detected);
    EXPECT_EQ(stop.errorCode, ErrorCodes::GROUP_EXISTS);
    EXPECT_FALSE(stop.savedGroup.has_value());
    EXPECT_EQ(labels->physicalGroup("Dock")->members, (std::vector<std::string>{"2-1"}));
}

TEST_F(TopologyServiceTest, LearningRejectsDoubleStartAndIdleStop) {
    EXPECT_EQ(service->stopLearning(false).errorCode, ErrorCodes::NOT_ARMED);

    ASSERT_TRUE(service->startLearning().started);
    EXPECT_EQ(service->startLearning().errorCode, ErrorCodes::ALREADY_ARMED);

    LearningStopResult stop = service->stopLearning(true, "Nothing");
    EXPECT_FALSE(stop.detection.detected);
    EXPECT_FALSE(stop.savedGroup.has_value());
    EXPECT_TRUE(labels->physicalGroups().empty());
}

TEST_F(TopologyServiceTest, DetectedGroupsUseHubLabels) {
    service->setHubLabel("05e3:0610", "Desk hub");
    service->setHubLabel("motherboard", "Rear I/O");

    GroupDetection detection = service->detectGroups();
    ASSERT_EQ(detection.candidates.size(), 1u);
    EXPECT_EQ(detection.candidates[0].label, "Desk hub");
    EXPECT_EQ(detection.hostController.label, "Rear I/O");
}

} // namespace testing
} // namespace hubscope
