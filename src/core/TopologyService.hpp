#pragma once
#include <hubscope/Types.hpp>
#include "HubGrouping.hpp"
#include "LearningSession.hpp"
#include <QObject>
#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace hubscope {

class DeviceSource;
class EventBroadcaster;
class LabelStore;

struct ErrorEntry {
    std::string address;
    std::string message;
    std::chrono::system_clock::time_point timestamp{};
};

struct LearningStopResult {
    int errorCode{0};
    std::string message;
    LearningResult detection;
    std::optional<PhysicalGroup> savedGroup;
};

struct LearningStatus {
    LearningState state{LearningState::Idle};
    size_t observed{0};
    std::vector<std::string> baseline;
    std::vector<LearningDevice> storageDevices;
};

// Owns the canonical topology. Every mutation (rescans, error reports,
// learning transitions) runs on the thread this object lives on; snapshot()
// may be called from anywhere.
class TopologyService : public QObject {
    Q_OBJECT

public:
    TopologyService(DeviceSource* source, LabelStore* labels, QObject* parent = nullptr);
    ~TopologyService();

    void setDebounceWindow(std::chrono::milliseconds window);
    void setLearningWindow(std::chrono::milliseconds window);
    void setRescanSettle(int milliseconds);
    void setQueueCapacity(size_t capacity);

    EventBroadcaster* broadcaster() const;

    bool start();
    void stop();

    SnapshotPtr snapshot() const;
    std::optional<DeviceRecord> device(const std::string& address) const;
    std::vector<ErrorEntry> errors() const;
    // False after the device source failed to start or its last scan failed
    bool sourceAvailable() const;

    // Errors reported for an address apply to it and every descendant.
    void reportError(const std::string& address, const std::string& message);
    void setCustomName(const std::string& vendorId, const std::string& productId,
                       const std::string& name);
    void setHubLabel(const std::string& key, const std::string& label);

    // DEVICE_NOT_FOUND for an unknown address; otherwise the result is
    // published as a ResetResult event.
    int resetDevice(const std::string& address);

    std::vector<PhysicalGroup> confirmedGroups() const;
    GroupDetection detectGroups() const;

    LearningStartResult startLearning();
    LearningStopResult stopLearning(bool save, const std::string& name = "",
                                    const std::string& label = "");
    LearningResult previewLearning() const;
    LearningStatus learningStatus() const;

public slots:
    void scheduleRescan();
    void rescan();

private slots:
    void releaseExpired();
    void onResetFinished(const std::string& address, bool success);

private:
    void applyRecords(std::vector<DeviceRecord> records);
    void dispatch(std::vector<TopologyEvent> events);
    void armExpiryTimer();

    class Private;
    std::unique_ptr<Private> d;
};

}
