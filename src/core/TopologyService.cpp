#include "TopologyService.hpp"
#include "DeviceRecord.hpp"
#include "EventBroadcaster.hpp"
#include "Logger.hpp"
#include "SnapshotDiffer.hpp"
#include "TopologyBuilder.hpp"
#include "../device/DeviceSource.hpp"
#include "../utils/LabelStore.hpp"
#include <hubscope/Constants.hpp>
#include <QTimer>
#include <algorithm>
#include <map>
#include <mutex>
#include <set>

namespace hubscope {

namespace {

constexpr size_t ERROR_REGISTRY_LIMIT = 500;

struct RegistryEntry {
    ErrorEntry entry;
    quint64 sequence;
};

const char* eventName(EventKind kind) {
    switch (kind) {
        case EventKind::FullTree: return "full tree";
        case EventKind::DeviceAdded: return "added";
        case EventKind::DeviceRemoved: return "removed";
        case EventKind::ErrorsUpdated: return "errors updated";
        case EventKind::NameUpdated: return "name updated";
        case EventKind::ResetResult: return "reset result";
        case EventKind::LearningStarted: return "learning started";
        case EventKind::LearningStopped: return "learning stopped";
        case EventKind::Resync: return "resync";
    }
    return "unknown";
}

} // namespace

class TopologyService::Private {
public:
    DeviceSource* source{nullptr};
    LabelStore* labels{nullptr};
    EventBroadcaster* broadcaster{nullptr};
    QTimer* settleTimer{nullptr};
    QTimer* expiryTimer{nullptr};
    bool sourceFailed{false};

    EventCoalescer coalescer{std::chrono::milliseconds(DEBOUNCE_WINDOW)};
    LearningSession learning{std::chrono::milliseconds(LEARNING_WINDOW)};
    std::vector<LearningDevice> storageAtStart;

    SnapshotPtr current{std::make_shared<const TopologySnapshot>()};
    mutable std::mutex snapshotMutex;

    std::vector<RegistryEntry> registry;
    std::map<std::string, quint64> clearedAt;   // address -> first sequence still applying
    quint64 nextSequence{1};

    // Entries for the address itself or any ancestor, oldest first
    std::vector<std::string> errorsFor(const std::string& address) const {
        std::set<std::string> chain;
        for (std::string up = address; !up.empty(); up = parentAddressOf(up)) {
            chain.insert(up);
        }

        quint64 cleared = 0;
        auto it = clearedAt.find(address);
        if (it != clearedAt.end()) {
            cleared = it->second;
        }

        std::vector<std::string> messages;
        for (const auto& item : registry) {
            if (item.sequence < cleared || !chain.count(item.entry.address)) {
                continue;
            }
            if (std::find(messages.begin(), messages.end(), item.entry.message) == messages.end()) {
                messages.push_back(item.entry.message);
            }
        }
        return messages;
    }

    void forget(const std::string& address) {
        registry.erase(std::remove_if(registry.begin(), registry.end(),
            [&address](const RegistryEntry& item) { return item.entry.address == address; }),
            registry.end());
        clearedAt.erase(address);
    }

    std::vector<DeviceRecord> currentRecords() const {
        SnapshotPtr snapshot;
        {
            std::lock_guard<std::mutex> lock(snapshotMutex);
            snapshot = current;
        }
        std::vector<DeviceRecord> records;
        records.reserve(snapshot->size());
        for (const auto& [address, record] : snapshot->devices) {
            records.push_back(record);
        }
        return records;
    }
};

TopologyService::TopologyService(DeviceSource* source, LabelStore* labels, QObject* parent)
    : QObject(parent)
    , d(std::make_unique<Private>()) {
    d->source = source;
    d->labels = labels;

    d->broadcaster = new EventBroadcaster(SUBSCRIBER_QUEUE_CAPACITY, this);
    d->broadcaster->setSnapshotProvider([this]() { return snapshot(); });

    d->settleTimer = new QTimer(this);
    d->settleTimer->setSingleShot(true);
    d->settleTimer->setInterval(RESCAN_SETTLE_INTERVAL);
    connect(d->settleTimer, &QTimer::timeout, this, &TopologyService::rescan);

    d->expiryTimer = new QTimer(this);
    d->expiryTimer->setSingleShot(true);
    connect(d->expiryTimer, &QTimer::timeout, this, &TopologyService::releaseExpired);

    if (d->source) {
        // Sources may notify from their own threads
        connect(d->source, &DeviceSource::devicesChanged,
                this, &TopologyService::scheduleRescan, Qt::QueuedConnection);
        connect(d->source, &DeviceSource::resetFinished,
                this, &TopologyService::onResetFinished);
        connect(d->source, &DeviceSource::sourceError, this, [this](const std::string& message) {
            LOG_ERROR("Device source: " + message);
            d->sourceFailed = true;
        });
    }
}

TopologyService::~TopologyService() = default;

void TopologyService::setDebounceWindow(std::chrono::milliseconds window) {
    d->coalescer.setWindow(window);
}

void TopologyService::setLearningWindow(std::chrono::milliseconds window) {
    d->learning.setWindow(window);
}

void TopologyService::setRescanSettle(int milliseconds) {
    d->settleTimer->setInterval(milliseconds);
}

void TopologyService::setQueueCapacity(size_t capacity) {
    d->broadcaster->setQueueCapacity(capacity);
}

EventBroadcaster* TopologyService::broadcaster() const {
    return d->broadcaster;
}

bool TopologyService::start() {
    if (!d->source) {
        LOG_ERROR("No device source configured");
        return false;
    }
    bool started = d->source->start();
    rescan();
    if (!started) {
        d->sourceFailed = true;
    }
    LOG_INFO("Topology service started with " + std::to_string(snapshot()->size()) + " devices");
    return started;
}

void TopologyService::stop() {
    d->settleTimer->stop();
    d->expiryTimer->stop();
    if (d->source) {
        d->source->stop();
    }
    dispatch(d->coalescer.releaseAll());
    d->learning.cancel();
}

SnapshotPtr TopologyService::snapshot() const {
    std::lock_guard<std::mutex> lock(d->snapshotMutex);
    return d->current;
}

std::optional<DeviceRecord> TopologyService::device(const std::string& address) const {
    SnapshotPtr current = snapshot();
    const DeviceRecord* record = current->find(address);
    if (!record) {
        return std::nullopt;
    }
    return *record;
}

std::vector<ErrorEntry> TopologyService::errors() const {
    std::vector<ErrorEntry> entries;
    entries.reserve(d->registry.size());
    for (const auto& item : d->registry) {
        entries.push_back(item.entry);
    }
    return entries;
}

bool TopologyService::sourceAvailable() const {
    return d->source && !d->sourceFailed;
}

void TopologyService::scheduleRescan() {
    if (!d->settleTimer->isActive()) {
        d->settleTimer->start();
    }
}

void TopologyService::rescan() {
    if (!d->source) return;
    d->sourceFailed = false;
    std::vector<DeviceRecord> records = d->source->enumerate();
    if (d->sourceFailed) {
        // A failed scan says nothing about what is attached
        LOG_WARNING("Rescan failed, keeping the previous topology");
        return;
    }
    applyRecords(std::move(records));
}

void TopologyService::applyRecords(std::vector<DeviceRecord> records) {
    auto now = std::chrono::system_clock::now();

    for (auto& record : records) {
        record.customName = d->labels ? d->labels->customName(record.vendorId, record.productId)
                                      : std::string();
        record.errors = d->errorsFor(record.address);
    }

    BuildResult built = TopologyBuilder::build(std::move(records));
    SnapshotPtr previous = snapshot();

    std::vector<TopologyEvent> events = SnapshotDiffer::diff(previous.get(), built.snapshot, now);
    std::vector<TopologyEvent> ready = d->coalescer.submit(std::move(events), now);

    // A recovery wipes the error history of the recovered address
    for (const auto& event : ready) {
        if (event.kind != EventKind::DeviceAdded || !event.recovered) continue;
        d->clearedAt[event.address] = d->nextSequence;
        auto it = built.snapshot.devices.find(event.address);
        if (it != built.snapshot.devices.end()) {
            it->second.errors.clear();
        }
        LOG_INFO("Device " + event.address + " recovered");
    }

    {
        std::lock_guard<std::mutex> lock(d->snapshotMutex);
        d->current = std::make_shared<const TopologySnapshot>(std::move(built.snapshot));
    }

    dispatch(std::move(ready));
    armExpiryTimer();
}

void TopologyService::dispatch(std::vector<TopologyEvent> events) {
    // The learning session and the viewers see one ordered stream
    for (const auto& event : events) {
        if (event.kind == EventKind::DeviceRemoved) {
            d->forget(event.address);
        }
        LOG_DEBUG("Event " + std::string(eventName(event.kind)) +
                  (event.address.empty() ? "" : " " + event.address));
        d->learning.observe(event);
        d->broadcaster->publish(event);
    }
}

void TopologyService::armExpiryTimer() {
    auto deadline = d->coalescer.nextDeadline();
    if (!deadline) {
        d->expiryTimer->stop();
        return;
    }
    auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
        *deadline - std::chrono::system_clock::now()).count();
    d->expiryTimer->start(static_cast<int>(std::max<long long>(remaining, 0)) + 1);
}

void TopologyService::releaseExpired() {
    dispatch(d->coalescer.releaseExpired(std::chrono::system_clock::now()));
    armExpiryTimer();
}

void TopologyService::reportError(const std::string& address, const std::string& message) {
    if (address.empty() || message.empty()) return;

    ErrorEntry entry{address, message, std::chrono::system_clock::now()};
    d->registry.push_back({entry, d->nextSequence++});
    if (d->registry.size() > ERROR_REGISTRY_LIMIT) {
        d->registry.erase(d->registry.begin(),
                          d->registry.end() - static_cast<std::ptrdiff_t>(ERROR_REGISTRY_LIMIT));
    }
    LOG_WARNING("Bus error at " + address + ": " + message);

    applyRecords(d->currentRecords());
}

void TopologyService::setCustomName(const std::string& vendorId, const std::string& productId,
                                    const std::string& name) {
    if (d->labels) {
        d->labels->setCustomName(vendorId, productId, name);
    }
    applyRecords(d->currentRecords());

    TopologyEvent event;
    event.kind = EventKind::NameUpdated;
    event.success = true;
    event.timestamp = std::chrono::system_clock::now();
    dispatch({event});
}

void TopologyService::setHubLabel(const std::string& key, const std::string& label) {
    if (d->labels) {
        d->labels->setHubLabel(key, label);
    }

    TopologyEvent event;
    event.kind = EventKind::NameUpdated;
    event.success = true;
    event.timestamp = std::chrono::system_clock::now();
    dispatch({event});
}

int TopologyService::resetDevice(const std::string& address) {
    if (!snapshot()->contains(address)) {
        LOG_WARNING("Reset requested for unknown device " + address);
        return ErrorCodes::DEVICE_NOT_FOUND;
    }
    if (!d->source) {
        return ErrorCodes::NOT_SUPPORTED;
    }
    LOG_INFO("Resetting device " + address);
    d->source->resetDevice(address);
    return ErrorCodes::SUCCESS;
}

void TopologyService::onResetFinished(const std::string& address, bool success) {
    if (!success) {
        LOG_ERROR("Reset of " + address + " failed (code " +
                  std::to_string(ErrorCodes::RESET_FAILED) + ")");
    }

    TopologyEvent event;
    event.kind = EventKind::ResetResult;
    event.address = address;
    event.success = success;
    event.timestamp = std::chrono::system_clock::now();
    dispatch({event});
}

std::vector<PhysicalGroup> TopologyService::confirmedGroups() const {
    return d->labels ? d->labels->physicalGroups() : std::vector<PhysicalGroup>();
}

GroupDetection TopologyService::detectGroups() const {
    HubGroupDetector::LabelLookup lookup;
    if (d->labels) {
        LabelStore* labels = d->labels;
        lookup = [labels](const std::string& key) { return labels->hubLabel(key); };
    }
    return HubGroupDetector::detect(*snapshot(), confirmedGroups(), lookup);
}

LearningStartResult TopologyService::startLearning() {
    LearningStartResult result = d->learning.start(*snapshot(), confirmedGroups());
    if (!result.started) {
        LOG_WARNING(result.message);
        return result;
    }

    d->storageAtStart = result.storageDevices;
    if (!result.storageDevices.empty()) {
        LOG_WARNING(std::to_string(result.storageDevices.size()) +
                    " storage devices attached; unplugging may interrupt transfers");
    }

    TopologyEvent event;
    event.kind = EventKind::LearningStarted;
    event.timestamp = std::chrono::system_clock::now();
    dispatch({event});
    return result;
}

LearningStopResult TopologyService::stopLearning(bool save, const std::string& name,
                                                 const std::string& label) {
    LearningStopResult result;

    // Lapsed removals still belong to the burst
    releaseExpired();

    if (!d->learning.isArmed()) {
        result.errorCode = ErrorCodes::NOT_ARMED;
        result.message = "No learning session is armed";
        return result;
    }

    result.detection = d->learning.stop();
    result.errorCode = result.detection.errorCode;
    d->storageAtStart.clear();

    if (!result.detection.detected) {
        result.message = "No hubs detected";
    } else if (save && d->labels) {
        std::string groupName = name;
        if (groupName.empty()) {
            // Identical enclosures share a display name
            groupName = d->labels->uniqueGroupName(result.detection.devices.empty()
                ? "Hub group"
                : result.detection.devices.front().name + " group");
        }
        if (d->labels->addPhysicalGroup(groupName, result.detection.members, label)) {
            result.savedGroup = d->labels->physicalGroup(groupName);
            result.message = "Saved physical group '" + groupName + "'";
        } else {
            result.errorCode = ErrorCodes::GROUP_EXISTS;
            result.message = "A group named '" + groupName + "' already exists";
        }
    } else {
        result.message = "Detected " + std::to_string(result.detection.members.size()) + " hubs";
    }

    TopologyEvent event;
    event.kind = EventKind::LearningStopped;
    event.success = result.detection.detected;
    event.timestamp = std::chrono::system_clock::now();
    dispatch({event});
    return result;
}

LearningResult TopologyService::previewLearning() const {
    return d->learning.preview();
}

LearningStatus TopologyService::learningStatus() const {
    LearningStatus status;
    status.state = d->learning.state();
    status.observed = d->learning.disappearances().size();
    status.baseline = d->learning.baseline();
    status.storageDevices = d->storageAtStart;
    return status;
}

}
