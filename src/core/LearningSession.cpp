#include "LearningSession.hpp"
#include "Logger.hpp"
#include <hubscope/Constants.hpp>
#include <algorithm>
#include <map>
#include <set>

namespace hubscope {

class LearningSession::Private {
public:
    LearningState state{LearningState::Idle};
    std::chrono::milliseconds window;

    std::map<std::string, std::string> baselineKeys;   // address -> vendor:product
    std::map<std::string, std::string> claimedKeys;    // hubs already in confirmed groups
    std::map<std::string, LearningDevice> knownDevices;
    std::set<std::string> storage;

    std::vector<Disappearance> observed;
    std::vector<Disappearance> claimedObserved;
    std::vector<Disappearance> storageObserved;

    void reset() {
        baselineKeys.clear();
        claimedKeys.clear();
        knownDevices.clear();
        storage.clear();
        observed.clear();
        claimedObserved.clear();
        storageObserved.clear();
    }

    static bool within(const Disappearance& entry,
                       std::chrono::system_clock::time_point begin,
                       std::chrono::system_clock::time_point end) {
        return entry.timestamp >= begin && entry.timestamp <= end;
    }

    LearningResult analyze() const {
        LearningResult result;
        result.observed = observed.size();
        result.errorCode = ErrorCodes::NO_GROUP_DETECTED;
        if (observed.empty()) {
            return result;
        }

        std::vector<Disappearance> sorted = observed;
        std::stable_sort(sorted.begin(), sorted.end(),
            [](const Disappearance& a, const Disappearance& b) {
                return a.timestamp < b.timestamp;
            });

        // Each cluster spans one window measured from its first disappearance
        std::vector<std::vector<Disappearance>> clusters;
        for (const auto& entry : sorted) {
            if (clusters.empty() || entry.timestamp - clusters.back().front().timestamp > window) {
                clusters.emplace_back();
            }
            clusters.back().push_back(entry);
        }

        const std::vector<Disappearance>* best = nullptr;
        std::vector<std::string> bestMembers;
        for (const auto& cluster : clusters) {
            std::vector<std::string> members;
            for (const auto& entry : cluster) {
                if (std::find(members.begin(), members.end(), entry.address) == members.end()) {
                    members.push_back(entry.address);
                }
            }
            if (!best || members.size() > bestMembers.size()) {
                best = &cluster;
                bestMembers = std::move(members);
            }
        }

        if (bestMembers.size() < 2) {
            return result;
        }

        auto begin = best->front().timestamp;
        auto end = begin + window;

        result.detected = true;
        result.errorCode = ErrorCodes::SUCCESS;
        result.firstDisappearance = begin;
        result.members = bestMembers;

        std::set<std::string> memberKeys;
        for (const auto& address : bestMembers) {
            memberKeys.insert(baselineKeys.at(address));
            auto info = knownDevices.find(address);
            if (info != knownDevices.end()) {
                result.devices.push_back(info->second);
            }
        }

        for (const auto& entry : claimedObserved) {
            if (within(entry, begin, end) &&
                memberKeys.count(claimedKeys.at(entry.address)) &&
                std::find(result.skippedExisting.begin(), result.skippedExisting.end(),
                          entry.address) == result.skippedExisting.end()) {
                result.skippedExisting.push_back(entry.address);
            }
        }

        result.hasStorage = std::any_of(storageObserved.begin(), storageObserved.end(),
            [&](const Disappearance& entry) { return within(entry, begin, end); });

        return result;
    }
};

LearningSession::LearningSession(std::chrono::milliseconds window)
    : d(std::make_unique<Private>()) {
    d->window = window;
}

LearningSession::~LearningSession() = default;

LearningState LearningSession::state() const {
    return d->state;
}

bool LearningSession::isArmed() const {
    return d->state == LearningState::Armed;
}

void LearningSession::setWindow(std::chrono::milliseconds window) {
    d->window = window;
}

std::chrono::milliseconds LearningSession::window() const {
    return d->window;
}

LearningStartResult LearningSession::start(const TopologySnapshot& snapshot,
                                           const std::vector<PhysicalGroup>& confirmed) {
    LearningStartResult result;
    if (isArmed()) {
        result.errorCode = ErrorCodes::ALREADY_ARMED;
        result.message = "A learning session is already armed";
        return result;
    }

    d->reset();

    std::set<std::string> claimed;
    for (const auto& group : confirmed) {
        claimed.insert(group.members.begin(), group.members.end());
    }

    for (const auto& [address, record] : snapshot.devices) {
        d->knownDevices[address] = {address, record.displayName(), record.deviceClass};

        if (record.deviceClass == DeviceClass::Storage) {
            d->storage.insert(address);
            result.storageDevices.push_back(d->knownDevices[address]);
        }

        // Root hubs live on the motherboard and cannot be unplugged
        if (record.deviceClass != DeviceClass::Hub || record.isRootHub) {
            continue;
        }
        if (claimed.count(address)) {
            d->claimedKeys[address] = record.hubKey();
        } else {
            d->baselineKeys[address] = record.hubKey();
            result.baseline.push_back(address);
        }
    }

    d->state = LearningState::Armed;
    result.started = true;
    result.errorCode = ErrorCodes::SUCCESS;

    LOG_INFO("Learning session armed with " + std::to_string(result.baseline.size()) +
             " hubs (" + std::to_string(d->claimedKeys.size()) + " already grouped)");
    return result;
}

void LearningSession::observe(const TopologyEvent& event) {
    if (!isArmed() || event.kind != EventKind::DeviceRemoved) {
        return;
    }

    Disappearance entry{event.address, event.timestamp};
    if (d->baselineKeys.count(event.address)) {
        d->observed.push_back(entry);
        LOG_DEBUG("Learning session observed disappearance of " + event.address);
    } else if (d->claimedKeys.count(event.address)) {
        d->claimedObserved.push_back(entry);
    } else if (d->storage.count(event.address)) {
        d->storageObserved.push_back(entry);
    }
}

LearningResult LearningSession::preview() const {
    if (!isArmed()) {
        LearningResult result;
        result.errorCode = ErrorCodes::NOT_ARMED;
        return result;
    }
    return d->analyze();
}

LearningResult LearningSession::stop() {
    if (!isArmed()) {
        LearningResult result;
        result.errorCode = ErrorCodes::NOT_ARMED;
        return result;
    }

    LearningResult result = d->analyze();
    d->state = LearningState::Completed;

    if (result.detected) {
        LOG_INFO("Learning session detected " + std::to_string(result.members.size()) +
                 " hubs from " + std::to_string(result.observed) + " disappearances");
    } else {
        LOG_INFO("Learning session stopped: no hubs detected");
    }

    // Completed is instantaneous
    d->reset();
    d->state = LearningState::Idle;
    return result;
}

void LearningSession::cancel() {
    if (isArmed()) {
        LOG_INFO("Learning session cancelled");
    }
    d->reset();
    d->state = LearningState::Idle;
}

const std::vector<Disappearance>& LearningSession::disappearances() const {
    return d->observed;
}

std::vector<std::string> LearningSession::baseline() const {
    std::vector<std::string> addresses;
    for (const auto& [address, key] : d->baselineKeys) {
        addresses.push_back(address);
    }
    return addresses;
}

}
