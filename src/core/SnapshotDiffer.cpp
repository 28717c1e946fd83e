#include "SnapshotDiffer.hpp"
#include "Logger.hpp"
#include <deque>
#include <functional>
#include <set>

namespace hubscope {

namespace {

using AddressSet = std::set<std::string, AddressLess>;

TopologyEvent makeEvent(EventKind kind, const DeviceRecord& record,
                        SnapshotDiffer::TimePoint timestamp) {
    TopologyEvent event;
    event.kind = kind;
    event.address = record.address;
    event.record = record;
    event.timestamp = timestamp;
    return event;
}

} // namespace

bool SnapshotDiffer::sameIdentity(const DeviceRecord& lhs, const DeviceRecord& rhs) {
    return lhs.vendorId == rhs.vendorId &&
           lhs.productId == rhs.productId &&
           lhs.deviceNumber == rhs.deviceNumber;
}

std::vector<TopologyEvent> SnapshotDiffer::diff(const TopologySnapshot* previous,
                                                const TopologySnapshot& current,
                                                TimePoint timestamp) {
    static const TopologySnapshot empty;
    const TopologySnapshot& before = previous ? *previous : empty;
    std::vector<TopologyEvent> events;

    // An address whose ancestor goes away (or is replaced) goes away with it
    AddressSet removed;
    for (const auto& [address, record] : before.devices) {
        const DeviceRecord* now = current.find(address);
        bool gone = !now || !sameIdentity(record, *now);
        if (!gone && !record.parentAddress.empty()) {
            gone = removed.count(record.parentAddress) > 0;
        }
        if (gone) {
            removed.insert(address);
        }
    }

    for (const auto& address : removed) {
        const DeviceRecord& record = before.devices.at(address);
        if (!record.parentAddress.empty() && removed.count(record.parentAddress)) {
            continue;
        }
        for (const auto& victim : before.subtreeDeepestFirst(address)) {
            events.push_back(makeEvent(EventKind::DeviceRemoved,
                                       before.devices.at(victim), timestamp));
        }
    }

    std::function<void(const std::string&)> addSubtree = [&](const std::string& address) {
        const DeviceRecord& record = current.devices.at(address);
        if (!before.contains(address) || removed.count(address)) {
            events.push_back(makeEvent(EventKind::DeviceAdded, record, timestamp));
        }
        for (const auto& child : record.children) {
            addSubtree(child);
        }
    };
    for (const auto& root : current.roots) {
        addSubtree(root);
    }

    for (const auto& [address, record] : current.devices) {
        const DeviceRecord* old = before.find(address);
        if (!old || removed.count(address) || old->errors == record.errors) {
            continue;
        }
        TopologyEvent event = makeEvent(EventKind::ErrorsUpdated, record, timestamp);
        event.errors = record.errors;
        events.push_back(std::move(event));
    }

    return events;
}

struct PendingRemoval {
    TopologyEvent event;
    EventCoalescer::TimePoint deadline;
};

class EventCoalescer::Private {
public:
    std::chrono::milliseconds window;
    std::deque<PendingRemoval> pending;

    bool cancelPending(const std::string& address) {
        for (auto it = pending.rbegin(); it != pending.rend(); ++it) {
            if (it->event.address == address) {
                pending.erase(std::next(it).base());
                return true;
            }
        }
        return false;
    }
};

EventCoalescer::EventCoalescer(std::chrono::milliseconds window)
    : d(std::make_unique<Private>()) {
    d->window = window;
}

EventCoalescer::~EventCoalescer() = default;

void EventCoalescer::setWindow(std::chrono::milliseconds window) {
    d->window = window;
}

std::chrono::milliseconds EventCoalescer::window() const {
    return d->window;
}

std::vector<TopologyEvent> EventCoalescer::submit(std::vector<TopologyEvent> events, TimePoint now) {
    std::vector<TopologyEvent> ready = releaseExpired(now);

    for (auto& event : events) {
        if (event.kind == EventKind::DeviceRemoved && d->window.count() > 0) {
            d->pending.push_back({std::move(event), now + d->window});
            continue;
        }

        if (event.kind == EventKind::DeviceAdded && d->cancelPending(event.address)) {
            LOG_DEBUG("Coalesced remove/add of " + event.address + " into a recovery");
            event.recovered = true;
            event.errors.clear();
            if (event.record) {
                event.record->errors.clear();
            }
        }
        ready.push_back(std::move(event));
    }

    return ready;
}

std::vector<TopologyEvent> EventCoalescer::releaseExpired(TimePoint now) {
    std::vector<TopologyEvent> ready;
    while (!d->pending.empty() && d->pending.front().deadline <= now) {
        ready.push_back(std::move(d->pending.front().event));
        d->pending.pop_front();
    }
    return ready;
}

std::vector<TopologyEvent> EventCoalescer::releaseAll() {
    std::vector<TopologyEvent> ready;
    for (auto& entry : d->pending) {
        ready.push_back(std::move(entry.event));
    }
    d->pending.clear();
    return ready;
}

std::optional<EventCoalescer::TimePoint> EventCoalescer::nextDeadline() const {
    if (d->pending.empty()) {
        return std::nullopt;
    }
    return d->pending.front().deadline;
}

size_t EventCoalescer::pendingCount() const {
    return d->pending.size();
}

bool EventCoalescer::isPending(const std::string& address) const {
    for (const auto& entry : d->pending) {
        if (entry.event.address == address) {
            return true;
        }
    }
    return false;
}

}
