#include "EventBroadcaster.hpp"
#include "Logger.hpp"
#include <algorithm>
#include <deque>
#include <mutex>

namespace hubscope {

class Subscription::Private {
public:
    quint64 id{0};
    size_t capacity{1};
    std::deque<TopologyEvent> queue;
    bool gap{false};
    size_t dropped{0};
    mutable std::mutex mutex;
};

Subscription::Subscription(quint64 id, size_t capacity)
    : d(std::make_unique<Private>()) {
    d->id = id;
    d->capacity = std::max<size_t>(capacity, 1);
}

Subscription::~Subscription() = default;

quint64 Subscription::id() const {
    return d->id;
}

size_t Subscription::capacity() const {
    return d->capacity;
}

size_t Subscription::pending() const {
    std::lock_guard<std::mutex> lock(d->mutex);
    return d->queue.size() + (d->gap ? 1 : 0);
}

size_t Subscription::droppedCount() const {
    std::lock_guard<std::mutex> lock(d->mutex);
    return d->dropped;
}

void Subscription::push(const TopologyEvent& event) {
    std::lock_guard<std::mutex> lock(d->mutex);
    if (d->queue.size() >= d->capacity) {
        d->queue.pop_front();
        d->gap = true;
        ++d->dropped;
        LOG_DEBUG("Subscriber " + std::to_string(d->id) + " overflowed, dropped oldest event");
    }
    d->queue.push_back(event);
}

std::vector<TopologyEvent> Subscription::drain(size_t maxEvents) {
    std::lock_guard<std::mutex> lock(d->mutex);
    std::vector<TopologyEvent> events;

    if (d->gap) {
        TopologyEvent marker;
        marker.kind = EventKind::Resync;
        marker.timestamp = std::chrono::system_clock::now();
        events.push_back(std::move(marker));
        d->gap = false;
    }

    size_t count = d->queue.size();
    if (maxEvents > 0) {
        count = std::min(count, maxEvents);
    }
    for (size_t i = 0; i < count; ++i) {
        events.push_back(std::move(d->queue.front()));
        d->queue.pop_front();
    }
    return events;
}

class EventBroadcaster::Private {
public:
    size_t capacity;
    SnapshotProvider snapshots;
    std::vector<SubscriptionHandle> subscribers;
    quint64 nextId{1};
    mutable std::mutex mutex;
};

EventBroadcaster::EventBroadcaster(size_t queueCapacity, QObject* parent)
    : QObject(parent)
    , d(std::make_unique<Private>()) {
    d->capacity = queueCapacity;
}

EventBroadcaster::~EventBroadcaster() = default;

void EventBroadcaster::setSnapshotProvider(SnapshotProvider provider) {
    std::lock_guard<std::mutex> lock(d->mutex);
    d->snapshots = std::move(provider);
}

void EventBroadcaster::setQueueCapacity(size_t capacity) {
    std::lock_guard<std::mutex> lock(d->mutex);
    d->capacity = capacity;
}

size_t EventBroadcaster::queueCapacity() const {
    std::lock_guard<std::mutex> lock(d->mutex);
    return d->capacity;
}

SubscriptionHandle EventBroadcaster::subscribe() {
    SubscriptionHandle handle;
    {
        std::lock_guard<std::mutex> lock(d->mutex);
        handle = std::make_shared<Subscription>(d->nextId++, d->capacity);

        // Taken under the lock so no publish can slip between the full tree
        // and the first incremental event
        TopologyEvent fullTree;
        fullTree.kind = EventKind::FullTree;
        fullTree.snapshot = d->snapshots ? d->snapshots() : nullptr;
        if (!fullTree.snapshot) {
            fullTree.snapshot = std::make_shared<const TopologySnapshot>();
        }
        fullTree.timestamp = std::chrono::system_clock::now();
        handle->push(fullTree);

        d->subscribers.push_back(handle);
    }

    LOG_INFO("Viewer subscribed (" + std::to_string(subscriberCount()) + " connected)");
    emit eventsAvailable(handle->id());
    return handle;
}

void EventBroadcaster::unsubscribe(const SubscriptionHandle& handle) {
    if (!handle) return;
    {
        std::lock_guard<std::mutex> lock(d->mutex);
        auto& subs = d->subscribers;
        subs.erase(std::remove(subs.begin(), subs.end(), handle), subs.end());
    }
    LOG_INFO("Viewer unsubscribed (" + std::to_string(subscriberCount()) + " connected)");
}

size_t EventBroadcaster::subscriberCount() const {
    std::lock_guard<std::mutex> lock(d->mutex);
    return d->subscribers.size();
}

void EventBroadcaster::publish(const TopologyEvent& event) {
    std::vector<SubscriptionHandle> targets;
    {
        std::lock_guard<std::mutex> lock(d->mutex);
        targets = d->subscribers;
        for (const auto& subscriber : targets) {
            subscriber->push(event);
        }
    }

    for (const auto& subscriber : targets) {
        emit eventsAvailable(subscriber->id());
    }
}

}
