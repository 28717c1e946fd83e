#pragma once
#include <hubscope/Types.hpp>
#include <QObject>
#include <functional>
#include <memory>
#include <vector>

namespace hubscope {

// One viewer's bounded outbound queue. Publishing never blocks: when the
// queue is full the oldest event is dropped and the next drain starts with a
// Resync marker, telling the viewer to fetch a fresh full tree.
class Subscription {
public:
    Subscription(quint64 id, size_t capacity);
    ~Subscription();

    Subscription(const Subscription&) = delete;
    Subscription& operator=(const Subscription&) = delete;

    quint64 id() const;
    size_t capacity() const;
    size_t pending() const;
    size_t droppedCount() const;

    // Thread-safe; returns queued events in publish order.
    std::vector<TopologyEvent> drain(size_t maxEvents = 0);

private:
    friend class EventBroadcaster;
    void push(const TopologyEvent& event);

    class Private;
    std::unique_ptr<Private> d;
};

using SubscriptionHandle = std::shared_ptr<Subscription>;

class EventBroadcaster : public QObject {
    Q_OBJECT

public:
    using SnapshotProvider = std::function<SnapshotPtr()>;

    explicit EventBroadcaster(size_t queueCapacity, QObject* parent = nullptr);
    ~EventBroadcaster();

    void setSnapshotProvider(SnapshotProvider provider);
    void setQueueCapacity(size_t capacity);
    size_t queueCapacity() const;

    // The new subscription's queue already holds a FullTree of the current
    // snapshot.
    SubscriptionHandle subscribe();
    void unsubscribe(const SubscriptionHandle& handle);
    size_t subscriberCount() const;

    void publish(const TopologyEvent& event);

signals:
    void eventsAvailable(quint64 subscriptionId);

private:
    class Private;
    std::unique_ptr<Private> d;
};

}
