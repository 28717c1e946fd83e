#pragma once
#include <hubscope/Types.hpp>
#include <chrono>
#include <memory>
#include <optional>
#include <vector>

namespace hubscope {

class SnapshotDiffer {
public:
    using TimePoint = std::chrono::system_clock::time_point;

    // Events that turn previous into current: removals (deepest first per
    // removed subtree), then additions (parents first), then error changes.
    // A null previous diffs against an empty topology.
    static std::vector<TopologyEvent> diff(const TopologySnapshot* previous,
                                           const TopologySnapshot& current,
                                           TimePoint timestamp);

    static bool sameIdentity(const DeviceRecord& lhs, const DeviceRecord& rhs);
};

// Holds DeviceRemoved events for a coalescing window. A DeviceAdded for the
// same address inside the window cancels the pending removal and is released
// as a single recovered add with its errors cleared.
class EventCoalescer {
public:
    using TimePoint = std::chrono::system_clock::time_point;

    explicit EventCoalescer(std::chrono::milliseconds window);
    ~EventCoalescer();

    void setWindow(std::chrono::milliseconds window);
    std::chrono::milliseconds window() const;

    // Returns events ready for dispatch, starting with removals whose window
    // lapsed before now.
    std::vector<TopologyEvent> submit(std::vector<TopologyEvent> events, TimePoint now);
    std::vector<TopologyEvent> releaseExpired(TimePoint now);
    std::vector<TopologyEvent> releaseAll();

    std::optional<TimePoint> nextDeadline() const;
    size_t pendingCount() const;
    bool isPending(const std::string& address) const;

private:
    class Private;
    std::unique_ptr<Private> d;
};

}
