#include "HubGrouping.hpp"
#include <algorithm>
#include <map>
#include <set>

namespace hubscope {

namespace {

class DisjointSet {
public:
    void add(const std::string& item) {
        parent_.emplace(item, item);
    }

    std::string find(const std::string& item) {
        std::string& up = parent_.at(item);
        if (up != item) {
            up = find(up);
        }
        return up;
    }

    void unite(const std::string& a, const std::string& b) {
        std::string ra = find(a);
        std::string rb = find(b);
        if (ra == rb) return;
        // Keep the lowest address as representative so output is stable
        if (AddressLess()(rb, ra)) std::swap(ra, rb);
        parent_[rb] = ra;
    }

private:
    std::map<std::string, std::string, AddressLess> parent_;
};

bool isGroupableHub(const DeviceRecord& record) {
    return record.deviceClass == DeviceClass::Hub && !record.isRootHub;
}

std::string lookup(const HubGroupDetector::LabelLookup& labels, const std::string& key) {
    return labels ? labels(key) : std::string();
}

} // namespace

GroupDetection HubGroupDetector::detect(const TopologySnapshot& snapshot,
                                        const std::vector<PhysicalGroup>& confirmed,
                                        const LabelLookup& labels) {
    GroupDetection result;

    DisjointSet sets;
    for (const auto& [address, record] : snapshot.devices) {
        if (isGroupableHub(record)) {
            sets.add(address);
        }
    }

    // Same silicon linked through an ancestor chain, whatever sits in between
    for (const auto& [address, record] : snapshot.devices) {
        if (!isGroupableHub(record)) continue;
        for (const auto& ancestor : snapshot.ancestorsOf(address)) {
            const DeviceRecord* up = snapshot.find(ancestor);
            if (up && isGroupableHub(*up) && up->hubKey() == record.hubKey()) {
                sets.unite(address, ancestor);
            }
        }
    }

    std::map<std::string, std::vector<std::string>, AddressLess> clusters;
    for (const auto& [address, record] : snapshot.devices) {
        if (isGroupableHub(record)) {
            clusters[sets.find(address)].push_back(address);
        }
    }

    std::set<std::string> claimed;
    for (const auto& group : confirmed) {
        claimed.insert(group.members.begin(), group.members.end());
    }

    for (auto& [representative, members] : clusters) {
        if (members.size() < 2) continue;

        size_t claimedCount = std::count_if(members.begin(), members.end(),
            [&claimed](const std::string& m) { return claimed.count(m) > 0; });
        if (claimedCount == members.size()) {
            continue;
        }

        const DeviceRecord& first = snapshot.devices.at(members.front());
        PhysicalGroup group;
        group.name = (first.vendorName.empty() ? first.hubKey() : first.vendorName) +
                     " hub (" + std::to_string(members.size()) + " chips)";
        group.label = lookup(labels, first.hubKey() + "@" + first.address);
        if (group.label.empty()) {
            group.label = lookup(labels, first.hubKey());
        }
        group.members = std::move(members);
        group.confirmed = false;
        group.overlapsConfirmed = claimedCount > 0;
        result.candidates.push_back(std::move(group));
    }

    result.hostController.name = HOST_CONTROLLER_NAME;
    result.hostController.label = lookup(labels, MOTHERBOARD_KEY);
    for (const auto& root : snapshot.roots) {
        const DeviceRecord* record = snapshot.find(root);
        if (record && record->isRootHub) {
            result.hostController.members.push_back(root);
        }
    }

    return result;
}

}
