#include "TopologyBuilder.hpp"
#include "Logger.hpp"
#include <map>

namespace hubscope {

namespace {

enum class Resolution { Pending, Visiting, Valid, Orphan };

class OrphanResolver {
public:
    explicit OrphanResolver(const DeviceMap& devices) : devices_(devices) {}

    // A record is valid when every ancestor up to a root is present. A cycle
    // in the parent chain counts as an orphan.
    bool isValid(const std::string& address) {
        auto& state = states_[address];
        if (state == Resolution::Valid) return true;
        if (state == Resolution::Orphan || state == Resolution::Visiting) return false;

        const DeviceRecord& record = devices_.at(address);
        if (record.parentAddress.empty()) {
            state = Resolution::Valid;
            return true;
        }

        state = Resolution::Visiting;
        bool valid = devices_.count(record.parentAddress) && isValid(record.parentAddress);
        states_[address] = valid ? Resolution::Valid : Resolution::Orphan;
        return valid;
    }

private:
    const DeviceMap& devices_;
    std::map<std::string, Resolution> states_;
};

} // namespace

BuildResult TopologyBuilder::build(std::vector<DeviceRecord> records) {
    BuildResult result;
    DeviceMap all;

    for (auto& record : records) {
        record.children.clear();
        if (record.parentAddress.empty()) {
            record.isRootHub = true;
        }
        std::string address = record.address;
        if (!all.emplace(address, std::move(record)).second) {
            LOG_WARNING("Duplicate device address " + address + ", keeping first record");
            result.duplicates.push_back(address);
        }
    }

    OrphanResolver resolver(all);
    for (auto it = all.begin(); it != all.end(); ) {
        if (resolver.isValid(it->first)) {
            ++it;
            continue;
        }
        LOG_WARNING("Dropping orphan record " + it->first +
                    ": parent " + it->second.parentAddress + " is absent");
        result.dropped.push_back({it->first, it->second.parentAddress});
        it = all.erase(it);
    }

    // DeviceMap iterates in address order, so children and roots come out sorted
    for (auto& [address, record] : all) {
        if (record.parentAddress.empty()) {
            result.snapshot.roots.push_back(address);
        } else {
            all.at(record.parentAddress).children.push_back(address);
        }
    }

    result.snapshot.devices = std::move(all);
    return result;
}

}
