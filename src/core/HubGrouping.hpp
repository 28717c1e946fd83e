#pragma once
#include <hubscope/Types.hpp>
#include <functional>
#include <string>
#include <vector>

namespace hubscope {

struct GroupDetection {
    std::vector<PhysicalGroup> candidates;   // unconfirmed, size >= 2
    PhysicalGroup hostController;            // root hubs; display aid only
};

// Proposes hub clusters that likely share one enclosure: hubs with the same
// vendor:product key linked through an ancestor chain. Advisory only; it may
// over- or under-group.
class HubGroupDetector {
public:
    // Resolves a hub label key ("vendor:product", "vendor:product@address",
    // "motherboard") to a label, empty when none is set.
    using LabelLookup = std::function<std::string(const std::string& key)>;

    static constexpr const char* HOST_CONTROLLER_NAME = "Host controller";
    static constexpr const char* MOTHERBOARD_KEY = "motherboard";

    static GroupDetection detect(const TopologySnapshot& snapshot,
                                 const std::vector<PhysicalGroup>& confirmed = {},
                                 const LabelLookup& labels = nullptr);
};

}
