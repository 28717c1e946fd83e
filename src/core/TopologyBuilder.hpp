#pragma once
#include <hubscope/Types.hpp>
#include <string>
#include <vector>

namespace hubscope {

struct DroppedRecord {
    std::string address;
    std::string missingParent;
};

struct BuildResult {
    TopologySnapshot snapshot;
    std::vector<DroppedRecord> dropped;      // orphans, transitively
    std::vector<std::string> duplicates;     // later records sharing an address
};

// Assembles a flat record set into a forest keyed by address. Records whose
// declared parent is absent are dropped and logged; the rest of the tree is
// still built.
class TopologyBuilder {
public:
    static BuildResult build(std::vector<DeviceRecord> records);
};

}
