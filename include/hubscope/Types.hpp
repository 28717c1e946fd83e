#pragma once
#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace hubscope {

enum class DeviceClass {
    Hub,
    HidKeyboard,
    HidMouse,
    HidOther,
    Audio,
    Video,
    Storage,
    Printer,
    Wireless,
    Comm,
    Unknown
};

// Orders addresses with numeric port segments compared as numbers,
// so "1-2" sorts before "1-10" and "usb2" before "usb10". A parent always
// sorts before its descendants.
struct AddressLess {
    bool operator()(const std::string& lhs, const std::string& rhs) const;
};

struct DeviceRecord {
    std::string address;        // "usb5", "5-1", "5-1.2.4"
    std::string parentAddress;  // empty for a root hub
    uint8_t busNumber{0};
    uint8_t deviceNumber{0};

    std::string vendorId;       // 4-digit lowercase hex
    std::string productId;
    std::string vendorName;     // from usb.ids
    std::string productName;
    std::string manufacturer;   // string descriptors, when readable
    std::string product;
    std::string serial;

    DeviceClass deviceClass{DeviceClass::Unknown};
    std::string speed;
    std::string usbVersion;
    int powerDrawMa{0};
    std::string driver;
    int numPorts{0};            // hubs only, 0 when unknown
    std::vector<std::string> deviceNodes;

    std::string customName;
    bool isRootHub{false};
    std::vector<std::string> errors;

    // Child addresses in AddressLess order; filled by the topology builder.
    std::vector<std::string> children;

    bool hasErrors() const { return !errors.empty(); }
    std::string displayName() const;
    std::string hubKey() const { return vendorId + ":" + productId; }
};

using DeviceMap = std::map<std::string, DeviceRecord, AddressLess>;

struct TopologySnapshot {
    std::vector<std::string> roots;
    DeviceMap devices;

    const DeviceRecord* find(const std::string& address) const;
    bool contains(const std::string& address) const;
    size_t size() const { return devices.size(); }
    bool empty() const { return devices.empty(); }

    // Post-order walk of the subtree rooted at address: descendants first,
    // address itself last.
    std::vector<std::string> subtreeDeepestFirst(const std::string& address) const;
    std::vector<std::string> ancestorsOf(const std::string& address) const;
};

using SnapshotPtr = std::shared_ptr<const TopologySnapshot>;

struct PhysicalGroup {
    std::string name;
    std::string label;
    std::vector<std::string> members;
    bool confirmed{false};
    bool overlapsConfirmed{false};
};

enum class EventKind {
    FullTree,
    DeviceAdded,
    DeviceRemoved,
    ErrorsUpdated,
    NameUpdated,
    ResetResult,
    LearningStarted,
    LearningStopped,
    Resync
};

struct TopologyEvent {
    EventKind kind{EventKind::FullTree};
    std::string address;
    std::optional<DeviceRecord> record;   // added record, or last known for removals
    std::vector<std::string> errors;      // ErrorsUpdated
    SnapshotPtr snapshot;                 // FullTree
    bool recovered{false};                // DeviceAdded that cancelled a pending removal
    bool success{false};                  // ResetResult, LearningStopped (group detected)
    std::chrono::system_clock::time_point timestamp{};
};

}
