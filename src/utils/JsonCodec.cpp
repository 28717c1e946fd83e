#include "JsonCodec.hpp"
#include "../core/DeviceRecord.hpp"
#include "../core/TopologyService.hpp"
#include "../device/KernelLogMonitor.hpp"

namespace hubscope {
namespace json {

namespace {

QJsonArray stringArray(const std::vector<std::string>& values) {
    QJsonArray array;
    for (const auto& value : values) {
        array.append(QString::fromStdString(value));
    }
    return array;
}

QString str(const std::string& value) {
    return QString::fromStdString(value);
}

// Optional strings are null rather than empty on the wire
QJsonValue optionalString(const std::string& value) {
    return value.empty() ? QJsonValue() : QJsonValue(str(value));
}

QJsonObject learningDeviceToJson(const LearningDevice& device) {
    QJsonObject obj;
    obj["port_path"] = str(device.address);
    obj["name"] = str(device.name);
    obj["device_class"] = str(deviceClassName(device.deviceClass));
    return obj;
}

const char* stateName(LearningState state) {
    switch (state) {
        case LearningState::Idle: return "idle";
        case LearningState::Armed: return "armed";
        case LearningState::Completed: return "completed";
    }
    return "idle";
}

const char* eventTypeName(EventKind kind) {
    switch (kind) {
        case EventKind::FullTree: return "full_tree";
        case EventKind::DeviceAdded: return "device_added";
        case EventKind::DeviceRemoved: return "device_removed";
        case EventKind::ErrorsUpdated: return "device_error";
        case EventKind::NameUpdated: return "name_updated";
        case EventKind::ResetResult: return "reset_result";
        case EventKind::LearningStarted: return "learning_started";
        case EventKind::LearningStopped: return "learning_stopped";
        case EventKind::Resync: return "resync";
    }
    return "unknown";
}

} // namespace

double toEpochSeconds(std::chrono::system_clock::time_point timestamp) {
    using namespace std::chrono;
    return duration_cast<microseconds>(timestamp.time_since_epoch()).count() / 1e6;
}

QJsonObject deviceToJson(const DeviceRecord& record, const TopologySnapshot* tree) {
    QJsonObject obj;
    obj["port_path"] = str(record.address);
    obj["parent_path"] = optionalString(record.parentAddress);
    obj["bus"] = record.busNumber;
    obj["device"] = record.deviceNumber;
    obj["unique_id"] = QString::number(record.busNumber) + "-" + str(record.address);
    obj["vendor_id"] = str(record.vendorId);
    obj["product_id"] = str(record.productId);
    obj["vendor_name"] = optionalString(record.vendorName);
    obj["product_name"] = optionalString(record.productName);
    obj["manufacturer"] = optionalString(record.manufacturer);
    obj["product"] = optionalString(record.product);
    obj["serial"] = optionalString(record.serial);
    obj["speed"] = str(record.speed);
    obj["usb_version"] = str(record.usbVersion);
    obj["device_class"] = str(deviceClassName(record.deviceClass));
    obj["num_ports"] = record.numPorts > 0 ? QJsonValue(record.numPorts) : QJsonValue();
    obj["power_draw_ma"] = record.powerDrawMa;
    obj["driver"] = optionalString(record.driver);
    obj["dev_nodes"] = stringArray(record.deviceNodes);
    obj["custom_name"] = optionalString(record.customName);
    obj["display_name"] = str(record.displayName());
    obj["is_root_hub"] = record.isRootHub;
    obj["errors"] = stringArray(record.errors);
    obj["has_errors"] = record.hasErrors();
    obj["child_paths"] = stringArray(record.children);

    QJsonArray children;
    if (tree) {
        for (const auto& child : record.children) {
            const DeviceRecord* childRecord = tree->find(child);
            if (childRecord) {
                children.append(deviceToJson(*childRecord, tree));
            }
        }
    }
    obj["children"] = children;
    return obj;
}

QJsonArray treeToJson(const TopologySnapshot& snapshot) {
    QJsonArray roots;
    for (const auto& root : snapshot.roots) {
        const DeviceRecord* record = snapshot.find(root);
        if (record) {
            roots.append(deviceToJson(*record, &snapshot));
        }
    }
    return roots;
}

QJsonObject eventToJson(const TopologyEvent& event) {
    QJsonObject msg;
    msg["type"] = eventTypeName(event.kind);
    msg["timestamp"] = toEpochSeconds(event.timestamp);

    switch (event.kind) {
        case EventKind::FullTree:
            msg["devices"] = event.snapshot ? treeToJson(*event.snapshot) : QJsonArray();
            break;
        case EventKind::DeviceAdded:
            msg["port_path"] = str(event.address);
            msg["data"] = event.record ? QJsonValue(deviceToJson(*event.record)) : QJsonValue();
            msg["recovered"] = event.recovered;
            break;
        case EventKind::DeviceRemoved:
            msg["port_path"] = str(event.address);
            msg["data"] = event.record ? QJsonValue(deviceToJson(*event.record)) : QJsonValue();
            break;
        case EventKind::ErrorsUpdated:
            msg["port_path"] = str(event.address);
            msg["error"] = event.errors.empty() ? QJsonValue() : QJsonValue(str(event.errors.back()));
            msg["errors"] = stringArray(event.errors);
            if (event.record) {
                msg["data"] = deviceToJson(*event.record);
            }
            break;
        case EventKind::NameUpdated:
            msg["success"] = event.success;
            break;
        case EventKind::ResetResult:
            msg["success"] = event.success;
            msg["port_path"] = str(event.address);
            break;
        case EventKind::LearningStopped:
            msg["detected"] = event.success;
            break;
        case EventKind::LearningStarted:
        case EventKind::Resync:
            break;
    }
    return msg;
}

QJsonObject groupToJson(const PhysicalGroup& group) {
    QJsonObject obj;
    obj["name"] = str(group.name);
    obj["label"] = optionalString(group.label);
    obj["members"] = stringArray(group.members);
    obj["confirmed"] = group.confirmed;
    if (!group.confirmed) {
        obj["overlaps_confirmed"] = group.overlapsConfirmed;
    }
    return obj;
}

QJsonArray groupsToJson(const std::vector<PhysicalGroup>& groups) {
    QJsonArray array;
    for (const auto& group : groups) {
        array.append(groupToJson(group));
    }
    return array;
}

QJsonObject learningStartToJson(const LearningStartResult& result) {
    QJsonObject obj;
    obj["status"] = result.started ? "started" : "already_armed";
    obj["success"] = result.started;
    if (!result.message.empty()) {
        obj["message"] = str(result.message);
    }
    obj["baseline"] = stringArray(result.baseline);

    QJsonArray storage;
    for (const auto& device : result.storageDevices) {
        storage.append(learningDeviceToJson(device));
    }
    obj["storage_devices"] = storage;
    obj["storage_warning"] = !result.storageDevices.empty();
    return obj;
}

QJsonObject learningResultToJson(const LearningResult& result) {
    QJsonObject obj;
    obj["members"] = stringArray(result.members);

    QJsonArray devices;
    for (const auto& device : result.devices) {
        devices.append(learningDeviceToJson(device));
    }
    obj["devices"] = devices;
    obj["skipped_existing"] = stringArray(result.skippedExisting);
    obj["has_storage"] = result.hasStorage;
    obj["first_disappearance"] = toEpochSeconds(result.firstDisappearance);
    return obj;
}

QJsonObject learningStopToJson(const LearningStopResult& result) {
    QJsonObject obj;
    const LearningResult& detection = result.detection;
    if (result.savedGroup) {
        obj["status"] = "saved";
        obj["saved_group"] = groupToJson(*result.savedGroup);
    } else {
        obj["status"] = detection.detected ? "detected" : "no_group_detected";
    }
    obj["message"] = str(result.message);
    obj["observed"] = static_cast<int>(detection.observed);
    obj["detected_group"] = detection.detected ? QJsonValue(learningResultToJson(detection))
                                               : QJsonValue();
    return obj;
}

QJsonObject learningStatusToJson(const LearningStatus& status) {
    QJsonObject obj;
    obj["state"] = stateName(status.state);
    obj["learning_mode"] = status.state == LearningState::Armed;
    obj["observed"] = static_cast<int>(status.observed);
    obj["baseline"] = stringArray(status.baseline);

    QJsonArray storage;
    for (const auto& device : status.storageDevices) {
        storage.append(learningDeviceToJson(device));
    }
    obj["storage_devices"] = storage;
    return obj;
}

QJsonObject errorEntryToJson(const ErrorEntry& entry) {
    QJsonObject obj;
    obj["timestamp"] = toEpochSeconds(entry.timestamp);
    obj["port_path"] = str(entry.address);
    obj["message"] = str(entry.message);
    return obj;
}

QJsonObject kernelLogEntryToJson(const KernelLogEntry& entry) {
    QJsonObject obj;
    obj["timestamp"] = toEpochSeconds(entry.timestamp);
    obj["port_path"] = str(entry.address);
    obj["message"] = str(entry.description);
    obj["severity"] = QString::fromStdString(KernelLogParser::severityName(entry.severity)).toLower();
    obj["raw_line"] = str(entry.rawLine);
    return obj;
}

}
}
