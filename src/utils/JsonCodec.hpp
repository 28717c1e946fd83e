#pragma once
#include <hubscope/Types.hpp>
#include "../core/LearningSession.hpp"
#include <QJsonArray>
#include <QJsonObject>
#include <chrono>

namespace hubscope {

struct ErrorEntry;
struct KernelLogEntry;
struct LearningStatus;
struct LearningStopResult;

namespace json {

double toEpochSeconds(std::chrono::system_clock::time_point timestamp);

// With a tree, children are written as nested records; otherwise only
// their addresses are listed in "child_paths".
QJsonObject deviceToJson(const DeviceRecord& record, const TopologySnapshot* tree = nullptr);
QJsonArray treeToJson(const TopologySnapshot& snapshot);

// Push-channel envelope: {"type": ..., "timestamp": ..., payload}
QJsonObject eventToJson(const TopologyEvent& event);

QJsonObject groupToJson(const PhysicalGroup& group);
QJsonArray groupsToJson(const std::vector<PhysicalGroup>& groups);

QJsonObject learningStartToJson(const LearningStartResult& result);
QJsonObject learningResultToJson(const LearningResult& result);
QJsonObject learningStopToJson(const LearningStopResult& result);
QJsonObject learningStatusToJson(const LearningStatus& status);

QJsonObject errorEntryToJson(const ErrorEntry& entry);
QJsonObject kernelLogEntryToJson(const KernelLogEntry& entry);

}
}
