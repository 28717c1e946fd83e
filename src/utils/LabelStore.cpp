#include "LabelStore.hpp"
#include "../core/Logger.hpp"
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QJsonParseError>
#include <QSaveFile>
#include <algorithm>
#include <mutex>

namespace hubscope {

class LabelStore::Private {
public:
    std::string path;
    std::vector<DeviceLabel> devices;
    std::map<std::string, std::string> hubLabels;
    std::vector<PhysicalGroup> groups;
    mutable std::mutex mutex;

    static std::string key(const std::string& vendorId, const std::string& productId) {
        return vendorId + ":" + productId;
    }

    std::vector<PhysicalGroup>::iterator findGroup(const std::string& name) {
        return std::find_if(groups.begin(), groups.end(),
            [&name](const PhysicalGroup& group) { return group.name == name; });
    }

    QJsonObject toJson() const {
        QJsonArray deviceArray;
        for (const auto& device : devices) {
            QJsonObject obj;
            obj["vendor_id"] = QString::fromStdString(device.vendorId);
            obj["product_id"] = QString::fromStdString(device.productId);
            obj["custom_name"] = QString::fromStdString(device.customName);
            if (!device.notes.empty()) {
                obj["notes"] = QString::fromStdString(device.notes);
            }
            deviceArray.append(obj);
        }

        QJsonObject labels;
        for (const auto& [labelKey, label] : hubLabels) {
            labels[QString::fromStdString(labelKey)] = QString::fromStdString(label);
        }

        QJsonArray groupArray;
        for (const auto& group : groups) {
            QJsonObject obj;
            obj["name"] = QString::fromStdString(group.name);
            obj["label"] = QString::fromStdString(group.label);
            QJsonArray members;
            for (const auto& member : group.members) {
                members.append(QString::fromStdString(member));
            }
            obj["members"] = members;
            groupArray.append(obj);
        }

        QJsonObject root;
        root["devices"] = deviceArray;
        root["hub_labels"] = labels;
        root["physical_groups"] = groupArray;
        return root;
    }

    void fromJson(const QJsonObject& root) {
        devices.clear();
        hubLabels.clear();
        groups.clear();

        for (const auto& value : root["devices"].toArray()) {
            QJsonObject obj = value.toObject();
            DeviceLabel device;
            device.vendorId = obj["vendor_id"].toString().toLower().toStdString();
            device.productId = obj["product_id"].toString().toLower().toStdString();
            device.customName = obj["custom_name"].toString().toStdString();
            device.notes = obj["notes"].toString().toStdString();
            if (!device.vendorId.empty() && !device.productId.empty()) {
                devices.push_back(device);
            }
        }

        QJsonObject labels = root["hub_labels"].toObject();
        for (auto it = labels.begin(); it != labels.end(); ++it) {
            QString label = it.value().toString();
            if (!label.isEmpty()) {
                hubLabels[it.key().toStdString()] = label.toStdString();
            }
        }

        for (const auto& value : root["physical_groups"].toArray()) {
            QJsonObject obj = value.toObject();
            PhysicalGroup group;
            group.name = obj["name"].toString().toStdString();
            group.label = obj["label"].toString().toStdString();
            group.confirmed = true;
            for (const auto& member : obj["members"].toArray()) {
                group.members.push_back(member.toString().toStdString());
            }
            if (!group.name.empty() && !group.members.empty()) {
                groups.push_back(group);
            }
        }
    }
};

LabelStore::LabelStore(const std::string& path, QObject* parent)
    : QObject(parent)
    , d(std::make_unique<Private>()) {
    d->path = path;
}

LabelStore::~LabelStore() = default;

std::string LabelStore::path() const {
    return d->path;
}

bool LabelStore::load() {
    if (d->path.empty()) {
        return true;
    }

    QFile file(QString::fromStdString(d->path));
    if (!file.exists()) {
        LOG_INFO("No label store at " + d->path + ", starting empty");
        return true;
    }
    if (!file.open(QIODevice::ReadOnly)) {
        LOG_ERROR("Cannot open label store " + d->path);
        emit errorOccurred("Cannot open label store " + d->path);
        return false;
    }

    QJsonParseError parseError;
    QJsonDocument doc = QJsonDocument::fromJson(file.readAll(), &parseError);
    if (doc.isNull() || !doc.isObject()) {
        LOG_ERROR("Invalid label store " + d->path + ": " +
                  parseError.errorString().toStdString());
        emit errorOccurred("Invalid label store " + d->path);
        return false;
    }

    {
        std::lock_guard<std::mutex> lock(d->mutex);
        d->fromJson(doc.object());
        LOG_INFO("Loaded " + std::to_string(d->devices.size()) + " names, " +
                 std::to_string(d->hubLabels.size()) + " hub labels and " +
                 std::to_string(d->groups.size()) + " physical groups from " + d->path);
    }
    emit labelsChanged();
    return true;
}

bool LabelStore::save() const {
    if (d->path.empty()) {
        return true;
    }

    QByteArray data;
    {
        std::lock_guard<std::mutex> lock(d->mutex);
        data = QJsonDocument(d->toJson()).toJson();
    }

    QFileInfo info(QString::fromStdString(d->path));
    QDir().mkpath(info.absolutePath());

    QSaveFile file(info.absoluteFilePath());
    if (!file.open(QIODevice::WriteOnly) || file.write(data) != data.size() || !file.commit()) {
        LOG_ERROR("Cannot write label store " + d->path + ": " + file.errorString().toStdString());
        return false;
    }
    return true;
}

std::string LabelStore::customName(const std::string& vendorId, const std::string& productId) const {
    std::lock_guard<std::mutex> lock(d->mutex);
    for (const auto& device : d->devices) {
        if (device.vendorId == vendorId && device.productId == productId) {
            return device.customName;
        }
    }
    return {};
}

void LabelStore::setCustomName(const std::string& vendorId, const std::string& productId,
                               const std::string& name) {
    {
        std::lock_guard<std::mutex> lock(d->mutex);
        auto& devices = d->devices;
        auto it = std::find_if(devices.begin(), devices.end(),
            [&](const DeviceLabel& device) {
                return device.vendorId == vendorId && device.productId == productId;
            });

        if (name.empty()) {
            if (it != devices.end()) {
                devices.erase(it);
            }
        } else if (it != devices.end()) {
            it->customName = name;
        } else {
            devices.push_back({vendorId, productId, name, {}});
        }
    }

    LOG_INFO("Custom name for " + Private::key(vendorId, productId) +
             (name.empty() ? " cleared" : " set to '" + name + "'"));
    if (!save()) {
        emit errorOccurred("Failed to save label store");
    }
    emit labelsChanged();
}

std::map<std::string, std::string> LabelStore::customNames() const {
    std::lock_guard<std::mutex> lock(d->mutex);
    std::map<std::string, std::string> names;
    for (const auto& device : d->devices) {
        names[Private::key(device.vendorId, device.productId)] = device.customName;
    }
    return names;
}

std::string LabelStore::hubLabel(const std::string& key) const {
    std::lock_guard<std::mutex> lock(d->mutex);
    auto it = d->hubLabels.find(key);
    return it != d->hubLabels.end() ? it->second : std::string();
}

void LabelStore::setHubLabel(const std::string& key, const std::string& label) {
    {
        std::lock_guard<std::mutex> lock(d->mutex);
        if (label.empty()) {
            d->hubLabels.erase(key);
        } else {
            d->hubLabels[key] = label;
        }
    }

    if (!save()) {
        emit errorOccurred("Failed to save label store");
    }
    emit labelsChanged();
}

std::map<std::string, std::string> LabelStore::hubLabels() const {
    std::lock_guard<std::mutex> lock(d->mutex);
    return d->hubLabels;
}

std::vector<PhysicalGroup> LabelStore::physicalGroups() const {
    std::lock_guard<std::mutex> lock(d->mutex);
    return d->groups;
}

std::optional<PhysicalGroup> LabelStore::physicalGroup(const std::string& name) const {
    std::lock_guard<std::mutex> lock(d->mutex);
    for (const auto& group : d->groups) {
        if (group.name == name) {
            return group;
        }
    }
    return std::nullopt;
}

std::optional<PhysicalGroup> LabelStore::groupForDevice(const std::string& address) const {
    std::lock_guard<std::mutex> lock(d->mutex);
    for (const auto& group : d->groups) {
        if (std::find(group.members.begin(), group.members.end(), address) != group.members.end()) {
            return group;
        }
    }
    return std::nullopt;
}

std::string LabelStore::uniqueGroupName(const std::string& base) const {
    std::lock_guard<std::mutex> lock(d->mutex);
    std::string candidate = base;
    for (int suffix = 2; d->findGroup(candidate) != d->groups.end(); ++suffix) {
        candidate = base + " " + std::to_string(suffix);
    }
    return candidate;
}

bool LabelStore::addPhysicalGroup(const std::string& name, const std::vector<std::string>& members,
                                  const std::string& label) {
    if (name.empty()) {
        return false;
    }
    {
        std::lock_guard<std::mutex> lock(d->mutex);
        auto& groups = d->groups;

        if (d->findGroup(name) != groups.end()) {
            LOG_WARNING("Physical group '" + name + "' already exists");
            return false;
        }

        for (auto& group : groups) {
            auto& current = group.members;
            current.erase(std::remove_if(current.begin(), current.end(),
                [&members](const std::string& address) {
                    return std::find(members.begin(), members.end(), address) != members.end();
                }), current.end());
        }
        groups.erase(std::remove_if(groups.begin(), groups.end(),
            [](const PhysicalGroup& group) {
                if (group.members.empty()) {
                    LOG_INFO("Physical group '" + group.name + "' lost all members, removing it");
                    return true;
                }
                return false;
            }), groups.end());

        PhysicalGroup group;
        group.name = name;
        group.label = label;
        group.members = members;
        group.confirmed = true;
        groups.push_back(group);
    }

    LOG_INFO("Saved physical group '" + name + "' with " + std::to_string(members.size()) + " hubs");
    if (!save()) {
        emit errorOccurred("Failed to save label store");
    }
    emit labelsChanged();
    return true;
}

bool LabelStore::updatePhysicalGroup(const std::string& oldName, const std::string& newName,
                                     const std::string& label) {
    {
        std::lock_guard<std::mutex> lock(d->mutex);
        auto it = d->findGroup(oldName);
        if (it == d->groups.end() || newName.empty()) {
            return false;
        }
        if (newName != oldName && d->findGroup(newName) != d->groups.end()) {
            LOG_WARNING("Cannot rename physical group '" + oldName + "': '" + newName + "' exists");
            return false;
        }
        it->name = newName;
        it->label = label;
    }

    if (!save()) {
        emit errorOccurred("Failed to save label store");
    }
    emit labelsChanged();
    return true;
}

bool LabelStore::removePhysicalGroup(const std::string& name) {
    {
        std::lock_guard<std::mutex> lock(d->mutex);
        auto it = d->findGroup(name);
        if (it == d->groups.end()) {
            return false;
        }
        d->groups.erase(it);
    }

    LOG_INFO("Removed physical group '" + name + "'");
    if (!save()) {
        emit errorOccurred("Failed to save label store");
    }
    emit labelsChanged();
    return true;
}

}
