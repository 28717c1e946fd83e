#pragma once
#include <hubscope/Types.hpp>
#include <QObject>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace hubscope {

struct DeviceLabel {
    std::string vendorId;
    std::string productId;
    std::string customName;
    std::string notes;
};

// Persistent user labels: custom device names, hub labels and confirmed
// physical groups. An empty path keeps everything in memory.
class LabelStore : public QObject {
    Q_OBJECT

public:
    explicit LabelStore(const std::string& path = "", QObject* parent = nullptr);
    ~LabelStore();

    std::string path() const;
    bool load();
    bool save() const;

    // Keyed "vendor:product"; an empty name removes the entry.
    std::string customName(const std::string& vendorId, const std::string& productId) const;
    void setCustomName(const std::string& vendorId, const std::string& productId,
                       const std::string& name);
    std::map<std::string, std::string> customNames() const;

    // Keys are "vendor:product", "vendor:product@address" or "motherboard".
    std::string hubLabel(const std::string& key) const;
    void setHubLabel(const std::string& key, const std::string& label);
    std::map<std::string, std::string> hubLabels() const;

    std::vector<PhysicalGroup> physicalGroups() const;
    std::optional<PhysicalGroup> physicalGroup(const std::string& name) const;
    std::optional<PhysicalGroup> groupForDevice(const std::string& address) const;

    // Members move out of any other group; groups left empty are deleted.
    // Fails when the name is empty or already taken.
    bool addPhysicalGroup(const std::string& name, const std::vector<std::string>& members,
                          const std::string& label = "");
    // "base", then "base 2", "base 3", ... whichever is free first
    std::string uniqueGroupName(const std::string& base) const;
    bool updatePhysicalGroup(const std::string& oldName, const std::string& newName,
                             const std::string& label);
    bool removePhysicalGroup(const std::string& name);

signals:
    void labelsChanged();
    void errorOccurred(const std::string& message);

private:
    class Private;
    std::unique_ptr<Private> d;
};

}
