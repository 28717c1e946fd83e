#pragma once
#include <hubscope/Types.hpp>
#include <QObject>
#include <string>
#include <vector>

namespace hubscope {

// Yields the flat device record set of the bus. Notifications only say that
// something changed; consumers call enumerate() for the full set.
// devicesChanged may be emitted from any thread.
class DeviceSource : public QObject {
    Q_OBJECT

public:
    explicit DeviceSource(QObject* parent = nullptr) : QObject(parent) {}
    virtual ~DeviceSource() = default;

    virtual bool start() = 0;
    virtual void stop() = 0;
    virtual std::vector<DeviceRecord> enumerate() = 0;

    // Result arrives through resetFinished.
    virtual void resetDevice(const std::string& address) = 0;

signals:
    void devicesChanged();
    void resetFinished(const std::string& address, bool success);
    void sourceError(const std::string& message);
};

}
