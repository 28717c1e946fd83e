#pragma once
#include "DeviceSource.hpp"
#include <memory>
#include <string>
#include <vector>

struct libusb_device;

namespace hubscope {

class UsbIdDatabase;

// libusb-backed device source. Uses hotplug notifications where the platform
// supports them and falls back to polling the device list.
class UsbEnumerator : public DeviceSource {
    Q_OBJECT

public:
    explicit UsbEnumerator(QObject* parent = nullptr);
    ~UsbEnumerator();

    void setPollInterval(int milliseconds);
    void setResetDelay(int milliseconds);
    void setUsbIdDatabase(std::shared_ptr<const UsbIdDatabase> database);

    bool start() override;
    void stop() override;
    std::vector<DeviceRecord> enumerate() override;
    void resetDevice(const std::string& address) override;

    bool hotplugSupported() const;

private slots:
    void pollDevices();

private:
    void setupHotplugSupport();
    DeviceRecord buildRecord(libusb_device* device);
    std::string getDeviceIdentifier(libusb_device* device);

    class Private;
    std::unique_ptr<Private> d;
};

}
