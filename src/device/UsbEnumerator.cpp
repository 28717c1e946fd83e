#include "UsbEnumerator.hpp"
#include "UsbIdDatabase.hpp"
#include "../core/DeviceRecord.hpp"
#include "../core/Logger.hpp"
#include <hubscope/Constants.hpp>
#include <libusb-1.0/libusb.h>
#include <QFile>
#include <QTimer>
#include <atomic>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <set>
#include <sstream>
#include <thread>

namespace fs = std::filesystem;

namespace hubscope {

namespace {

const char* SYSFS_USB_DEVICES = "/sys/bus/usb/devices";
constexpr int MAX_PORT_DEPTH = 7;

std::string hex4(uint16_t value) {
    std::stringstream ss;
    ss << std::hex << std::nouppercase << std::setw(4) << std::setfill('0') << value;
    return ss.str();
}

// bcdUSB 0x0210 -> "2.10"
std::string bcdVersion(uint16_t bcd) {
    std::stringstream ss;
    ss << std::hex << ((bcd >> 8) & 0xff) << "."
       << std::setw(2) << std::setfill('0') << (bcd & 0xff);
    return ss.str();
}

std::string readAttribute(const fs::path& path) {
    std::ifstream in(path);
    if (!in) return {};
    std::string value;
    std::getline(in, value);
    while (!value.empty() && (value.back() == '\n' || value.back() == ' ' || value.back() == '\r')) {
        value.pop_back();
    }
    return value;
}

// sysfs reports Mbit/s: "1.5", "12", "480", "5000", "10000", "20000"
std::string speedFromSysfs(const std::string& value) {
    if (value.empty()) return {};
    if (value == "1.5") return "1.5M";
    try {
        int mbps = std::stoi(value);
        if (mbps >= 5000) {
            return std::to_string(mbps / 1000) + "G";
        }
        return std::to_string(mbps) + "M";
    } catch (const std::exception&) {
        return {};
    }
}

std::string speedFromLibusb(int speed) {
    switch (speed) {
        case LIBUSB_SPEED_LOW: return "1.5M";
        case LIBUSB_SPEED_FULL: return "12M";
        case LIBUSB_SPEED_HIGH: return "480M";
        case LIBUSB_SPEED_SUPER: return "5G";
        case LIBUSB_SPEED_SUPER_PLUS: return "10G";
        default: return "";
    }
}

bool isInterfaceDir(const fs::path& path) {
    return path.filename().string().find(':') != std::string::npos;
}

std::string interfaceDriver(const fs::path& deviceDir) {
    std::error_code ec;
    for (const auto& entry : fs::directory_iterator(deviceDir, ec)) {
        if (!isInterfaceDir(entry.path())) continue;
        fs::path driver = entry.path() / "driver";
        if (fs::is_symlink(driver, ec)) {
            return fs::read_symlink(driver, ec).filename().string();
        }
    }
    return {};
}

// Walks the interface directories only; child devices are siblings of the
// interfaces and must not contribute nodes to their parent.
std::vector<std::string> collectDeviceNodes(const fs::path& deviceDir) {
    static const std::set<std::string> subsystems = {
        "tty", "block", "hidraw", "video4linux", "sound", "input"
    };

    std::set<std::string> nodes;
    std::error_code ec;
    for (const auto& iface : fs::directory_iterator(deviceDir, ec)) {
        if (!isInterfaceDir(iface.path())) continue;

        fs::recursive_directory_iterator it(iface.path(),
            fs::directory_options::skip_permission_denied, ec);
        for (; !ec && it != fs::recursive_directory_iterator(); it.increment(ec)) {
            const fs::path& path = it->path();
            std::string parent = path.parent_path().filename().string();
            if (!subsystems.count(parent)) continue;

            std::string name = path.filename().string();
            if (parent == "sound" && name.rfind("card", 0) == 0) {
                continue;
            }
            if (parent == "input" && name.rfind("event", 0) != 0) {
                continue;
            }
            if (parent == "sound") {
                nodes.insert("/dev/snd/" + name);
            } else if (parent == "input") {
                nodes.insert("/dev/input/" + name);
            } else {
                nodes.insert("/dev/" + name);
            }
        }
    }
    return {nodes.begin(), nodes.end()};
}

}

class UsbEnumerator::Private {
public:
    libusb_context* context{nullptr};
    bool hotplugSupported{false};
    libusb_hotplug_callback_handle hotplugHandle{};
    std::thread eventThread;
    std::atomic<bool> running{false};
    QTimer* pollTimer{nullptr};
    int pollInterval{POLLING_INTERVAL};
    int resetDelay{RESET_DELAY};
    std::set<std::string> lastIdentifiers;
    std::shared_ptr<const UsbIdDatabase> ids;
    UsbEnumerator* q_ptr{nullptr};

    static int LIBUSB_CALL hotplugCallback(libusb_context*,
                                           libusb_device*,
                                           libusb_hotplug_event,
                                           void* user_data) {
        auto enumerator = static_cast<UsbEnumerator*>(user_data);
        Q_EMIT enumerator->devicesChanged();
        return 0;
    }

    void handleEvents() {
        while (running) {
            timeval timeout{0, 250000};
            int ret = libusb_handle_events_timeout_completed(context, &timeout, nullptr);
            if (ret != LIBUSB_SUCCESS && ret != LIBUSB_ERROR_INTERRUPTED) {
                LOG_ERROR("libusb event handling failed: " + std::string(libusb_error_name(ret)));
                Q_EMIT q_ptr->sourceError("USB event handling failed");
                break;
            }
        }
    }

    std::string getStringDescriptor(libusb_device_handle* handle, uint8_t index) {
        if (!handle || index == 0) return "";

        unsigned char buffer[MAX_STRING_LENGTH];
        int ret = libusb_get_string_descriptor_ascii(
            handle, index, buffer, sizeof(buffer));

        if (ret < 0) return "";
        return std::string(reinterpret_cast<char*>(buffer), ret);
    }

    bool writeAuthorized(const std::string& address, const char* value) {
        QFile file(QString::fromStdString(
            (fs::path(SYSFS_USB_DEVICES) / address / "authorized").string()));
        if (!file.open(QIODevice::WriteOnly)) {
            LOG_ERROR("Cannot write " + file.fileName().toStdString() + ": " +
                      file.errorString().toStdString());
            return false;
        }
        return file.write(value) == 1;
    }
};

UsbEnumerator::UsbEnumerator(QObject* parent)
    : DeviceSource(parent)
    , d(std::make_unique<Private>()) {
    d->q_ptr = this;

    d->pollTimer = new QTimer(this);
    connect(d->pollTimer, &QTimer::timeout, this, &UsbEnumerator::pollDevices);
}

UsbEnumerator::~UsbEnumerator() {
    stop();
    if (d->context) {
        libusb_exit(d->context);
        d->context = nullptr;
    }
}

void UsbEnumerator::setPollInterval(int milliseconds) {
    d->pollInterval = milliseconds;
    if (d->pollTimer->isActive()) {
        d->pollTimer->start(milliseconds);
    }
}

void UsbEnumerator::setResetDelay(int milliseconds) {
    d->resetDelay = milliseconds;
}

void UsbEnumerator::setUsbIdDatabase(std::shared_ptr<const UsbIdDatabase> database) {
    d->ids = std::move(database);
}

bool UsbEnumerator::hotplugSupported() const {
    return d->hotplugSupported;
}

bool UsbEnumerator::start() {
    if (!d->context) {
        int ret = libusb_init(&d->context);
        if (ret != LIBUSB_SUCCESS) {
            d->context = nullptr;
            LOG_CRITICAL("Failed to initialize libusb: " + std::string(libusb_error_name(ret)));
            emit sourceError("Failed to initialize libusb");
            return false;
        }
    }

    setupHotplugSupport();

    if (d->hotplugSupported) {
        d->running = true;
        d->eventThread = std::thread([this]() { d->handleEvents(); });
        LOG_INFO("USB hotplug notifications enabled");
    } else {
        d->pollTimer->start(d->pollInterval);
        LOG_INFO("USB hotplug unavailable, polling every " + std::to_string(d->pollInterval) + " ms");
    }
    return true;
}

void UsbEnumerator::stop() {
    d->pollTimer->stop();

    if (d->hotplugSupported) {
        d->running = false;
        libusb_hotplug_deregister_callback(d->context, d->hotplugHandle);
        d->hotplugSupported = false;
    }
    if (d->eventThread.joinable()) {
        d->eventThread.join();
    }
}

void UsbEnumerator::setupHotplugSupport() {
    if (d->hotplugSupported || !libusb_has_capability(LIBUSB_CAP_HAS_HOTPLUG)) {
        return;
    }

    // No LIBUSB_HOTPLUG_ENUMERATE: the initial set comes from enumerate()
    int result = libusb_hotplug_register_callback(
        d->context,
        static_cast<libusb_hotplug_event>(
            LIBUSB_HOTPLUG_EVENT_DEVICE_ARRIVED |
            LIBUSB_HOTPLUG_EVENT_DEVICE_LEFT),
        static_cast<libusb_hotplug_flag>(0),
        LIBUSB_HOTPLUG_MATCH_ANY,
        LIBUSB_HOTPLUG_MATCH_ANY,
        LIBUSB_HOTPLUG_MATCH_ANY,
        Private::hotplugCallback,
        this,
        &d->hotplugHandle
    );

    if (result == LIBUSB_SUCCESS) {
        d->hotplugSupported = true;
    } else {
        LOG_WARNING("Hotplug registration failed: " + std::string(libusb_error_name(result)));
    }
}

void UsbEnumerator::pollDevices() {
    if (!d->context) return;

    libusb_device** list;
    ssize_t count = libusb_get_device_list(d->context, &list);
    if (count < 0) {
        emit sourceError("Failed to get device list");
        return;
    }

    std::set<std::string> current;
    for (ssize_t i = 0; i < count; i++) {
        current.insert(getDeviceIdentifier(list[i]));
    }
    libusb_free_device_list(list, 1);

    if (current != d->lastIdentifiers) {
        d->lastIdentifiers = std::move(current);
        emit devicesChanged();
    }
}

std::vector<DeviceRecord> UsbEnumerator::enumerate() {
    std::vector<DeviceRecord> records;
    if (!d->context) {
        return records;
    }

    libusb_device** list;
    ssize_t count = libusb_get_device_list(d->context, &list);
    if (count < 0) {
        LOG_ERROR("Failed to get device list: " +
                  std::string(libusb_error_name(static_cast<int>(count))));
        emit sourceError("Failed to get device list");
        return records;
    }

    records.reserve(count);
    std::set<std::string> identifiers;
    for (ssize_t i = 0; i < count; i++) {
        identifiers.insert(getDeviceIdentifier(list[i]));
        records.push_back(buildRecord(list[i]));
    }
    libusb_free_device_list(list, 1);

    d->lastIdentifiers = std::move(identifiers);
    return records;
}

DeviceRecord UsbEnumerator::buildRecord(libusb_device* device) {
    DeviceRecord record;
    record.busNumber = libusb_get_bus_number(device);
    record.deviceNumber = libusb_get_device_address(device);

    uint8_t ports[MAX_PORT_DEPTH];
    int depth = libusb_get_port_numbers(device, ports, MAX_PORT_DEPTH);
    if (depth <= 0) {
        record.address = "usb" + std::to_string(record.busNumber);
        record.isRootHub = true;
    } else {
        std::string address = std::to_string(record.busNumber) + "-" + std::to_string(ports[0]);
        for (int i = 1; i < depth; i++) {
            address += "." + std::to_string(ports[i]);
        }
        record.address = address;
    }
    record.parentAddress = parentAddressOf(record.address);

    libusb_device_descriptor desc{};
    if (libusb_get_device_descriptor(device, &desc) != LIBUSB_SUCCESS) {
        LOG_WARNING("Cannot read device descriptor of " + record.address);
    }
    record.vendorId = hex4(desc.idVendor);
    record.productId = hex4(desc.idProduct);
    record.usbVersion = bcdVersion(desc.bcdUSB);

    fs::path sysfsDir = fs::path(SYSFS_USB_DEVICES) / record.address;

    record.speed = speedFromSysfs(readAttribute(sysfsDir / "speed"));
    if (record.speed.empty()) {
        record.speed = speedFromLibusb(libusb_get_device_speed(device));
    }
    bool superSpeed = libusb_get_device_speed(device) >= LIBUSB_SPEED_SUPER;

    std::vector<InterfaceCode> interfaces;
    libusb_config_descriptor* config;
    if (libusb_get_active_config_descriptor(device, &config) == LIBUSB_SUCCESS) {
        // MaxPower is in 2mA units, 8mA for SuperSpeed
        record.powerDrawMa = config->MaxPower * (superSpeed ? 8 : 2);
        for (int i = 0; i < config->bNumInterfaces; i++) {
            const libusb_interface& iface = config->interface[i];
            if (iface.num_altsetting > 0) {
                const libusb_interface_descriptor& alt = iface.altsetting[0];
                interfaces.push_back({alt.bInterfaceClass, alt.bInterfaceSubClass,
                                      alt.bInterfaceProtocol});
            }
        }
        libusb_free_config_descriptor(config);
    }
    record.deviceClass = classifyUsbCodes(desc.bDeviceClass, interfaces);

    if (record.deviceClass == DeviceClass::Hub) {
        std::string maxchild = readAttribute(sysfsDir / "maxchild");
        if (!maxchild.empty()) {
            try {
                record.numPorts = std::stoi(maxchild);
            } catch (const std::exception&) {
                record.numPorts = 0;
            }
        }
    }

    record.driver = interfaceDriver(sysfsDir);
    record.deviceNodes = collectDeviceNodes(sysfsDir);

    record.manufacturer = readAttribute(sysfsDir / "manufacturer");
    record.product = readAttribute(sysfsDir / "product");
    record.serial = readAttribute(sysfsDir / "serial");
    if (record.manufacturer.empty() && record.product.empty()) {
        libusb_device_handle* handle = nullptr;
        if (libusb_open(device, &handle) == LIBUSB_SUCCESS) {
            record.manufacturer = d->getStringDescriptor(handle, desc.iManufacturer);
            record.product = d->getStringDescriptor(handle, desc.iProduct);
            record.serial = d->getStringDescriptor(handle, desc.iSerialNumber);
            libusb_close(handle);
        }
    }

    if (d->ids) {
        record.vendorName = d->ids->vendorName(record.vendorId);
        record.productName = d->ids->productName(record.vendorId, record.productId);
    }

    return record;
}

void UsbEnumerator::resetDevice(const std::string& address) {
    fs::path authorized = fs::path(SYSFS_USB_DEVICES) / address / "authorized";
    std::error_code ec;
    if (!fs::exists(authorized, ec)) {
        LOG_ERROR("Cannot reset " + address + ": " + authorized.string() + " not found");
        emit resetFinished(address, false);
        return;
    }

    if (!d->writeAuthorized(address, "0")) {
        emit resetFinished(address, false);
        return;
    }
    LOG_INFO("Deauthorized " + address + ", re-authorizing in " +
             std::to_string(d->resetDelay) + " ms");

    QTimer::singleShot(d->resetDelay, this, [this, address]() {
        bool success = d->writeAuthorized(address, "1");
        if (success) {
            LOG_INFO("Reset of " + address + " completed");
        } else {
            LOG_ERROR("Reset of " + address + " failed while re-authorizing");
        }
        emit resetFinished(address, success);
    });
}

std::string UsbEnumerator::getDeviceIdentifier(libusb_device* device) {
    uint8_t busNum = libusb_get_bus_number(device);
    uint8_t devAddr = libusb_get_device_address(device);

    libusb_device_descriptor desc;
    if (libusb_get_device_descriptor(device, &desc) != 0) {
        desc.idVendor = 0;
        desc.idProduct = 0;
    }

    std::stringstream ss;
    ss << hex4(desc.idVendor) << ":" << hex4(desc.idProduct) << ":"
       << static_cast<int>(busNum) << ":" << static_cast<int>(devAddr);

    return ss.str();
}

}
