#pragma once
#include <hubscope/Types.hpp>
#include <cstdint>
#include <string>
#include <vector>

namespace hubscope {

struct InterfaceCode {
    uint8_t interfaceClass;
    uint8_t interfaceSubClass;
    uint8_t interfaceProtocol;
};

std::string deviceClassName(DeviceClass deviceClass);
DeviceClass deviceClassFromName(const std::string& name);

// Maps USB class codes to a DeviceClass. interfaces are consulted when the
// device descriptor defers classification (bDeviceClass 0x00 or 0xef).
DeviceClass classifyUsbCodes(uint8_t deviceClass, const std::vector<InterfaceCode>& interfaces);

// "5-1.2.4" -> "5-1.2", "5-1" -> "usb5", "usb5" -> "".
std::string parentAddressOf(const std::string& address);

bool isRootAddress(const std::string& address);

}
