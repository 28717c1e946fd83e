#include "DeviceRecord.hpp"
#include <algorithm>
#include <cctype>
#include <functional>

namespace hubscope {

namespace {

struct AddressToken {
    bool numeric;
    std::string text;
};

std::vector<AddressToken> tokenize(const std::string& address) {
    std::vector<AddressToken> tokens;
    size_t i = 0;
    while (i < address.size()) {
        bool digit = std::isdigit(static_cast<unsigned char>(address[i])) != 0;
        size_t j = i;
        while (j < address.size() &&
               (std::isdigit(static_cast<unsigned char>(address[j])) != 0) == digit) {
            ++j;
        }
        tokens.push_back({digit, address.substr(i, j - i)});
        i = j;
    }
    return tokens;
}

int compareNumeric(const std::string& lhs, const std::string& rhs) {
    size_t l = lhs.find_first_not_of('0');
    size_t r = rhs.find_first_not_of('0');
    std::string a = l == std::string::npos ? std::string() : lhs.substr(l);
    std::string b = r == std::string::npos ? std::string() : rhs.substr(r);
    if (a.size() != b.size()) {
        return a.size() < b.size() ? -1 : 1;
    }
    return a.compare(b);
}

const char* friendlyTypeName(DeviceClass deviceClass) {
    switch (deviceClass) {
        case DeviceClass::Hub:         return "Hub";
        case DeviceClass::HidKeyboard: return "Keyboard";
        case DeviceClass::HidMouse:    return "Mouse";
        case DeviceClass::HidOther:    return "Input Device";
        case DeviceClass::Audio:       return "Audio";
        case DeviceClass::Video:       return "Webcam";
        case DeviceClass::Storage:     return "Storage";
        case DeviceClass::Printer:     return "Printer";
        case DeviceClass::Wireless:    return "Wireless";
        case DeviceClass::Comm:        return "Serial";
        default:                       return nullptr;
    }
}

DeviceClass classFromCode(uint8_t code) {
    switch (code) {
        case 0x01: return DeviceClass::Audio;
        case 0x02:
        case 0x0A: return DeviceClass::Comm;
        case 0x03: return DeviceClass::HidOther;
        case 0x07: return DeviceClass::Printer;
        case 0x08: return DeviceClass::Storage;
        case 0x09: return DeviceClass::Hub;
        case 0x0E: return DeviceClass::Video;
        case 0xE0: return DeviceClass::Wireless;
        default:   return DeviceClass::Unknown;
    }
}

} // namespace

bool AddressLess::operator()(const std::string& lhs, const std::string& rhs) const {
    auto a = tokenize(lhs);
    auto b = tokenize(rhs);
    size_t n = std::min(a.size(), b.size());
    for (size_t i = 0; i < n; ++i) {
        if (a[i].numeric != b[i].numeric) {
            // root hubs ("usbN") sort ahead of everything attached below them
            return !a[i].numeric;
        }
        int cmp = a[i].numeric ? compareNumeric(a[i].text, b[i].text)
                               : a[i].text.compare(b[i].text);
        if (cmp != 0) {
            return cmp < 0;
        }
    }
    if (a.size() != b.size()) {
        return a.size() < b.size();
    }
    // "5-01" and "5-1" tokenize equal; fall back to plain ordering to stay strict
    return lhs < rhs;
}

std::string DeviceRecord::displayName() const {
    if (!customName.empty()) return customName;
    if (!product.empty()) return product;
    if (!productName.empty()) return productName;

    const std::string& vendor = vendorName.empty() ? manufacturer : vendorName;
    const char* type = friendlyTypeName(deviceClass);

    if (!vendor.empty() && type) return vendor + " (" + type + ")";
    if (!vendor.empty()) return vendor;
    if (type) return std::string("Unknown (") + type + ")";

    return vendorId + ":" + productId;
}

const DeviceRecord* TopologySnapshot::find(const std::string& address) const {
    auto it = devices.find(address);
    return it != devices.end() ? &it->second : nullptr;
}

bool TopologySnapshot::contains(const std::string& address) const {
    return devices.find(address) != devices.end();
}

std::vector<std::string> TopologySnapshot::subtreeDeepestFirst(const std::string& address) const {
    std::vector<std::string> order;
    std::function<void(const std::string&)> visit = [&](const std::string& current) {
        const DeviceRecord* record = find(current);
        if (!record) return;
        for (const auto& child : record->children) {
            visit(child);
        }
        order.push_back(current);
    };
    visit(address);
    return order;
}

std::vector<std::string> TopologySnapshot::ancestorsOf(const std::string& address) const {
    std::vector<std::string> chain;
    const DeviceRecord* record = find(address);
    while (record && !record->parentAddress.empty()) {
        chain.push_back(record->parentAddress);
        record = find(record->parentAddress);
    }
    return chain;
}

std::string deviceClassName(DeviceClass deviceClass) {
    switch (deviceClass) {
        case DeviceClass::Hub:         return "hub";
        case DeviceClass::HidKeyboard: return "hid_keyboard";
        case DeviceClass::HidMouse:    return "hid_mouse";
        case DeviceClass::HidOther:    return "hid_other";
        case DeviceClass::Audio:       return "audio";
        case DeviceClass::Video:       return "video";
        case DeviceClass::Storage:     return "storage";
        case DeviceClass::Printer:     return "printer";
        case DeviceClass::Wireless:    return "wireless";
        case DeviceClass::Comm:        return "comm";
        default:                       return "unknown";
    }
}

DeviceClass deviceClassFromName(const std::string& name) {
    static const std::map<std::string, DeviceClass> byName = {
        {"hub", DeviceClass::Hub},
        {"hid_keyboard", DeviceClass::HidKeyboard},
        {"hid_mouse", DeviceClass::HidMouse},
        {"hid_other", DeviceClass::HidOther},
        {"audio", DeviceClass::Audio},
        {"video", DeviceClass::Video},
        {"storage", DeviceClass::Storage},
        {"printer", DeviceClass::Printer},
        {"wireless", DeviceClass::Wireless},
        {"comm", DeviceClass::Comm}
    };
    auto it = byName.find(name);
    return it != byName.end() ? it->second : DeviceClass::Unknown;
}

DeviceClass classifyUsbCodes(uint8_t deviceClass, const std::vector<InterfaceCode>& interfaces) {
    DeviceClass result = classFromCode(deviceClass);
    if (result != DeviceClass::Unknown) {
        return result;
    }

    for (const auto& iface : interfaces) {
        DeviceClass ifaceClass = classFromCode(iface.interfaceClass);
        if (ifaceClass == DeviceClass::HidOther && iface.interfaceSubClass == 0x01) {
            // Boot interface subclass: protocol tells keyboard from mouse
            if (iface.interfaceProtocol == 0x01) return DeviceClass::HidKeyboard;
            if (iface.interfaceProtocol == 0x02) return DeviceClass::HidMouse;
        }
        if (ifaceClass != DeviceClass::Unknown) {
            return ifaceClass;
        }
    }
    return DeviceClass::Unknown;
}

std::string parentAddressOf(const std::string& address) {
    if (isRootAddress(address)) {
        return {};
    }
    auto dot = address.rfind('.');
    if (dot != std::string::npos) {
        return address.substr(0, dot);
    }
    auto dash = address.find('-');
    if (dash != std::string::npos) {
        return "usb" + address.substr(0, dash);
    }
    return {};
}

bool isRootAddress(const std::string& address) {
    return address.rfind("usb", 0) == 0;
}

}
