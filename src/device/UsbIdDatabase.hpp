#pragma once
#include <QByteArray>
#include <map>
#include <string>
#include <vector>

namespace hubscope {

// Vendor and product names from the usb.ids database.
class UsbIdDatabase {
public:
    static std::vector<std::string> defaultPaths();

    // Empty path searches defaultPaths().
    bool load(const std::string& path = "");
    void parse(const QByteArray& data);

    bool isLoaded() const { return !vendors.empty(); }
    size_t vendorCount() const { return vendors.size(); }

    std::string vendorName(const std::string& vendorId) const;
    std::string productName(const std::string& vendorId, const std::string& productId) const;

private:
    std::map<std::string, std::string> vendors;
    std::map<std::string, std::map<std::string, std::string>> products;
};

}
