#include "UsbIdDatabase.hpp"
#include "../core/Logger.hpp"
#include <QFile>
#include <QList>

namespace hubscope {

namespace {

bool isHexId(const QByteArray& token) {
    if (token.size() != 4) return false;
    bool ok = false;
    token.toUInt(&ok, 16);
    return ok;
}

// "05e3  Genesys Logic, Inc." -> ("05e3", "Genesys Logic, Inc.")
bool splitEntry(const QByteArray& line, std::string& id, std::string& name) {
    QByteArray trimmed = line.trimmed();
    int space = trimmed.indexOf(' ');
    if (space < 0) return false;

    QByteArray token = trimmed.left(space);
    if (!isHexId(token)) return false;

    id = token.toLower().toStdString();
    name = trimmed.mid(space).trimmed().toStdString();
    return !name.empty();
}

}

std::vector<std::string> UsbIdDatabase::defaultPaths() {
    return {
        "/usr/share/hwdata/usb.ids",
        "/usr/share/misc/usb.ids",
        "/usr/share/usb.ids",
        "/var/lib/usbutils/usb.ids"
    };
}

bool UsbIdDatabase::load(const std::string& path) {
    std::vector<std::string> candidates;
    if (!path.empty()) {
        candidates.push_back(path);
    } else {
        candidates = defaultPaths();
    }

    for (const auto& candidate : candidates) {
        QFile file(QString::fromStdString(candidate));
        if (!file.exists()) continue;
        if (!file.open(QIODevice::ReadOnly)) {
            LOG_WARNING("Cannot read USB ID database " + candidate);
            continue;
        }
        parse(file.readAll());
        LOG_INFO("Loaded " + std::to_string(vendors.size()) + " vendors from " + candidate);
        return true;
    }

    LOG_WARNING("USB ID database not found, names will be unresolved");
    return false;
}

void UsbIdDatabase::parse(const QByteArray& data) {
    vendors.clear();
    products.clear();

    std::string currentVendor;
    for (const QByteArray& line : data.split('\n')) {
        if (line.trimmed().isEmpty() || line.startsWith('#')) {
            continue;
        }

        std::string id;
        std::string name;
        if (line.startsWith("\t\t")) {
            // interface entries
            continue;
        }
        if (line.startsWith('\t')) {
            if (!currentVendor.empty() && splitEntry(line, id, name)) {
                products[currentVendor][id] = name;
            }
            continue;
        }

        // Class, language and HID sections also start unindented but their
        // keys are not four hex digits
        if (splitEntry(line, id, name)) {
            vendors[id] = name;
            currentVendor = id;
        } else {
            currentVendor.clear();
        }
    }
}

std::string UsbIdDatabase::vendorName(const std::string& vendorId) const {
    auto it = vendors.find(vendorId);
    return it != vendors.end() ? it->second : std::string();
}

std::string UsbIdDatabase::productName(const std::string& vendorId, const std::string& productId) const {
    auto vendor = products.find(vendorId);
    if (vendor == products.end()) return {};
    auto it = vendor->second.find(productId);
    return it != vendor->second.end() ? it->second : std::string();
}

}
