#include "ConfigManager.hpp"
#include "../core/Logger.hpp"
#include <hubscope/Constants.hpp>
#include <QFile>
#include <QJsonDocument>
#include <QJsonObject>
#include <QJsonParseError>
#include <QJsonValue>
#include <cmath>

namespace hubscope {

template<class... Ts>
struct overloaded : Ts... {
    using Ts::operator()...;
};
template<class... Ts>
overloaded(Ts...) -> overloaded<Ts...>;

class ConfigManager::Private {
public:
    std::map<std::string, ConfigValue> settings;

    QJsonValue toJsonValue(const ConfigValue& value) const {
        return std::visit(overloaded{
            [](bool b) -> QJsonValue { return b; },
            [](int i) -> QJsonValue { return i; },
            [](double v) -> QJsonValue { return v; },
            [](const std::string& s) -> QJsonValue { return QString::fromStdString(s); }
        }, value);
    }

    bool fromJsonValue(const QJsonValue& json, ConfigValue& out) const {
        switch (json.type()) {
            case QJsonValue::Bool:
                out = json.toBool();
                return true;
            case QJsonValue::Double: {
                double v = json.toDouble();
                if (std::floor(v) == v && std::abs(v) < 2147483647.0) {
                    out = static_cast<int>(v);
                } else {
                    out = v;
                }
                return true;
            }
            case QJsonValue::String:
                out = json.toString().toStdString();
                return true;
            default:
                return false;
        }
    }

    void setDefaults() {
        settings = {
            {ConfigKeys::HOST, std::string("0.0.0.0")},
            {ConfigKeys::HTTP_PORT, DEFAULT_HTTP_PORT},
            {ConfigKeys::WS_PORT, DEFAULT_WS_PORT},
            {ConfigKeys::DEBOUNCE_WINDOW_MS, DEBOUNCE_WINDOW},
            {ConfigKeys::LEARNING_WINDOW_MS, LEARNING_WINDOW},
            {ConfigKeys::SUBSCRIBER_QUEUE_CAPACITY, SUBSCRIBER_QUEUE_CAPACITY},
            {ConfigKeys::RESCAN_SETTLE_MS, RESCAN_SETTLE_INTERVAL},
            {ConfigKeys::POLL_INTERVAL_MS, POLLING_INTERVAL},
            {ConfigKeys::KERNEL_LOG_POLL_MS, KERNEL_LOG_INTERVAL},
            {ConfigKeys::KERNEL_LOG_LINES, KERNEL_LOG_LINES},
            {ConfigKeys::RESET_DELAY_MS, RESET_DELAY},
            {ConfigKeys::LABEL_STORE_PATH, std::string()},
            {ConfigKeys::LOG_LEVEL, 1},
            {ConfigKeys::LOG_FILE, std::string()}
        };
    }
};

ConfigManager::ConfigManager(QObject* parent)
    : QObject(parent)
    , d(std::make_unique<Private>()) {
    d->setDefaults();
}

ConfigManager::~ConfigManager() = default;

bool ConfigManager::getBool(const std::string& key, bool defaultValue) const {
    auto it = d->settings.find(key);
    if (it != d->settings.end() && std::holds_alternative<bool>(it->second)) {
        return std::get<bool>(it->second);
    }
    return defaultValue;
}

int ConfigManager::getInt(const std::string& key, int defaultValue) const {
    auto it = d->settings.find(key);
    if (it != d->settings.end()) {
        if (std::holds_alternative<int>(it->second)) {
            return std::get<int>(it->second);
        }
        if (std::holds_alternative<double>(it->second)) {
            return static_cast<int>(std::get<double>(it->second));
        }
    }
    return defaultValue;
}

double ConfigManager::getDouble(const std::string& key, double defaultValue) const {
    auto it = d->settings.find(key);
    if (it != d->settings.end()) {
        if (std::holds_alternative<double>(it->second)) {
            return std::get<double>(it->second);
        }
        if (std::holds_alternative<int>(it->second)) {
            return std::get<int>(it->second);
        }
    }
    return defaultValue;
}

std::string ConfigManager::getString(const std::string& key, const std::string& defaultValue) const {
    auto it = d->settings.find(key);
    if (it != d->settings.end() && std::holds_alternative<std::string>(it->second)) {
        return std::get<std::string>(it->second);
    }
    return defaultValue;
}

void ConfigManager::setBool(const std::string& key, bool value) {
    d->settings[key] = value;
    emit configChanged(key);
}

void ConfigManager::setInt(const std::string& key, int value) {
    d->settings[key] = value;
    emit configChanged(key);
}

void ConfigManager::setDouble(const std::string& key, double value) {
    d->settings[key] = value;
    emit configChanged(key);
}

void ConfigManager::setString(const std::string& key, const std::string& value) {
    d->settings[key] = value;
    emit configChanged(key);
}

bool ConfigManager::contains(const std::string& key) const {
    return d->settings.count(key) > 0;
}

std::map<std::string, ConfigValue> ConfigManager::values() const {
    return d->settings;
}

bool ConfigManager::loadFromFile(const std::string& filename) {
    QFile file(QString::fromStdString(filename));
    if (!file.open(QIODevice::ReadOnly)) {
        LOG_WARNING("Cannot open config file " + filename);
        return false;
    }

    QJsonParseError parseError;
    QJsonDocument doc = QJsonDocument::fromJson(file.readAll(), &parseError);
    if (doc.isNull() || !doc.isObject()) {
        LOG_WARNING("Invalid config file " + filename + ": " +
                    parseError.errorString().toStdString());
        return false;
    }

    QJsonObject globals = doc.object()["global"].toObject();
    for (auto it = globals.begin(); it != globals.end(); ++it) {
        std::string key = it.key().toStdString();
        ConfigValue value;
        if (!d->fromJsonValue(it.value(), value)) {
            LOG_WARNING("Ignoring config key " + key + " with unsupported type");
            continue;
        }
        d->settings[key] = value;
        emit configChanged(key);
    }

    return true;
}

bool ConfigManager::saveToFile(const std::string& filename) const {
    QJsonObject globals;
    for (const auto& [key, value] : d->settings) {
        globals[QString::fromStdString(key)] = d->toJsonValue(value);
    }
    QJsonObject root;
    root["global"] = globals;

    QFile file(QString::fromStdString(filename));
    if (!file.open(QIODevice::WriteOnly)) {
        LOG_ERROR("Cannot write config file " + filename);
        return false;
    }
    return file.write(QJsonDocument(root).toJson()) >= 0;
}

void ConfigManager::resetToDefaults() {
    d->setDefaults();
    for (const auto& [key, _] : d->settings) {
        emit configChanged(key);
    }
}

}
