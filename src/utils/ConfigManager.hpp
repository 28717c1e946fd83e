#pragma once
#include <QObject>
#include <map>
#include <memory>
#include <string>
#include <variant>

namespace hubscope {

using ConfigValue = std::variant<bool, int, double, std::string>;

namespace ConfigKeys {
    constexpr const char* HOST = "host";
    constexpr const char* HTTP_PORT = "httpPort";
    constexpr const char* WS_PORT = "wsPort";
    constexpr const char* DEBOUNCE_WINDOW_MS = "debounceWindowMs";
    constexpr const char* LEARNING_WINDOW_MS = "learningWindowMs";
    constexpr const char* SUBSCRIBER_QUEUE_CAPACITY = "subscriberQueueCapacity";
    constexpr const char* RESCAN_SETTLE_MS = "rescanSettleMs";
    constexpr const char* POLL_INTERVAL_MS = "pollIntervalMs";
    constexpr const char* KERNEL_LOG_POLL_MS = "kernelLogPollMs";
    constexpr const char* KERNEL_LOG_LINES = "kernelLogLines";
    constexpr const char* RESET_DELAY_MS = "resetDelayMs";
    constexpr const char* LABEL_STORE_PATH = "labelStorePath";
    constexpr const char* LOG_LEVEL = "logLevel";
    constexpr const char* LOG_FILE = "logFile";
}

class ConfigManager : public QObject {
    Q_OBJECT

public:
    explicit ConfigManager(QObject* parent = nullptr);
    ~ConfigManager();

    bool getBool(const std::string& key, bool defaultValue = false) const;
    int getInt(const std::string& key, int defaultValue = 0) const;
    double getDouble(const std::string& key, double defaultValue = 0.0) const;
    std::string getString(const std::string& key, const std::string& defaultValue = "") const;

    void setBool(const std::string& key, bool value);
    void setInt(const std::string& key, int value);
    void setDouble(const std::string& key, double value);
    void setString(const std::string& key, const std::string& value);

    bool contains(const std::string& key) const;
    std::map<std::string, ConfigValue> values() const;

    bool loadFromFile(const std::string& filename);
    bool saveToFile(const std::string& filename) const;

    void resetToDefaults();

signals:
    void configChanged(const std::string& key);

private:
    class Private;
    std::unique_ptr<Private> d;
};

}
