#pragma once
#include <QObject>
#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace hubscope {

enum class KernelLogSeverity {
    Info,
    Warning,
    Error
};

struct KernelLogEntry {
    std::string address;        // normalized, "usb5-port1" becomes "5-1"
    std::string description;
    std::string rawLine;
    KernelLogSeverity severity{KernelLogSeverity::Error};
    std::chrono::system_clock::time_point timestamp{};

    // "[ERROR] Device descriptor read failed"
    std::string formatted() const;
};

class KernelLogParser {
public:
    static std::optional<KernelLogEntry> parseLine(const std::string& line);
    static std::string severityName(KernelLogSeverity severity);
};

// Polls the kernel ring buffer for bus errors and reports each new line once.
class KernelLogMonitor : public QObject {
    Q_OBJECT

public:
    static constexpr size_t HISTORY_LIMIT = 500;
    static constexpr size_t HISTORY_KEEP = 200;

    explicit KernelLogMonitor(QObject* parent = nullptr);
    ~KernelLogMonitor();

    void setInterval(int milliseconds);
    void setLineCount(int lines);

    void start();
    void stop();
    bool isRunning() const;

    // Feeds dmesg output; exposed so tests can script the log.
    void processOutput(const QString& output);

    std::vector<KernelLogEntry> cachedErrors() const;

signals:
    // Informational lines (disconnects) are cached but not signalled.
    void errorDetected(const std::string& address, const std::string& message);
    void monitorError(const std::string& message);

private slots:
    void poll();

private:
    class Private;
    std::unique_ptr<Private> d;
};

}
