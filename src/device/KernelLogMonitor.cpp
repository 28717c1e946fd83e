#include "KernelLogMonitor.hpp"
#include "../core/Logger.hpp"
#include <hubscope/Constants.hpp>
#include <QProcess>
#include <QRegularExpression>
#include <QStringList>
#include <QTimer>
#include <algorithm>
#include <set>

namespace hubscope {

namespace {

struct LinePattern {
    QRegularExpression regex;
    const char* description;
};

const std::vector<LinePattern>& linePatterns() {
    static const std::vector<LinePattern> patterns = {
        {QRegularExpression(R"(usb (\d+-[\d.]+): device descriptor read.*, error (-?\d+))"),
         "Device descriptor read failed"},
        {QRegularExpression(R"(usb (\d+-[\d.]+): device not accepting address .*, error (-?\d+))"),
         "Device not accepting address"},
        {QRegularExpression(R"(usb (\d+-[\d.]+): USB disconnect, device number (\d+))"),
         "Device disconnected"},
        {QRegularExpression(R"(usb (\d+-[\d.]+): can't .*, error (-?\d+))"),
         "Device error"},

        {QRegularExpression(R"(usb (usb\d+-port\d+): disabled by hub \(EMI\?\))"),
         "Port disabled (possible EMI)"},
        {QRegularExpression(R"(usb (usb\d+-port\d+): cannot reset)"),
         "Port cannot reset"},
        {QRegularExpression(R"(usb (usb\d+-port\d+): unable to enumerate USB device)"),
         "Cannot enumerate device"},
        {QRegularExpression(R"(usb (usb\d+-port\d+): attempt power cycle)"),
         "Power cycle attempted"},
        {QRegularExpression(R"(usb (usb\d+-port\d+): connect-debounce failed)"),
         "Connect debounce failed"},

        {QRegularExpression(R"(usb (\d+-[\d.]+)-port(\d+): disabled by hub)"),
         "Port disabled by hub"},
        {QRegularExpression(R"(usb (\d+-[\d.]+)-port(\d+): cannot)"),
         "Port error"},

        {QRegularExpression(R"(usb (\d+-[\d.]+): over-current)"),
         "Over-current detected"},
        {QRegularExpression(R"(usb (\d+-[\d.]+): reset.*failed)"),
         "Reset failed"}
    };
    return patterns;
}

// "usb5-port1" -> "5-1"
std::string normalizeAddress(const QString& address) {
    static const QRegularExpression portForm(R"(^usb(\d+)-port(\d+)$)");
    QRegularExpressionMatch match = portForm.match(address);
    if (match.hasMatch()) {
        return (match.captured(1) + "-" + match.captured(2)).toStdString();
    }
    return address.toStdString();
}

}

std::string KernelLogEntry::formatted() const {
    return "[" + KernelLogParser::severityName(severity) + "] " + description;
}

std::string KernelLogParser::severityName(KernelLogSeverity severity) {
    switch (severity) {
        case KernelLogSeverity::Info: return "INFO";
        case KernelLogSeverity::Warning: return "WARNING";
        case KernelLogSeverity::Error: return "ERROR";
    }
    return "ERROR";
}

std::optional<KernelLogEntry> KernelLogParser::parseLine(const std::string& line) {
    QString text = QString::fromStdString(line);
    QString lower = text.toLower();
    if (!lower.contains("usb")) {
        return std::nullopt;
    }

    for (const auto& pattern : linePatterns()) {
        QRegularExpressionMatch match = pattern.regex.match(text);
        if (!match.hasMatch()) continue;

        KernelLogEntry entry;
        entry.address = normalizeAddress(match.captured(1));
        entry.description = pattern.description;
        entry.rawLine = text.trimmed().toStdString();
        entry.timestamp = std::chrono::system_clock::now();

        if (lower.contains("disconnect")) {
            entry.severity = KernelLogSeverity::Info;
        } else if (lower.contains("warning")) {
            entry.severity = KernelLogSeverity::Warning;
        } else {
            entry.severity = KernelLogSeverity::Error;
        }
        return entry;
    }
    return std::nullopt;
}

class KernelLogMonitor::Private {
public:
    QTimer* timer{nullptr};
    QProcess* process{nullptr};
    int lineCount{KERNEL_LOG_LINES};
    bool isoTimestamps{true};
    std::vector<KernelLogEntry> history;
    std::set<std::string> seen;
};

KernelLogMonitor::KernelLogMonitor(QObject* parent)
    : QObject(parent)
    , d(std::make_unique<Private>()) {
    d->timer = new QTimer(this);
    d->timer->setInterval(KERNEL_LOG_INTERVAL);
    connect(d->timer, &QTimer::timeout, this, &KernelLogMonitor::poll);

    d->process = new QProcess(this);
    connect(d->process, qOverload<int, QProcess::ExitStatus>(&QProcess::finished),
            this, [this](int exitCode, QProcess::ExitStatus status) {
        if (status != QProcess::NormalExit || exitCode != 0) {
            if (d->isoTimestamps) {
                LOG_DEBUG("dmesg --time-format=iso failed, retrying without it");
                d->isoTimestamps = false;
            } else {
                LOG_WARNING("dmesg exited with code " + std::to_string(exitCode));
            }
            return;
        }
        processOutput(QString::fromLocal8Bit(d->process->readAllStandardOutput()));
    });
    connect(d->process, &QProcess::errorOccurred, this, [this](QProcess::ProcessError error) {
        if (error == QProcess::FailedToStart) {
            LOG_ERROR("Cannot run dmesg, kernel log monitoring disabled");
            emit monitorError("Cannot run dmesg");
            stop();
        }
    });
}

KernelLogMonitor::~KernelLogMonitor() {
    stop();
}

void KernelLogMonitor::setInterval(int milliseconds) {
    d->timer->setInterval(milliseconds);
}

void KernelLogMonitor::setLineCount(int lines) {
    d->lineCount = lines;
}

void KernelLogMonitor::start() {
    if (d->timer->isActive()) return;
    LOG_INFO("Kernel log monitoring started");
    poll();
    d->timer->start();
}

void KernelLogMonitor::stop() {
    if (!d->timer->isActive()) return;
    d->timer->stop();
    if (d->process->state() != QProcess::NotRunning) {
        d->process->kill();
        d->process->waitForFinished(1000);
    }
    LOG_INFO("Kernel log monitoring stopped");
}

bool KernelLogMonitor::isRunning() const {
    return d->timer->isActive();
}

void KernelLogMonitor::poll() {
    if (d->process->state() != QProcess::NotRunning) {
        return;
    }
    QStringList arguments;
    if (d->isoTimestamps) {
        arguments << "--time-format=iso";
    }
    d->process->start("dmesg", arguments);
}

void KernelLogMonitor::processOutput(const QString& output) {
    QStringList lines = output.split('\n', Qt::SkipEmptyParts);
    int first = std::max(0, static_cast<int>(lines.size()) - d->lineCount);

    for (int i = first; i < lines.size(); ++i) {
        auto entry = KernelLogParser::parseLine(lines[i].toStdString());
        if (!entry || d->seen.count(entry->rawLine)) {
            continue;
        }

        d->seen.insert(entry->rawLine);
        d->history.push_back(*entry);
        LOG_DEBUG("Kernel log: " + entry->address + " " + entry->formatted());

        if (entry->severity != KernelLogSeverity::Info) {
            emit errorDetected(entry->address, entry->formatted());
        }
    }

    if (d->history.size() > HISTORY_LIMIT) {
        d->history.erase(d->history.begin(), d->history.end() - static_cast<std::ptrdiff_t>(HISTORY_KEEP));
        d->seen.clear();
        for (const auto& entry : d->history) {
            d->seen.insert(entry.rawLine);
        }
    }
}

std::vector<KernelLogEntry> KernelLogMonitor::cachedErrors() const {
    return d->history;
}

}
