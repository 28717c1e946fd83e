// syslog.h claims the LOG_* names used by our logging macros; capture the
// priorities first and release the names before Logger.hpp defines them.
#include <syslog.h>

namespace {
constexpr int kSyslogDebug = LOG_DEBUG;
constexpr int kSyslogInfo = LOG_INFO;
constexpr int kSyslogWarning = LOG_WARNING;
constexpr int kSyslogError = LOG_ERR;
constexpr int kSyslogCritical = LOG_CRIT;
}

#undef LOG_DEBUG
#undef LOG_INFO
#undef LOG_WARNING

#include "Logger.hpp"
#include <QString>
#include <chrono>
#include <deque>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>

namespace hubscope {

struct LogEntry {
    std::chrono::system_clock::time_point timestamp;
    LogLevel level;
    std::string text;   // already formatted
};

class Logger::Private {
public:
    LogLevel currentLevel{LogLevel::Info};
    LogDestination destination{LogDestination::Console};
    std::string logFile;
    size_t maxFileSize{10 * 1024 * 1024};
    bool includeSourceInfo{true};

    std::deque<LogEntry> recent;
    size_t maxRecent{1000};
    mutable std::mutex logMutex;
    std::unique_ptr<std::ofstream> fileStream;

    void openLogFile() {
        if (!logFile.empty()) {
            fileStream = std::make_unique<std::ofstream>(logFile, std::ios::app);
        }
    }

    void closeLogFile() {
        if (fileStream) {
            fileStream->close();
            fileStream.reset();
        }
    }

    void writeToFile(const std::string& line) {
        if (!fileStream || !fileStream->is_open()) {
            openLogFile();
        }
        if (fileStream && fileStream->is_open()) {
            (*fileStream) << line << '\n';
            fileStream->flush();
        }
    }

    static int syslogPriority(LogLevel level) {
        switch (level) {
            case LogLevel::Debug:    return kSyslogDebug;
            case LogLevel::Info:     return kSyslogInfo;
            case LogLevel::Warning:  return kSyslogWarning;
            case LogLevel::Error:    return kSyslogError;
            case LogLevel::Critical: return kSyslogCritical;
        }
        return kSyslogInfo;
    }

    // Returns the rotated file name, empty if no rotation happened.
    std::string rotateIfNeeded() {
        std::error_code ec;
        if (logFile.empty() || !std::filesystem::exists(logFile, ec)) {
            return {};
        }
        auto size = std::filesystem::file_size(logFile, ec);
        if (ec || size < maxFileSize) {
            return {};
        }

        closeLogFile();
        auto now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
        std::stringstream ss;
        ss << logFile << "." << std::put_time(std::localtime(&now), "%Y%m%d_%H%M%S");
        std::string rotated = ss.str();

        std::filesystem::rename(logFile, rotated, ec);
        openLogFile();
        if (ec) {
            std::cerr << "Failed to rotate log file: " << ec.message() << std::endl;
            return {};
        }
        return rotated;
    }

    std::string format(LogLevel level,
                       const std::string& message,
                       const std::string& source,
                       const std::string& function,
                       std::chrono::system_clock::time_point when) const {
        auto time = std::chrono::system_clock::to_time_t(when);
        std::stringstream ss;
        ss << std::put_time(std::localtime(&time), "%Y-%m-%d %H:%M:%S")
           << " [" << levelString(level) << "] ";

        if (includeSourceInfo && !source.empty()) {
            ss << std::filesystem::path(source).filename().string();
            if (!function.empty()) {
                ss << ":" << function;
            }
            ss << " - ";
        }
        ss << message;
        return ss.str();
    }

    static const char* levelString(LogLevel level) {
        switch (level) {
            case LogLevel::Debug:    return "DEBUG";
            case LogLevel::Info:     return "INFO";
            case LogLevel::Warning:  return "WARNING";
            case LogLevel::Error:    return "ERROR";
            case LogLevel::Critical: return "CRITICAL";
        }
        return "UNKNOWN";
    }
};

Logger& Logger::instance() {
    static Logger instance;
    return instance;
}

Logger::Logger()
    : d(std::make_unique<Private>()) {
}

Logger::~Logger() = default;

void Logger::setLogLevel(LogLevel level) {
    std::lock_guard<std::mutex> lock(d->logMutex);
    d->currentLevel = level;
}

LogLevel Logger::logLevel() const {
    std::lock_guard<std::mutex> lock(d->logMutex);
    return d->currentLevel;
}

void Logger::setLogDestination(LogDestination dest) {
    std::lock_guard<std::mutex> lock(d->logMutex);
    d->destination = dest;
}

void Logger::setLogFile(const std::string& filename) {
    std::lock_guard<std::mutex> lock(d->logMutex);
    d->closeLogFile();
    d->logFile = filename;
    d->openLogFile();
}

void Logger::setMaxFileSize(size_t bytes) {
    std::lock_guard<std::mutex> lock(d->logMutex);
    d->maxFileSize = bytes;
}

void Logger::enableSourceInfo(bool enable) {
    std::lock_guard<std::mutex> lock(d->logMutex);
    d->includeSourceInfo = enable;
}

LogLevel Logger::levelFromVerbosity(int verbosity) {
    switch (verbosity) {
        case 0: return LogLevel::Debug;
        case 1: return LogLevel::Info;
        case 2: return LogLevel::Warning;
        case 3: return LogLevel::Error;
        case 4: return LogLevel::Critical;
        default: return LogLevel::Info;
    }
}

void Logger::debug(const std::string& message,
                  const std::string& source,
                  const std::string& function) {
    log(LogLevel::Debug, message, source, function);
}

void Logger::info(const std::string& message,
                 const std::string& source,
                 const std::string& function) {
    log(LogLevel::Info, message, source, function);
}

void Logger::warning(const std::string& message,
                    const std::string& source,
                    const std::string& function) {
    log(LogLevel::Warning, message, source, function);
}

void Logger::error(const std::string& message,
                  const std::string& source,
                  const std::string& function) {
    log(LogLevel::Error, message, source, function);
}

void Logger::critical(const std::string& message,
                     const std::string& source,
                     const std::string& function) {
    log(LogLevel::Critical, message, source, function);
}

void Logger::log(LogLevel level,
                const std::string& message,
                const std::string& source,
                const std::string& function) {
    std::lock_guard<std::mutex> lock(d->logMutex);
    if (level < d->currentLevel) {
        return;
    }

    auto now = std::chrono::system_clock::now();
    std::string line = d->format(level, message, source, function, now);

    d->recent.push_back({now, level, line});
    while (d->recent.size() > d->maxRecent) {
        d->recent.pop_front();
    }

    bool all = d->destination == LogDestination::All;
    if (all || d->destination == LogDestination::Console) {
        std::clog << line << std::endl;
    }
    if (all || d->destination == LogDestination::File) {
        std::string rotated = d->rotateIfNeeded();
        if (!rotated.empty()) {
            d->writeToFile(d->format(LogLevel::Info, "Previous log moved to " + rotated, "", "", now));
        }
        d->writeToFile(line);
    }
    if (all || d->destination == LogDestination::System) {
        syslog(Private::syslogPriority(level), "%s", line.c_str());
    }
}

void Logger::flush() {
    std::lock_guard<std::mutex> lock(d->logMutex);
    if (d->fileStream) {
        d->fileStream->flush();
    }
}

std::vector<std::string> Logger::recentLogs(size_t count) const {
    std::vector<std::string> result;
    std::lock_guard<std::mutex> lock(d->logMutex);

    size_t start = (count >= d->recent.size()) ? 0 : d->recent.size() - count;
    for (size_t i = start; i < d->recent.size(); ++i) {
        result.push_back(d->recent[i].text);
    }
    return result;
}

} // namespace hubscope
