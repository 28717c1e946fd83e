#include <gtest/gtest.h>
#include "KernelLogMonitor.hpp"
#include "TestRecords.hpp"

namespace hubscope {
namespace testing {

TEST(KernelLogParserTest, DescriptorReadFailure) {
    auto entry = KernelLogParser::parseLine(
        "[ 1234.567890] usb 1-1.2: device descriptor read/64, error -71");
    ASSERT_TRUE(entry.has_value());
    EXPECT_EQ(entry->address, "1-1.2");
    EXPECT_EQ(entry->description, "Device descriptor read failed");
    EXPECT_EQ(entry->severity, KernelLogSeverity::Error);
    EXPECT_EQ(entry->formatted(), "[ERROR] Device descriptor read failed");
}

TEST(KernelLogParserTest, RootPortFormIsNormalized) {
    auto entry = KernelLogParser::parseLine(
        "usb usb3-port2: disabled by hub (EMI?), re-enabling...");
    ASSERT_TRUE(entry.has_value());
    EXPECT_EQ(entry->address, "3-2");
    EXPECT_EQ(entry->description, "Port disabled (possible EMI)");
}

TEST(KernelLogParserTest, HubPortErrorAppliesToHub) {
    auto entry = KernelLogParser::parseLine("usb 1-1.4-port3: cannot disable (err = -32)");
    ASSERT_TRUE(entry.has_value());
    EXPECT_EQ(entry->address, "1-1.4");
    EXPECT_EQ(entry->description, "Port error");
}

TEST(KernelLogParserTest, DisconnectIsInformational) {
    auto entry = KernelLogParser::parseLine("usb 2-1: USB disconnect, device number 7");
    ASSERT_TRUE(entry.has_value());
    EXPECT_EQ(entry->severity, KernelLogSeverity::Info);
    EXPECT_EQ(entry->formatted(), "[INFO] Device disconnected");
}

TEST(KernelLogParserTest, UnrelatedLinesAreIgnored) {
    EXPECT_FALSE(KernelLogParser::parseLine("EXT4-fs (sda1): mounted filesystem").has_value());
    EXPECT_FALSE(KernelLogParser::parseLine("usb 1-1: new high-speed USB device number 3").has_value());
}

class KernelLogMonitorTest : public QtTest {};

TEST_F(KernelLogMonitorTest, ReportsEachErrorLineOnce) {
    KernelLogMonitor monitor;
    std::vector<std::pair<std::string, std::string>> reported;
    QObject::connect(&monitor, &KernelLogMonitor::errorDetected,
        [&reported](const std::string& address, const std::string& message) {
            reported.emplace_back(address, message);
        });

    QString log =
        "[ 10.0] usb 1-1.2: device descriptor read/64, error -71\n"
        "[ 11.0] usb 2-1: USB disconnect, device number 7\n"
        "[ 12.0] usb 1-3: over-current condition\n";
    monitor.processOutput(log);
    monitor.processOutput(log);

    ASSERT_EQ(reported.size(), 2u);
    EXPECT_EQ(reported[0].first, "1-1.2");
    EXPECT_EQ(reported[1].first, "1-3");
    EXPECT_EQ(reported[1].second, "[ERROR] Over-current detected");

    // The disconnect is cached even though it is not reported
    EXPECT_EQ(monitor.cachedErrors().size(), 3u);
}

TEST_F(KernelLogMonitorTest, OnlyTheLastLinesAreScanned) {
    KernelLogMonitor monitor;
    monitor.setLineCount(1);
    monitor.processOutput(
        "usb 1-1: device descriptor read/64, error -71\n"
        "usb 1-2: device descriptor read/64, error -71\n");

    auto cached = monitor.cachedErrors();
    ASSERT_EQ(cached.size(), 1u);
    EXPECT_EQ(cached[0].address, "1-2");
}

TEST_F(KernelLogMonitorTest, HistoryIsBounded) {
    KernelLogMonitor monitor;
    monitor.setLineCount(1000);

    QString log;
    for (size_t i = 0; i <= KernelLogMonitor::HISTORY_LIMIT; ++i) {
        log += QString("[%1] usb 1-1: device descriptor read/64, error -71\n").arg(i);
    }
    monitor.processOutput(log);

    EXPECT_EQ(monitor.cachedErrors().size(), KernelLogMonitor::HISTORY_KEEP);
}

} // namespace testing
} // namespace hubscope
