#pragma once
#include <hubscope/Types.hpp>
#include <chrono>
#include <memory>
#include <string>
#include <vector>

namespace hubscope {

enum class LearningState {
    Idle,
    Armed,
    Completed
};

struct Disappearance {
    std::string address;
    std::chrono::system_clock::time_point timestamp;
};

struct LearningDevice {
    std::string address;
    std::string name;
    DeviceClass deviceClass{DeviceClass::Unknown};
};

struct LearningStartResult {
    bool started{false};
    int errorCode{0};
    std::string message;
    std::vector<std::string> baseline;
    std::vector<LearningDevice> storageDevices;   // may lose data when unplugged
};

struct LearningResult {
    bool detected{false};
    int errorCode{0};                             // NO_GROUP_DETECTED is informational
    std::vector<std::string> members;
    std::vector<LearningDevice> devices;
    std::vector<std::string> skippedExisting;
    bool hasStorage{false};
    std::chrono::system_clock::time_point firstDisappearance{};
    size_t observed{0};
};

// Confirms a physical grouping from a burst of correlated disconnects. Only
// one session may be armed; callers serialize start/observe/stop on the
// topology writer context.
class LearningSession {
public:
    explicit LearningSession(std::chrono::milliseconds window);
    ~LearningSession();

    LearningState state() const;
    bool isArmed() const;
    void setWindow(std::chrono::milliseconds window);
    std::chrono::milliseconds window() const;

    // Hubs already in a confirmed group stay out of the baseline.
    LearningStartResult start(const TopologySnapshot& snapshot,
                              const std::vector<PhysicalGroup>& confirmed);

    void observe(const TopologyEvent& event);

    // The detection stop() would report, leaving the session armed.
    LearningResult preview() const;

    // Computes the detection and returns the session to Idle.
    LearningResult stop();
    void cancel();

    const std::vector<Disappearance>& disappearances() const;
    std::vector<std::string> baseline() const;

private:
    class Private;
    std::unique_ptr<Private> d;
};

}
