#pragma once

namespace hubscope {

constexpr int DEFAULT_HTTP_PORT = 8080;
constexpr int DEFAULT_WS_PORT = 8081;

constexpr int DEBOUNCE_WINDOW = 300;        // ms
constexpr int LEARNING_WINDOW = 2000;       // ms
constexpr int RESCAN_SETTLE_INTERVAL = 50;  // ms
constexpr int POLLING_INTERVAL = 1000;      // ms
constexpr int KERNEL_LOG_INTERVAL = 2000;   // ms
constexpr int KERNEL_LOG_LINES = 200;
constexpr int RESET_DELAY = 500;            // ms

constexpr int SUBSCRIBER_QUEUE_CAPACITY = 256;
constexpr int MAX_STRING_LENGTH = 256;

namespace ErrorCodes {
    constexpr int SUCCESS = 0;
    constexpr int DEVICE_NOT_FOUND = -1;
    constexpr int ACCESS_DENIED = -2;
    constexpr int INVALID_PARAM = -3;
    constexpr int IO_ERROR = -4;
    constexpr int SYSTEM_ERROR = -7;
    constexpr int BUSY = -8;
    constexpr int NOT_SUPPORTED = -9;
    constexpr int TIMEOUT = -10;

    constexpr int ORPHAN_RECORD = -20;
    constexpr int ALREADY_ARMED = -21;
    constexpr int NOT_ARMED = -22;
    constexpr int NO_GROUP_DETECTED = -23;
    constexpr int RESET_FAILED = -24;
    constexpr int GROUP_NOT_FOUND = -25;
    constexpr int GROUP_EXISTS = -26;
}

}
