#include "core/Logger.hpp"
#include "core/TopologyService.hpp"
#include "device/KernelLogMonitor.hpp"
#include "device/UsbEnumerator.hpp"
#include "device/UsbIdDatabase.hpp"
#include "server/ApiServer.hpp"
#include "server/PushServer.hpp"
#include "utils/ConfigManager.hpp"
#include "utils/LabelStore.hpp"
#include <hubscope/Constants.hpp>
#include <QCoreApplication>
#include <QCommandLineParser>
#include <QCommandLineOption>
#include <QDir>
#include <QFile>
#include <QHostAddress>
#include <chrono>
#include <iostream>

using namespace hubscope;

void setupCommandLineParser(QCommandLineParser& parser) {
    parser.setApplicationDescription("USB topology and hub grouping service");
    parser.addHelpOption();
    parser.addVersionOption();

    parser.addOption(QCommandLineOption(
        QStringList() << "c" << "config",
        "Specify configuration file path.",
        "config"));

    parser.addOption(QCommandLineOption(
        QStringList() << "l" << "log-file",
        "Specify log file path.",
        "log-file"));

    parser.addOption(QCommandLineOption(
        QStringList() << "v" << "verbosity",
        "Set log level (0-4: debug, info, warning, error, critical).",
        "level",
        "1"));

    parser.addOption(QCommandLineOption(
        QStringList() << "host",
        "Address to listen on.",
        "host"));

    parser.addOption(QCommandLineOption(
        QStringList() << "p" << "port",
        "HTTP API port.",
        "port"));

    parser.addOption(QCommandLineOption(
        QStringList() << "ws-port",
        "WebSocket push port.",
        "port"));

    parser.addOption(QCommandLineOption(
        QStringList() << "labels",
        "Label store path.",
        "path"));
}

void initializeLogger(const QCommandLineParser& parser, const ConfigManager& config) {
    auto& logger = Logger::instance();

    std::string logFile = parser.isSet("log-file")
        ? parser.value("log-file").toStdString()
        : config.getString(ConfigKeys::LOG_FILE);
    if (!logFile.empty()) {
        logger.setLogFile(logFile);
        logger.setLogDestination(LogDestination::All);
    }

    int verbosity = parser.isSet("verbosity")
        ? parser.value("verbosity").toInt()
        : config.getInt(ConfigKeys::LOG_LEVEL, 1);
    logger.setLogLevel(Logger::levelFromVerbosity(verbosity));
}

bool loadConfiguration(ConfigManager& config, const QCommandLineParser& parser) {
    QString configPath;

    if (parser.isSet("config")) {
        configPath = parser.value("config");
    } else {
        QStringList configLocations = {
            QDir::currentPath() + "/config.json",
            QDir::homePath() + "/.config/hubscope/config.json",
            "/etc/hubscope/config.json"
        };

        for (const auto& path : configLocations) {
            if (QFile::exists(path)) {
                configPath = path;
                break;
            }
        }
    }

    if (!configPath.isEmpty()) {
        if (!config.loadFromFile(configPath.toStdString())) {
            std::cerr << "Failed to load configuration from " << configPath.toStdString() << std::endl;
            return false;
        }
        return true;
    }

    return true;
}

int main(int argc, char *argv[]) {
    try {
        QCoreApplication app(argc, argv);
        app.setApplicationName("hubscope");
        app.setApplicationVersion("1.0.0");

        QCommandLineParser parser;
        setupCommandLineParser(parser);
        parser.process(app);

        ConfigManager config;
        if (!loadConfiguration(config, parser)) {
            return 1;
        }
        initializeLogger(parser, config);
        LOG_INFO("hubscope starting...");

        auto usbIds = std::make_shared<UsbIdDatabase>();
        if (!usbIds->load()) {
            LOG_WARNING("usb.ids not found, vendor and product names will be missing");
        }

        UsbEnumerator enumerator;
        enumerator.setUsbIdDatabase(usbIds);
        enumerator.setPollInterval(config.getInt(ConfigKeys::POLL_INTERVAL_MS, POLLING_INTERVAL));
        enumerator.setResetDelay(config.getInt(ConfigKeys::RESET_DELAY_MS, RESET_DELAY));

        std::string labelPath = parser.isSet("labels")
            ? parser.value("labels").toStdString()
            : config.getString(ConfigKeys::LABEL_STORE_PATH);
        if (labelPath.empty()) {
            labelPath = (QDir::homePath() + "/.config/hubscope/labels.json").toStdString();
        }
        LabelStore labels(labelPath);
        if (!labels.load()) {
            LOG_WARNING("Could not read labels from " + labelPath + ", starting empty");
        }

        TopologyService service(&enumerator, &labels);
        service.setDebounceWindow(std::chrono::milliseconds(
            config.getInt(ConfigKeys::DEBOUNCE_WINDOW_MS, DEBOUNCE_WINDOW)));
        service.setLearningWindow(std::chrono::milliseconds(
            config.getInt(ConfigKeys::LEARNING_WINDOW_MS, LEARNING_WINDOW)));
        service.setRescanSettle(config.getInt(ConfigKeys::RESCAN_SETTLE_MS, RESCAN_SETTLE_INTERVAL));
        service.setQueueCapacity(static_cast<size_t>(
            config.getInt(ConfigKeys::SUBSCRIBER_QUEUE_CAPACITY, SUBSCRIBER_QUEUE_CAPACITY)));

        KernelLogMonitor kernelLog;
        kernelLog.setInterval(config.getInt(ConfigKeys::KERNEL_LOG_POLL_MS, KERNEL_LOG_INTERVAL));
        kernelLog.setLineCount(config.getInt(ConfigKeys::KERNEL_LOG_LINES, KERNEL_LOG_LINES));
        QObject::connect(&kernelLog, &KernelLogMonitor::errorDetected, &service,
                         &TopologyService::reportError);

        if (!service.start()) {
            LOG_CRITICAL("Device enumeration could not be started");
            return 1;
        }
        kernelLog.start();

        QString hostValue = parser.isSet("host")
            ? parser.value("host")
            : QString::fromStdString(config.getString(ConfigKeys::HOST, "0.0.0.0"));
        QHostAddress host(hostValue);
        if (host.isNull()) {
            LOG_CRITICAL("Invalid listen address " + hostValue.toStdString());
            return 1;
        }
        int httpPort = parser.isSet("port")
            ? parser.value("port").toInt()
            : config.getInt(ConfigKeys::HTTP_PORT, DEFAULT_HTTP_PORT);
        int wsPort = parser.isSet("ws-port")
            ? parser.value("ws-port").toInt()
            : config.getInt(ConfigKeys::WS_PORT, DEFAULT_WS_PORT);

        PushServer push(&service);
        if (!push.listen(host, static_cast<quint16>(wsPort))) {
            return 1;
        }

        ApiServer api(&service, &labels);
        api.setKernelLogMonitor(&kernelLog);
        api.setPushServer(&push);
        if (!api.listen(host, static_cast<quint16>(httpPort))) {
            return 1;
        }

        QObject::connect(&app, &QCoreApplication::aboutToQuit, [&]() {
            kernelLog.stop();
            push.close();
            service.stop();
            LOG_INFO("hubscope stopped");
            Logger::instance().flush();
        });

        LOG_INFO("hubscope initialized successfully");

        return app.exec();

    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << std::endl;
        LOG_CRITICAL("Fatal error: " + std::string(e.what()));
        return 1;
    }
}
