#include "ApiServer.hpp"
#include "PushServer.hpp"
#include "../core/Logger.hpp"
#include "../core/TopologyService.hpp"
#include "../device/KernelLogMonitor.hpp"
#include "../utils/JsonCodec.hpp"
#include "../utils/LabelStore.hpp"
#include <hubscope/Constants.hpp>
#include <QHttpServer>
#include <QHttpServerRequest>
#include <QHttpServerResponse>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QTcpServer>
#include <QUrl>
#include <QUrlQuery>

namespace hubscope {

namespace {

using Method = QHttpServerRequest::Method;
using StatusCode = QHttpServerResponder::StatusCode;

QHttpServerResponse failure(StatusCode status, const QString& detail) {
    return QHttpServerResponse(QJsonObject{{"detail", detail}}, status);
}

QHttpServerResponse success(QJsonObject body = {}) {
    body["success"] = true;
    return QHttpServerResponse(body);
}

// Route arguments arrive percent-encoded ("Desk%20hub", "05e3:0610%405-1")
std::string decoded(const QString& argument) {
    return QUrl::fromPercentEncoding(argument.toUtf8()).toStdString();
}

bool parseBody(const QHttpServerRequest& request, QJsonObject& body) {
    if (request.body().trimmed().isEmpty()) {
        body = {};
        return true;
    }
    QJsonDocument doc = QJsonDocument::fromJson(request.body());
    if (!doc.isObject()) {
        return false;
    }
    body = doc.object();
    return true;
}

std::vector<std::string> toStrings(const QJsonArray& array) {
    std::vector<std::string> values;
    for (const auto& value : array) {
        QString text = value.toString();
        if (!text.isEmpty()) {
            values.push_back(text.toStdString());
        }
    }
    return values;
}

}

class ApiServer::Private {
public:
    TopologyService* service{nullptr};
    LabelStore* labels{nullptr};
    KernelLogMonitor* kernelLog{nullptr};
    PushServer* push{nullptr};
    QHttpServer* http{nullptr};
    QTcpServer* tcp{nullptr};
};

ApiServer::ApiServer(TopologyService* service, LabelStore* labels, QObject* parent)
    : QObject(parent)
    , d(std::make_unique<Private>()) {
    d->service = service;
    d->labels = labels;
    d->http = new QHttpServer(this);
    setupRoutes();
}

ApiServer::~ApiServer() = default;

void ApiServer::setKernelLogMonitor(KernelLogMonitor* monitor) {
    d->kernelLog = monitor;
}

void ApiServer::setPushServer(PushServer* push) {
    d->push = push;
}

bool ApiServer::listen(const QHostAddress& address, quint16 port) {
    d->tcp = new QTcpServer(this);
    if (!d->tcp->listen(address, port)) {
        LOG_ERROR("Cannot listen for HTTP on " + address.toString().toStdString() + ":" +
                  std::to_string(port) + ": " + d->tcp->errorString().toStdString());
        delete d->tcp;
        d->tcp = nullptr;
        return false;
    }
    d->http->bind(d->tcp);
    LOG_INFO("HTTP API listening on " + address.toString().toStdString() + ":" +
             std::to_string(d->tcp->serverPort()));
    return true;
}

quint16 ApiServer::port() const {
    return d->tcp ? d->tcp->serverPort() : 0;
}

void ApiServer::setupRoutes() {
    QHttpServer* http = d->http;
    TopologyService* service = d->service;
    LabelStore* labels = d->labels;

    // Devices

    http->route("/api/devices", Method::Get, [service]() {
        return QHttpServerResponse(json::treeToJson(*service->snapshot()));
    });

    http->route("/api/device/<arg>", Method::Get, [service](const QString& address) {
        SnapshotPtr snapshot = service->snapshot();
        const DeviceRecord* record = snapshot->find(decoded(address));
        if (!record) {
            return failure(StatusCode::NotFound, "Device not found");
        }
        return QHttpServerResponse(json::deviceToJson(*record, snapshot.get()));
    });

    http->route("/api/device/<arg>/reset", Method::Post, [service](const QString& argument) {
        std::string address = decoded(argument);
        int result = service->resetDevice(address);
        if (result == ErrorCodes::DEVICE_NOT_FOUND) {
            return failure(StatusCode::NotFound, "Device not found");
        }
        if (result != ErrorCodes::SUCCESS) {
            return failure(StatusCode::InternalServerError, "Failed to reset device");
        }
        QJsonObject body{{"success", true},
                         {"status", "accepted"},
                         {"port_path", QString::fromStdString(address)}};
        return QHttpServerResponse(body, StatusCode::Accepted);
    });

    // Names and labels

    http->route("/api/names", Method::Get, [labels]() {
        QJsonObject names;
        for (const auto& [key, name] : labels->customNames()) {
            names[QString::fromStdString(key)] = QString::fromStdString(name);
        }
        return QHttpServerResponse(names);
    });

    http->route("/api/device/name", Method::Post, [service](const QHttpServerRequest& request) {
        QJsonObject body;
        if (!parseBody(request, body)) {
            return failure(StatusCode::BadRequest, "Invalid JSON body");
        }
        std::string vendorId = body.value("vendor_id").toString().toLower().toStdString();
        std::string productId = body.value("product_id").toString().toLower().toStdString();
        if (vendorId.empty() || productId.empty() || !body.contains("name")) {
            return failure(StatusCode::BadRequest, "Missing required fields");
        }
        service->setCustomName(vendorId, productId, body.value("name").toString().trimmed().toStdString());
        return success();
    });

    http->route("/api/hub-labels", Method::Get, [labels]() {
        QJsonObject result;
        for (const auto& [key, label] : labels->hubLabels()) {
            result[QString::fromStdString(key)] = QString::fromStdString(label);
        }
        return QHttpServerResponse(result);
    });

    http->route("/api/hub-labels/<arg>", Method::Get, [labels](const QString& argument) {
        std::string key = decoded(argument);
        std::string label = labels->hubLabel(key);
        QJsonObject result{{"key", QString::fromStdString(key)}};
        result["label"] = label.empty() ? QJsonValue() : QJsonValue(QString::fromStdString(label));
        return QHttpServerResponse(result);
    });

    http->route("/api/hub-labels", Method::Post, [service](const QHttpServerRequest& request) {
        QJsonObject body;
        if (!parseBody(request, body)) {
            return failure(StatusCode::BadRequest, "Invalid JSON body");
        }
        std::string key = body.value("key").toString().trimmed().toStdString();
        if (key.empty()) {
            return failure(StatusCode::BadRequest, "Missing key");
        }
        service->setHubLabel(key, body.value("label").toString().trimmed().toStdString());
        return success();
    });

    // Physical groups

    http->route("/api/physical-groups", Method::Get, [service]() {
        return QHttpServerResponse(json::groupsToJson(service->confirmedGroups()));
    });

    http->route("/api/physical-groups/detected", Method::Get, [service]() {
        GroupDetection detection = service->detectGroups();
        QJsonObject result;
        result["candidates"] = json::groupsToJson(detection.candidates);
        result["host_controller"] = json::groupToJson(detection.hostController);
        return QHttpServerResponse(result);
    });

    http->route("/api/physical-groups", Method::Post, [labels](const QHttpServerRequest& request) {
        QJsonObject body;
        if (!parseBody(request, body)) {
            return failure(StatusCode::BadRequest, "Invalid JSON body");
        }
        std::string name = body.value("name").toString().trimmed().toStdString();
        std::vector<std::string> members = toStrings(body.value("members").toArray());
        if (name.empty() || members.empty()) {
            return failure(StatusCode::BadRequest, "Missing name or members");
        }
        if (!labels->addPhysicalGroup(name, members, body.value("label").toString().trimmed().toStdString())) {
            return failure(StatusCode::Conflict, "A group with that name already exists");
        }
        auto group = labels->physicalGroup(name);
        if (!group) {
            return failure(StatusCode::InternalServerError, "Group was not stored");
        }
        return success(QJsonObject{{"group", json::groupToJson(*group)}});
    });

    http->route("/api/physical-groups/<arg>", Method::Put,
                [labels](const QString& argument, const QHttpServerRequest& request) {
        std::string name = decoded(argument);
        QJsonObject body;
        if (!parseBody(request, body)) {
            return failure(StatusCode::BadRequest, "Invalid JSON body");
        }
        auto existing = labels->physicalGroup(name);
        if (!existing) {
            return failure(StatusCode::NotFound, "Group not found");
        }

        std::string newName = body.contains("name")
            ? body.value("name").toString().trimmed().toStdString() : name;
        if (newName.empty()) {
            return failure(StatusCode::BadRequest, "Group name cannot be empty");
        }
        std::string label = body.contains("label")
            ? body.value("label").toString().trimmed().toStdString() : existing->label;
        if (!labels->updatePhysicalGroup(name, newName, label)) {
            return failure(StatusCode::Conflict, "A group with that name already exists");
        }
        return success(QJsonObject{{"group", json::groupToJson(*labels->physicalGroup(newName))}});
    });

    http->route("/api/physical-groups/<arg>", Method::Delete, [labels](const QString& argument) {
        if (!labels->removePhysicalGroup(decoded(argument))) {
            return failure(StatusCode::NotFound, "Group not found");
        }
        return success();
    });

    // Learning

    http->route("/api/learning/start", Method::Post, [service]() {
        LearningStartResult result = service->startLearning();
        if (result.errorCode == ErrorCodes::ALREADY_ARMED) {
            return failure(StatusCode::Conflict, QString::fromStdString(result.message));
        }
        return QHttpServerResponse(json::learningStartToJson(result));
    });

    http->route("/api/learning/stop", Method::Post, [service](const QHttpServerRequest& request) {
        QJsonObject body;
        if (!parseBody(request, body)) {
            return failure(StatusCode::BadRequest, "Invalid JSON body");
        }
        LearningStopResult result = service->stopLearning(
            body.value("save").toBool(false),
            body.value("name").toString().trimmed().toStdString(),
            body.value("label").toString().trimmed().toStdString());
        if (result.errorCode == ErrorCodes::NOT_ARMED) {
            return failure(StatusCode::Conflict, QString::fromStdString(result.message));
        }
        return QHttpServerResponse(json::learningStopToJson(result));
    });

    http->route("/api/learning/status", Method::Get, [service]() {
        return QHttpServerResponse(json::learningStatusToJson(service->learningStatus()));
    });

    http->route("/api/learning/preview", Method::Get, [service]() {
        LearningResult preview = service->previewLearning();
        if (preview.errorCode == ErrorCodes::NOT_ARMED) {
            return QHttpServerResponse(QJsonObject{{"status", "not_in_learning_mode"}});
        }
        QJsonObject result{{"status", "preview"}};
        result["observed"] = static_cast<int>(preview.observed);
        result["detected_group"] = preview.detected ? QJsonValue(json::learningResultToJson(preview))
                                                    : QJsonValue();
        return QHttpServerResponse(result);
    });

    // Diagnostics

    http->route("/api/errors", Method::Get, [this, service]() {
        QJsonArray errors;
        if (d->kernelLog) {
            for (const auto& entry : d->kernelLog->cachedErrors()) {
                errors.append(json::kernelLogEntryToJson(entry));
            }
        } else {
            for (const auto& entry : service->errors()) {
                errors.append(json::errorEntryToJson(entry));
            }
        }
        return QHttpServerResponse(errors);
    });

    http->route("/api/logs", Method::Get, [](const QHttpServerRequest& request) {
        bool ok = true;
        QString requested = request.query().queryItemValue("lines");
        int count = requested.isEmpty() ? 100 : requested.toInt(&ok);
        if (!ok || count <= 0) {
            return failure(StatusCode::BadRequest, "lines must be a positive number");
        }
        QJsonArray lines;
        for (const auto& line : Logger::instance().recentLogs(static_cast<size_t>(count))) {
            lines.append(QString::fromStdString(line));
        }
        return QHttpServerResponse(QJsonObject{{"lines", lines}});
    });

    http->route("/api/health", Method::Get, [this, service]() {
        QJsonObject result{{"status", service->sourceAvailable() ? "healthy" : "source_unavailable"}};
        result["websocket_connections"] = d->push ? d->push->connectionCount() : 0;
        result["device_count"] = static_cast<int>(service->snapshot()->size());
        return QHttpServerResponse(result);
    });
}

}
