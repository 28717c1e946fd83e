#include "PushServer.hpp"
#include "../core/EventBroadcaster.hpp"
#include "../core/Logger.hpp"
#include "../core/TopologyService.hpp"
#include "../utils/JsonCodec.hpp"
#include <hubscope/Constants.hpp>
#include <QJsonDocument>
#include <QJsonObject>
#include <QWebSocket>
#include <QWebSocketServer>
#include <algorithm>
#include <map>

namespace hubscope {

namespace {

constexpr size_t DRAIN_BATCH = 32;

}

struct ViewerConnection {
    QWebSocket* socket{nullptr};
    SubscriptionHandle subscription;
    qint64 outstanding{0};
};

class PushServer::Private {
public:
    TopologyService* service{nullptr};
    QWebSocketServer* server{nullptr};
    std::map<quint64, ViewerConnection> connections;
};

PushServer::PushServer(TopologyService* service, QObject* parent)
    : QObject(parent)
    , d(std::make_unique<Private>()) {
    d->service = service;
    d->server = new QWebSocketServer("hubscope", QWebSocketServer::NonSecureMode, this);
    connect(d->server, &QWebSocketServer::newConnection, this, &PushServer::onNewConnection);

    // Queued so publishing never waits on socket writes
    connect(service->broadcaster(), &EventBroadcaster::eventsAvailable,
            this, &PushServer::onEventsAvailable, Qt::QueuedConnection);
}

PushServer::~PushServer() {
    close();
}

bool PushServer::listen(const QHostAddress& address, quint16 port) {
    if (!d->server->listen(address, port)) {
        LOG_ERROR("Cannot listen for viewers on " + address.toString().toStdString() + ":" +
                  std::to_string(port) + ": " + d->server->errorString().toStdString());
        return false;
    }
    LOG_INFO("Push channel listening on " + address.toString().toStdString() + ":" +
             std::to_string(d->server->serverPort()));
    return true;
}

void PushServer::close() {
    for (auto& [id, connection] : d->connections) {
        d->service->broadcaster()->unsubscribe(connection.subscription);
        connection.socket->disconnect(this);
        connection.socket->close();
        connection.socket->deleteLater();
    }
    d->connections.clear();
    d->server->close();
}

quint16 PushServer::port() const {
    return d->server->serverPort();
}

int PushServer::connectionCount() const {
    return static_cast<int>(d->connections.size());
}

void PushServer::onNewConnection() {
    while (QWebSocket* socket = d->server->nextPendingConnection()) {
        SubscriptionHandle subscription = d->service->broadcaster()->subscribe();
        quint64 id = subscription->id();
        d->connections[id] = {socket, subscription, 0};

        LOG_INFO("Viewer connected from " + socket->peerAddress().toString().toStdString());

        connect(socket, &QWebSocket::textMessageReceived, this, [this, socket](const QString& message) {
            handleMessage(socket, message);
        });
        connect(socket, &QWebSocket::bytesWritten, this, [this, id](qint64 bytes) {
            auto it = d->connections.find(id);
            if (it == d->connections.end()) return;
            it->second.outstanding = std::max<qint64>(0, it->second.outstanding - bytes);
            flush(id);
        });
        connect(socket, &QWebSocket::disconnected, this, [this, id]() {
            auto it = d->connections.find(id);
            if (it == d->connections.end()) return;
            d->service->broadcaster()->unsubscribe(it->second.subscription);
            it->second.socket->deleteLater();
            d->connections.erase(it);
            LOG_INFO("Viewer disconnected");
            emit connectionCountChanged(connectionCount());
        });

        emit connectionCountChanged(connectionCount());
        flush(id);
    }
}

void PushServer::onEventsAvailable(quint64 subscriptionId) {
    flush(subscriptionId);
}

void PushServer::flush(quint64 subscriptionId) {
    auto it = d->connections.find(subscriptionId);
    if (it == d->connections.end()) return;

    ViewerConnection& connection = it->second;
    while (connection.outstanding < MAX_OUTSTANDING_BYTES) {
        std::vector<TopologyEvent> events = connection.subscription->drain(DRAIN_BATCH);
        if (events.empty()) break;

        for (const auto& event : events) {
            QByteArray payload = QJsonDocument(json::eventToJson(event)).toJson(QJsonDocument::Compact);
            connection.outstanding += connection.socket->sendTextMessage(QString::fromUtf8(payload));
        }
    }
}

void PushServer::sendDirect(QWebSocket* socket, const QJsonObject& message) {
    socket->sendTextMessage(QString::fromUtf8(QJsonDocument(message).toJson(QJsonDocument::Compact)));
}

void PushServer::handleMessage(QWebSocket* socket, const QString& message) {
    QJsonDocument doc = QJsonDocument::fromJson(message.toUtf8());
    if (!doc.isObject()) {
        LOG_WARNING("Ignoring malformed viewer message");
        return;
    }

    QJsonObject data = doc.object();
    QString action = data.value("action").toString();

    if (action == "refresh") {
        TopologyEvent event;
        event.kind = EventKind::FullTree;
        event.snapshot = d->service->snapshot();
        event.timestamp = std::chrono::system_clock::now();
        sendDirect(socket, json::eventToJson(event));

    } else if (action == "set_name") {
        std::string vendorId = data.value("vendor_id").toString().toLower().toStdString();
        std::string productId = data.value("product_id").toString().toLower().toStdString();
        if (vendorId.empty() || productId.empty() || !data.contains("name")) {
            sendDirect(socket, {{"type", "error"}, {"detail", "Missing required fields"}});
            return;
        }
        d->service->setCustomName(vendorId, productId, data.value("name").toString().trimmed().toStdString());

    } else if (action == "reset_device") {
        QString address = data.value("port_path").toString();
        if (address.isEmpty()) {
            sendDirect(socket, {{"type", "error"}, {"detail", "Missing port_path"}});
            return;
        }
        int result = d->service->resetDevice(address.toStdString());
        if (result != ErrorCodes::SUCCESS) {
            sendDirect(socket, {{"type", "reset_result"}, {"success", false}, {"port_path", address}});
        }

    } else {
        LOG_WARNING("Unknown viewer action '" + action.toStdString() + "'");
    }
}

}
