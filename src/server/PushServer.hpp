#pragma once
#include <QHostAddress>
#include <QJsonObject>
#include <QObject>
#include <memory>

class QWebSocket;

namespace hubscope {

class TopologyService;

// WebSocket push channel. Each connection owns one broadcaster subscription
// and drains it only while the socket's unsent bytes stay under a bound, so a
// slow viewer falls into drop-oldest/resync instead of growing memory.
class PushServer : public QObject {
    Q_OBJECT

public:
    static constexpr qint64 MAX_OUTSTANDING_BYTES = 1024 * 1024;

    explicit PushServer(TopologyService* service, QObject* parent = nullptr);
    ~PushServer();

    bool listen(const QHostAddress& address, quint16 port);
    void close();
    quint16 port() const;
    int connectionCount() const;

signals:
    void connectionCountChanged(int count);

private slots:
    void onNewConnection();
    void onEventsAvailable(quint64 subscriptionId);

private:
    void flush(quint64 subscriptionId);
    void handleMessage(QWebSocket* socket, const QString& message);
    void sendDirect(QWebSocket* socket, const QJsonObject& message);

    class Private;
    std::unique_ptr<Private> d;
};

}
