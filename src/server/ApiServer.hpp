#pragma once
#include <QHostAddress>
#include <QObject>
#include <memory>

namespace hubscope {

class KernelLogMonitor;
class LabelStore;
class PushServer;
class TopologyService;

// Request/response surface over Qt HTTP Server. Failures answer with
// {"detail": message} and 400, 404, 409 or 500.
class ApiServer : public QObject {
    Q_OBJECT

public:
    ApiServer(TopologyService* service, LabelStore* labels, QObject* parent = nullptr);
    ~ApiServer();

    void setKernelLogMonitor(KernelLogMonitor* monitor);
    void setPushServer(PushServer* push);

    bool listen(const QHostAddress& address, quint16 port);
    quint16 port() const;

private:
    void setupRoutes();

    class Private;
    std::unique_ptr<Private> d;
};

}
