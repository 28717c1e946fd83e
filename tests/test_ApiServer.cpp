#include <gtest/gtest.h>
#include "ApiServer.hpp"
#include "FakeDeviceSource.hpp"
#include "LabelStore.hpp"
#include "Logger.hpp"
#include "TestRecords.hpp"
#include "TopologyService.hpp"
#include <QEventLoop>
#include <QHostAddress>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QNetworkAccessManager>
#include <QNetworkReply>
#include <QNetworkRequest>
#include <QTimer>

namespace hubscope {
namespace testing {

namespace {

struct Reply {
    int status{0};
    QJsonDocument body;
};

} // namespace

class ApiServerTest : public QtTest {
protected:
    void SetUp() override {
        QtTest::SetUp();
        source = std::make_unique<FakeDeviceSource>();
        source->records = {makeRootHub("usb1"), makeHub("1-1"), makeHub("1-1.1")};
        labels = std::make_unique<LabelStore>();
        service = std::make_unique<TopologyService>(source.get(), labels.get());
        ASSERT_TRUE(service->start());

        api = std::make_unique<ApiServer>(service.get(), labels.get());
        ASSERT_TRUE(api->listen(QHostAddress::LocalHost, 0));
        network = std::make_unique<QNetworkAccessManager>();
    }

    void TearDown() override {
        network.reset();
        api.reset();
        service.reset();
        labels.reset();
        source.reset();
        QtTest::TearDown();
    }

    Reply send(const QByteArray& verb, const QString& path, const QJsonObject& body = {}) {
        QNetworkRequest request(QUrl(QString("http://127.0.0.1:%1%2").arg(api->port()).arg(path)));
        request.setHeader(QNetworkRequest::ContentTypeHeader, "application/json");
        QByteArray payload = body.isEmpty() ? QByteArray() : QJsonDocument(body).toJson();
        QNetworkReply* reply = network->sendCustomRequest(request, verb, payload);

        QEventLoop loop;
        QTimer::singleShot(5000, &loop, &QEventLoop::quit);
        QObject::connect(reply, &QNetworkReply::finished, &loop, &QEventLoop::quit);
        loop.exec();

        Reply result;
        result.status = reply->attribute(QNetworkRequest::HttpStatusCodeAttribute).toInt();
        result.body = QJsonDocument::fromJson(reply->readAll());
        reply->deleteLater();
        return result;
    }

    std::unique_ptr<FakeDeviceSource> source;
    std::unique_ptr<LabelStore> labels;
    std::unique_ptr<TopologyService> service;
    std::unique_ptr<ApiServer> api;
    std::unique_ptr<QNetworkAccessManager> network;
};

TEST_F(ApiServerTest, DuplicateGroupNameConflicts) {
    QJsonObject dock{{"name", "Dock"}, {"members", QJsonArray{"1-1", "1-1.1"}}};
    EXPECT_EQ(send("POST", "/api/physical-groups", dock).status, 200);

    QJsonObject again{{"name", "Dock"}, {"members", QJsonArray{"2-1"}}};
    Reply reply = send("POST", "/api/physical-groups", again);
    EXPECT_EQ(reply.status, 409);
    EXPECT_FALSE(reply.body.object()["detail"].toString().isEmpty());
    EXPECT_EQ(labels->physicalGroup("Dock")->members.size(), 2u);
}

TEST_F(ApiServerTest, RenameToEmptyNameIsBadRequest) {
    labels->addPhysicalGroup("Dock", {"1-1"});

    EXPECT_EQ(send("PUT", "/api/physical-groups/Dock", QJsonObject{{"name", "  "}}).status, 400);
    EXPECT_EQ(send("PUT", "/api/physical-groups/Missing", QJsonObject{{"name", "Other"}}).status, 404);
    EXPECT_TRUE(labels->physicalGroup("Dock").has_value());
}

TEST_F(ApiServerTest, HealthReportsUnavailableSource) {
    Reply reply = send("GET", "/api/health");
    EXPECT_EQ(reply.status, 200);
    EXPECT_EQ(reply.body.object()["status"].toString(), "healthy");
    EXPECT_EQ(reply.body.object()["device_count"].toInt(), 3);

    source->failNext = true;
    service->rescan();
    reply = send("GET", "/api/health");
    EXPECT_EQ(reply.body.object()["status"].toString(), "source_unavailable");
    EXPECT_EQ(reply.body.object()["device_count"].toInt(), 3);
}

TEST_F(ApiServerTest, LogsReturnRecentLines) {
    LOG_WARNING("Hub 1-1 reported over-current");

    Reply reply = send("GET", "/api/logs?lines=5");
    ASSERT_EQ(reply.status, 200);
    QJsonArray lines = reply.body.object()["lines"].toArray();
    ASSERT_FALSE(lines.isEmpty());
    EXPECT_LE(lines.size(), 5);

    bool found = false;
    for (const auto& line : lines) {
        found = found || line.toString().contains("Hub 1-1 reported over-current");
    }
    EXPECT_TRUE(found);

    EXPECT_EQ(send("GET", "/api/logs?lines=0").status, 400);
}

} // namespace testing
} // namespace hubscope
