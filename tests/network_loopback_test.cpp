#include "ApiRouter.hpp"
#include "CryptoEngine.hpp"
#include "DeviceSyncController.hpp"
#include "HttpFrontend.hpp"
#include "MemoryKeyValueStore.hpp"
#include "NetworkApiTransport.hpp"
#include "OneTimeKeyClient.hpp"
#include "OneTimeSecretService.hpp"
#include "PairingRegistry.hpp"
#include "ShareSessionClient.hpp"
#include "ShareSessionService.hpp"
#include "SyncCollaborators.hpp"
#include "SyncRelay.hpp"
#include "TestSupport.hpp"
#include "WebSocketRelayServer.hpp"
#include "WebSocketSyncChannel.hpp"

#include <QJsonArray>
#include <QNetworkAccessManager>
#include <QNetworkReply>
#include <QStringList>
#include <QTcpServer>
#include <QTimer>
#include <QWebSocket>
#include <cassert>
#include <iostream>
#include <memory>
#include <optional>

namespace {

using State = SyncStateMachine::State;

class MemoryDataStore : public SyncDataStore {
public:
    QJsonObject exportAllData() override { return data; }

    bool importAllData(const QJsonObject& snapshot, QString*) override {
        data = snapshot;
        return true;
    }

    QJsonObject data;
};

class AcceptingPrompt : public ConfirmationPrompt {
public:
    void ask(const QString&, const QString&, std::function<void()> onConfirm, std::function<void()>) override {
        ++asked;
        QTimer::singleShot(0, [onConfirm] { onConfirm(); });
    }

    int asked = 0;
};

struct Device {
    Device(CryptoEngine* crypto, const QUrl& relayUrl)
        : channel(relayUrl), controller(crypto, &channel, &store, &prompt) {
        controller.setConnectTimeoutMs(3000);
        QObject::connect(&controller, &DeviceSyncController::codeReady, [this](const QString& c) { code = c; });
        QObject::connect(&controller, &DeviceSyncController::completed, [this] { ++completions; });
        QObject::connect(&controller, &DeviceSyncController::failed, [this](ErrorKind k, const QString& m) {
            errorKind = k;
            errorMessage = m;
        });
    }

    WebSocketSyncChannel channel;
    MemoryDataStore store;
    AcceptingPrompt prompt;
    DeviceSyncController controller;

    QString code;
    int completions = 0;
    std::optional<ErrorKind> errorKind;
    QString errorMessage;
};

struct RelayHost {
    explicit RelayHost(qint64 maxMessageBytes = 1024 * 1024) : server(&relay, maxMessageBytes) {
        port = server.listen(QHostAddress::LocalHost, 0);
        assert(port != 0);
    }

    QUrl url(const QString& path = QStringLiteral("/sync")) const {
        return QUrl(QString("ws://127.0.0.1:%1%2").arg(port).arg(path));
    }

    CryptoEngine crypto;
    PairingRegistry registry;
    SyncRelay relay{&registry, &crypto};
    WebSocketRelayServer server;
    quint16 port = 0;
};

struct ApiHost {
    ApiHost() {
        port = http.listen(QHostAddress::LocalHost, 0);
        assert(port != 0);
        transport.setBaseUrl(baseUrl());
        transport.setTimeoutMs(3000);
    }

    QUrl baseUrl() const { return QUrl(QString("http://127.0.0.1:%1/").arg(port)); }

    MemoryKeyValueStore kv{QStringLiteral("memory")};
    ShareSessionService shares{&kv};
    OneTimeSecretService secrets{&kv};
    ApiRouter router{&shares, &secrets};
    HttpFrontend http{&router};
    quint16 port = 0;

    NetworkApiTransport transport;
    ShareSessionClient sessions{&transport};
    OneTimeKeyClient keys{&transport};
};

// A port nothing is listening on.
quint16 ClosedPort() {
    QTcpServer listener;
    const bool ok = listener.listen(QHostAddress::LocalHost, 0);
    assert(ok);
    const quint16 port = listener.serverPort();
    listener.close();
    return port;
}

// Opens a raw socket and records what the relay does with it.
struct RawClient {
    explicit RawClient(const QUrl& url) {
        QObject::connect(&socket, &QWebSocket::connected, [this] { connected = true; });
        QObject::connect(&socket, &QWebSocket::textMessageReceived, [this](const QString& t) { texts << t; });
        QObject::connect(&socket, &QWebSocket::disconnected, [this] { disconnected = true; });
        socket.open(url);
    }

    QWebSocket socket;
    bool connected = false;
    bool disconnected = false;
    QStringList texts;
};

void TestDeviceSyncOverWebSockets() {
    RelayHost host;
    CryptoEngine crypto;
    Device laptop(&crypto, host.url());
    Device phone(&crypto, host.url());

    QJsonArray bills;
    bills.append(QJsonObject{{"id", "b1"}, {"title", "Dinner"}, {"total", 42.0}});
    laptop.store.data = QJsonObject{{"bills", bills}};
    phone.store.data = QJsonObject{{"bills", QJsonArray{}}};

    assert(laptop.controller.startSending());
    assert(WaitUntil([&] { return !laptop.code.isEmpty(); }));
    assert(laptop.code.size() == 6);
    assert(laptop.controller.state() == State::Waiting);

    assert(phone.controller.startReceiving(laptop.code));
    assert(WaitUntil([&] { return laptop.completions == 1 && phone.completions == 1; }));
    assert(phone.store.data == laptop.store.data);
    assert(phone.prompt.asked == 1);
    assert(!laptop.errorKind && !phone.errorKind);
    assert(laptop.controller.state() == State::Complete);
    assert(phone.controller.state() == State::Complete);

    // The pairing is gone once the transfer finished.
    Device late(&crypto, host.url());
    assert(late.controller.startReceiving(laptop.code));
    assert(WaitUntil([&] { return late.errorKind.has_value(); }));
    assert(*late.errorKind == ErrorKind::NotFound);
    assert(late.errorMessage == "Invalid or expired code.");
}

void TestRelayRefusedConnection() {
    CryptoEngine crypto;
    Device offline(&crypto, QUrl(QString("ws://127.0.0.1:%1/sync").arg(ClosedPort())));

    assert(offline.controller.startSending());
    assert(WaitUntil([&] { return offline.errorKind.has_value(); }));
    assert(*offline.errorKind == ErrorKind::TransportFailure);
    assert(offline.errorMessage == "Could not connect to sync service.");
    assert(offline.controller.state() == State::Error);
}

void TestRelayServerFiltersConnections() {
    RelayHost host(4096);

    RawClient wrongPath(host.url("/chat"));
    assert(WaitUntil([&] { return wrongPath.disconnected; }));
    assert(wrongPath.texts.isEmpty());

    // The code comes from the query string.
    RawClient unknownCode(host.url("/sync?code=999999"));
    assert(WaitUntil([&] { return unknownCode.disconnected; }));
    assert(unknownCode.texts.size() == 1);
    assert(unknownCode.texts.first().contains("Invalid or expired code."));

    RawClient sender(host.url());
    assert(WaitUntil([&] { return !sender.texts.isEmpty(); }));
    assert(sender.texts.first().contains("session_created"));

    // Frames above the configured limit end the connection.
    sender.socket.sendTextMessage(QString(8192, QLatin1Char('x')));
    assert(WaitUntil([&] { return sender.disconnected; }));
}

void TestChannelCloseIsSilent() {
    CryptoEngine crypto;
    PairingRegistry registry;
    SyncRelay relay(&registry, &crypto);
    auto server = std::make_unique<WebSocketRelayServer>(&relay, 1024 * 1024);
    const quint16 port = server->listen(QHostAddress::LocalHost, 0);
    assert(port != 0);

    WebSocketSyncChannel channel(QUrl(QString("ws://127.0.0.1:%1/sync").arg(port)));
    int opened = 0;
    int closed = 0;
    int errors = 0;
    QObject::connect(&channel, &SyncChannel::opened, [&] { ++opened; });
    QObject::connect(&channel, &SyncChannel::closed, [&] { ++closed; });
    QObject::connect(&channel, &SyncChannel::errorOccurred, [&](const QString&) { ++errors; });

    channel.open(QString());
    assert(WaitUntil([&] { return opened == 1; }));
    channel.close();
    WaitUntil([&] { return closed > 0 || errors > 0; }, 300);
    assert(closed == 0 && errors == 0);

    // A close the client did not ask for is reported.
    channel.open(QString());
    assert(WaitUntil([&] { return opened == 2; }));
    server.reset();
    assert(WaitUntil([&] { return closed > 0 || errors > 0; }));
}

void TestShareApiOverHttp() {
    ApiHost api;

    std::optional<ShareCreated> created;
    api.sessions.create("ciphertext-v1", [&](const ShareCreated& c) { created = c; },
                        [](const ApiError&) { assert(false); });
    assert(WaitUntil([&] { return created.has_value(); }));
    assert(!created->id.isEmpty() && !created->updateToken.isEmpty());

    std::optional<ShareSnapshot> snapshot;
    api.sessions.fetch(created->id, std::nullopt,
                       [&](const std::optional<ShareSnapshot>& s) { snapshot = s; },
                       [](const ApiError&) { assert(false); });
    assert(WaitUntil([&] { return snapshot.has_value(); }));
    assert(snapshot->ciphertext == "ciphertext-v1");
    assert(snapshot->version == created->version);

    bool notModified = false;
    api.sessions.fetch(created->id, created->version,
                       [&](const std::optional<ShareSnapshot>& s) { notModified = !s; },
                       [](const ApiError&) { assert(false); });
    assert(WaitUntil([&] { return notModified; }));

    std::optional<ApiError> error;
    api.sessions.update(created->id, "ciphertext-v2", "wrong-token", [](qint64) { assert(false); },
                        [&](const ApiError& e) { error = e; });
    assert(WaitUntil([&] { return error.has_value(); }));
    assert(error->kind == ErrorKind::Forbidden);

    std::optional<QVector<ShareStatus>> statuses;
    api.sessions.statusBatch({created->id}, [&](const QVector<ShareStatus>& s) { statuses = s; },
                             [](const ApiError&) { assert(false); });
    assert(WaitUntil([&] { return statuses.has_value(); }));
    assert(statuses->size() == 1 && statuses->first().live);

    // Raw reply: 304 has no body, and nothing is cacheable.
    QNetworkAccessManager nam;
    QUrl url = api.baseUrl().resolved(QUrl("/share/" + created->id));
    url.setQuery(QString("ifNewerThan=%1").arg(created->version));
    QNetworkReply* reply = nam.get(QNetworkRequest(url));
    assert(WaitUntil([&] { return reply->isFinished(); }));
    assert(reply->attribute(QNetworkRequest::HttpStatusCodeAttribute).toInt() == 304);
    assert(reply->readAll().isEmpty());
    assert(reply->rawHeader("Cache-Control") == "no-store");
    reply->deleteLater();

    QNetworkReply* missing = nam.get(QNetworkRequest(api.baseUrl().resolved(QUrl("/nowhere"))));
    assert(WaitUntil([&] { return missing->isFinished(); }));
    assert(missing->attribute(QNetworkRequest::HttpStatusCodeAttribute).toInt() == 404);
    missing->deleteLater();
}

void TestOneTimeKeyOverHttp() {
    ApiHost api;

    QString keyId;
    api.keys.create("wrapped-key", [&](const QString& id) { keyId = id; }, [](const ApiError&) { assert(false); });
    assert(WaitUntil([&] { return !keyId.isEmpty(); }));

    std::optional<bool> available;
    api.keys.peek(keyId, [&](bool a) { available = a; }, [](const ApiError&) { assert(false); });
    assert(WaitUntil([&] { return available.has_value(); }));
    assert(*available);

    QByteArray payload;
    api.keys.consume(keyId, [&](const QByteArray& p) { payload = p; }, [](const ApiError&) { assert(false); });
    assert(WaitUntil([&] { return !payload.isEmpty(); }));
    assert(payload == "wrapped-key");

    std::optional<ApiError> error;
    api.keys.consume(keyId, [](const QByteArray&) { assert(false); }, [&](const ApiError& e) { error = e; });
    assert(WaitUntil([&] { return error.has_value(); }));
    assert(error->kind == ErrorKind::NotFound);
}

void TestApiServerUnreachable() {
    NetworkApiTransport transport;
    transport.setBaseUrl(QUrl(QString("http://127.0.0.1:%1/").arg(ClosedPort())));
    transport.setTimeoutMs(3000);
    OneTimeKeyClient keys(&transport);

    std::optional<ApiError> error;
    keys.create("x", [](const QString&) { assert(false); }, [&](const ApiError& e) { error = e; });
    assert(WaitUntil([&] { return error.has_value(); }));
    assert(error->kind == ErrorKind::TransportFailure);
}

} // namespace

int main(int argc, char* argv[]) {
    QCoreApplication app(argc, argv);

    TestDeviceSyncOverWebSockets();
    TestRelayRefusedConnection();
    TestRelayServerFiltersConnections();
    TestChannelCloseIsSilent();
    TestShareApiOverHttp();
    TestOneTimeKeyOverHttp();
    TestApiServerUnreachable();

    std::cout << "network_loopback_test: pass\n";
    return 0;
}
