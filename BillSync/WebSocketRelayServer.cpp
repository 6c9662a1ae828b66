#include "WebSocketRelayServer.hpp"
#include "Logging.hpp"
#include "SyncRelay.hpp"

#include <QUrlQuery>
#include <QWebSocket>

class WebSocketRelayPeer : public RelayPeer {
public:
    explicit WebSocketRelayPeer(QWebSocket* socket) : m_socket(socket) {}

    void sendText(const QString& text) override {
        if (m_socket->isValid()) m_socket->sendTextMessage(text);
    }

    void close() override { m_socket->close(); }

    QString describe() const override {
        return QStringLiteral("%1:%2").arg(m_socket->peerAddress().toString()).arg(m_socket->peerPort());
    }

private:
    QWebSocket* m_socket = nullptr;
};

WebSocketRelayServer::WebSocketRelayServer(SyncRelay* relay, qint64 maxMessageBytes, QObject* parent)
    : QObject(parent),
    m_relay(relay),
    m_maxMessageBytes(maxMessageBytes),
    m_server(QStringLiteral("billsync-relay"), QWebSocketServer::NonSecureMode) {

    connect(&m_server, &QWebSocketServer::newConnection, this, &WebSocketRelayServer::onNewConnection);
}

WebSocketRelayServer::~WebSocketRelayServer() {
    m_server.close();
    for (auto it = m_peers.begin(); it != m_peers.end(); ++it) {
        it.key()->disconnect(this);
        it.key()->abort();
        it.key()->deleteLater();
    }
}

quint16 WebSocketRelayServer::listen(const QHostAddress& address, quint16 port) {
    if (!m_server.listen(address, port)) {
        qCWarning(lcRelay) << "could not listen on" << address.toString() << port << ":" << m_server.errorString();
        return 0;
    }
    qCInfo(lcRelay) << "relay listening on" << m_server.serverUrl().toString();
    return m_server.serverPort();
}

void WebSocketRelayServer::onNewConnection() {
    while (QWebSocket* socket = m_server.nextPendingConnection()) {
        const QUrl requestUrl = socket->requestUrl();
        if (requestUrl.path() != QLatin1String("/sync")) {
            qCInfo(lcRelay) << "refusing connection to" << requestUrl.path();
            socket->close(QWebSocketProtocol::CloseCodePolicyViolated, QStringLiteral("unknown endpoint"));
            socket->deleteLater();
            continue;
        }

        socket->setMaxAllowedIncomingMessageSize(quint64(m_maxMessageBytes));
        auto peer = std::make_shared<WebSocketRelayPeer>(socket);
        m_peers.insert(socket, peer);

        connect(socket, &QWebSocket::textMessageReceived, this, [this, socket](const QString& text) {
            auto it = m_peers.find(socket);
            if (it != m_peers.end()) m_relay->peerMessage(it.value().get(), text);
        });
        connect(socket, &QWebSocket::disconnected, this, [this, socket]() { drop(socket); });

        const QString code = QUrlQuery(requestUrl).queryItemValue(QStringLiteral("code"));
        m_relay->peerConnected(peer.get(), code);
    }
}

void WebSocketRelayServer::drop(QWebSocket* socket) {
    auto it = m_peers.find(socket);
    if (it == m_peers.end()) return;
    std::shared_ptr<WebSocketRelayPeer> peer = it.value();
    m_peers.erase(it);
    m_relay->peerDisconnected(peer.get());
    socket->deleteLater();
}
