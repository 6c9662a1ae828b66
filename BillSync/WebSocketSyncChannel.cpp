#include "WebSocketSyncChannel.hpp"
#include "Logging.hpp"
#include "SyncMessage.hpp"

#include <QUrlQuery>

WebSocketSyncChannel::WebSocketSyncChannel(const QUrl& relayUrl, QObject* parent)
    : SyncChannel(parent), m_relayUrl(relayUrl) {

    connect(&m_socket, &QWebSocket::connected, this, &SyncChannel::opened);

    connect(&m_socket, &QWebSocket::textMessageReceived, this, [this](const QString& text) {
        bool ok = false;
        const QJsonObject msg = SyncMessage::decode(text, &ok);
        if (!ok) {
            qCWarning(lcSync) << "relay sent a malformed frame";
            emit errorOccurred(QStringLiteral("Received an invalid message from the other device."));
            return;
        }
        emit messageReceived(msg);
    });

    connect(&m_socket, &QWebSocket::disconnected, this, [this]() {
        if (m_closing) return;
        emit closed();
    });

    connect(&m_socket, &QWebSocket::errorOccurred, this, [this](QAbstractSocket::SocketError err) {
        if (m_closing) return;
        qCWarning(lcSync) << "relay socket error" << err << m_socket.errorString();
        emit errorOccurred(m_socket.errorString());
    });
}

void WebSocketSyncChannel::open(const QString& code) {
    QUrl url(m_relayUrl);
    if (!code.isEmpty()) {
        QUrlQuery q;
        q.addQueryItem("code", code);
        url.setQuery(q);
    }
    m_closing = false;
    qCInfo(lcSync) << "connecting to relay" << m_relayUrl.toString();
    m_socket.open(url);
}

void WebSocketSyncChannel::send(const QJsonObject& message) {
    if (!m_socket.isValid()) {
        qCWarning(lcSync) << "send on a closed relay socket";
        return;
    }
    m_socket.sendTextMessage(SyncMessage::encode(message));
}

void WebSocketSyncChannel::close() {
    m_closing = true;
    m_socket.close();
}
