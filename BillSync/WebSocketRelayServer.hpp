#pragma once
#include <QHash>
#include <QHostAddress>
#include <QObject>
#include <QWebSocketServer>
#include <memory>

class QWebSocket;
class SyncRelay;
class WebSocketRelayPeer;

// Accepts ws://host:port/sync[?code=NNNNNN] connections and hands them to a
// SyncRelay.
class WebSocketRelayServer : public QObject {
    Q_OBJECT
public:
    WebSocketRelayServer(SyncRelay* relay, qint64 maxMessageBytes, QObject* parent = nullptr);
    ~WebSocketRelayServer() override;

    quint16 listen(const QHostAddress& address, quint16 port);
    QUrl url() const { return m_server.serverUrl(); }

private slots:
    void onNewConnection();

private:
    void drop(QWebSocket* socket);

    SyncRelay* m_relay = nullptr;
    qint64 m_maxMessageBytes;
    QWebSocketServer m_server;
    QHash<QWebSocket*, std::shared_ptr<WebSocketRelayPeer>> m_peers;
};
