#pragma once
#include "SyncChannel.hpp"

#include <QUrl>
#include <QWebSocket>

class WebSocketSyncChannel : public SyncChannel {
    Q_OBJECT
public:
    // relayUrl like ws://host:8081/sync
    explicit WebSocketSyncChannel(const QUrl& relayUrl, QObject* parent = nullptr);

    void open(const QString& code) override;
    void send(const QJsonObject& message) override;
    void close() override;

private:
    QUrl m_relayUrl;
    QWebSocket m_socket;
    bool m_closing = false;
};
