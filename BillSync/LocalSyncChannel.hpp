#pragma once
#include "SyncChannel.hpp"

#include <QPointer>
#include <memory>

class SyncRelay;

// Talks to a SyncRelay in the same process. Outgoing frames reach the relay
// immediately; everything coming back arrives on a later event loop
// iteration, the way a socket would deliver it.
class LocalSyncChannel : public SyncChannel {
    Q_OBJECT
public:
    // A null relay behaves like an unreachable server.
    explicit LocalSyncChannel(SyncRelay* relay, const QString& name = QStringLiteral("local"),
                              QObject* parent = nullptr);
    ~LocalSyncChannel() override;

    void open(const QString& code) override;
    void send(const QJsonObject& message) override;
    void close() override;

    // Drops the connection as a network failure would.
    void dropConnection();

private:
    class Peer;
    friend class Peer;

    void deliverFromRelay(const QString& text);
    void closedByRelay();

    QPointer<SyncRelay> m_relay;
    QString m_name;
    std::unique_ptr<Peer> m_peer;
    bool m_connected = false;
    quint64 m_generation = 0;
};
