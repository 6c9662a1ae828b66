#include "LocalSyncChannel.hpp"
#include "Logging.hpp"
#include "SyncMessage.hpp"
#include "SyncRelay.hpp"

#include <QTimer>

class LocalSyncChannel::Peer : public RelayPeer {
public:
    explicit Peer(LocalSyncChannel* channel) : m_channel(channel) {}

    void sendText(const QString& text) override { m_channel->deliverFromRelay(text); }
    void close() override { m_channel->closedByRelay(); }
    QString describe() const override { return m_channel->m_name; }

private:
    LocalSyncChannel* m_channel = nullptr;
};

LocalSyncChannel::LocalSyncChannel(SyncRelay* relay, const QString& name, QObject* parent)
    : SyncChannel(parent),
    m_relay(relay),
    m_name(name),
    m_peer(std::make_unique<Peer>(this)) {}

LocalSyncChannel::~LocalSyncChannel() {
    if (m_connected && m_relay) m_relay->peerDisconnected(m_peer.get());
}

void LocalSyncChannel::open(const QString& code) {
    close();
    const quint64 gen = m_generation;

    if (!m_relay) {
        QTimer::singleShot(0, this, [this, gen]() {
            if (gen == m_generation) emit errorOccurred(QStringLiteral("Connection refused"));
        });
        return;
    }

    QTimer::singleShot(0, this, [this, gen, code]() {
        if (gen != m_generation) return;
        m_connected = true;
        emit opened();
        // opened() handlers may already have closed us.
        if (gen != m_generation || !m_connected) return;
        m_relay->peerConnected(m_peer.get(), code);
    });
}

void LocalSyncChannel::send(const QJsonObject& message) {
    if (!m_connected || !m_relay) {
        qCWarning(lcSync) << m_name << "send on a closed channel";
        return;
    }
    m_relay->peerMessage(m_peer.get(), SyncMessage::encode(message));
}

void LocalSyncChannel::close() {
    ++m_generation;
    if (!m_connected) return;
    m_connected = false;
    if (m_relay) m_relay->peerDisconnected(m_peer.get());
}

void LocalSyncChannel::dropConnection() {
    if (!m_connected) return;
    close();
    const quint64 gen = m_generation;
    QTimer::singleShot(0, this, [this, gen]() {
        if (gen == m_generation) emit closed();
    });
}

void LocalSyncChannel::deliverFromRelay(const QString& text) {
    const quint64 gen = m_generation;
    QTimer::singleShot(0, this, [this, gen, text]() {
        if (gen != m_generation) return;
        bool ok = false;
        const QJsonObject msg = SyncMessage::decode(text, &ok);
        if (!ok) {
            emit errorOccurred(QStringLiteral("Received an invalid message from the other device."));
            return;
        }
        emit messageReceived(msg);
    });
}

void LocalSyncChannel::closedByRelay() {
    if (!m_connected) return;
    m_connected = false;
    const quint64 gen = m_generation;
    QTimer::singleShot(0, this, [this, gen]() {
        if (gen != m_generation) return;
        if (m_relay) m_relay->peerDisconnected(m_peer.get());
        emit closed();
    });
}
