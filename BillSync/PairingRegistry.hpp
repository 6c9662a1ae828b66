#pragma once
#include <QHash>
#include <QString>

class RelayPeer;

struct SyncPairing {
    QString code;
    RelayPeer* sender = nullptr;
    RelayPeer* receiver = nullptr;
    qint64 createdAtMs = 0;
    bool completed = false;
};

// Live pairings of one relay process, keyed by 6-digit code. Owned by whoever
// creates the relay and passed in; touched only from the relay's thread.
class PairingRegistry {
public:
    enum class BindResult { Bound, UnknownCode, AlreadyPaired };

    bool contains(const QString& code) const { return m_pairings.contains(code); }
    SyncPairing* find(const QString& code);
    QString codeFor(const RelayPeer* peer) const { return m_codeByPeer.value(peer); }

    // false if the code is already taken
    bool create(const QString& code, RelayPeer* sender, qint64 nowMs);

    // Single check-and-set: at most one receiver ever binds to a code.
    BindResult bindReceiver(const QString& code, RelayPeer* receiver);

    void remove(const QString& code);
    int size() const { return int(m_pairings.size()); }

private:
    QHash<QString, SyncPairing> m_pairings;
    QHash<const RelayPeer*, QString> m_codeByPeer;
};
