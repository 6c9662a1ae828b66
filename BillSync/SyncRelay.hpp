#pragma once
#include <QObject>
#include <QString>
#include <functional>

class CryptoEngine;
class PairingRegistry;

// One end of a relay connection, as seen by the relay.
class RelayPeer {
public:
    virtual ~RelayPeer() = default;
    virtual void sendText(const QString& text) = 0;
    virtual void close() = 0;
    virtual QString describe() const = 0;
};

// Code-addressed rendezvous: pairs one sender and one receiver per code and
// forwards frames between them. Nothing it forwards is kept.
class SyncRelay : public QObject {
    Q_OBJECT
public:
    using CodeGenerator = std::function<QString()>;

    SyncRelay(PairingRegistry* registry, CryptoEngine* crypto, QObject* parent = nullptr);

    // Replaces the random 6-digit generator (tests use it to pin a code).
    void setCodeGenerator(CodeGenerator generator) { m_generator = std::move(generator); }

    // Empty code = sender asking for a new pairing; otherwise a receiver.
    void peerConnected(RelayPeer* peer, const QString& code);
    void peerMessage(RelayPeer* peer, const QString& text);
    void peerDisconnected(RelayPeer* peer);

signals:
    void pairingCreated(const QString& code);
    void pairingBound(const QString& code);
    void pairingClosed(const QString& code, bool completed);

private:
    QString freshCode() const;
    void reject(RelayPeer* peer, const QString& message);
    void teardown(const QString& code, bool completed);

    PairingRegistry* m_registry = nullptr;
    CryptoEngine* m_crypto = nullptr;
    CodeGenerator m_generator;
};
