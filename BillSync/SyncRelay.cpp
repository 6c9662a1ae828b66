#include "SyncRelay.hpp"
#include "CryptoEngine.hpp"
#include "Logging.hpp"
#include "PairingRegistry.hpp"
#include "SyncMessage.hpp"

#include <QDateTime>

SyncRelay::SyncRelay(PairingRegistry* registry, CryptoEngine* crypto, QObject* parent)
    : QObject(parent), m_registry(registry), m_crypto(crypto) {}

QString SyncRelay::freshCode() const {
    // A custom generator gets a few draws before falling back to random codes.
    for (int attempt = 0;; ++attempt) {
        const QString code = (m_generator && attempt < 8) ? m_generator() : m_crypto->randomDigits(6);
        if (SyncMessage::isValidCode(code) && !m_registry->contains(code)) return code;
    }
}

void SyncRelay::reject(RelayPeer* peer, const QString& message) {
    qCInfo(lcRelay) << "rejecting" << peer->describe() << ":" << message;
    peer->sendText(SyncMessage::encode(SyncMessage::makeError(message)));
    peer->close();
}

void SyncRelay::peerConnected(RelayPeer* peer, const QString& code) {
    if (code.isEmpty()) {
        const QString fresh = freshCode();
        m_registry->create(fresh, peer, QDateTime::currentMSecsSinceEpoch());
        qCInfo(lcRelay) << "pairing" << fresh << "created for" << peer->describe();

        QJsonObject msg = SyncMessage::make(SyncMessage::SessionCreated);
        msg["code"] = fresh;
        peer->sendText(SyncMessage::encode(msg));
        emit pairingCreated(fresh);
        return;
    }

    if (!SyncMessage::isValidCode(code)) {
        reject(peer, QStringLiteral("Sync codes are exactly 6 digits."));
        return;
    }

    switch (m_registry->bindReceiver(code, peer)) {
    case PairingRegistry::BindResult::UnknownCode:
        reject(peer, QStringLiteral("Invalid or expired code."));
        return;
    case PairingRegistry::BindResult::AlreadyPaired:
        reject(peer, QStringLiteral("This code is already in use by another device."));
        return;
    case PairingRegistry::BindResult::Bound:
        break;
    }

    SyncPairing* p = m_registry->find(code);
    qCInfo(lcRelay) << "pairing" << code << "bound" << p->sender->describe() << "<->" << peer->describe();
    const QString joined = SyncMessage::encode(SyncMessage::make(SyncMessage::PeerJoined));
    p->sender->sendText(joined);
    p->receiver->sendText(joined);
    emit pairingBound(code);
}

void SyncRelay::peerMessage(RelayPeer* peer, const QString& text) {
    const QString code = m_registry->codeFor(peer);
    SyncPairing* p = code.isEmpty() ? nullptr : m_registry->find(code);
    if (!p) {
        qCDebug(lcRelay) << "dropping frame from unpaired" << peer->describe();
        return;
    }

    bool ok = false;
    const QJsonObject msg = SyncMessage::decode(text, &ok);
    if (!ok) {
        peer->sendText(SyncMessage::encode(SyncMessage::makeError(QStringLiteral("Malformed message."))));
        return;
    }

    RelayPeer* other = (peer == p->sender) ? p->receiver : p->sender;
    if (!other) {
        peer->sendText(SyncMessage::encode(SyncMessage::makeError(QStringLiteral("No device has joined yet."))));
        return;
    }

    const QString type = msg.value("type").toString();
    if (type != SyncMessage::Key && type != SyncMessage::Data &&
        type != SyncMessage::SyncComplete && type != SyncMessage::Error) {
        peer->sendText(SyncMessage::encode(
            SyncMessage::makeError(QStringLiteral("Unsupported message type '%1'.").arg(type))));
        return;
    }

    other->sendText(text);

    if (type == SyncMessage::SyncComplete) {
        p->completed = true;
        teardown(code, true);
    } else if (type == SyncMessage::Error) {
        teardown(code, false);
    }
}

void SyncRelay::peerDisconnected(RelayPeer* peer) {
    const QString code = m_registry->codeFor(peer);
    SyncPairing* p = code.isEmpty() ? nullptr : m_registry->find(code);
    if (!p) return;

    RelayPeer* other = (peer == p->sender) ? p->receiver : p->sender;
    const bool completed = p->completed;
    teardown(code, completed);

    if (other && !completed) {
        qCInfo(lcRelay) << peer->describe() << "left pairing" << code << "before completion";
        other->sendText(SyncMessage::encode(SyncMessage::make(SyncMessage::PeerDisconnected)));
    }
}

void SyncRelay::teardown(const QString& code, bool completed) {
    m_registry->remove(code);
    qCInfo(lcRelay) << "pairing" << code << (completed ? "completed" : "closed");
    emit pairingClosed(code, completed);
}
