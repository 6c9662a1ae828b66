#include "BillShareState.hpp"

QJsonObject BillShareState::toJson() const {
    QJsonObject o;
    o["billId"] = billId;
    o["shareId"] = shareId;
    o["updateToken"] = updateToken;
    o["version"] = double(version);
    if (contentKey.size() == 32)
        o["contentKey"] = CryptoEngine::exportSymmetricKey(contentKey);
    if (signing.isValid()) {
        o["signingPublicKey"] = CryptoEngine::exportPublicKey(signing.publicKey);
        o["signingPrivateKey"] = CryptoEngine::exportSigningKeyPair(signing);
    }

    QJsonObject parts;
    for (auto it = participants.constBegin(); it != participants.constEnd(); ++it) {
        QJsonObject p;
        p["keyId"] = it->keyId;
        p["fragmentKey"] = CryptoEngine::exportSymmetricKey(it->fragmentKey);
        p["expiresAtMs"] = double(it->expiresAtMs);
        parts[it.key()] = p;
    }
    o["participants"] = parts;
    return o;
}

BillShareState BillShareState::fromJson(const QJsonObject& o) {
    BillShareState s;
    s.billId = o.value("billId").toString();
    s.shareId = o.value("shareId").toString();
    s.updateToken = o.value("updateToken").toString();
    s.version = qint64(o.value("version").toDouble());
    s.contentKey = CryptoEngine::importSymmetricKey(o.value("contentKey").toString());
    s.signing = CryptoEngine::importSigningKeyPair(o.value("signingPrivateKey").toString());

    const QJsonObject parts = o.value("participants").toObject();
    for (auto it = parts.constBegin(); it != parts.constEnd(); ++it) {
        const QJsonObject p = it.value().toObject();
        ParticipantLink link;
        link.keyId = p.value("keyId").toString();
        link.fragmentKey = CryptoEngine::importSymmetricKey(p.value("fragmentKey").toString());
        link.expiresAtMs = qint64(p.value("expiresAtMs").toDouble());
        if (link.keyId.isEmpty() || link.fragmentKey.isEmpty()) continue;
        s.participants.insert(it.key(), link);
    }
    return s;
}
