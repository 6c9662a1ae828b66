#pragma once
#include "CryptoEngine.hpp"

#include <QHash>
#include <QJsonObject>
#include <QString>

struct ParticipantLink {
    QString keyId;
    QByteArray fragmentKey;
    qint64 expiresAtMs = 0;
};

// Owner-side record of a shared bill. Holds private key material, so it is
// only ever persisted locally.
struct BillShareState {
    QString billId;
    QString shareId;
    QString updateToken;
    qint64 version = 0;
    QByteArray contentKey;
    SigningKeyPair signing;
    QHash<QString, ParticipantLink> participants;

    bool hasSession() const { return !shareId.isEmpty() && contentKey.size() == 32 && signing.isValid(); }

    QJsonObject toJson() const;

    // Missing or malformed key material yields a state without a session.
    static BillShareState fromJson(const QJsonObject& o);
};
