#pragma once
#include <QByteArray>
#include <QJsonObject>
#include <QString>
#include <optional>

class CryptoEngine;
struct SigningKeyPair;

// Plaintext carried inside a share session's ciphertext:
// {bill, creatorName, publicKey, signature, paymentDetails?}
struct SharedBill {
    QJsonObject bill;
    QString creatorName;
    QJsonObject paymentDetails;
    QByteArray publicKey;
};

namespace SharedBillPayload {

// Copy of the bill with participants' phone and email removed.
QJsonObject sanitizeBill(const QJsonObject& bill);

// Signs the sanitized bill and returns the compact JSON payload.
QByteArray build(const CryptoEngine& crypto, const QJsonObject& bill, const QString& creatorName,
                 const QJsonObject& paymentDetails, const SigningKeyPair& signing);

// Parses a payload and checks the bill's signature against the embedded
// public key. std::nullopt (with *error set) on malformed JSON or a bad
// signature.
std::optional<SharedBill> verify(const CryptoEngine& crypto, const QByteArray& payload,
                                 QString* error = nullptr);

} // namespace SharedBillPayload
