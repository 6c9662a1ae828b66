#include "SharedBillPayload.hpp"
#include "CryptoEngine.hpp"
#include "Logging.hpp"

#include <QJsonArray>
#include <QJsonDocument>

namespace SharedBillPayload {

namespace {

QByteArray canonical(const QJsonObject& o) {
    return QJsonDocument(o).toJson(QJsonDocument::Compact);
}

} // namespace

QJsonObject sanitizeBill(const QJsonObject& bill) {
    QJsonObject out = bill;
    QJsonArray participants;
    for (const QJsonValue& v : bill.value("participants").toArray()) {
        QJsonObject p = v.toObject();
        p.remove("phone");
        p.remove("email");
        participants.append(p);
    }
    if (bill.contains("participants")) out["participants"] = participants;
    return out;
}

QByteArray build(const CryptoEngine& crypto, const QJsonObject& bill, const QString& creatorName,
                 const QJsonObject& paymentDetails, const SigningKeyPair& signing) {
    const QJsonObject clean = sanitizeBill(bill);

    QJsonObject o;
    o["bill"] = clean;
    o["creatorName"] = creatorName;
    o["publicKey"] = CryptoEngine::exportPublicKey(signing.publicKey);
    o["signature"] = CryptoEngine::toBase64Url(crypto.signDetached(canonical(clean), signing.secretKey));
    if (!paymentDetails.isEmpty()) o["paymentDetails"] = paymentDetails;
    return canonical(o);
}

std::optional<SharedBill> verify(const CryptoEngine& crypto, const QByteArray& payload, QString* error) {
    QJsonParseError perr{};
    const QJsonDocument doc = QJsonDocument::fromJson(payload, &perr);
    if (perr.error != QJsonParseError::NoError || !doc.isObject()) {
        if (error) *error = QStringLiteral("Shared bill payload is not valid JSON.");
        return std::nullopt;
    }
    const QJsonObject o = doc.object();

    SharedBill out;
    out.bill = o.value("bill").toObject();
    out.creatorName = o.value("creatorName").toString();
    out.paymentDetails = o.value("paymentDetails").toObject();
    out.publicKey = CryptoEngine::importPublicKey(o.value("publicKey").toString());
    const QByteArray signature = CryptoEngine::fromBase64Url(o.value("signature").toString());

    if (out.bill.isEmpty() || out.publicKey.isEmpty()) {
        if (error) *error = QStringLiteral("Shared bill payload is incomplete.");
        return std::nullopt;
    }
    if (!crypto.verifyDetached(canonical(out.bill), signature, out.publicKey)) {
        qCWarning(lcCrypto) << "signature check failed for bill" << out.bill.value("id").toString();
        if (error) *error = QStringLiteral("The shared bill's signature is invalid.");
        return std::nullopt;
    }
    return out;
}

} // namespace SharedBillPayload
