#include "OneTimeKeyClient.hpp"
#include "CryptoEngine.hpp"
#include "ShareLink.hpp"

#include <QJsonDocument>
#include <QJsonObject>
#include <QTimer>

OneTimeKeyClient::OneTimeKeyClient(ApiTransport* transport, QObject* parent)
    : QObject(parent), m_transport(transport) {}

bool OneTimeKeyClient::rejectMalformed(const QString& keyId, const ErrorCallback& onError) {
    if (ShareLink::isWellFormedId(keyId)) return false;
    QTimer::singleShot(0, this, [onError]() {
        onError({ErrorKind::ValidationFailure, QStringLiteral("Malformed one-time key id.")});
    });
    return true;
}

void OneTimeKeyClient::create(const QByteArray& encryptedPayload,
                              std::function<void(const QString&)> onDone, ErrorCallback onError) {
    QJsonObject j;
    j["encryptedPayload"] = CryptoEngine::toBase64Url(encryptedPayload);

    m_transport->send("POST", "/onetime-key", {}, QJsonDocument(j).toJson(QJsonDocument::Compact),
                      guardedBy(this, [this, onDone, onError](const ApiResponse& res) {
        if (res.status != 201) {
            const ApiError err = apiErrorFrom(res);
            emit status(QString("onetime-key create error: %1").arg(err.message));
            onError(err);
            return;
        }
        const QString keyId = QJsonDocument::fromJson(res.body).object()["keyId"].toString();
        emit status(QString("onetime-key created id=%1").arg(keyId));
        onDone(keyId);
    }));
}

void OneTimeKeyClient::consume(const QString& keyId,
                               std::function<void(const QByteArray&)> onDone, ErrorCallback onError) {
    if (rejectMalformed(keyId, onError)) return;
    m_transport->send("GET", "/onetime-key/" + keyId, {}, {},
                      guardedBy(this, [this, onDone, onError](const ApiResponse& res) {
        if (res.status != 200) {
            const ApiError err = apiErrorFrom(res);
            emit status(QString("onetime-key consume error: %1").arg(err.message));
            onError(err);
            return;
        }
        const QByteArray payload =
            CryptoEngine::fromBase64Url(QJsonDocument::fromJson(res.body).object()["encryptedPayload"].toString());
        if (payload.isEmpty()) {
            onError({ErrorKind::ValidationFailure, QStringLiteral("One-time key payload is corrupted.")});
            return;
        }
        onDone(payload);
    }));
}

void OneTimeKeyClient::peek(const QString& keyId,
                            std::function<void(bool)> onDone, ErrorCallback onError) {
    if (rejectMalformed(keyId, onError)) return;
    m_transport->send("GET", "/onetime-key/" + keyId + "/status", {}, {},
                      [onDone, onError](const ApiResponse& res) {
        if (res.status == 404) {
            onDone(false);
            return;
        }
        if (res.status != 200) {
            onError(apiErrorFrom(res));
            return;
        }
        onDone(QJsonDocument::fromJson(res.body).object()["status"].toString() == "available");
    });
}
