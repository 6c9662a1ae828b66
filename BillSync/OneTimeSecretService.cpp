#include "OneTimeSecretService.hpp"
#include "ErrorKind.hpp"
#include "KeyValueStore.hpp"
#include "Logging.hpp"

#include <QUuid>

OneTimeSecretService::OneTimeSecretService(KeyValueStore* kv, qint64 ttlSeconds)
    : m_kv(kv), m_ttlSeconds(ttlSeconds) {}

QString OneTimeSecretService::storageKey(const QString& id) {
    return QStringLiteral("onetimekey:") + id;
}

void OneTimeSecretService::requireValidId(const QString& id) {
    if (id.isEmpty())
        throw ServiceError(ErrorKind::ValidationFailure, QStringLiteral("Missing 'keyId'."));
    if (QUuid::fromString(id).isNull())
        throw ServiceError(ErrorKind::ValidationFailure, QStringLiteral("Malformed 'keyId'."));
}

QString OneTimeSecretService::create(const QByteArray& payload) {
    if (payload.isEmpty())
        throw ServiceError(ErrorKind::ValidationFailure,
                           QStringLiteral("Invalid payload. 'encryptedPayload' is required."));

    const QString id = QUuid::createUuid().toString(QUuid::WithoutBraces);
    try {
        m_kv->set(storageKey(id), payload, m_ttlSeconds);
    } catch (const KvBackendError& e) {
        qCWarning(lcSecret) << "store error while creating one-time key:" << e.what();
        throw ServiceError(ErrorKind::Internal,
                           QStringLiteral("A storage error occurred while creating the one-time key."));
    }
    qCInfo(lcSecret) << "created one-time key" << id;
    return id;
}

QByteArray OneTimeSecretService::consume(const QString& id) {
    requireValidId(id);

    std::optional<QByteArray> payload;
    try {
        payload = m_kv->take(storageKey(id));
    } catch (const KvBackendError& e) {
        qCWarning(lcSecret) << "store error while consuming" << id << ":" << e.what();
        throw ServiceError(ErrorKind::Internal,
                           QStringLiteral("A storage error occurred while reading the one-time key."));
    }
    if (!payload)
        throw ServiceError(ErrorKind::NotFound, QStringLiteral("Invalid or expired key ID."));

    qCInfo(lcSecret) << "one-time key" << id << "consumed";
    return *payload;
}

QString OneTimeSecretService::peek(const QString& id) {
    requireValidId(id);
    if (!m_kv->exists(storageKey(id)))
        throw ServiceError(ErrorKind::NotFound, QStringLiteral("Key not found or already consumed."));
    return QStringLiteral("available");
}
