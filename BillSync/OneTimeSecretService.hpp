#pragma once
#include <QByteArray>
#include <QString>

class KeyValueStore;

// Holds one opaque blob per id that can be read destructively exactly once.
class OneTimeSecretService {
public:
    static constexpr qint64 kDefaultTtlSeconds = 24 * 60 * 60;

    explicit OneTimeSecretService(KeyValueStore* kv, qint64 ttlSeconds = kDefaultTtlSeconds);

    QString create(const QByteArray& payload);

    // Fetches and deletes. Throws ServiceError(NotFound) if absent, expired or
    // already consumed.
    QByteArray consume(const QString& id);

    // Never deletes. Throws ServiceError(NotFound) under the same conditions
    // as consume().
    QString peek(const QString& id);

    qint64 ttlSeconds() const { return m_ttlSeconds; }

private:
    static QString storageKey(const QString& id);
    static void requireValidId(const QString& id);

    KeyValueStore* m_kv = nullptr;
    qint64 m_ttlSeconds;
};
