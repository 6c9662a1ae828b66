#pragma once
#include <QByteArray>
#include <QString>
#include <optional>
#include <stdexcept>

// Raised by a backend that cannot serve a request (unreachable, shut down).
class KvBackendError : public std::runtime_error {
public:
    explicit KvBackendError(const QString& message)
        : std::runtime_error(message.toStdString()) {}
};

// Ephemeral key/value storage with per-key expiry. Implementations must be
// safe to call from several threads at once.
class KeyValueStore {
public:
    virtual ~KeyValueStore() = default;

    virtual std::optional<QByteArray> get(const QString& key) = 0;

    // ttlSeconds <= 0 stores the value without expiry.
    virtual void set(const QString& key, const QByteArray& value, qint64 ttlSeconds) = 0;

    virtual void del(const QString& key) = 0;
    virtual bool exists(const QString& key) = 0;

    // Atomic get-and-delete. At most one caller observes the value.
    virtual std::optional<QByteArray> take(const QString& key) = 0;
};
