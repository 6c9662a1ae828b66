#pragma once
#include "KeyValueStore.hpp"

#include <QHash>
#include <QMutex>
#include <functional>

class MemoryKeyValueStore : public KeyValueStore {
public:
    using Clock = std::function<qint64()>; // ms since epoch

    explicit MemoryKeyValueStore(const QString& name = QStringLiteral("memory"),
                                 Clock clock = {});

    std::optional<QByteArray> get(const QString& key) override;
    void set(const QString& key, const QByteArray& value, qint64 ttlSeconds) override;
    void del(const QString& key) override;
    bool exists(const QString& key) override;
    std::optional<QByteArray> take(const QString& key) override;

    // Drops every record whose expiry has passed; returns how many went.
    int sweepExpired();

    int size() const;
    const QString& name() const { return m_name; }

private:
    struct Record {
        QByteArray value;
        qint64 expiresAtMs = 0; // 0 = never
    };

    bool isLive(const Record& r, qint64 now) const;

    QString m_name;
    Clock m_clock;
    mutable QMutex m_mutex;
    QHash<QString, Record> m_records;
};
