#pragma once
#include <QByteArray>
#include <QString>
#include <QStringList>
#include <QVector>
#include <functional>
#include <optional>

class KeyValueStore;

struct ShareCreated {
    QString id;
    qint64 version = 0;
    QString updateToken;
};

struct ShareSnapshot {
    QByteArray ciphertext;
    qint64 version = 0;
};

struct ShareStatus {
    QString id;
    bool live = false;
};

struct ShareVersionCheck {
    QString id;
    qint64 version = 0;
};

struct ShareChange {
    QString id;
    QByteArray ciphertext;
    qint64 version = 0;
};

// Versioned ciphertext blobs behind persistent (re-shareable) bill links.
class ShareSessionService {
public:
    using Clock = std::function<qint64()>;

    static constexpr qint64 kDefaultTtlSeconds = 30LL * 24 * 60 * 60;

    explicit ShareSessionService(KeyValueStore* kv,
                                 qint64 ttlSeconds = kDefaultTtlSeconds,
                                 Clock clock = {});

    ShareCreated create(const QByteArray& ciphertext);

    // Throws NotFound when the session expired or never existed, Forbidden
    // when updateToken does not match. Returns the new version, which is
    // always greater than the previous one. Resets the TTL.
    qint64 update(const QString& id, const QByteArray& ciphertext, const QString& updateToken);

    // std::nullopt means "not modified": the stored version is not newer
    // than ifNewerThan.
    std::optional<ShareSnapshot> fetch(const QString& id, std::optional<qint64> ifNewerThan = std::nullopt);

    QVector<ShareStatus> statusBatch(const QStringList& ids);
    QVector<ShareChange> fetchChanged(const QVector<ShareVersionCheck>& known);

private:
    struct Record {
        QByteArray ciphertext;
        qint64 version = 0;
        QString updateToken;
    };

    static QString storageKey(const QString& id);
    static void requireValidId(const QString& id);
    std::optional<Record> load(const QString& id);
    void store(const QString& id, const Record& record);

    KeyValueStore* m_kv = nullptr;
    qint64 m_ttlSeconds;
    Clock m_clock;
};
