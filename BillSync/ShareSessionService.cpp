#include "ShareSessionService.hpp"
#include "CryptoEngine.hpp"
#include "ErrorKind.hpp"
#include "KeyValueStore.hpp"
#include "Logging.hpp"

#include <QDateTime>
#include <QJsonDocument>
#include <QJsonObject>
#include <QUuid>

ShareSessionService::ShareSessionService(KeyValueStore* kv, qint64 ttlSeconds, Clock clock)
    : m_kv(kv), m_ttlSeconds(ttlSeconds), m_clock(std::move(clock)) {
    if (!m_clock) m_clock = [] { return QDateTime::currentMSecsSinceEpoch(); };
}

QString ShareSessionService::storageKey(const QString& id) {
    return QStringLiteral("share:") + id;
}

void ShareSessionService::requireValidId(const QString& id) {
    if (id.isEmpty())
        throw ServiceError(ErrorKind::ValidationFailure, QStringLiteral("Missing 'shareId'."));
    if (QUuid::fromString(id).isNull())
        throw ServiceError(ErrorKind::ValidationFailure, QStringLiteral("Malformed 'shareId'."));
}

std::optional<ShareSessionService::Record> ShareSessionService::load(const QString& id) {
    const auto raw = m_kv->get(storageKey(id));
    if (!raw) return std::nullopt;

    const QJsonObject o = QJsonDocument::fromJson(*raw).object();
    Record r;
    r.ciphertext = CryptoEngine::fromBase64Url(o.value("ciphertext").toString());
    r.version = qint64(o.value("version").toDouble());
    r.updateToken = o.value("updateToken").toString();
    if (r.ciphertext.isEmpty() || r.version <= 0) {
        qCWarning(lcShare) << "share session" << id << "is corrupted";
        throw ServiceError(ErrorKind::Internal,
                           QStringLiteral("Share session is corrupted and contains no valid data payload."));
    }
    return r;
}

void ShareSessionService::store(const QString& id, const Record& record) {
    QJsonObject o;
    o["ciphertext"] = CryptoEngine::toBase64Url(record.ciphertext);
    o["version"] = double(record.version);
    o["updateToken"] = record.updateToken;
    try {
        m_kv->set(storageKey(id), QJsonDocument(o).toJson(QJsonDocument::Compact), m_ttlSeconds);
    } catch (const KvBackendError& e) {
        qCWarning(lcShare) << "store error for share session" << id << ":" << e.what();
        throw ServiceError(ErrorKind::Internal,
                           QStringLiteral("A storage error occurred while saving the share session."));
    }
}

ShareCreated ShareSessionService::create(const QByteArray& ciphertext) {
    if (ciphertext.isEmpty())
        throw ServiceError(ErrorKind::ValidationFailure,
                           QStringLiteral("Invalid payload. 'ciphertext' is required."));

    ShareCreated created;
    created.id = QUuid::createUuid().toString(QUuid::WithoutBraces);
    created.version = m_clock();
    created.updateToken = QUuid::createUuid().toString(QUuid::WithoutBraces);

    store(created.id, Record{ciphertext, created.version, created.updateToken});
    qCInfo(lcShare) << "created share session" << created.id;
    return created;
}

qint64 ShareSessionService::update(const QString& id, const QByteArray& ciphertext, const QString& updateToken) {
    requireValidId(id);
    if (ciphertext.isEmpty())
        throw ServiceError(ErrorKind::ValidationFailure,
                           QStringLiteral("Invalid payload. 'ciphertext' is required."));

    auto existing = load(id);
    if (!existing)
        throw ServiceError(ErrorKind::NotFound, QStringLiteral("Share session not found or expired."));
    if (existing->updateToken != updateToken)
        throw ServiceError(ErrorKind::Forbidden, QStringLiteral("Forbidden: Invalid update token provided."));

    Record next = *existing;
    next.ciphertext = ciphertext;
    next.version = qMax(m_clock(), existing->version + 1);
    store(id, next);
    qCDebug(lcShare) << "updated share session" << id << "to version" << next.version;
    return next.version;
}

std::optional<ShareSnapshot> ShareSessionService::fetch(const QString& id, std::optional<qint64> ifNewerThan) {
    requireValidId(id);
    auto record = load(id);
    if (!record)
        throw ServiceError(ErrorKind::NotFound, QStringLiteral("Invalid or expired share ID."));
    if (ifNewerThan && record->version <= *ifNewerThan) return std::nullopt;
    return ShareSnapshot{record->ciphertext, record->version};
}

QVector<ShareStatus> ShareSessionService::statusBatch(const QStringList& ids) {
    QVector<ShareStatus> out;
    out.reserve(ids.size());
    for (const QString& id : ids) {
        requireValidId(id);
        out.push_back({id, m_kv->exists(storageKey(id))});
    }
    return out;
}

QVector<ShareChange> ShareSessionService::fetchChanged(const QVector<ShareVersionCheck>& known) {
    QVector<ShareChange> changed;
    for (const ShareVersionCheck& k : known) {
        requireValidId(k.id);
        auto record = load(k.id);
        if (!record) continue;
        if (record->version > k.version)
            changed.push_back({k.id, record->ciphertext, record->version});
    }
    return changed;
}
