#include "ShardedKeyValueStore.hpp"
#include "Logging.hpp"

#include <QMutex>
#include <QMutexLocker>
#include <QWaitCondition>
#include <QtConcurrent/QtConcurrentRun>

namespace {

struct ProbeState {
    QMutex mutex;
    QWaitCondition done;
    int pending = 0;
    std::optional<QByteArray> hit;
};

} // namespace

ShardedKeyValueStore::ShardedKeyValueStore(std::vector<std::shared_ptr<KeyValueStore>> backends)
    : m_backends(std::move(backends)) {
    if (m_backends.empty())
        qCWarning(lcKv) << "sharded store created without backends; reads return absent and writes fail";
}

quint32 ShardedKeyValueStore::stableHash(const QString& key) {
    // h = h * 31 + c over UTF-16 code units, wrapping at 32 bits
    quint32 h = 0;
    for (QChar c : key) h = (h << 5) - h + c.unicode();
    return h;
}

int ShardedKeyValueStore::backendIndexFor(const QString& key) const {
    if (m_backends.empty()) return -1;
    return int(stableHash(key) % quint32(m_backends.size()));
}

std::optional<QByteArray> ShardedKeyValueStore::probe(const QString& key, bool valueNeeded) {
    if (m_backends.empty()) return std::nullopt;

    auto state = std::make_shared<ProbeState>();
    state->pending = int(m_backends.size());

    for (size_t i = 0; i < m_backends.size(); ++i) {
        std::shared_ptr<KeyValueStore> backend = m_backends[i];
        (void)QtConcurrent::run([state, backend, key, valueNeeded, i]() {
            std::optional<QByteArray> answer;
            try {
                if (valueNeeded) {
                    answer = backend->get(key);
                } else if (backend->exists(key)) {
                    answer = QByteArray();
                }
            } catch (const std::exception& e) {
                qCWarning(lcKv) << "backend" << i << "gave no answer:" << e.what();
            }
            QMutexLocker lock(&state->mutex);
            if (answer && !state->hit) state->hit = std::move(answer);
            --state->pending;
            state->done.wakeAll();
        });
    }

    QMutexLocker lock(&state->mutex);
    while (!state->hit && state->pending > 0) state->done.wait(&state->mutex);
    return state->hit;
}

std::optional<QByteArray> ShardedKeyValueStore::get(const QString& key) {
    return probe(key, true);
}

bool ShardedKeyValueStore::exists(const QString& key) {
    return probe(key, false).has_value();
}

void ShardedKeyValueStore::set(const QString& key, const QByteArray& value, qint64 ttlSeconds) {
    const int idx = backendIndexFor(key);
    if (idx < 0) throw KvBackendError(QStringLiteral("no backends configured"));
    m_backends[size_t(idx)]->set(key, value, ttlSeconds);
}

void ShardedKeyValueStore::del(const QString& key) {
    // A key is normally only on its writer-of-record, but a changed backend
    // count can leave copies elsewhere.
    for (size_t i = 0; i < m_backends.size(); ++i) {
        try {
            m_backends[i]->del(key);
        } catch (const std::exception& e) {
            if (int(i) == backendIndexFor(key)) throw;
            qCWarning(lcKv) << "delete on backend" << i << "failed:" << e.what();
        }
    }
}

std::optional<QByteArray> ShardedKeyValueStore::take(const QString& key) {
    const int idx = backendIndexFor(key);
    if (idx < 0) return std::nullopt;
    return m_backends[size_t(idx)]->take(key);
}
