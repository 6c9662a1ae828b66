#include "MemoryKeyValueStore.hpp"
#include "Logging.hpp"

#include <QDateTime>
#include <QMutexLocker>
#include <limits>

namespace {

// Saturates instead of overflowing for absurdly long TTLs.
qint64 expiryFor(qint64 now, qint64 ttlSeconds) {
    constexpr qint64 kMax = std::numeric_limits<qint64>::max();
    if (ttlSeconds >= (kMax - now) / 1000) return kMax;
    return now + ttlSeconds * 1000;
}

} // namespace

MemoryKeyValueStore::MemoryKeyValueStore(const QString& name, Clock clock)
    : m_name(name), m_clock(std::move(clock)) {
    if (!m_clock) m_clock = [] { return QDateTime::currentMSecsSinceEpoch(); };
}

bool MemoryKeyValueStore::isLive(const Record& r, qint64 now) const {
    return r.expiresAtMs == 0 || now < r.expiresAtMs;
}

std::optional<QByteArray> MemoryKeyValueStore::get(const QString& key) {
    QMutexLocker lock(&m_mutex);
    auto it = m_records.find(key);
    if (it == m_records.end()) return std::nullopt;
    if (!isLive(*it, m_clock())) {
        m_records.erase(it);
        return std::nullopt;
    }
    return it->value;
}

void MemoryKeyValueStore::set(const QString& key, const QByteArray& value, qint64 ttlSeconds) {
    QMutexLocker lock(&m_mutex);
    Record r;
    r.value = value;
    r.expiresAtMs = ttlSeconds > 0 ? expiryFor(m_clock(), ttlSeconds) : 0;
    m_records.insert(key, r);
}

void MemoryKeyValueStore::del(const QString& key) {
    QMutexLocker lock(&m_mutex);
    m_records.remove(key);
}

bool MemoryKeyValueStore::exists(const QString& key) {
    QMutexLocker lock(&m_mutex);
    auto it = m_records.find(key);
    if (it == m_records.end()) return false;
    if (!isLive(*it, m_clock())) {
        m_records.erase(it);
        return false;
    }
    return true;
}

std::optional<QByteArray> MemoryKeyValueStore::take(const QString& key) {
    QMutexLocker lock(&m_mutex);
    auto it = m_records.find(key);
    if (it == m_records.end()) return std::nullopt;
    const bool live = isLive(*it, m_clock());
    QByteArray value = it->value;
    m_records.erase(it);
    if (!live) return std::nullopt;
    return value;
}

int MemoryKeyValueStore::sweepExpired() {
    QMutexLocker lock(&m_mutex);
    const qint64 now = m_clock();
    int removed = 0;
    for (auto it = m_records.begin(); it != m_records.end();) {
        if (!isLive(*it, now)) {
            it = m_records.erase(it);
            ++removed;
        } else {
            ++it;
        }
    }
    if (removed > 0)
        qCDebug(lcKv) << m_name << "swept" << removed << "expired records";
    return removed;
}

int MemoryKeyValueStore::size() const {
    QMutexLocker lock(&m_mutex);
    return int(m_records.size());
}
