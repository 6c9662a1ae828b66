#pragma once
#include "KeyValueStore.hpp"

#include <memory>
#include <vector>

// Federates several independent backends.
//   set/take  -> the one backend chosen by stableHash(key) % n
//   del       -> every backend
//   get/exists-> every backend concurrently, first affirmative answer wins;
//                a backend error counts as "no answer"
class ShardedKeyValueStore : public KeyValueStore {
public:
    explicit ShardedKeyValueStore(std::vector<std::shared_ptr<KeyValueStore>> backends);

    std::optional<QByteArray> get(const QString& key) override;
    void set(const QString& key, const QByteArray& value, qint64 ttlSeconds) override;
    void del(const QString& key) override;
    bool exists(const QString& key) override;
    std::optional<QByteArray> take(const QString& key) override;

    static quint32 stableHash(const QString& key);
    int backendIndexFor(const QString& key) const;
    int backendCount() const { return int(m_backends.size()); }

private:
    std::optional<QByteArray> probe(const QString& key, bool valueNeeded);

    std::vector<std::shared_ptr<KeyValueStore>> m_backends;
};
