#include "MemoryKeyValueStore.hpp"
#include "ShardedKeyValueStore.hpp"
#include "TestSupport.hpp"

#include <QAtomicInt>
#include <cassert>
#include <iostream>
#include <limits>
#include <memory>
#include <thread>

namespace {

// Backend that can be switched off to imitate an outage.
class FlakyStore : public KeyValueStore {
public:
    std::optional<QByteArray> get(const QString& key) override {
        check();
        return inner.get(key);
    }
    void set(const QString& key, const QByteArray& value, qint64 ttlSeconds) override {
        check();
        inner.set(key, value, ttlSeconds);
    }
    void del(const QString& key) override {
        check();
        inner.del(key);
    }
    bool exists(const QString& key) override {
        check();
        return inner.exists(key);
    }
    std::optional<QByteArray> take(const QString& key) override {
        check();
        return inner.take(key);
    }

    QAtomicInt down{0};
    MemoryKeyValueStore inner{QStringLiteral("flaky")};

private:
    void check() {
        if (down.loadRelaxed()) throw KvBackendError(QStringLiteral("backend offline"));
    }
};

struct Cluster {
    std::vector<std::shared_ptr<FlakyStore>> nodes;
    std::unique_ptr<ShardedKeyValueStore> store;

    explicit Cluster(int n) {
        std::vector<std::shared_ptr<KeyValueStore>> backends;
        for (int i = 0; i < n; ++i) {
            nodes.push_back(std::make_shared<FlakyStore>());
            backends.push_back(nodes.back());
        }
        store = std::make_unique<ShardedKeyValueStore>(backends);
    }
};

void TestMemoryStoreExpiresOnRead() {
    ManualClock clock;
    MemoryKeyValueStore kv(QStringLiteral("m"), clock.fn());

    kv.set("a", "1", 10);
    kv.set("forever", "2", 0);
    assert(kv.get("a") == QByteArray("1"));
    assert(kv.exists("a"));

    clock.advanceSeconds(9);
    assert(kv.exists("a"));

    clock.advanceSeconds(1);
    assert(!kv.get("a"));
    assert(!kv.exists("a"));
    assert(kv.get("forever") == QByteArray("2"));
}

void TestMemoryStoreHugeTtlDoesNotWrap() {
    ManualClock clock;
    MemoryKeyValueStore kv(QStringLiteral("m"), clock.fn());

    kv.set("big", "1", std::numeric_limits<qint64>::max() / 10);
    kv.set("max", "2", std::numeric_limits<qint64>::max());
    clock.advanceSeconds(10LL * 365 * 24 * 60 * 60);
    assert(kv.get("big") == QByteArray("1"));
    assert(kv.get("max") == QByteArray("2"));
    assert(kv.sweepExpired() == 0);
}

void TestMemoryStoreSweepDropsOnlyExpired() {
    ManualClock clock;
    MemoryKeyValueStore kv(QStringLiteral("m"), clock.fn());
    kv.set("short", "x", 5);
    kv.set("long", "y", 500);
    kv.set("none", "z", 0);

    clock.advanceSeconds(60);
    assert(kv.sweepExpired() == 1);
    assert(kv.size() == 2);
    assert(kv.sweepExpired() == 0);
}

void TestMemoryStoreTakeIsSingleUse() {
    MemoryKeyValueStore kv;
    kv.set("k", "v", 60);
    assert(kv.take("k") == QByteArray("v"));
    assert(!kv.take("k"));
    assert(!kv.exists("k"));
}

void TestMemoryStoreTakeRacesHaveOneWinner() {
    MemoryKeyValueStore kv;
    kv.set("k", "v", 60);

    QAtomicInt winners{0};
    std::vector<std::thread> threads;
    for (int i = 0; i < 8; ++i)
        threads.emplace_back([&] {
            if (kv.take("k")) winners.fetchAndAddRelaxed(1);
        });
    for (auto& t : threads) t.join();
    assert(winners.loadRelaxed() == 1);
}

void TestStableHashMatchesStringHash() {
    // h = h * 31 + c
    assert(ShardedKeyValueStore::stableHash("") == 0u);
    assert(ShardedKeyValueStore::stableHash("a") == 97u);
    assert(ShardedKeyValueStore::stableHash("ab") == 97u * 31u + 98u);
    assert(ShardedKeyValueStore::stableHash("onetimekey:x") == ShardedKeyValueStore::stableHash("onetimekey:x"));
}

void TestWritesLandOnDesignatedBackendOnly() {
    Cluster c(3);
    for (int i = 0; i < 30; ++i) {
        const QString key = QString("share:%1").arg(i);
        c.store->set(key, "v", 60);
        const int home = c.store->backendIndexFor(key);
        for (int n = 0; n < 3; ++n) assert(c.nodes[size_t(n)]->inner.exists(key) == (n == home));
    }
}

void TestReadsSurviveOtherBackendOutage() {
    Cluster c(3);
    const QString key = "onetimekey:abc";
    c.store->set(key, "payload", 60);
    const int home = c.store->backendIndexFor(key);

    for (int n = 0; n < 3; ++n)
        if (n != home) c.nodes[size_t(n)]->down.storeRelaxed(1);

    assert(c.store->get(key) == QByteArray("payload"));
    assert(c.store->exists(key));
    assert(!c.store->get("missing"));
}

void TestReadIsAbsentWhenHomeBackendDown() {
    Cluster c(2);
    const QString key = "share:down";
    c.store->set(key, "v", 60);
    c.nodes[size_t(c.store->backendIndexFor(key))]->down.storeRelaxed(1);

    assert(!c.store->get(key));
    assert(!c.store->exists(key));
}

void TestSetPropagatesDesignatedBackendError() {
    Cluster c(3);
    const QString key = "share:err";
    c.nodes[size_t(c.store->backendIndexFor(key))]->down.storeRelaxed(1);

    bool threw = false;
    try {
        c.store->set(key, "v", 60);
    } catch (const KvBackendError&) {
        threw = true;
    }
    assert(threw);
}

void TestDeleteClearsStrayCopies() {
    Cluster c(3);
    const QString key = "share:stray";
    for (auto& n : c.nodes) n->inner.set(key, "old", 60);

    c.store->del(key);
    for (auto& n : c.nodes) assert(!n->inner.exists(key));
}

void TestDeleteToleratesNonHomeOutage() {
    Cluster c(3);
    const QString key = "share:partial";
    c.store->set(key, "v", 60);
    const int home = c.store->backendIndexFor(key);
    c.nodes[size_t((home + 1) % 3)]->down.storeRelaxed(1);

    c.store->del(key);
    assert(!c.store->exists(key));
}

void TestEmptyClusterReadsAbsentAndRejectsWrites() {
    ShardedKeyValueStore kv(std::vector<std::shared_ptr<KeyValueStore>>{});
    assert(!kv.get("k"));
    assert(!kv.exists("k"));
    bool threw = false;
    try {
        kv.set("k", "v", 1);
    } catch (const KvBackendError&) {
        threw = true;
    }
    assert(threw);
}

} // namespace

int main(int argc, char* argv[]) {
    QCoreApplication app(argc, argv);

    TestMemoryStoreExpiresOnRead();
    TestMemoryStoreHugeTtlDoesNotWrap();
    TestMemoryStoreSweepDropsOnlyExpired();
    TestMemoryStoreTakeIsSingleUse();
    TestMemoryStoreTakeRacesHaveOneWinner();
    TestStableHashMatchesStringHash();
    TestWritesLandOnDesignatedBackendOnly();
    TestReadsSurviveOtherBackendOutage();
    TestReadIsAbsentWhenHomeBackendDown();
    TestSetPropagatesDesignatedBackendError();
    TestDeleteClearsStrayCopies();
    TestDeleteToleratesNonHomeOutage();
    TestEmptyClusterReadsAbsentAndRejectsWrites();

    std::cout << "key_value_store_test: pass\n";
    return 0;
}
