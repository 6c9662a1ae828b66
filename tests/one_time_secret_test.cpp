#include "ErrorKind.hpp"
#include "MemoryKeyValueStore.hpp"
#include "OneTimeSecretService.hpp"
#include "TestSupport.hpp"

#include <QUuid>
#include <cassert>
#include <iostream>

namespace {

ErrorKind KindOf(const std::function<void()>& fn) {
    try {
        fn();
    } catch (const ServiceError& e) {
        return e.kind();
    }
    assert(false && "expected a ServiceError");
    return ErrorKind::Internal;
}

void TestCreateReturnsUuidAndStoresUnderPrefix() {
    MemoryKeyValueStore kv;
    OneTimeSecretService secrets(&kv);

    const QString id = secrets.create("wrapped-key");
    assert(!QUuid::fromString(id).isNull());
    assert(kv.exists("onetimekey:" + id));
}

void TestSecondConsumeFailsNotFound() {
    MemoryKeyValueStore kv;
    OneTimeSecretService secrets(&kv);
    const QString id = secrets.create("wrapped-key");

    assert(secrets.consume(id) == QByteArray("wrapped-key"));
    assert(KindOf([&] { secrets.consume(id); }) == ErrorKind::NotFound);
    assert(KindOf([&] { secrets.consume(id); }) == ErrorKind::NotFound);
}

void TestPeekDoesNotConsume() {
    MemoryKeyValueStore kv;
    OneTimeSecretService secrets(&kv);
    const QString id = secrets.create("wrapped-key");

    for (int i = 0; i < 3; ++i) assert(secrets.peek(id) == "available");
    assert(secrets.consume(id) == QByteArray("wrapped-key"));
    assert(KindOf([&] { secrets.peek(id); }) == ErrorKind::NotFound);
}

void TestExpiredSecretIsGone() {
    ManualClock clock;
    MemoryKeyValueStore kv(QStringLiteral("m"), clock.fn());
    OneTimeSecretService secrets(&kv);
    const QString id = secrets.create("wrapped-key");

    clock.advanceSeconds(OneTimeSecretService::kDefaultTtlSeconds - 1);
    assert(secrets.peek(id) == "available");

    clock.advanceSeconds(1);
    assert(KindOf([&] { secrets.peek(id); }) == ErrorKind::NotFound);
    assert(KindOf([&] { secrets.consume(id); }) == ErrorKind::NotFound);
}

void TestMalformedInputIsValidationFailure() {
    MemoryKeyValueStore kv;
    OneTimeSecretService secrets(&kv);

    assert(KindOf([&] { secrets.create(QByteArray()); }) == ErrorKind::ValidationFailure);
    assert(KindOf([&] { secrets.consume(""); }) == ErrorKind::ValidationFailure);
    assert(KindOf([&] { secrets.consume("not-a-uuid"); }) == ErrorKind::ValidationFailure);
    assert(KindOf([&] { secrets.peek("../share/x"); }) == ErrorKind::ValidationFailure);
}

void TestUnknownIdIsNotFound() {
    MemoryKeyValueStore kv;
    OneTimeSecretService secrets(&kv);
    const QString id = QUuid::createUuid().toString(QUuid::WithoutBraces);

    assert(KindOf([&] { secrets.consume(id); }) == ErrorKind::NotFound);
    assert(KindOf([&] { secrets.peek(id); }) == ErrorKind::NotFound);
}

} // namespace

int main() {
    TestCreateReturnsUuidAndStoresUnderPrefix();
    TestSecondConsumeFailsNotFound();
    TestPeekDoesNotConsume();
    TestExpiredSecretIsGone();
    TestMalformedInputIsValidationFailure();
    TestUnknownIdIsNotFound();

    std::cout << "one_time_secret_test: pass\n";
    return 0;
}
