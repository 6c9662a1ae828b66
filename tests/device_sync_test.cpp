#include "CryptoEngine.hpp"
#include "DeviceSyncController.hpp"
#include "JsonFileDataStore.hpp"
#include "LocalSyncChannel.hpp"
#include "PairingRegistry.hpp"
#include "SyncCollaborators.hpp"
#include "SyncMessage.hpp"
#include "SyncRelay.hpp"
#include "TestSupport.hpp"

#include <QFile>
#include <QJsonArray>
#include <QTemporaryDir>
#include <QTimer>
#include <QVector>
#include <cassert>
#include <iostream>
#include <optional>

namespace {

using State = SyncStateMachine::State;

class MemoryDataStore : public SyncDataStore {
public:
    QJsonObject exportAllData() override { return data; }

    bool importAllData(const QJsonObject& snapshot, QString* error) override {
        if (refuse) {
            if (error) *error = QStringLiteral("disk full");
            return false;
        }
        data = snapshot;
        return true;
    }

    QJsonObject data;
    bool refuse = false;
};

class ScriptedPrompt : public ConfirmationPrompt {
public:
    enum class Answer { Confirm, Decline, Hold };

    void ask(const QString& title, const QString&, std::function<void()> onConfirm,
             std::function<void()> onCancel) override {
        ++asked;
        lastTitle = title;
        confirm = std::move(onConfirm);
        decline = std::move(onCancel);
        if (answer == Answer::Hold) return;
        QTimer::singleShot(0, [this] {
            if (answer == Answer::Confirm)
                confirm();
            else
                decline();
        });
    }

    Answer answer = Answer::Confirm;
    int asked = 0;
    QString lastTitle;
    std::function<void()> confirm;
    std::function<void()> decline;
};

// Accepts open() and never answers.
class SilentChannel : public SyncChannel {
public:
    void open(const QString&) override {}
    void send(const QJsonObject&) override {}
    void close() override {}
};

struct Device {
    Device(CryptoEngine* crypto, SyncRelay* relay, const QString& name)
        : channel(relay, name), controller(crypto, &channel, &store, &prompt) {
        QObject::connect(&controller, &DeviceSyncController::codeReady, [this](const QString& c) { code = c; });
        QObject::connect(&controller, &DeviceSyncController::completed, [this] { ++completions; });
        QObject::connect(&controller, &DeviceSyncController::cancelled,
                         [this](const QString& m) { cancelMessage = m; });
        QObject::connect(&controller, &DeviceSyncController::failed, [this](ErrorKind k, const QString& m) {
            errorKind = k;
            errorMessage = m;
        });
    }

    LocalSyncChannel channel;
    MemoryDataStore store;
    ScriptedPrompt prompt;
    DeviceSyncController controller;

    QString code;
    int completions = 0;
    QString cancelMessage;
    std::optional<ErrorKind> errorKind;
    QString errorMessage;
};

struct World {
    CryptoEngine crypto;
    PairingRegistry registry;
    SyncRelay relay{&registry, &crypto};

    World() {
        relay.setCodeGenerator([] { return QStringLiteral("482913"); });
    }
};

QJsonObject ThreeBills() {
    QJsonArray bills;
    bills.append(QJsonObject{{"id", "b1"}, {"title", "Dinner"}, {"total", 42.0}});
    bills.append(QJsonObject{{"id", "b2"}, {"title", "Groceries"}, {"total", 18.5}});
    bills.append(QJsonObject{{"id", "b3"}, {"title", "Taxi"}, {"total", 23.0}});
    return QJsonObject{{"bills", bills}, {"settings", QJsonObject{{"currency", "USD"}}}};
}

QJsonObject OldData() {
    return QJsonObject{{"bills", QJsonArray{QJsonObject{{"id", "old"}}}}};
}

// Sender gets its code and the receiver joins it.
void Pair(Device& sender, Device& receiver) {
    assert(sender.controller.startSending());
    assert(sender.controller.state() == State::Connecting);
    assert(WaitUntil([&] { return !sender.code.isEmpty(); }));
    assert(sender.controller.state() == State::Waiting);
    assert(receiver.controller.startReceiving(sender.code));
}

void TestFullTransfer() {
    World w;
    Device sender(&w.crypto, &w.relay, "phone");
    Device receiver(&w.crypto, &w.relay, "laptop");
    sender.store.data = ThreeBills();
    receiver.store.data = OldData();

    Pair(sender, receiver);
    assert(sender.code == "482913");

    assert(WaitUntil([&] { return sender.completions == 1 && receiver.completions == 1; }));
    assert(sender.controller.state() == State::Complete);
    assert(receiver.controller.state() == State::Complete);
    assert(receiver.prompt.asked == 1);
    assert(receiver.store.data == ThreeBills());
    assert(receiver.store.data.value("bills").toArray().size() == 3);
    assert(sender.store.data == ThreeBills());
    assert(!sender.errorKind && !receiver.errorKind);
    assert(!w.registry.contains("482913"));

    // The code is single-use.
    Device late(&w.crypto, &w.relay, "tablet");
    assert(late.controller.startReceiving("482913"));
    assert(WaitUntil([&] { return late.errorKind.has_value(); }));
    assert(*late.errorKind == ErrorKind::NotFound);
    assert(late.errorMessage.contains("Invalid or expired"));
    assert(late.controller.state() == State::Error);

    late.controller.reset();
    assert(late.controller.state() == State::Idle);
    sender.controller.reset();
    assert(sender.controller.state() == State::Idle);
}

void TestDeclineLeavesDataAndReturnsSenderToIdle() {
    World w;
    Device sender(&w.crypto, &w.relay, "phone");
    Device receiver(&w.crypto, &w.relay, "laptop");
    sender.store.data = ThreeBills();
    receiver.store.data = OldData();
    receiver.prompt.answer = ScriptedPrompt::Answer::Decline;

    Pair(sender, receiver);
    assert(WaitUntil([&] { return !sender.cancelMessage.isEmpty() && !receiver.cancelMessage.isEmpty(); }));

    assert(receiver.store.data == OldData());
    assert(receiver.controller.state() == State::Idle);
    assert(receiver.cancelMessage == "Import cancelled. No data was changed.");
    assert(sender.controller.state() == State::Idle);
    assert(sender.cancelMessage == "User cancelled import.");
    assert(sender.completions == 0 && receiver.completions == 0);
    assert(!sender.errorKind && !receiver.errorKind);
}

void TestCancelWhileConfirmingCountsAsDecline() {
    World w;
    Device sender(&w.crypto, &w.relay, "phone");
    Device receiver(&w.crypto, &w.relay, "laptop");
    sender.store.data = ThreeBills();
    receiver.store.data = OldData();
    receiver.prompt.answer = ScriptedPrompt::Answer::Hold;

    Pair(sender, receiver);
    assert(WaitUntil([&] { return receiver.controller.state() == State::Confirming; }));
    receiver.controller.cancel();
    assert(receiver.controller.state() == State::Idle);
    assert(WaitUntil([&] { return sender.controller.state() == State::Idle; }));

    // A late answer from the dialog changes nothing.
    receiver.prompt.confirm();
    Drain();
    assert(receiver.store.data == OldData());
    assert(receiver.completions == 0);
}

void TestFailedImportFailsBothSides() {
    World w;
    Device sender(&w.crypto, &w.relay, "phone");
    Device receiver(&w.crypto, &w.relay, "laptop");
    sender.store.data = ThreeBills();
    receiver.store.data = OldData();
    receiver.store.refuse = true;

    Pair(sender, receiver);
    assert(WaitUntil([&] { return sender.errorKind && receiver.errorKind; }));
    assert(*receiver.errorKind == ErrorKind::Internal);
    assert(receiver.errorMessage == "Could not save the received data.");
    assert(*sender.errorKind == ErrorKind::Internal);
    assert(sender.controller.state() == State::Error);
    assert(receiver.store.data == OldData());
}

void TestDropMidTransfer() {
    World w;
    Device sender(&w.crypto, &w.relay, "phone");
    Device receiver(&w.crypto, &w.relay, "laptop");
    sender.store.data = ThreeBills();
    receiver.store.data = OldData();
    receiver.prompt.answer = ScriptedPrompt::Answer::Hold;

    Pair(sender, receiver);
    assert(WaitUntil([&] { return receiver.prompt.asked == 1; }));
    assert(sender.controller.state() == State::Sending);

    sender.channel.dropConnection();
    assert(WaitUntil([&] { return sender.errorKind && receiver.errorKind; }));
    assert(*sender.errorKind == ErrorKind::TransportFailure);
    assert(sender.errorMessage == "Connection to the sync service was lost.");
    assert(*receiver.errorKind == ErrorKind::TransportFailure);
    assert(receiver.errorMessage == "The other device disconnected.");
    assert(receiver.controller.state() == State::Error);

    receiver.prompt.confirm();
    Drain();
    assert(receiver.store.data == OldData());
    assert(receiver.completions == 0);
}

void TestRelayUnreachable() {
    CryptoEngine crypto;
    Device offline(&crypto, nullptr, "offline");

    assert(offline.controller.startSending());
    assert(WaitUntil([&] { return offline.errorKind.has_value(); }));
    assert(*offline.errorKind == ErrorKind::TransportFailure);
    assert(offline.errorMessage == "Could not connect to sync service.");
    assert(offline.controller.state() == State::Error);
}

void TestConnectTimeout() {
    CryptoEngine crypto;
    SilentChannel channel;
    MemoryDataStore store;
    ScriptedPrompt prompt;
    DeviceSyncController controller(&crypto, &channel, &store, &prompt);
    controller.setConnectTimeoutMs(50);

    std::optional<ErrorKind> kind;
    QString message;
    QObject::connect(&controller, &DeviceSyncController::failed, [&](ErrorKind k, const QString& m) {
        kind = k;
        message = m;
    });

    assert(controller.startReceiving("123456"));
    assert(WaitUntil([&] { return kind.has_value(); }, 2000));
    assert(*kind == ErrorKind::TransportFailure);
    assert(message == "Timed out connecting to the sync service.");
    assert(controller.state() == State::Error);
}

void TestInvalidCodeAndBusyGuard() {
    World w;
    Device d(&w.crypto, &w.relay, "phone");

    assert(!d.controller.startReceiving("12ab56"));
    assert(d.errorKind && *d.errorKind == ErrorKind::ValidationFailure);
    assert(d.errorMessage == "Please enter a valid 6-digit code.");
    assert(d.controller.state() == State::Error);
    assert(!d.controller.startSending());

    d.controller.reset();
    assert(d.controller.startSending());
    assert(!d.controller.startSending());
    assert(!d.controller.startReceiving("123456"));
    assert(d.controller.role() == DeviceSyncController::Role::Sender);

    d.controller.cancel();
    assert(d.controller.state() == State::Idle);
    assert(d.cancelMessage == "Sync cancelled.");
}

void TestDataBeforeKeyIsRejected() {
    World w;
    Device receiver(&w.crypto, &w.relay, "laptop");
    receiver.store.data = OldData();

    LocalSyncChannel rogue(&w.relay, "rogue");
    QVector<QJsonObject> seen;
    QObject::connect(&rogue, &SyncChannel::messageReceived, [&](const QJsonObject& m) { seen << m; });
    rogue.open(QString());
    assert(WaitUntil([&] { return !seen.isEmpty(); }));
    const QString code = seen.first().value("code").toString();

    assert(receiver.controller.startReceiving(code));
    assert(WaitUntil([&] { return receiver.controller.state() == State::Connected; }));

    QJsonObject data = SyncMessage::make(SyncMessage::Data);
    data["payload"] = CryptoEngine::toBase64Url("not encrypted");
    rogue.send(data);

    assert(WaitUntil([&] { return receiver.errorKind.has_value(); }));
    assert(*receiver.errorKind == ErrorKind::ValidationFailure);
    assert(receiver.errorMessage == "Data received before encryption key. Sync failed.");
    assert(WaitUntil([&] { return seen.last().value("type").toString() == SyncMessage::Error; }));
    assert(receiver.store.data == OldData());
    assert(receiver.prompt.asked == 0);
}

void TestJsonFileDataStore() {
    QTemporaryDir dir;
    assert(dir.isValid());
    JsonFileDataStore store(dir.filePath("data.json"));
    assert(store.exportAllData().isEmpty());

    QString error;
    assert(store.importAllData(ThreeBills(), &error));
    assert(store.exportAllData() == ThreeBills());

    QFile f(store.path());
    assert(f.open(QIODevice::WriteOnly | QIODevice::Truncate));
    f.write("[not an object");
    f.close();
    assert(store.exportAllData().isEmpty());

    JsonFileDataStore unwritable(dir.filePath("missing/dir/data.json"));
    assert(!unwritable.importAllData(ThreeBills(), &error));
    assert(!error.isEmpty());
}

} // namespace

int main(int argc, char* argv[]) {
    QCoreApplication app(argc, argv);

    TestFullTransfer();
    TestDeclineLeavesDataAndReturnsSenderToIdle();
    TestCancelWhileConfirmingCountsAsDecline();
    TestFailedImportFailsBothSides();
    TestDropMidTransfer();
    TestRelayUnreachable();
    TestConnectTimeout();
    TestInvalidCodeAndBusyGuard();
    TestDataBeforeKeyIsRejected();
    TestJsonFileDataStore();

    std::cout << "device_sync_test: pass\n";
    return 0;
}
