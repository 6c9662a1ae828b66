#include "DeviceSyncController.hpp"
#include "CryptoEngine.hpp"
#include "Logging.hpp"
#include "SyncChannel.hpp"
#include "SyncCollaborators.hpp"
#include "SyncMessage.hpp"

#include <QJsonDocument>

using State = SyncStateMachine::State;
using Event = SyncStateMachine::Event;

DeviceSyncController::DeviceSyncController(CryptoEngine* crypto, SyncChannel* channel, SyncDataStore* store,
                                           ConfirmationPrompt* prompt, QObject* parent)
    : QObject(parent),
    m_crypto(crypto),
    m_channel(channel),
    m_store(store),
    m_prompt(prompt) {

    m_connectTimer.setSingleShot(true);

    connect(&m_machine, &SyncStateMachine::stateChanged, this,
            [this](State, State to) { emit stateChanged(to); });
    connect(&m_connectTimer, &QTimer::timeout, this, &DeviceSyncController::onConnectTimeout);
    connect(m_channel, &SyncChannel::opened, this, [this]() { emit status("relay connected"); });
    connect(m_channel, &SyncChannel::messageReceived, this, &DeviceSyncController::onMessage);
    connect(m_channel, &SyncChannel::closed, this, &DeviceSyncController::onClosed);
    connect(m_channel, &SyncChannel::errorOccurred, this, &DeviceSyncController::onChannelError);
}

bool DeviceSyncController::startSending() {
    if (!m_machine.canFire(Event::StartSending)) {
        qCWarning(lcSync) << "a sync is already in progress";
        return false;
    }
    m_role = Role::Sender;
    m_code.clear();
    m_machine.fire(Event::StartSending);
    m_connectTimer.start(m_connectTimeoutMs);
    emit status("requesting a sync code");
    m_channel->open(QString());
    return true;
}

bool DeviceSyncController::startReceiving(const QString& code) {
    if (!m_machine.canFire(Event::StartReceiving)) {
        qCWarning(lcSync) << "a sync is already in progress";
        return false;
    }
    m_role = Role::Receiver;
    m_code = code.trimmed();
    if (!SyncMessage::isValidCode(m_code)) {
        fail(ErrorKind::ValidationFailure, QStringLiteral("Please enter a valid 6-digit code."));
        return false;
    }
    m_machine.fire(Event::StartReceiving);
    m_connectTimer.start(m_connectTimeoutMs);
    emit status(QString("joining %1").arg(m_code));
    m_channel->open(m_code);
    return true;
}

void DeviceSyncController::cancel() {
    if (m_machine.state() == State::Confirming) {
        declineImport(m_session);
        return;
    }
    if (!m_machine.fire(Event::Cancel)) return;
    finish();
    emit cancelled(QStringLiteral("Sync cancelled."));
}

void DeviceSyncController::reset() {
    if (!m_machine.fire(Event::Reset)) return;
    m_role = Role::None;
    m_code.clear();
}

void DeviceSyncController::onMessage(const QJsonObject& msg) {
    if (!m_machine.isBusy()) {
        qCDebug(lcSync) << "dropping frame outside a transfer";
        return;
    }
    const QString type = msg.value("type").toString();
    if (type == SyncMessage::Error) {
        handleErrorFrame(msg);
        return;
    }
    if (type == SyncMessage::PeerDisconnected) {
        fail(ErrorKind::TransportFailure, QStringLiteral("The other device disconnected."));
        return;
    }
    if (m_role == Role::Sender)
        handleAsSender(type, msg);
    else
        handleAsReceiver(type, msg);
}

void DeviceSyncController::handleAsSender(const QString& type, const QJsonObject& msg) {
    if (type == SyncMessage::SessionCreated) {
        const QString code = msg.value("code").toString();
        if (!SyncMessage::isValidCode(code) || !m_machine.fire(Event::CodeIssued)) {
            fail(ErrorKind::ValidationFailure, QStringLiteral("Received an invalid message from the other device."));
            return;
        }
        m_connectTimer.stop();
        m_code = code;
        qCInfo(lcSync) << "waiting for a receiver on" << m_code;
        emit codeReady(m_code);
    } else if (type == SyncMessage::PeerJoined) {
        if (!m_machine.fire(Event::PeerJoined)) return;
        sendDataset();
    } else if (type == SyncMessage::SyncComplete) {
        if (!m_machine.fire(Event::PeerCompleted)) return;
        qCInfo(lcSync) << "receiver applied the dataset";
        finish();
        emit completed();
    } else {
        qCDebug(lcSync) << "sender ignoring" << type;
    }
}

void DeviceSyncController::handleAsReceiver(const QString& type, const QJsonObject& msg) {
    if (type == SyncMessage::PeerJoined) {
        if (!m_machine.fire(Event::PeerJoined)) return;
        m_connectTimer.stop();
        emit status(QString("paired on %1").arg(m_code));
    } else if (type == SyncMessage::Key) {
        receiveKey(msg);
    } else if (type == SyncMessage::Data) {
        receiveData(msg);
    } else {
        qCDebug(lcSync) << "receiver ignoring" << type;
    }
}

void DeviceSyncController::handleErrorFrame(const QJsonObject& msg) {
    const QString message = msg.value("message").toString();

    if (msg.value("reason").toString() == SyncMessage::ReasonCancelled &&
        m_machine.fire(Event::PeerCancelled)) {
        qCInfo(lcSync) << "receiver declined the import";
        finish();
        emit cancelled(message.isEmpty() ? QStringLiteral("The other device cancelled the sync.") : message);
        return;
    }

    // While connecting the only error source is the relay refusing the code.
    const ErrorKind kind = m_machine.state() == State::Connecting ? ErrorKind::NotFound : ErrorKind::Internal;
    fail(kind, message.isEmpty() ? QStringLiteral("An error occurred on the other device.") : message);
}

void DeviceSyncController::sendDataset() {
    const QByteArray key = m_crypto->generateSymmetricKey();
    const QByteArray dataset = QJsonDocument(m_store->exportAllData()).toJson(QJsonDocument::Compact);
    const QByteArray sealed = m_crypto->sealCompressed(key, dataset);
    if (sealed.isEmpty()) {
        fail(ErrorKind::Internal, QStringLiteral("Failed to send data."), true);
        return;
    }

    QJsonObject keyMsg = SyncMessage::make(SyncMessage::Key);
    keyMsg["key"] = CryptoEngine::exportSymmetricKey(key);
    m_channel->send(keyMsg);

    QJsonObject dataMsg = SyncMessage::make(SyncMessage::Data);
    dataMsg["payload"] = CryptoEngine::toBase64Url(sealed);
    m_channel->send(dataMsg);

    m_machine.fire(Event::PayloadSent);
    qCInfo(lcSync) << "sent dataset of" << dataset.size() << "bytes";
    emit status("dataset sent, waiting for the other device");
}

void DeviceSyncController::receiveKey(const QJsonObject& msg) {
    const QByteArray key = CryptoEngine::importSymmetricKey(msg.value("key").toString());
    if (key.isEmpty() || !m_machine.canFire(Event::KeyReceived)) {
        fail(ErrorKind::ValidationFailure, QStringLiteral("The encryption key from the other device is invalid."),
             true);
        return;
    }
    m_key = key;
    m_machine.fire(Event::KeyReceived);
}

void DeviceSyncController::receiveData(const QJsonObject& msg) {
    if (m_machine.state() != State::Receiving || m_key.isEmpty()) {
        fail(ErrorKind::ValidationFailure, QStringLiteral("Data received before encryption key. Sync failed."), true);
        return;
    }

    bool ok = false;
    const QByteArray plain =
        m_crypto->openCompressed(m_key, CryptoEngine::fromBase64Url(msg.value("payload").toString()), &ok);
    QJsonParseError perr{};
    const QJsonDocument doc = ok ? QJsonDocument::fromJson(plain, &perr) : QJsonDocument();
    if (!ok || perr.error != QJsonParseError::NoError || !doc.isObject()) {
        fail(ErrorKind::ValidationFailure, QStringLiteral("Received an invalid message from the other device."),
             true);
        return;
    }

    m_pending = doc.object();
    m_key.fill('\0');
    m_key.clear();
    m_machine.fire(Event::PayloadDecrypted);

    const quint64 session = m_session;
    m_prompt->ask(QStringLiteral("Overwrite local data?"),
                  QStringLiteral("All data on this device will be replaced with the data from the other "
                                 "device. This cannot be undone."),
                  [this, session]() { confirmImport(session); },
                  [this, session]() { declineImport(session); });
}

void DeviceSyncController::confirmImport(quint64 session) {
    if (session != m_session || m_machine.state() != State::Confirming) return;

    QString why;
    if (!m_store->importAllData(m_pending, &why)) {
        qCWarning(lcSync) << "import failed:" << why;
        fail(ErrorKind::Internal, QStringLiteral("Could not save the received data."), true);
        return;
    }

    m_channel->send(SyncMessage::make(SyncMessage::SyncComplete));
    m_machine.fire(Event::ImportApplied);
    qCInfo(lcSync) << "import applied";
    finish();
    emit completed();
}

void DeviceSyncController::declineImport(quint64 session) {
    if (session != m_session || m_machine.state() != State::Confirming) return;

    m_channel->send(SyncMessage::makeError(QStringLiteral("User cancelled import."), SyncMessage::ReasonCancelled));
    m_machine.fire(Event::Declined);
    finish();
    emit cancelled(QStringLiteral("Import cancelled. No data was changed."));
}

void DeviceSyncController::onClosed() {
    if (!m_machine.isBusy()) return;
    fail(ErrorKind::TransportFailure, QStringLiteral("Connection to the sync service was lost."));
}

void DeviceSyncController::onChannelError(const QString& message) {
    if (!m_machine.isBusy()) return;
    qCWarning(lcSync) << "channel error:" << message;
    fail(ErrorKind::TransportFailure,
         m_machine.state() == State::Connecting ? QStringLiteral("Could not connect to sync service.")
                                                : QStringLiteral("Connection to the sync service was lost."));
}

void DeviceSyncController::onConnectTimeout() {
    if (m_machine.state() != State::Connecting) return;
    fail(ErrorKind::TransportFailure, QStringLiteral("Timed out connecting to the sync service."));
}

void DeviceSyncController::fail(ErrorKind kind, const QString& message, bool notifyPeer) {
    if (notifyPeer) m_channel->send(SyncMessage::makeError(message));
    if (!m_machine.fire(Event::Failure))
        qCDebug(lcSync) << "failure reported in state" << SyncStateMachine::stateName(m_machine.state());
    qCWarning(lcSync) << errorKindName(kind) << message;
    finish();
    emit status(QString("sync failed: %1").arg(message));
    emit failed(kind, message);
}

void DeviceSyncController::finish() {
    m_connectTimer.stop();
    ++m_session;
    m_channel->close();
    m_key.fill('\0');
    m_key.clear();
    m_pending = QJsonObject();
}
