#pragma once
#include <QJsonObject>
#include <QObject>
#include <QTimer>

#include "ErrorKind.hpp"
#include "SyncStateMachine.hpp"

class ConfirmationPrompt;
class CryptoEngine;
class SyncChannel;
class SyncDataStore;

// Runs one side of a device-to-device transfer over a SyncChannel. The
// sender exports everything, encrypts it under a fresh key and ships key
// and ciphertext through the relay; the receiver decrypts, asks the user,
// and only then overwrites local data.
class DeviceSyncController : public QObject {
    Q_OBJECT
public:
    enum class Role { None, Sender, Receiver };

    static constexpr int kDefaultConnectTimeoutMs = 15000;

    DeviceSyncController(CryptoEngine* crypto, SyncChannel* channel, SyncDataStore* store,
                         ConfirmationPrompt* prompt, QObject* parent = nullptr);

    void setConnectTimeoutMs(int ms) { m_connectTimeoutMs = ms; }

    // Both return false and change nothing while another transfer is active.
    bool startSending();
    bool startReceiving(const QString& code);

    // Closes the channel; a pending confirmation counts as declined.
    void cancel();
    // complete/error -> idle
    void reset();

    SyncStateMachine::State state() const { return m_machine.state(); }
    Role role() const { return m_role; }
    QString code() const { return m_code; }

signals:
    void stateChanged(SyncStateMachine::State state);
    void codeReady(const QString& code);
    void completed();
    void cancelled(const QString& message);
    void failed(ErrorKind kind, const QString& message);
    void status(const QString& s);

private slots:
    void onMessage(const QJsonObject& msg);
    void onClosed();
    void onChannelError(const QString& message);
    void onConnectTimeout();

private:
    void handleAsSender(const QString& type, const QJsonObject& msg);
    void handleAsReceiver(const QString& type, const QJsonObject& msg);
    void handleErrorFrame(const QJsonObject& msg);
    void sendDataset();
    void receiveKey(const QJsonObject& msg);
    void receiveData(const QJsonObject& msg);
    void confirmImport(quint64 session);
    void declineImport(quint64 session);
    void fail(ErrorKind kind, const QString& message, bool notifyPeer = false);
    void finish();

    CryptoEngine* m_crypto = nullptr;
    SyncChannel* m_channel = nullptr;
    SyncDataStore* m_store = nullptr;
    ConfirmationPrompt* m_prompt = nullptr;

    SyncStateMachine m_machine;
    QTimer m_connectTimer;
    int m_connectTimeoutMs = kDefaultConnectTimeoutMs;

    Role m_role = Role::None;
    QString m_code;
    QByteArray m_key;
    QJsonObject m_pending;
    quint64 m_session = 0;
};
