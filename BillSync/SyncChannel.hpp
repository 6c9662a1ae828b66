#pragma once
#include <QJsonObject>
#include <QObject>

// Client end of a relay connection. Implementations deliver every signal
// asynchronously. closed() reports a close the client did not ask for;
// close() itself is silent.
class SyncChannel : public QObject {
    Q_OBJECT
public:
    using QObject::QObject;

    // Empty code asks the relay for a new pairing.
    virtual void open(const QString& code) = 0;
    virtual void send(const QJsonObject& message) = 0;
    virtual void close() = 0;

signals:
    void opened();
    void messageReceived(const QJsonObject& message);
    void closed();
    void errorOccurred(const QString& message);
};
