#pragma once
#include "ApiTransport.hpp"

#include <QObject>

class OneTimeKeyClient : public QObject {
    Q_OBJECT
public:
    explicit OneTimeKeyClient(ApiTransport* transport, QObject* parent = nullptr);

    void create(const QByteArray& encryptedPayload,
                std::function<void(const QString& keyId)> onDone, ErrorCallback onError);

    // Destructive read.
    void consume(const QString& keyId,
                 std::function<void(const QByteArray& encryptedPayload)> onDone, ErrorCallback onError);

    // available == false when the server reports the key gone (404).
    void peek(const QString& keyId,
              std::function<void(bool available)> onDone, ErrorCallback onError);

signals:
    void status(const QString& s);

private:
    // Ids go into the request path, so they are checked before sending.
    bool rejectMalformed(const QString& keyId, const ErrorCallback& onError);

    ApiTransport* m_transport = nullptr;
};
