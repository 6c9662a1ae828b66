#pragma once
#include "ApiTransport.hpp"

#include <QObject>

class ApiRouter;

// Calls an in-process ApiRouter, delivering the reply on the next event
// loop iteration like a network round trip would.
class LocalApiTransport : public QObject, public ApiTransport {
    Q_OBJECT
public:
    explicit LocalApiTransport(const ApiRouter* router, QObject* parent = nullptr);

    // Simulates an unreachable server.
    void setOffline(bool offline) { m_offline = offline; }

    void send(const QByteArray& method, const QString& path, const QUrlQuery& query,
              const QByteArray& jsonBody, Callback done) override;

private:
    const ApiRouter* m_router = nullptr;
    bool m_offline = false;
};
