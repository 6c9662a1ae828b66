#pragma once
#include <QHostAddress>
#include <QHttpServer>
#include <QObject>

class ApiRouter;

// Binds ApiRouter to a QHttpServer listening socket.
class HttpFrontend : public QObject {
    Q_OBJECT
public:
    explicit HttpFrontend(const ApiRouter* router, QObject* parent = nullptr);

    // Returns the bound port, or 0 if listening failed.
    quint16 listen(const QHostAddress& address, quint16 port);

private:
    const ApiRouter* m_router = nullptr;
    QHttpServer m_server;
};
