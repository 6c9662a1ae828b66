#include "LocalApiTransport.hpp"
#include "ApiRouter.hpp"

#include <QTimer>

LocalApiTransport::LocalApiTransport(const ApiRouter* router, QObject* parent)
    : QObject(parent), m_router(router) {}

void LocalApiTransport::send(const QByteArray& method, const QString& path, const QUrlQuery& query,
                             const QByteArray& jsonBody, Callback done) {
    ApiResponse res;
    if (m_offline) {
        res.networkError = QStringLiteral("Connection refused");
    } else {
        HttpRequest req;
        req.method = method;
        req.path = path;
        req.query = query;
        req.body = jsonBody;
        const HttpReply reply = m_router->handle(req);
        res.status = reply.status;
        res.body = reply.body;
    }
    QTimer::singleShot(0, this, [res, done = std::move(done)]() { done(res); });
}
