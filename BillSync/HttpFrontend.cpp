#include "HttpFrontend.hpp"
#include "ApiRouter.hpp"
#include "Logging.hpp"

#include <QHttpHeaders>
#include <QHttpServerRequest>
#include <QHttpServerResponse>
#include <QTcpServer>

namespace {

QByteArray methodName(QHttpServerRequest::Method m) {
    switch (m) {
    case QHttpServerRequest::Method::Get:  return "GET";
    case QHttpServerRequest::Method::Post: return "POST";
    default: break;
    }
    return "OTHER";
}

} // namespace

HttpFrontend::HttpFrontend(const ApiRouter* router, QObject* parent)
    : QObject(parent), m_router(router) {

    const auto dispatch = [this](const QHttpServerRequest& req) {
        HttpRequest in;
        in.method = methodName(req.method());
        in.path = req.url().path();
        in.query = req.query();
        in.body = req.body();

        const HttpReply out = m_router->handle(in);
        qCDebug(lcHttp) << in.method << in.path << out.status;

        const auto status = static_cast<QHttpServerResponse::StatusCode>(out.status);
        QHttpServerResponse resp = out.body.isEmpty()
            ? QHttpServerResponse(status)
            : QHttpServerResponse(QByteArrayLiteral("application/json"), out.body, status);
        QHttpHeaders headers = resp.headers();
        for (const auto& h : out.headers) {
            if (h.first.compare("Content-Type", Qt::CaseInsensitive) == 0) continue;
            headers.append(h.first, h.second);
        }
        resp.setHeaders(std::move(headers));
        return resp;
    };

    const auto methods = QHttpServerRequest::Method::Get | QHttpServerRequest::Method::Post;

    m_server.route("/share", methods,
                   [dispatch](const QHttpServerRequest& req) { return dispatch(req); });
    m_server.route("/share/<arg>", methods,
                   [dispatch](const QString&, const QHttpServerRequest& req) { return dispatch(req); });
    m_server.route("/onetime-key", methods,
                   [dispatch](const QHttpServerRequest& req) { return dispatch(req); });
    m_server.route("/onetime-key/<arg>", methods,
                   [dispatch](const QString&, const QHttpServerRequest& req) { return dispatch(req); });
    m_server.route("/onetime-key/<arg>/status", methods,
                   [dispatch](const QString&, const QHttpServerRequest& req) { return dispatch(req); });
}

quint16 HttpFrontend::listen(const QHostAddress& address, quint16 port) {
    auto* tcp = new QTcpServer(this);
    if (!tcp->listen(address, port) || !m_server.bind(tcp)) {
        qCWarning(lcHttp) << "could not listen on" << address.toString() << port << ":" << tcp->errorString();
        delete tcp;
        return 0;
    }
    qCInfo(lcHttp) << "HTTP API listening on" << address.toString() << tcp->serverPort();
    return tcp->serverPort();
}
