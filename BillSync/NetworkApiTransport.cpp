#include "NetworkApiTransport.hpp"
#include "Logging.hpp"

#include <QNetworkReply>
#include <QNetworkRequest>

NetworkApiTransport::NetworkApiTransport(QObject* parent)
    : QObject(parent) {}

void NetworkApiTransport::setBaseUrl(const QUrl& u) { m_base = u; }

void NetworkApiTransport::send(const QByteArray& method, const QString& path, const QUrlQuery& query,
                               const QByteArray& jsonBody, Callback done) {
    QUrl url = m_base.resolved(QUrl(path));
    url.setQuery(query);

    QNetworkRequest req(url);
    req.setTransferTimeout(m_timeoutMs);
    if (!jsonBody.isEmpty())
        req.setHeader(QNetworkRequest::ContentTypeHeader, "application/json");

    QNetworkReply* rep = nullptr;
    if (method == "GET")
        rep = m_nam.get(req);
    else if (method == "POST")
        rep = m_nam.post(req, jsonBody);
    else
        rep = m_nam.sendCustomRequest(req, method, jsonBody);

    connect(rep, &QNetworkReply::finished, this, [rep, done = std::move(done)]() {
        ApiResponse res;
        res.status = rep->attribute(QNetworkRequest::HttpStatusCodeAttribute).toInt();
        res.body = rep->readAll();
        if (res.status == 0 && rep->error() != QNetworkReply::NoError) {
            res.networkError = rep->errorString();
            qCWarning(lcLink) << "request to" << rep->url().path() << "failed:" << res.networkError;
        }
        rep->deleteLater();
        done(res);
    });
}
