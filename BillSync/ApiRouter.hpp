#pragma once
#include <QByteArray>
#include <QList>
#include <QPair>
#include <QString>
#include <QUrlQuery>

class OneTimeSecretService;
class ShareSessionService;

struct HttpRequest {
    QByteArray method; // "GET", "POST", ...
    QString path;      // "/share/<id>"
    QUrlQuery query;
    QByteArray body;
};

struct HttpReply {
    int status = 200;
    QByteArray body; // JSON or empty
    QList<QPair<QByteArray, QByteArray>> headers;
};

// Framework-free dispatcher for the share and one-time-key endpoints. The
// HTTP server binding and the in-process client transport both go through it.
class ApiRouter {
public:
    ApiRouter(ShareSessionService* shares, OneTimeSecretService* secrets);

    HttpReply handle(const HttpRequest& request) const;

private:
    HttpReply route(const HttpRequest& request) const;
    HttpReply handleShare(const HttpRequest& request, const QStringList& parts) const;
    HttpReply handleOnetimeKey(const HttpRequest& request, const QStringList& parts) const;

    ShareSessionService* m_shares = nullptr;
    OneTimeSecretService* m_secrets = nullptr;
};
