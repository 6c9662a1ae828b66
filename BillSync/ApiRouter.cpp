#include "ApiRouter.hpp"
#include "CryptoEngine.hpp"
#include "ErrorKind.hpp"
#include "Logging.hpp"
#include "OneTimeSecretService.hpp"
#include "ShareSessionService.hpp"

#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>

namespace {

HttpReply jsonReply(int status, const QJsonDocument& doc) {
    HttpReply r;
    r.status = status;
    r.body = doc.toJson(QJsonDocument::Compact);
    r.headers.append({"Content-Type", "application/json"});
    r.headers.append({"Cache-Control", "no-store"});
    return r;
}

HttpReply jsonReply(int status, const QJsonObject& o) { return jsonReply(status, QJsonDocument(o)); }
HttpReply jsonReply(int status, const QJsonArray& a) { return jsonReply(status, QJsonDocument(a)); }

HttpReply errorReply(ErrorKind kind, const QString& message) {
    QJsonObject o;
    o["error"] = message;
    o["kind"] = errorKindName(kind);
    return jsonReply(httpStatusFor(kind), o);
}

HttpReply methodNotAllowed() {
    QJsonObject o;
    o["error"] = QStringLiteral("Method Not Allowed");
    HttpReply r = jsonReply(405, o);
    r.headers.append({"Allow", "GET, POST"});
    return r;
}

HttpReply notModified() {
    HttpReply r;
    r.status = 304;
    r.headers.append({"Cache-Control", "no-store"});
    return r;
}

QJsonDocument parseBody(const QByteArray& body) {
    QJsonParseError err{};
    QJsonDocument doc = QJsonDocument::fromJson(body, &err);
    if (err.error != QJsonParseError::NoError)
        throw ServiceError(ErrorKind::ValidationFailure, QStringLiteral("Request body is not valid JSON."));
    return doc;
}

QJsonObject parseObject(const QByteArray& body) {
    const QJsonDocument doc = parseBody(body);
    if (!doc.isObject())
        throw ServiceError(ErrorKind::ValidationFailure, QStringLiteral("Request body must be a JSON object."));
    return doc.object();
}

QByteArray requireBlob(const QJsonObject& o, const char* field) {
    const QByteArray blob = CryptoEngine::fromBase64Url(o.value(QLatin1String(field)).toString());
    if (blob.isEmpty())
        throw ServiceError(ErrorKind::ValidationFailure,
                           QStringLiteral("Invalid payload. '%1' string is required.").arg(QLatin1String(field)));
    return blob;
}

} // namespace

ApiRouter::ApiRouter(ShareSessionService* shares, OneTimeSecretService* secrets)
    : m_shares(shares), m_secrets(secrets) {}

HttpReply ApiRouter::handle(const HttpRequest& request) const {
    try {
        return route(request);
    } catch (const ServiceError& e) {
        if (e.kind() == ErrorKind::Internal)
            qCWarning(lcHttp) << request.method << request.path << "failed:" << e.what();
        else
            qCDebug(lcHttp) << request.method << request.path << "->" << errorKindName(e.kind());
        return errorReply(e.kind(), QString::fromStdString(e.what()));
    } catch (const std::exception& e) {
        qCWarning(lcHttp) << request.method << request.path << "unexpected error:" << e.what();
        return errorReply(ErrorKind::Internal, QStringLiteral("An internal server error occurred."));
    }
}

HttpReply ApiRouter::route(const HttpRequest& request) const {
    const QStringList parts = request.path.split('/', Qt::SkipEmptyParts);
    if (!parts.isEmpty() && parts.front() == QLatin1String("share"))
        return handleShare(request, parts);
    if (!parts.isEmpty() && parts.front() == QLatin1String("onetime-key"))
        return handleOnetimeKey(request, parts);
    return errorReply(ErrorKind::NotFound, QStringLiteral("No such endpoint."));
}

HttpReply ApiRouter::handleShare(const HttpRequest& request, const QStringList& parts) const {
    const bool isPost = request.method == "POST";
    const bool isGet = request.method == "GET";

    if (isPost && parts.size() == 1) {
        const QJsonObject body = parseObject(request.body);
        const ShareCreated created = m_shares->create(requireBlob(body, "ciphertext"));
        QJsonObject o;
        o["shareId"] = created.id;
        o["version"] = double(created.version);
        o["updateToken"] = created.updateToken;
        return jsonReply(201, o);
    }

    if (isPost && parts.size() == 2 && parts[1] == QLatin1String("batch-status")) {
        const QJsonObject body = parseObject(request.body);
        QStringList ids;
        for (const QJsonValue& v : body.value("shareIds").toArray()) ids << v.toString();
        QJsonArray out;
        for (const ShareStatus& s : m_shares->statusBatch(ids)) {
            QJsonObject o;
            o["shareId"] = s.id;
            o["status"] = s.live ? "live" : "expired";
            out.append(o);
        }
        return jsonReply(200, out);
    }

    if (isPost && parts.size() == 2 && parts[1] == QLatin1String("batch-check")) {
        const QJsonDocument doc = parseBody(request.body);
        if (!doc.isArray())
            throw ServiceError(ErrorKind::ValidationFailure, QStringLiteral("Expected an array of share versions."));
        QVector<ShareVersionCheck> known;
        for (const QJsonValue& v : doc.array()) {
            const QJsonObject o = v.toObject();
            known.push_back({o.value("shareId").toString(), qint64(o.value("version").toDouble())});
        }
        QJsonArray out;
        for (const ShareChange& c : m_shares->fetchChanged(known)) {
            QJsonObject o;
            o["shareId"] = c.id;
            o["ciphertext"] = CryptoEngine::toBase64Url(c.ciphertext);
            o["version"] = double(c.version);
            out.append(o);
        }
        return jsonReply(200, out);
    }

    if (isPost && parts.size() == 2) {
        const QJsonObject body = parseObject(request.body);
        const qint64 version = m_shares->update(parts[1], requireBlob(body, "ciphertext"),
                                                body.value("updateToken").toString());
        QJsonObject o;
        o["shareId"] = parts[1];
        o["version"] = double(version);
        return jsonReply(200, o);
    }

    if (isGet && parts.size() == 2) {
        std::optional<qint64> ifNewerThan;
        if (request.query.hasQueryItem("ifNewerThan")) {
            bool ok = false;
            const qint64 ts = request.query.queryItemValue("ifNewerThan").toLongLong(&ok);
            if (!ok)
                throw ServiceError(ErrorKind::ValidationFailure, QStringLiteral("Malformed 'ifNewerThan'."));
            ifNewerThan = ts;
        }
        const auto snapshot = m_shares->fetch(parts[1], ifNewerThan);
        if (!snapshot) return notModified();
        QJsonObject o;
        o["ciphertext"] = CryptoEngine::toBase64Url(snapshot->ciphertext);
        o["version"] = double(snapshot->version);
        return jsonReply(200, o);
    }

    return methodNotAllowed();
}

HttpReply ApiRouter::handleOnetimeKey(const HttpRequest& request, const QStringList& parts) const {
    if (request.method == "POST" && parts.size() == 1) {
        const QJsonObject body = parseObject(request.body);
        QJsonObject o;
        o["keyId"] = m_secrets->create(requireBlob(body, "encryptedPayload"));
        return jsonReply(201, o);
    }

    if (request.method == "GET" && parts.size() == 3 && parts[2] == QLatin1String("status")) {
        QJsonObject o;
        o["status"] = m_secrets->peek(parts[1]);
        return jsonReply(200, o);
    }

    if (request.method == "GET" && parts.size() == 2) {
        QJsonObject o;
        o["encryptedPayload"] = CryptoEngine::toBase64Url(m_secrets->consume(parts[1]));
        return jsonReply(200, o);
    }

    return methodNotAllowed();
}
