#include "ShareSessionClient.hpp"
#include "CryptoEngine.hpp"
#include "ShareLink.hpp"

#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QTimer>

ShareSessionClient::ShareSessionClient(ApiTransport* transport, QObject* parent)
    : QObject(parent), m_transport(transport) {}

bool ShareSessionClient::rejectMalformed(const QString& shareId, const ErrorCallback& onError) {
    if (ShareLink::isWellFormedId(shareId)) return false;
    QTimer::singleShot(0, this, [onError]() {
        onError({ErrorKind::ValidationFailure, QStringLiteral("Malformed share id.")});
    });
    return true;
}

void ShareSessionClient::create(const QByteArray& ciphertext,
                                std::function<void(const ShareCreated&)> onDone, ErrorCallback onError) {
    QJsonObject j;
    j["ciphertext"] = CryptoEngine::toBase64Url(ciphertext);

    m_transport->send("POST", "/share", {}, QJsonDocument(j).toJson(QJsonDocument::Compact),
                      guardedBy(this, [this, onDone, onError](const ApiResponse& res) {
        if (res.status != 201) {
            const ApiError err = apiErrorFrom(res);
            emit status(QString("share create error: %1").arg(err.message));
            onError(err);
            return;
        }
        const QJsonObject o = QJsonDocument::fromJson(res.body).object();
        ShareCreated created;
        created.id = o["shareId"].toString();
        created.version = qint64(o["version"].toDouble());
        created.updateToken = o["updateToken"].toString();
        emit status(QString("share created id=%1").arg(created.id));
        onDone(created);
    }));
}

void ShareSessionClient::update(const QString& shareId, const QByteArray& ciphertext, const QString& updateToken,
                                std::function<void(qint64)> onDone, ErrorCallback onError) {
    if (rejectMalformed(shareId, onError)) return;
    QJsonObject j;
    j["ciphertext"] = CryptoEngine::toBase64Url(ciphertext);
    j["updateToken"] = updateToken;

    m_transport->send("POST", "/share/" + shareId, {}, QJsonDocument(j).toJson(QJsonDocument::Compact),
                      guardedBy(this, [this, onDone, onError](const ApiResponse& res) {
        if (res.status != 200) {
            const ApiError err = apiErrorFrom(res);
            emit status(QString("share update error: %1").arg(err.message));
            onError(err);
            return;
        }
        onDone(qint64(QJsonDocument::fromJson(res.body).object()["version"].toDouble()));
    }));
}

void ShareSessionClient::fetch(const QString& shareId, std::optional<qint64> ifNewerThan,
                               std::function<void(const std::optional<ShareSnapshot>&)> onDone,
                               ErrorCallback onError) {
    if (rejectMalformed(shareId, onError)) return;
    QUrlQuery q;
    if (ifNewerThan) q.addQueryItem("ifNewerThan", QString::number(*ifNewerThan));

    m_transport->send("GET", "/share/" + shareId, q, {}, [onDone, onError](const ApiResponse& res) {
        if (res.status == 304) {
            onDone(std::nullopt);
            return;
        }
        if (res.status != 200) {
            onError(apiErrorFrom(res));
            return;
        }
        const QJsonObject o = QJsonDocument::fromJson(res.body).object();
        ShareSnapshot snap;
        snap.ciphertext = CryptoEngine::fromBase64Url(o["ciphertext"].toString());
        snap.version = qint64(o["version"].toDouble());
        if (snap.ciphertext.isEmpty()) {
            onError({ErrorKind::ValidationFailure, QStringLiteral("Share session returned no ciphertext.")});
            return;
        }
        onDone(snap);
    });
}

void ShareSessionClient::statusBatch(const QStringList& shareIds,
                                     std::function<void(const QVector<ShareStatus>&)> onDone,
                                     ErrorCallback onError) {
    QJsonObject j;
    j["shareIds"] = QJsonArray::fromStringList(shareIds);

    m_transport->send("POST", "/share/batch-status", {}, QJsonDocument(j).toJson(QJsonDocument::Compact),
                      [onDone, onError](const ApiResponse& res) {
        if (res.status != 200) {
            onError(apiErrorFrom(res));
            return;
        }
        QVector<ShareStatus> out;
        for (const QJsonValue& v : QJsonDocument::fromJson(res.body).array()) {
            const QJsonObject o = v.toObject();
            out.push_back({o["shareId"].toString(), o["status"].toString() == "live"});
        }
        onDone(out);
    });
}

void ShareSessionClient::fetchChanged(const QVector<ShareVersionCheck>& known,
                                      std::function<void(const QVector<ShareChange>&)> onDone,
                                      ErrorCallback onError) {
    QJsonArray j;
    for (const ShareVersionCheck& k : known) {
        QJsonObject o;
        o["shareId"] = k.id;
        o["version"] = double(k.version);
        j.append(o);
    }

    m_transport->send("POST", "/share/batch-check", {}, QJsonDocument(j).toJson(QJsonDocument::Compact),
                      [onDone, onError](const ApiResponse& res) {
        if (res.status != 200) {
            onError(apiErrorFrom(res));
            return;
        }
        QVector<ShareChange> out;
        for (const QJsonValue& v : QJsonDocument::fromJson(res.body).array()) {
            const QJsonObject o = v.toObject();
            out.push_back({o["shareId"].toString(),
                           CryptoEngine::fromBase64Url(o["ciphertext"].toString()),
                           qint64(o["version"].toDouble())});
        }
        onDone(out);
    });
}
