#include "ClientConfig.hpp"

#include <QFile>
#include <QJsonDocument>
#include <stdexcept>

namespace {

[[noreturn]] void invalid(const QString& what) {
    throw std::invalid_argument(what.toStdString());
}

QUrl urlField(const QJsonObject& o, const char* key, const QUrl& fallback) {
    if (!o.contains(key)) return fallback;
    if (!o.value(key).isString()) invalid(QString("config: '%1' must be a string").arg(key));
    return QUrl(o.value(key).toString());
}

} // namespace

void ClientConfig::validate() const {
    const QString api = apiBaseUrl.scheme();
    if (!apiBaseUrl.isValid() || (api != "http" && api != "https"))
        invalid(QString("apiBaseUrl '%1' must be an http(s) URL").arg(apiBaseUrl.toString()));
    const QString relay = relayUrl.scheme();
    if (!relayUrl.isValid() || (relay != "ws" && relay != "wss"))
        invalid(QString("relayUrl '%1' must be a ws(s) URL").arg(relayUrl.toString()));
    if (!linkBaseUrl.isValid() || linkBaseUrl.isRelative())
        invalid(QString("linkBaseUrl '%1' must be absolute").arg(linkBaseUrl.toString()));
    if (connectTimeoutMs < 100) invalid("connectTimeoutMs must be at least 100");
    if (dataFile.isEmpty()) invalid("dataFile must not be empty");
    if (shareStateFile.isEmpty()) invalid("shareStateFile must not be empty");
}

ClientConfig ClientConfig::fromJson(const QJsonObject& o, const ClientConfig& base) {
    ClientConfig c = base;
    c.apiBaseUrl = urlField(o, "apiBaseUrl", c.apiBaseUrl);
    c.relayUrl = urlField(o, "relayUrl", c.relayUrl);
    c.linkBaseUrl = urlField(o, "linkBaseUrl", c.linkBaseUrl);
    if (o.contains("connectTimeoutMs")) {
        if (!o.value("connectTimeoutMs").isDouble()) invalid("config: 'connectTimeoutMs' must be a number");
        c.connectTimeoutMs = o.value("connectTimeoutMs").toInt();
    }
    if (o.contains("dataFile")) c.dataFile = o.value("dataFile").toString();
    if (o.contains("shareStateFile")) c.shareStateFile = o.value("shareStateFile").toString();
    if (o.contains("creatorName")) c.creatorName = o.value("creatorName").toString();
    c.validate();
    return c;
}

ClientConfig ClientConfig::loadFile(const QString& path) {
    QFile f(path);
    if (!f.exists()) return {};
    if (!f.open(QIODevice::ReadOnly)) invalid(QString("cannot open config %1: %2").arg(path, f.errorString()));

    QJsonParseError err{};
    const QJsonDocument doc = QJsonDocument::fromJson(f.readAll(), &err);
    if (err.error != QJsonParseError::NoError || !doc.isObject())
        invalid(QString("config %1 is not a JSON object: %2").arg(path, err.errorString()));
    return fromJson(doc.object());
}
