#pragma once
#include <QJsonObject>
#include <QString>
#include <QUrl>

struct ClientConfig {
    QUrl apiBaseUrl = QUrl(QStringLiteral("http://127.0.0.1:8080/"));
    QUrl relayUrl = QUrl(QStringLiteral("ws://127.0.0.1:8081/sync"));
    int connectTimeoutMs = 15000;
    QUrl linkBaseUrl = QUrl(QStringLiteral("http://127.0.0.1:8080/"));
    QString dataFile = QStringLiteral("billsync-data.json");
    QString shareStateFile = QStringLiteral("billsync-shares.json");
    QString creatorName;

    // Throws std::invalid_argument.
    void validate() const;

    static ClientConfig fromJson(const QJsonObject& o, const ClientConfig& base = {});
    // A missing file yields the defaults; an unreadable or malformed one throws.
    static ClientConfig loadFile(const QString& path);
};
