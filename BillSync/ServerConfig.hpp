#pragma once
#include <QJsonObject>
#include <QString>

class QCommandLineParser;

struct ServerConfig {
    static constexpr int kMaxBackends = 64;
    static constexpr int kMaxSweepIntervalSeconds = 24 * 60 * 60;
    static constexpr qint64 kMaxTtlSeconds = 366LL * 24 * 60 * 60;
    static constexpr qint64 kMaxMessageBytes = 256LL * 1024 * 1024;

    QString host = QStringLiteral("0.0.0.0");
    quint16 httpPort = 8080;
    quint16 relayPort = 8081;
    int backendCount = 3;
    int sweepIntervalSeconds = 60;
    qint64 oneTimeTtlSeconds = 86400;
    qint64 shareTtlSeconds = 2592000;
    qint64 maxMessageBytes = 16 * 1024 * 1024;

    // All loaders throw std::invalid_argument on unknown keys, wrong types
    // and out-of-range values.
    void validate() const;

    // Keys absent from o keep base's value.
    static ServerConfig fromJson(const QJsonObject& o, const ServerConfig& base = {});
    static ServerConfig loadFile(const QString& path, const ServerConfig& base = {});

    // Defaults, then --config <file>, then individual flags.
    static void addOptions(QCommandLineParser& parser);
    static ServerConfig fromParser(const QCommandLineParser& parser);
};
