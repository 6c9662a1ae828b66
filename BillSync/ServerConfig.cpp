#include "ServerConfig.hpp"

#include <QCommandLineParser>
#include <QFile>
#include <QHostAddress>
#include <QJsonDocument>
#include <stdexcept>

namespace {

const char* const kKeys[] = {
    "host", "httpPort", "relayPort", "backendCount", "sweepIntervalSeconds",
    "oneTimeTtlSeconds", "shareTtlSeconds", "maxMessageBytes",
};

[[noreturn]] void invalid(const QString& what) {
    throw std::invalid_argument(what.toStdString());
}

qint64 integerField(const QJsonObject& o, const char* key, qint64 fallback) {
    if (!o.contains(key)) return fallback;
    const QJsonValue v = o.value(key);
    const double d = v.toDouble();
    // JSON numbers are exact integers only up to 2^53.
    if (!v.isDouble() || qAbs(d) > 9007199254740992.0 || d != double(qint64(d))) invalid(QString("config: '%1' must be an integer").arg(key));
    return qint64(d);
}

qint64 integerFlag(const QCommandLineParser& parser, const QString& name, qint64 fallback) {
    if (!parser.isSet(name)) return fallback;
    bool ok = false;
    const qint64 v = parser.value(name).toLongLong(&ok);
    if (!ok) invalid(QString("--%1 must be an integer, got '%2'").arg(name, parser.value(name)));
    return v;
}

int smallInt(qint64 v, qint64 lo, qint64 hi, const char* what) {
    if (v < lo || v > hi) invalid(QString("%1 must be %2..%3, got %4").arg(what).arg(lo).arg(hi).arg(v));
    return int(v);
}

quint16 port(qint64 v, const char* what) {
    if (v < 0 || v > 65535) invalid(QString("%1 %2 is not a valid port").arg(what).arg(v));
    return quint16(v);
}

} // namespace

void ServerConfig::validate() const {
    if (QHostAddress(host).isNull()) invalid(QString("host '%1' is not an IP address").arg(host));
    smallInt(backendCount, 1, kMaxBackends, "backendCount");
    smallInt(sweepIntervalSeconds, 1, kMaxSweepIntervalSeconds, "sweepIntervalSeconds");
    if (oneTimeTtlSeconds < 1 || oneTimeTtlSeconds > kMaxTtlSeconds)
        invalid(QString("oneTimeTtlSeconds must be 1..%1").arg(kMaxTtlSeconds));
    if (shareTtlSeconds < 1 || shareTtlSeconds > kMaxTtlSeconds)
        invalid(QString("shareTtlSeconds must be 1..%1").arg(kMaxTtlSeconds));
    if (maxMessageBytes < 1024 || maxMessageBytes > kMaxMessageBytes)
        invalid(QString("maxMessageBytes must be 1024..%1").arg(kMaxMessageBytes));
}

ServerConfig ServerConfig::fromJson(const QJsonObject& o, const ServerConfig& base) {
    for (auto it = o.constBegin(); it != o.constEnd(); ++it) {
        bool known = false;
        for (const char* k : kKeys) known = known || it.key() == QLatin1String(k);
        if (!known) invalid(QString("config: unknown key '%1'").arg(it.key()));
    }

    ServerConfig c = base;
    if (o.contains("host")) {
        if (!o.value("host").isString()) invalid("config: 'host' must be a string");
        c.host = o.value("host").toString();
    }
    c.httpPort = port(integerField(o, "httpPort", c.httpPort), "httpPort");
    c.relayPort = port(integerField(o, "relayPort", c.relayPort), "relayPort");
    c.backendCount = smallInt(integerField(o, "backendCount", c.backendCount), 1, kMaxBackends, "backendCount");
    c.sweepIntervalSeconds = smallInt(integerField(o, "sweepIntervalSeconds", c.sweepIntervalSeconds), 1,
                                      kMaxSweepIntervalSeconds, "sweepIntervalSeconds");
    c.oneTimeTtlSeconds = integerField(o, "oneTimeTtlSeconds", c.oneTimeTtlSeconds);
    c.shareTtlSeconds = integerField(o, "shareTtlSeconds", c.shareTtlSeconds);
    c.maxMessageBytes = integerField(o, "maxMessageBytes", c.maxMessageBytes);
    c.validate();
    return c;
}

ServerConfig ServerConfig::loadFile(const QString& path, const ServerConfig& base) {
    QFile f(path);
    if (!f.open(QIODevice::ReadOnly)) invalid(QString("cannot open config %1: %2").arg(path, f.errorString()));

    QJsonParseError err{};
    const QJsonDocument doc = QJsonDocument::fromJson(f.readAll(), &err);
    if (err.error != QJsonParseError::NoError || !doc.isObject())
        invalid(QString("config %1 is not a JSON object: %2").arg(path, err.errorString()));
    return fromJson(doc.object(), base);
}

void ServerConfig::addOptions(QCommandLineParser& parser) {
    parser.addOptions({
        {"config", "JSON config file.", "file"},
        {"host", "Address to bind.", "address"},
        {"http-port", "HTTP API port.", "port"},
        {"relay-port", "Sync relay port.", "port"},
        {"backends", "Number of in-memory KV backends.", "count"},
        {"sweep-interval", "Seconds between expiry sweeps.", "seconds"},
        {"onetime-ttl", "One-time key lifetime in seconds.", "seconds"},
        {"share-ttl", "Share session lifetime in seconds.", "seconds"},
    });
}

ServerConfig ServerConfig::fromParser(const QCommandLineParser& parser) {
    ServerConfig c;
    if (parser.isSet("config")) c = loadFile(parser.value("config"), c);

    if (parser.isSet("host")) c.host = parser.value("host");
    c.httpPort = port(integerFlag(parser, "http-port", c.httpPort), "--http-port");
    c.relayPort = port(integerFlag(parser, "relay-port", c.relayPort), "--relay-port");
    c.backendCount = smallInt(integerFlag(parser, "backends", c.backendCount), 1, kMaxBackends, "--backends");
    c.sweepIntervalSeconds = smallInt(integerFlag(parser, "sweep-interval", c.sweepIntervalSeconds), 1,
                                      kMaxSweepIntervalSeconds, "--sweep-interval");
    c.oneTimeTtlSeconds = integerFlag(parser, "onetime-ttl", c.oneTimeTtlSeconds);
    c.shareTtlSeconds = integerFlag(parser, "share-ttl", c.shareTtlSeconds);
    c.validate();
    return c;
}
