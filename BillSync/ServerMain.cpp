#include <QCommandLineParser>
#include <QCoreApplication>
#include <QHostAddress>
#include <QTimer>
#include <stdexcept>

#include "ApiRouter.hpp"
#include "CryptoEngine.hpp"
#include "HttpFrontend.hpp"
#include "Logging.hpp"
#include "MemoryKeyValueStore.hpp"
#include "OneTimeSecretService.hpp"
#include "PairingRegistry.hpp"
#include "ServerConfig.hpp"
#include "ShardedKeyValueStore.hpp"
#include "ShareSessionService.hpp"
#include "SyncRelay.hpp"
#include "WebSocketRelayServer.hpp"

int main(int argc, char* argv[]) {
    QCoreApplication app(argc, argv);
    QCoreApplication::setApplicationName("billsync-server");

    QCommandLineParser parser;
    parser.setApplicationDescription("Share/one-time-key API and device sync relay.");
    parser.addHelpOption();
    ServerConfig::addOptions(parser);
    parser.process(app);

    ServerConfig cfg;
    try {
        cfg = ServerConfig::fromParser(parser);
    } catch (const std::invalid_argument& e) {
        qCritical() << "configuration error:" << e.what();
        return 2;
    }

    try {
        CryptoEngine crypto;

        std::vector<std::shared_ptr<MemoryKeyValueStore>> memories;
        std::vector<std::shared_ptr<KeyValueStore>> backends;
        for (int i = 0; i < cfg.backendCount; ++i) {
            auto m = std::make_shared<MemoryKeyValueStore>(QString("memory-%1").arg(i));
            memories.push_back(m);
            backends.push_back(m);
        }
        ShardedKeyValueStore kv(backends);

        OneTimeSecretService secrets(&kv, cfg.oneTimeTtlSeconds);
        ShareSessionService shares(&kv, cfg.shareTtlSeconds);
        ApiRouter router(&shares, &secrets);

        const QHostAddress address(cfg.host);
        HttpFrontend http(&router);
        if (http.listen(address, cfg.httpPort) == 0) return 1;

        PairingRegistry registry;
        SyncRelay relay(&registry, &crypto);
        WebSocketRelayServer relayServer(&relay, cfg.maxMessageBytes);
        if (relayServer.listen(address, cfg.relayPort) == 0) return 1;

        QTimer sweep;
        QObject::connect(&sweep, &QTimer::timeout, [&memories]() {
            int dropped = 0;
            for (const auto& m : memories) dropped += m->sweepExpired();
            if (dropped > 0) qCInfo(lcKv) << "sweep dropped" << dropped << "expired records";
        });
        sweep.start(cfg.sweepIntervalSeconds * 1000);

        return app.exec();
    } catch (const std::exception& e) {
        qCritical() << "fatal:" << e.what();
        return 1;
    }
}
