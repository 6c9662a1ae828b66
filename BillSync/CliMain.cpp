#include <QCommandLineParser>
#include <QCoreApplication>
#include <QFile>
#include <QJsonDocument>
#include <QSaveFile>
#include <QTextStream>
#include <stdexcept>

#include "BillShareState.hpp"
#include "ClientConfig.hpp"
#include "CryptoEngine.hpp"
#include "DeviceSyncController.hpp"
#include "JsonFileDataStore.hpp"
#include "LinkSharer.hpp"
#include "NetworkApiTransport.hpp"
#include "OneTimeKeyClient.hpp"
#include "ShareSessionClient.hpp"
#include "SharedBillViewer.hpp"
#include "SyncCollaborators.hpp"
#include "WebSocketSyncChannel.hpp"

namespace {

QTextStream& out() {
    static QTextStream s(stdout);
    return s;
}

class ConsolePrompt : public ConfirmationPrompt {
public:
    explicit ConsolePrompt(bool assumeYes) : m_assumeYes(assumeYes) {}

    void ask(const QString& title, const QString& body,
             std::function<void()> onConfirm, std::function<void()> onCancel) override {
        out() << title << "\n" << body << "\n";
        if (m_assumeYes) {
            out() << "[--yes] confirmed\n" << Qt::flush;
            onConfirm();
            return;
        }
        out() << "Type 'yes' to continue: " << Qt::flush;
        QTextStream in(stdin);
        const QString answer = in.readLine().trimmed().toLower();
        if (answer == "yes" || answer == "y")
            onConfirm();
        else
            onCancel();
    }

private:
    bool m_assumeYes = false;
};

// Owner-side share state, one entry per bill.
QHash<QString, BillShareState> loadShareStates(const QString& path) {
    QHash<QString, BillShareState> states;
    QFile f(path);
    if (!f.open(QIODevice::ReadOnly)) return states;
    const QJsonObject o = QJsonDocument::fromJson(f.readAll()).object();
    for (auto it = o.constBegin(); it != o.constEnd(); ++it)
        states.insert(it.key(), BillShareState::fromJson(it.value().toObject()));
    return states;
}

bool saveShareStates(const QString& path, const QHash<QString, BillShareState>& states) {
    QJsonObject o;
    for (auto it = states.constBegin(); it != states.constEnd(); ++it) o[it.key()] = it->toJson();
    QSaveFile f(path);
    if (!f.open(QIODevice::WriteOnly)) return false;
    f.write(QJsonDocument(o).toJson(QJsonDocument::Indented));
    return f.commit();
}

int runSync(QCoreApplication& app, CryptoEngine& crypto, const ClientConfig& cfg,
            bool sending, const QString& code, bool assumeYes) {
    WebSocketSyncChannel channel(cfg.relayUrl);
    JsonFileDataStore store(cfg.dataFile);
    ConsolePrompt prompt(assumeYes);
    DeviceSyncController sync(&crypto, &channel, &store, &prompt);
    sync.setConnectTimeoutMs(cfg.connectTimeoutMs);

    QObject::connect(&sync, &DeviceSyncController::stateChanged, [](SyncStateMachine::State s) {
        out() << "[" << SyncStateMachine::stateName(s) << "]\n" << Qt::flush;
    });
    QObject::connect(&sync, &DeviceSyncController::codeReady, [](const QString& c) {
        out() << "Sync code: " << c << "\nEnter it on the other device.\n" << Qt::flush;
    });
    QObject::connect(&sync, &DeviceSyncController::completed, &app, [&app]() {
        out() << "Sync complete.\n" << Qt::flush;
        app.exit(0);
    });
    QObject::connect(&sync, &DeviceSyncController::cancelled, &app, [&app](const QString& why) {
        out() << why << "\n" << Qt::flush;
        app.exit(1);
    });
    QObject::connect(&sync, &DeviceSyncController::failed, &app, [&app](ErrorKind, const QString& why) {
        out() << "Error: " << why << "\n" << Qt::flush;
        app.exit(1);
    });

    const bool started = sending ? sync.startSending() : sync.startReceiving(code);
    if (!started) return 1;
    return app.exec();
}

int runShare(QCoreApplication& app, CryptoEngine& crypto, const ClientConfig& cfg,
             const QString& billFile, const QString& participantId) {
    QFile f(billFile);
    if (!f.open(QIODevice::ReadOnly)) {
        out() << "Cannot read " << billFile << ": " << f.errorString() << "\n";
        return 1;
    }
    const QJsonObject bill = QJsonDocument::fromJson(f.readAll()).object();
    if (bill.value("id").toString().isEmpty()) {
        out() << billFile << " is not a bill (no id).\n";
        return 1;
    }

    NetworkApiTransport transport;
    transport.setBaseUrl(cfg.apiBaseUrl);
    transport.setTimeoutMs(cfg.connectTimeoutMs);
    ShareSessionClient sessions(&transport);
    OneTimeKeyClient keys(&transport);
    LinkSharer sharer(&crypto, &sessions, &keys);
    sharer.setLinkBaseUrl(cfg.linkBaseUrl);
    sharer.setCreatorName(cfg.creatorName);

    QHash<QString, BillShareState> states = loadShareStates(cfg.shareStateFile);
    for (const BillShareState& s : states) sharer.restoreState(s);

    QObject::connect(&sharer, &LinkSharer::stateChanged, [&states, &cfg](const BillShareState& s) {
        states.insert(s.billId, s);
        if (!saveShareStates(cfg.shareStateFile, states))
            out() << "Warning: could not save " << cfg.shareStateFile << "\n" << Qt::flush;
    });
    QObject::connect(&sharer, &LinkSharer::shareRecreated, [](const QString&, const QString&) {
        out() << "The previous share expired; earlier links no longer work.\n" << Qt::flush;
    });
    QObject::connect(&sharer, &LinkSharer::linkReady, &app,
                     [&app](const QString&, const QString&, const QString& link) {
        out() << link << "\n" << Qt::flush;
        app.exit(0);
    });
    QObject::connect(&sharer, &LinkSharer::failed, &app, [&app](ErrorKind, const QString& why) {
        out() << "Error: " << why << "\n" << Qt::flush;
        app.exit(1);
    });

    sharer.shareWith(bill, participantId);
    return app.exec();
}

int runView(QCoreApplication& app, CryptoEngine& crypto, const ClientConfig& cfg, const QString& link) {
    NetworkApiTransport transport;
    transport.setBaseUrl(cfg.apiBaseUrl);
    transport.setTimeoutMs(cfg.connectTimeoutMs);
    ShareSessionClient sessions(&transport);
    OneTimeKeyClient keys(&transport);
    SharedBillViewer viewer(&crypto, &sessions, &keys);

    QObject::connect(&viewer, &SharedBillViewer::opened, &app, [&app](const SharedBillView& v) {
        out() << "Shared by " << v.content.creatorName << " for participant " << v.participantId << "\n"
              << QJsonDocument(v.content.bill).toJson(QJsonDocument::Indented) << Qt::flush;
        app.exit(0);
    });
    QObject::connect(&viewer, &SharedBillViewer::failed, &app, [&app](ErrorKind, const QString& why) {
        out() << "Error: " << why << "\n" << Qt::flush;
        app.exit(1);
    });

    viewer.open(link);
    return app.exec();
}

} // namespace

int main(int argc, char* argv[]) {
    QCoreApplication app(argc, argv);
    QCoreApplication::setApplicationName("billsync-cli");

    QCommandLineParser parser;
    parser.setApplicationDescription("Device sync and bill links.");
    parser.addHelpOption();
    parser.addOptions({
        {"config", "Client config (JSON).", "file", "billsync.json"},
        {"yes", "Accept the overwrite prompt without asking."},
    });
    parser.addPositionalArgument("command", "send | receive <code> | share <bill.json> <participantId> | view <link>");
    parser.process(app);

    ClientConfig cfg;
    try {
        cfg = ClientConfig::loadFile(parser.value("config"));
    } catch (const std::invalid_argument& e) {
        out() << "Configuration error: " << e.what() << "\n";
        return 2;
    }

    const QStringList args = parser.positionalArguments();
    const QString command = args.value(0);

    try {
        CryptoEngine crypto;
        if (command == "send" && args.size() == 1)
            return runSync(app, crypto, cfg, true, QString(), parser.isSet("yes"));
        if (command == "receive" && args.size() == 2)
            return runSync(app, crypto, cfg, false, args.at(1), parser.isSet("yes"));
        if (command == "share" && args.size() == 3)
            return runShare(app, crypto, cfg, args.at(1), args.at(2));
        if (command == "view" && args.size() == 2)
            return runView(app, crypto, cfg, args.at(1));
    } catch (const std::exception& e) {
        out() << "Fatal: " << e.what() << "\n";
        return 1;
    }

    parser.showHelp(2);
}
