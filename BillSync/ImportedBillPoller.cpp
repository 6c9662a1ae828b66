#include "ImportedBillPoller.hpp"
#include "CryptoEngine.hpp"
#include "Logging.hpp"
#include "ShareSessionClient.hpp"

ImportedBillPoller::ImportedBillPoller(CryptoEngine* crypto, ShareSessionClient* sessions, QObject* parent)
    : QObject(parent), m_crypto(crypto), m_sessions(sessions) {}

void ImportedBillPoller::track(const SharedBillView& view, const QByteArray& contentKey) {
    m_bills.insert(view.shareId, {view, contentKey});
}

void ImportedBillPoller::untrack(const QString& shareId) {
    m_bills.remove(shareId);
}

bool ImportedBillPoller::poll() {
    if (m_polling) return false;
    if (m_bills.isEmpty()) {
        emit pollFinished();
        return true;
    }
    m_polling = true;

    QVector<ShareVersionCheck> known;
    known.reserve(m_bills.size());
    for (auto it = m_bills.constBegin(); it != m_bills.constEnd(); ++it)
        known.push_back({it.key(), it->view.version});

    emit status(QString("checking %1 imported bills").arg(known.size()));
    m_sessions->fetchChanged(known, guardedBy(this, [this](const QVector<ShareChange>& changes) {
        for (const ShareChange& c : changes) apply(c);
        checkLiveness();
    }), guardedBy(this, [this](const ApiError& err) {
        fail(err, QStringLiteral("batch check"));
    }));
    return true;
}

void ImportedBillPoller::apply(const ShareChange& change) {
    auto it = m_bills.find(change.id);
    if (it == m_bills.end() || change.version <= it->view.version) return;

    bool ok = false;
    const QByteArray payload = m_crypto->openCompressed(it->contentKey, change.ciphertext, &ok);
    QString why = QStringLiteral("could not decrypt");
    std::optional<SharedBill> bill;
    if (ok) bill = SharedBillPayload::verify(*m_crypto, payload, &why);
    if (!bill) {
        qCWarning(lcLink) << "update for share" << change.id << "rejected:" << why;
        emit stale(change.id);
        return;
    }

    it->view.content = *bill;
    it->view.version = change.version;
    emit updated(it->view);
}

void ImportedBillPoller::checkLiveness() {
    m_sessions->statusBatch(m_bills.keys(), guardedBy(this, [this](const QVector<ShareStatus>& statuses) {
        for (const ShareStatus& s : statuses) {
            if (s.live || !m_bills.contains(s.id)) continue;
            qCInfo(lcLink) << "share" << s.id << "has expired";
            m_bills.remove(s.id);
            emit expired(s.id);
        }
        finish();
    }), guardedBy(this, [this](const ApiError& err) {
        fail(err, QStringLiteral("batch status"));
    }));
}

void ImportedBillPoller::finish() {
    m_polling = false;
    emit pollFinished();
}

void ImportedBillPoller::fail(const ApiError& err, const QString& what) {
    m_polling = false;
    qCWarning(lcLink) << what << "failed:" << errorKindName(err.kind) << err.message;
    emit status(QString("%1 failed: %2").arg(what, err.message));
    emit failed(err.kind, userMessageFor(err.kind));
}
