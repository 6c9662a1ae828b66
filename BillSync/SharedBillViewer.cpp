#include "SharedBillViewer.hpp"
#include "CryptoEngine.hpp"
#include "Logging.hpp"
#include "OneTimeKeyClient.hpp"
#include "ShareLink.hpp"
#include "ShareSessionClient.hpp"

SharedBillViewer::SharedBillViewer(CryptoEngine* crypto, ShareSessionClient* sessions, OneTimeKeyClient* keys,
                                   QObject* parent)
    : QObject(parent), m_crypto(crypto), m_sessions(sessions), m_keys(keys) {
    connect(m_sessions, &ShareSessionClient::status, this, &SharedBillViewer::status);
    connect(m_keys, &OneTimeKeyClient::status, this, &SharedBillViewer::status);
}

void SharedBillViewer::open(const QString& link) {
    QString why;
    const std::optional<ShareLink> parsed = ShareLink::parse(link, &why);
    if (!parsed) {
        fail(ErrorKind::ValidationFailure, why);
        return;
    }

    m_contentKey.clear();
    m_view = SharedBillView{};
    m_view.shareId = parsed->shareId;
    m_encryptedParticipantId = parsed->encryptedParticipantId;
    const QByteArray fragmentKey = parsed->fragmentKey;

    // The server deletes the secret as it answers; there is no second try.
    m_keys->consume(parsed->keyId, guardedBy(this, [this, fragmentKey](const QByteArray& wrapped) {
        bool ok = false;
        const QByteArray portable = m_crypto->openCompressed(fragmentKey, wrapped, &ok);
        const QByteArray contentKey = ok ? CryptoEngine::importSymmetricKey(QString::fromUtf8(portable))
                                         : QByteArray();
        if (contentKey.isEmpty()) {
            fail(ErrorKind::ValidationFailure, QStringLiteral("could not unwrap the content key"));
            return;
        }
        m_contentKey = contentKey;

        const QByteArray pid = m_crypto->openCompressed(m_contentKey, m_encryptedParticipantId, &ok);
        if (!ok || pid.isEmpty()) {
            m_contentKey.clear();
            fail(ErrorKind::ValidationFailure, QStringLiteral("could not decrypt the participant"));
            return;
        }
        m_view.participantId = QString::fromUtf8(pid);
        fetchAndShow(true);
    }), guardedBy(this, [this](const ApiError& err) {
        fail(err.kind, err.message);
    }));
}

void SharedBillViewer::refresh() {
    if (!isOpen()) {
        fail(ErrorKind::ValidationFailure, QStringLiteral("refresh before a link was opened"));
        return;
    }
    fetchAndShow(false);
}

void SharedBillViewer::fetchAndShow(bool initial) {
    const std::optional<qint64> since = initial ? std::nullopt : std::optional<qint64>(m_view.version);

    m_sessions->fetch(m_view.shareId, since, guardedBy(this, [this, initial](const std::optional<ShareSnapshot>& snap) {
        if (!snap) {
            emit upToDate();
            return;
        }
        if (!decodeSnapshot(snap->ciphertext, snap->version)) return;

        qCInfo(lcLink) << "showing bill" << m_view.content.bill.value("id").toString()
                       << "version" << m_view.version;
        if (initial)
            emit opened(m_view);
        else
            emit updated(m_view);
    }), guardedBy(this, [this](const ApiError& err) {
        fail(err.kind, err.message);
    }));
}

bool SharedBillViewer::decodeSnapshot(const QByteArray& ciphertext, qint64 version) {
    bool ok = false;
    const QByteArray payload = m_crypto->openCompressed(m_contentKey, ciphertext, &ok);
    if (!ok) {
        fail(ErrorKind::ValidationFailure, QStringLiteral("could not decrypt the shared bill"));
        return false;
    }

    QString why;
    const std::optional<SharedBill> bill = SharedBillPayload::verify(*m_crypto, payload, &why);
    if (!bill) {
        fail(ErrorKind::ValidationFailure, why);
        return false;
    }
    m_view.content = *bill;
    m_view.version = version;
    return true;
}

void SharedBillViewer::fail(ErrorKind kind, const QString& detail) {
    qCWarning(lcLink) << "viewing shared bill failed:" << errorKindName(kind) << detail;
    emit status(QString("view failed: %1").arg(detail));
    emit failed(kind, userMessageFor(kind));
}
