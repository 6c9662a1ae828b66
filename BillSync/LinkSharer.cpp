#include "LinkSharer.hpp"
#include "CryptoEngine.hpp"
#include "Logging.hpp"
#include "OneTimeKeyClient.hpp"
#include "ShareLink.hpp"
#include "ShareSessionClient.hpp"
#include "SharedBillPayload.hpp"

#include <QDateTime>

LinkSharer::LinkSharer(CryptoEngine* crypto, ShareSessionClient* sessions, OneTimeKeyClient* keys,
                       QObject* parent)
    : QObject(parent),
    m_crypto(crypto),
    m_sessions(sessions),
    m_keys(keys),
    m_clock([] { return QDateTime::currentMSecsSinceEpoch(); }) {

    connect(m_sessions, &ShareSessionClient::status, this, &LinkSharer::status);
    connect(m_keys, &OneTimeKeyClient::status, this, &LinkSharer::status);
}

void LinkSharer::setClock(Clock clock) {
    if (clock) m_clock = std::move(clock);
}

void LinkSharer::restoreState(const BillShareState& state) {
    if (state.billId.isEmpty()) return;
    m_states.insert(state.billId, state);
}

void LinkSharer::publish(const QJsonObject& bill) {
    ensureSession(bill, [] {});
}

void LinkSharer::shareWith(const QJsonObject& bill, const QString& participantId) {
    const QString billId = bill.value("id").toString();
    if (participantId.isEmpty()) {
        emit failed(ErrorKind::ValidationFailure, QStringLiteral("Choose a participant to share with."));
        return;
    }
    ensureSession(bill, [this, billId, participantId] {
        ensureParticipantLink(billId, participantId, [this, billId, participantId] {
            const QString link = buildLink(m_states.value(billId), participantId);
            qCInfo(lcLink) << "link ready for bill" << billId << "participant" << participantId;
            emit linkReady(billId, participantId, link);
        });
    });
}

void LinkSharer::ensureSession(const QJsonObject& bill, Continuation then) {
    const QString billId = bill.value("id").toString();
    if (billId.isEmpty()) {
        emit failed(ErrorKind::ValidationFailure, QStringLiteral("The bill has no id."));
        return;
    }

    const BillShareState current = m_states.value(billId);
    if (!current.hasSession()) {
        createSession(bill, false, std::move(then));
        return;
    }

    // Same keys, same session id: existing links keep working.
    m_sessions->update(current.shareId, sealBill(current, bill), current.updateToken,
                       guardedBy(this, [this, billId, then](qint64 version) {
        BillShareState& s = m_states[billId];
        s.version = version;
        emit stateChanged(s);
        emit published(billId, s.shareId, version);
        then();
    }), guardedBy(this, [this, bill, billId, then](const ApiError& err) {
        if (err.kind == ErrorKind::NotFound || err.kind == ErrorKind::Conflict) {
            qCInfo(lcLink) << "share session for bill" << billId << "is gone, recreating";
            createSession(bill, true, then);
            return;
        }
        fail(err, QStringLiteral("update share session"));
    }));
}

void LinkSharer::createSession(const QJsonObject& bill, bool recreating, Continuation then) {
    BillShareState fresh;
    fresh.billId = bill.value("id").toString();
    fresh.contentKey = m_crypto->generateSymmetricKey();
    fresh.signing = m_crypto->generateSigningKeyPair();

    m_sessions->create(sealBill(fresh, bill), guardedBy(this, [this, fresh, recreating, then](const ShareCreated& created) {
        BillShareState s = fresh;
        s.shareId = created.id;
        s.updateToken = created.updateToken;
        s.version = created.version;
        m_states.insert(s.billId, s);

        emit stateChanged(s);
        if (recreating) emit shareRecreated(s.billId, s.shareId);
        emit published(s.billId, s.shareId, s.version);
        then();
    }), guardedBy(this, [this](const ApiError& err) {
        fail(err, QStringLiteral("create share session"));
    }));
}

void LinkSharer::ensureParticipantLink(const QString& billId, const QString& participantId, Continuation then) {
    const BillShareState& s = m_states[billId];
    const auto it = s.participants.constFind(participantId);
    if (it == s.participants.constEnd() || m_clock() >= it->expiresAtMs) {
        mintParticipantLink(billId, participantId, std::move(then));
        return;
    }

    m_keys->peek(it->keyId, guardedBy(this, [this, billId, participantId, then](bool available) {
        if (available) {
            then();
            return;
        }
        mintParticipantLink(billId, participantId, then);
    }), guardedBy(this, [this, billId, participantId, then](const ApiError& err) {
        qCWarning(lcLink) << "link status check failed, minting a new one:" << err.message;
        mintParticipantLink(billId, participantId, then);
    }));
}

void LinkSharer::mintParticipantLink(const QString& billId, const QString& participantId, Continuation then) {
    const QByteArray fragmentKey = m_crypto->generateSymmetricKey();
    const QByteArray wrapped = m_crypto->sealCompressed(
        fragmentKey, CryptoEngine::exportSymmetricKey(m_states.value(billId).contentKey).toUtf8());

    m_keys->create(wrapped, guardedBy(this, [this, billId, participantId, fragmentKey, then](const QString& keyId) {
        BillShareState& s = m_states[billId];
        ParticipantLink link;
        link.keyId = keyId;
        link.fragmentKey = fragmentKey;
        link.expiresAtMs = m_clock() + kParticipantLinkTtlMs;
        s.participants.insert(participantId, link);
        emit stateChanged(s);
        then();
    }), guardedBy(this, [this](const ApiError& err) {
        fail(err, QStringLiteral("create one-time key"));
    }));
}

QString LinkSharer::buildLink(const BillShareState& state, const QString& participantId) const {
    const ParticipantLink p = state.participants.value(participantId);
    ShareLink link;
    link.shareId = state.shareId;
    link.keyId = p.keyId;
    link.fragmentKey = p.fragmentKey;
    link.encryptedParticipantId = m_crypto->sealCompressed(state.contentKey, participantId.toUtf8());
    return link.toString(m_linkBase);
}

QByteArray LinkSharer::sealBill(const BillShareState& state, const QJsonObject& bill) const {
    const QByteArray payload =
        SharedBillPayload::build(*m_crypto, bill, m_creatorName, m_paymentDetails, state.signing);
    return m_crypto->sealCompressed(state.contentKey, payload);
}

void LinkSharer::fail(const ApiError& err, const QString& what) {
    qCWarning(lcLink) << what << "failed:" << errorKindName(err.kind) << err.message;
    emit status(QString("%1 failed: %2").arg(what, err.message));
    emit failed(err.kind, userMessageFor(err.kind));
}
