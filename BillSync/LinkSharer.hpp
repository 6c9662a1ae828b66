#pragma once
#include <QHash>
#include <QJsonObject>
#include <QObject>
#include <QUrl>
#include <functional>

#include "BillShareState.hpp"
#include "ErrorKind.hpp"

class CryptoEngine;
class OneTimeKeyClient;
class ShareSessionClient;

// Owner side of bill links. Keeps one share session per bill alive and
// hands out per-participant links backed by one-time secrets.
class LinkSharer : public QObject {
    Q_OBJECT
public:
    using Clock = std::function<qint64()>;

    // How long a minted participant link is reused before a fresh secret is
    // issued, even if the old one is still unread.
    static constexpr qint64 kParticipantLinkTtlMs = 5 * 60 * 1000;

    LinkSharer(CryptoEngine* crypto, ShareSessionClient* sessions, OneTimeKeyClient* keys,
               QObject* parent = nullptr);

    void setLinkBaseUrl(const QUrl& base) { m_linkBase = base; }
    void setCreatorName(const QString& name) { m_creatorName = name; }
    void setPaymentDetails(const QJsonObject& details) { m_paymentDetails = details; }
    void setClock(Clock clock);

    void restoreState(const BillShareState& state);
    BillShareState state(const QString& billId) const { return m_states.value(billId); }

    // Encrypts and uploads the bill: create on first share, update after
    // that, recreating the session when the server no longer has it.
    void publish(const QJsonObject& bill);

    // publish(), then emit linkReady for one participant.
    void shareWith(const QJsonObject& bill, const QString& participantId);

signals:
    void published(const QString& billId, const QString& shareId, qint64 version);
    void linkReady(const QString& billId, const QString& participantId, const QString& link);
    // Earlier links for this bill no longer work.
    void shareRecreated(const QString& billId, const QString& shareId);
    void stateChanged(const BillShareState& state);
    void failed(ErrorKind kind, const QString& message);
    void status(const QString& s);

private:
    using Continuation = std::function<void()>;

    void ensureSession(const QJsonObject& bill, Continuation then);
    void createSession(const QJsonObject& bill, bool recreating, Continuation then);
    void ensureParticipantLink(const QString& billId, const QString& participantId, Continuation then);
    void mintParticipantLink(const QString& billId, const QString& participantId, Continuation then);
    QString buildLink(const BillShareState& state, const QString& participantId) const;
    QByteArray sealBill(const BillShareState& state, const QJsonObject& bill) const;
    void fail(const ApiError& err, const QString& what);

    CryptoEngine* m_crypto = nullptr;
    ShareSessionClient* m_sessions = nullptr;
    OneTimeKeyClient* m_keys = nullptr;

    QUrl m_linkBase;
    QString m_creatorName;
    QJsonObject m_paymentDetails;
    Clock m_clock;
    QHash<QString, BillShareState> m_states;
};
