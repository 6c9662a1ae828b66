#pragma once
#include <QObject>

#include "ErrorKind.hpp"
#include "SharedBillPayload.hpp"

class CryptoEngine;
class OneTimeKeyClient;
class ShareSessionClient;

struct SharedBillView {
    QString shareId;
    QString participantId;
    qint64 version = 0;
    SharedBill content;
};

// Recipient side of a bill link. The first open() spends the link's
// one-time secret; after that the content key lives only in this object,
// and refresh() polls the share session for newer versions.
class SharedBillViewer : public QObject {
    Q_OBJECT
public:
    SharedBillViewer(CryptoEngine* crypto, ShareSessionClient* sessions, OneTimeKeyClient* keys,
                     QObject* parent = nullptr);

    void open(const QString& link);
    void refresh();

    bool isOpen() const { return m_contentKey.size() == 32; }
    const SharedBillView& current() const { return m_view; }
    const QByteArray& contentKey() const { return m_contentKey; }

signals:
    void opened(const SharedBillView& view);
    void updated(const SharedBillView& view);
    void upToDate();
    void failed(ErrorKind kind, const QString& message);
    void status(const QString& s);

private:
    void fetchAndShow(bool initial);
    bool decodeSnapshot(const QByteArray& ciphertext, qint64 version);
    void fail(ErrorKind kind, const QString& detail);

    CryptoEngine* m_crypto = nullptr;
    ShareSessionClient* m_sessions = nullptr;
    OneTimeKeyClient* m_keys = nullptr;

    QByteArray m_contentKey;
    QByteArray m_encryptedParticipantId;
    SharedBillView m_view;
};
