#pragma once
#include <QHash>
#include <QObject>

#include "ErrorKind.hpp"
#include "SharedBillViewer.hpp"

class CryptoEngine;
class ShareSessionClient;
struct ShareChange;

// Keeps every bill this device has opened from a link up to date with one
// batch-check per poll, then asks batch-status which sessions are gone.
class ImportedBillPoller : public QObject {
    Q_OBJECT
public:
    ImportedBillPoller(CryptoEngine* crypto, ShareSessionClient* sessions, QObject* parent = nullptr);

    void track(const SharedBillView& view, const QByteArray& contentKey);
    void untrack(const QString& shareId);
    bool isTracking(const QString& shareId) const { return m_bills.contains(shareId); }
    int trackedCount() const { return m_bills.size(); }
    SharedBillView view(const QString& shareId) const { return m_bills.value(shareId).view; }

    // false while a poll is already running.
    bool poll();

signals:
    void updated(const SharedBillView& view);
    // Ciphertext arrived but did not decrypt or verify; the old view is kept.
    void stale(const QString& shareId);
    // Server no longer has the session; it is dropped from tracking.
    void expired(const QString& shareId);
    void pollFinished();
    void failed(ErrorKind kind, const QString& message);
    void status(const QString& s);

private:
    struct Tracked {
        SharedBillView view;
        QByteArray contentKey;
    };

    void apply(const ShareChange& change);
    void checkLiveness();
    void finish();
    void fail(const ApiError& err, const QString& what);

    CryptoEngine* m_crypto = nullptr;
    ShareSessionClient* m_sessions = nullptr;

    QHash<QString, Tracked> m_bills;
    bool m_polling = false;
};
