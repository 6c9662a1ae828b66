#pragma once
#include "ApiTransport.hpp"
#include "ShareSessionService.hpp"

#include <QObject>

class ShareSessionClient : public QObject {
    Q_OBJECT
public:
    explicit ShareSessionClient(ApiTransport* transport, QObject* parent = nullptr);

    void create(const QByteArray& ciphertext,
                std::function<void(const ShareCreated&)> onDone, ErrorCallback onError);

    void update(const QString& shareId, const QByteArray& ciphertext, const QString& updateToken,
                std::function<void(qint64 version)> onDone, ErrorCallback onError);

    // onDone gets std::nullopt when the server answers 304 Not Modified.
    void fetch(const QString& shareId, std::optional<qint64> ifNewerThan,
               std::function<void(const std::optional<ShareSnapshot>&)> onDone, ErrorCallback onError);

    void statusBatch(const QStringList& shareIds,
                     std::function<void(const QVector<ShareStatus>&)> onDone, ErrorCallback onError);

    void fetchChanged(const QVector<ShareVersionCheck>& known,
                      std::function<void(const QVector<ShareChange>&)> onDone, ErrorCallback onError);

signals:
    void status(const QString& s);

private:
    bool rejectMalformed(const QString& shareId, const ErrorCallback& onError);

    ApiTransport* m_transport = nullptr;
};
