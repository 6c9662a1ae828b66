#pragma once
#include "ApiTransport.hpp"

#include <QNetworkAccessManager>
#include <QObject>
#include <QUrl>

class NetworkApiTransport : public QObject, public ApiTransport {
    Q_OBJECT
public:
    explicit NetworkApiTransport(QObject* parent = nullptr);

    void setBaseUrl(const QUrl& u);
    void setTimeoutMs(int ms) { m_timeoutMs = ms; }

    void send(const QByteArray& method, const QString& path, const QUrlQuery& query,
              const QByteArray& jsonBody, Callback done) override;

private:
    QNetworkAccessManager m_nam;
    QUrl m_base;
    int m_timeoutMs = 15000;
};
