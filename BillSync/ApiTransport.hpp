#pragma once
#include "ErrorKind.hpp"

#include <QByteArray>
#include <QObject>
#include <QPointer>
#include <QString>
#include <QUrlQuery>
#include <functional>
#include <utility>

struct ApiResponse {
    int status = 0;          // 0 = no HTTP response at all
    QByteArray body;
    QString networkError;
};

using ErrorCallback = std::function<void(const ApiError&)>;

// Completion that is dropped once owner has been destroyed.
template <typename Fn>
auto guardedBy(QObject* owner, Fn fn) {
    return [guard = QPointer<QObject>(owner), fn = std::move(fn)](auto&&... args) {
        if (guard) fn(std::forward<decltype(args)>(args)...);
    };
}

// How the service clients reach the share/one-time-key API. Completion is
// always delivered asynchronously on the caller's event loop.
class ApiTransport {
public:
    using Callback = std::function<void(const ApiResponse&)>;

    virtual ~ApiTransport() = default;
    virtual void send(const QByteArray& method, const QString& path, const QUrlQuery& query,
                      const QByteArray& jsonBody, Callback done) = 0;
};

// Maps a failed response onto the error taxonomy; uses the server's "error"
// text when it sent one.
ApiError apiErrorFrom(const ApiResponse& response);
