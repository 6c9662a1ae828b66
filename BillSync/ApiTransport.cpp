#include "ApiTransport.hpp"

#include <QJsonDocument>
#include <QJsonObject>

ApiError apiErrorFrom(const ApiResponse& response) {
    ApiError err;
    if (response.status == 0) {
        err.kind = ErrorKind::TransportFailure;
        err.message = response.networkError.isEmpty() ? userMessageFor(err.kind) : response.networkError;
        return err;
    }
    err.kind = errorKindFromHttpStatus(response.status);
    const QJsonObject o = QJsonDocument::fromJson(response.body).object();
    err.message = o.value("error").toString();
    if (err.message.isEmpty()) err.message = QStringLiteral("HTTP %1").arg(response.status);
    return err;
}
