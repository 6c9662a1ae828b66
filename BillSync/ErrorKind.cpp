#include "ErrorKind.hpp"

QString errorKindName(ErrorKind kind) {
    switch (kind) {
    case ErrorKind::NotFound:          return QStringLiteral("NotFound");
    case ErrorKind::Conflict:          return QStringLiteral("Conflict");
    case ErrorKind::Forbidden:         return QStringLiteral("Forbidden");
    case ErrorKind::TransportFailure:  return QStringLiteral("TransportFailure");
    case ErrorKind::ValidationFailure: return QStringLiteral("ValidationFailure");
    case ErrorKind::Internal:          return QStringLiteral("Internal");
    }
    return QStringLiteral("Internal");
}

QString userMessageFor(ErrorKind kind) {
    switch (kind) {
    case ErrorKind::NotFound:
        return QStringLiteral("This link is invalid or has expired.");
    case ErrorKind::Conflict:
        return QStringLiteral("The shared bill was changed elsewhere. Please share it again.");
    case ErrorKind::Forbidden:
        return QStringLiteral("This device is not allowed to update the shared bill.");
    case ErrorKind::TransportFailure:
        return QStringLiteral("Could not reach the sync service. Check your connection and try again.");
    case ErrorKind::ValidationFailure:
        return QStringLiteral("The data received was malformed or could not be decrypted.");
    case ErrorKind::Internal:
        break;
    }
    return QStringLiteral("An unexpected error occurred.");
}

int httpStatusFor(ErrorKind kind) {
    switch (kind) {
    case ErrorKind::NotFound:          return 404;
    case ErrorKind::Conflict:          return 409;
    case ErrorKind::Forbidden:         return 403;
    case ErrorKind::ValidationFailure: return 400;
    case ErrorKind::TransportFailure:  return 503;
    case ErrorKind::Internal:          return 500;
    }
    return 500;
}

ErrorKind errorKindFromHttpStatus(int status) {
    switch (status) {
    case 400: return ErrorKind::ValidationFailure;
    case 403: return ErrorKind::Forbidden;
    case 404: return ErrorKind::NotFound;
    case 409: return ErrorKind::Conflict;
    case 502:
    case 503:
    case 504: return ErrorKind::TransportFailure;
    default:  break;
    }
    return status == 0 ? ErrorKind::TransportFailure : ErrorKind::Internal;
}

ServiceError::ServiceError(ErrorKind kind, const QString& message)
    : std::runtime_error(message.toStdString()), m_kind(kind) {}
