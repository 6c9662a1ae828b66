#pragma once
#include <QString>
#include <stdexcept>

enum class ErrorKind {
    NotFound,           // session/secret absent, expired or consumed
    Conflict,           // concurrent update on a share session
    Forbidden,          // update token mismatch
    TransportFailure,   // relay or API unreachable, connection dropped
    ValidationFailure,  // malformed code, payload, key or link
    Internal
};

QString errorKindName(ErrorKind kind);

// Text that is safe to show to a user verbatim.
QString userMessageFor(ErrorKind kind);

int httpStatusFor(ErrorKind kind);
ErrorKind errorKindFromHttpStatus(int status);

// Thrown by the server-side services; translated to HTTP statuses by ApiRouter.
class ServiceError : public std::runtime_error {
public:
    ServiceError(ErrorKind kind, const QString& message);

    ErrorKind kind() const { return m_kind; }

private:
    ErrorKind m_kind;
};

// Client-side failure passed to completion callbacks.
struct ApiError {
    ErrorKind kind = ErrorKind::Internal;
    QString message;
};
