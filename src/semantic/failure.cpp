#include "failure.h"

int DomainFailure::httpStatus() const {
    switch (kind) {
    case ErrorKind::InvalidInput:  return 400;
    case ErrorKind::Unauthorized:  return 401;
    case ErrorKind::Forbidden:     return 403;
    case ErrorKind::NotFound:      return 404;
    case ErrorKind::RateLimited:   return 429;
    case ErrorKind::NotSupported:  return 501;
    case ErrorKind::Unavailable:   return 503;
    case ErrorKind::Timeout:       return 504;
    case ErrorKind::Internal:
    default:                       return 500;
    }
}

const char* DomainFailure::kindName(ErrorKind kind) {
    switch (kind) {
    case ErrorKind::InvalidInput:  return "invalid_input";
    case ErrorKind::Unauthorized:  return "unauthorized";
    case ErrorKind::Forbidden:     return "forbidden";
    case ErrorKind::NotFound:      return "not_found";
    case ErrorKind::RateLimited:   return "rate_limited";
    case ErrorKind::Unavailable:   return "unavailable";
    case ErrorKind::Timeout:       return "timeout";
    case ErrorKind::NotSupported:  return "not_supported";
    case ErrorKind::Internal:
    default:                       return "internal";
    }
}

QJsonObject DomainFailure::toJson() const {
    // Same "error" key the event stream uses for its error payload
    QJsonObject root;
    root["error"] = message;
    root["code"] = code.isEmpty() ? QString::fromLatin1(kindName(kind)) : code;
    root["status"] = httpStatus();
    return root;
}

QString DomainFailure::describe() const {
    return QStringLiteral("[%1] %2")
        .arg(code.isEmpty() ? QString::fromLatin1(kindName(kind)) : code, message);
}

DomainFailure DomainFailure::invalidInput(const QString& code, const QString& msg) {
    return {ErrorKind::InvalidInput, code, msg, false, false};
}

DomainFailure DomainFailure::forbidden(const QString& code, const QString& msg) {
    return {ErrorKind::Forbidden, code, msg, false, false};
}

DomainFailure DomainFailure::notFound(const QString& code, const QString& msg) {
    return {ErrorKind::NotFound, code, msg, false, false};
}

DomainFailure DomainFailure::notSupported(const QString& code, const QString& msg) {
    return {ErrorKind::NotSupported, code, msg, false, false};
}

// Docker daemon or backend not reachable; a later request may succeed
DomainFailure DomainFailure::unavailable(const QString& msg) {
    return {ErrorKind::Unavailable, "unavailable", msg, true, true};
}

DomainFailure DomainFailure::timeout(const QString& msg) {
    return {ErrorKind::Timeout, "timeout", msg, true, true};
}

DomainFailure DomainFailure::internal(const QString& msg) {
    return {ErrorKind::Internal, "internal", msg, false, false};
}
