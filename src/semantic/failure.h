#pragma once
#include "types.h"
#include <QString>
#include <QJsonObject>

// Error value carried through Result<T>. The HTTP layer turns it into a status
// and a JSON body; the agent loop turns it into an "error" event.
struct DomainFailure {
    ErrorKind   kind = ErrorKind::Internal;
    QString     code;
    QString     message;
    bool        retryable = false;
    bool        temporary = false;

    int httpStatus() const;
    QJsonObject toJson() const;

    // "[code] message", for log lines
    QString describe() const;

    static const char* kindName(ErrorKind kind);

    static DomainFailure invalidInput(const QString& code, const QString& msg);
    static DomainFailure forbidden(const QString& code, const QString& msg);
    static DomainFailure notFound(const QString& code, const QString& msg);
    static DomainFailure notSupported(const QString& code, const QString& msg);
    static DomainFailure unavailable(const QString& msg);
    static DomainFailure timeout(const QString& msg);
    static DomainFailure internal(const QString& msg);
};
