#pragma once
#include <QtGlobal>

enum class ErrorKind : quint8 {
    InvalidInput,    // 400
    Unauthorized,    // 401
    Forbidden,       // 403
    NotFound,        // 404
    RateLimited,     // 429  (retryable)
    Unavailable,     // 503  (retryable)
    Timeout,         // 504  (retryable)
    NotSupported,    // 501
    Internal         // 500
};

enum class ExecutionFailure : quint8 {
    None,
    WorkingArea,
    Provisioning,
    NonZeroExit,
    ArtifactMissing,
    Cancelled,
    Internal
};

enum class NotificationStatus : quint8 {
    Started, Running, Completed, Failed
};
