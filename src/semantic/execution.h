#pragma once
#include "types.h"
#include <QString>
#include <QStringList>
#include <optional>

struct ExecutionRequest {
    QString sourceText;
    QString toolCallId;
};

struct ExecutionResult {
    QString requestId;
    QString toolCallId;
    int exitStatus = -1;
    QString combinedLog;
    std::optional<QString> artifactPath;
    QString artifactUrl;
    ExecutionFailure failure = ExecutionFailure::None;
    QString diagnostic;

    bool succeeded() const {
        return failure == ExecutionFailure::None && artifactPath.has_value();
    }

    // Text handed back to the model as the tool message content.
    QString toolOutput() const;

    static const char* failureName(ExecutionFailure failure);
};

struct ContainerSpec {
    QString name;
    QString image;
    QStringList command;
    QString workingDir;
    QStringList binds;
    QString networkMode;
};
