#include "execution.h"

QString ExecutionResult::toolOutput() const
{
    if (succeeded()) {
        return artifactUrl.isEmpty() ? *artifactPath : artifactUrl;
    }
    return QStringLiteral("Error executing scene code: %1\n\n"
                          "Please review the code and fix any issues.")
        .arg(diagnostic);
}

const char* ExecutionResult::failureName(ExecutionFailure failure)
{
    switch (failure) {
    case ExecutionFailure::None:            return "none";
    case ExecutionFailure::WorkingArea:     return "working_area";
    case ExecutionFailure::Provisioning:    return "provisioning";
    case ExecutionFailure::NonZeroExit:     return "non_zero_exit";
    case ExecutionFailure::ArtifactMissing: return "artifact_missing";
    case ExecutionFailure::Cancelled:       return "cancelled";
    case ExecutionFailure::Internal:
    default:                                return "internal";
    }
}
