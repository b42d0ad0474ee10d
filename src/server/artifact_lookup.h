#pragma once
#include "semantic/ports.h"
#include <QString>
#include <optional>

// Resolves GET /api/videos/<executionId>/<filename> to a file inside that
// execution's working area.
class ArtifactLookup {
public:
    ArtifactLookup(const QString& workRoot, const QString& outputSubdir, const QString& extension);

    // `relativePath` is the request path below /api/videos/. Malformed input
    // fails with InvalidInput before the filesystem is consulted; then
    // NotFound, then Forbidden when the file escapes the execution directory.
    Result<QString> resolve(const QString& relativePath) const;

    struct Target {
        QString executionId;
        QString fileName;
    };
    static Result<Target> parseTarget(const QString& relativePath, const QString& extension);

private:
    static std::optional<QString> findByName(const QString& dir, const QString& fileName);

    QString m_workRoot;
    QString m_outputSubdir;
    QString m_extension;
};
