#pragma once
#include "semantic/ports.h"
#include <QString>
#include <optional>

// Per-execution directory <root>/<requestId>. Owned by exactly one execution
// and never reused; it outlives the run so the artifact can be served.
class WorkingArea {
public:
    WorkingArea(const QString& root, const QString& requestId);

    VoidResult create();
    VoidResult writeSource(const QString& fileName, const QString& sourceText);

    // First file with the extension under <path>/<subdir>, depth-first in
    // directory enumeration order.
    std::optional<QString> findArtifact(const QString& subdir, const QString& extension) const;

    QString path() const { return m_path; }
    QString requestId() const { return m_requestId; }

    static std::optional<QString> searchTree(const QString& dir, const QString& extension);

private:
    QString m_path;
    QString m_requestId;
};
