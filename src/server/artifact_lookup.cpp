#include "artifact_lookup.h"
#include "core/log_manager.h"
#include <QDir>
#include <QFileInfo>
#include <QRegularExpression>
#include <QUrl>

ArtifactLookup::ArtifactLookup(const QString& workRoot, const QString& outputSubdir, const QString& extension)
    : m_workRoot(workRoot)
    , m_outputSubdir(outputSubdir)
    , m_extension(extension)
{
}

Result<ArtifactLookup::Target> ArtifactLookup::parseTarget(const QString& relativePath, const QString& extension)
{
    static const QRegularExpression idPattern(QStringLiteral("^[A-Za-z0-9_-]+$"));
    static const QRegularExpression namePattern(QStringLiteral("^[A-Za-z0-9_.-]+$"));

    const QString decoded = QUrl::fromPercentEncoding(relativePath.toUtf8());
    const QStringList segments = decoded.split(QLatin1Char('/'));
    if (segments.size() != 2)
        return std::unexpected(DomainFailure::invalidInput(
            QStringLiteral("invalid_parameters"),
            QStringLiteral("Invalid request parameters: expected <executionId>/<filename>")));

    Target target{segments[0], segments[1]};
    if (!idPattern.match(target.executionId).hasMatch())
        return std::unexpected(DomainFailure::invalidInput(
            QStringLiteral("invalid_parameters"),
            QStringLiteral("Invalid request parameters: execution ID must contain only alphanumeric characters, hyphens, and underscores")));

    if (!namePattern.match(target.fileName).hasMatch())
        return std::unexpected(DomainFailure::invalidInput(
            QStringLiteral("invalid_parameters"),
            QStringLiteral("Invalid request parameters: filename must contain only alphanumeric characters, dots, hyphens, and underscores")));

    if (!target.fileName.endsWith(extension) || target.fileName.size() == extension.size())
        return std::unexpected(DomainFailure::invalidInput(
            QStringLiteral("invalid_parameters"),
            QStringLiteral("Invalid request parameters: filename must end with %1").arg(extension)));

    return target;
}

Result<QString> ArtifactLookup::resolve(const QString& relativePath) const
{
    auto target = parseTarget(relativePath, m_extension);
    if (!target)
        return std::unexpected(target.error());

    const QString executionDir = QDir(m_workRoot).filePath(target->executionId);
    if (!QFileInfo(executionDir).isDir())
        return std::unexpected(DomainFailure::notFound(
            QStringLiteral("execution_not_found"), QStringLiteral("Execution not found")));

    const auto found = findByName(QDir(executionDir).filePath(m_outputSubdir), target->fileName);
    if (!found)
        return std::unexpected(DomainFailure::notFound(
            QStringLiteral("artifact_not_found"), QStringLiteral("Video file not found")));

    // Symlinks are resolved before the containment check
    const QString canonicalFile = QFileInfo(*found).canonicalFilePath();
    const QString canonicalDir = QFileInfo(executionDir).canonicalFilePath();
    if (canonicalFile.isEmpty() || canonicalDir.isEmpty())
        return std::unexpected(DomainFailure::notFound(
            QStringLiteral("artifact_not_found"), QStringLiteral("Video file not found")));

    if (!canonicalFile.startsWith(canonicalDir + QLatin1Char('/'))) {
        LOG_WARNING(QStringLiteral("ArtifactLookup: %1 resolves outside %2").arg(*found, canonicalDir));
        return std::unexpected(DomainFailure::forbidden(
            QStringLiteral("path_outside_execution"), QStringLiteral("Invalid file path")));
    }

    return canonicalFile;
}

std::optional<QString> ArtifactLookup::findByName(const QString& dir, const QString& fileName)
{
    const QFileInfoList entries = QDir(dir).entryInfoList(
        QDir::AllEntries | QDir::NoDotAndDotDot | QDir::Hidden | QDir::System, QDir::Unsorted);

    for (const QFileInfo& entry : entries) {
        if (entry.isDir()) {
            // Directory links could loop
            if (entry.isSymLink())
                continue;
            if (auto found = findByName(entry.absoluteFilePath(), fileName))
                return found;
        } else if (entry.fileName() == fileName) {
            return entry.absoluteFilePath();
        }
    }
    return std::nullopt;
}
