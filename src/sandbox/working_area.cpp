#include "working_area.h"
#include "core/log_manager.h"
#include <QDir>
#include <QFile>
#include <QFileInfo>

WorkingArea::WorkingArea(const QString& root, const QString& requestId)
    : m_path(QDir(root).filePath(requestId))
    , m_requestId(requestId)
{
}

VoidResult WorkingArea::create()
{
    QDir dir(m_path);
    if (dir.exists())
        return std::unexpected(DomainFailure::internal(
            QStringLiteral("working area already exists: %1").arg(m_path)));

    if (!QDir().mkpath(m_path))
        return std::unexpected(DomainFailure::internal(
            QStringLiteral("cannot create working area: %1").arg(m_path)));

    LOG_DEBUG(QStringLiteral("WorkingArea: created %1").arg(m_path));
    return {};
}

VoidResult WorkingArea::writeSource(const QString& fileName, const QString& sourceText)
{
    QFile file(QDir(m_path).filePath(fileName));
    if (!file.open(QIODevice::WriteOnly | QIODevice::Truncate))
        return std::unexpected(DomainFailure::internal(
            QStringLiteral("cannot write %1: %2").arg(file.fileName(), file.errorString())));

    const QByteArray bytes = sourceText.toUtf8();
    if (file.write(bytes) != bytes.size())
        return std::unexpected(DomainFailure::internal(
            QStringLiteral("short write to %1: %2").arg(file.fileName(), file.errorString())));

    file.close();
    return {};
}

std::optional<QString> WorkingArea::findArtifact(const QString& subdir, const QString& extension) const
{
    const QString root = QDir(m_path).filePath(subdir);
    if (!QFileInfo(root).isDir())
        return std::nullopt;
    return searchTree(root, extension);
}

std::optional<QString> WorkingArea::searchTree(const QString& dir, const QString& extension)
{
    const QFileInfoList entries = QDir(dir).entryInfoList(
        QDir::AllEntries | QDir::NoDotAndDotDot | QDir::Hidden, QDir::Unsorted);

    for (const QFileInfo& entry : entries) {
        if (entry.isSymLink())
            continue;
        if (entry.isDir()) {
            if (auto found = searchTree(entry.absoluteFilePath(), extension))
                return found;
        } else if (entry.isFile() && entry.fileName().endsWith(extension)) {
            return entry.absoluteFilePath();
        }
    }
    return std::nullopt;
}
