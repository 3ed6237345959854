#include "qfatfilesystem.h"
#include <QDebug>

// ============================================================================
// QFATPathResolver
// ============================================================================

QFATPathResolver::QFATPathResolver(QFATVolume *volume, bool strict)
    : m_volume(volume)
    , m_strict(strict)
{
}

QStringList QFATPathResolver::splitPath(const QString &path)
{
    QString normalized = path;
    // Normalize path separators
    normalized.replace('\\', '/');

    return normalized.split('/', Qt::SkipEmptyParts);
}

bool QFATPathResolver::matchesName(const QFATDirectoryEntry &entry, const QString &name)
{
    return entry.name.compare(name, Qt::CaseInsensitive) == 0
        || entry.shortName.compare(name, Qt::CaseInsensitive) == 0;
}

QFATDirectoryEntry QFATPathResolver::resolve(const QString &path, QFATError &error)
{
    return resolve(splitPath(path), error);
}

QFATDirectoryEntry QFATPathResolver::resolve(const QStringList &segments, QFATError &error)
{
    error = QFATError::None;

    // Start from root directory
    QFATDirectoryEntry current = m_volume->rootEntry();

    for (int i = 0; i < segments.size(); i++) {
        QFATDirectoryEntry found;
        if (!findInDirectory(current, segments[i], found, error)) {
            if (error == QFATError::None) {
                error = QFATError::NotFound;
            }
            return QFATDirectoryEntry();
        }

        // Every segment but the last must name a directory
        if (i < segments.size() - 1 && !found.isDirectory) {
            qDebug() << "[resolve]" << segments[i] << "is not a directory";
            error = QFATError::NotADirectory;
            return QFATDirectoryEntry();
        }

        current = found;
    }

    return current;
}

bool QFATPathResolver::findInDirectory(const QFATDirectoryEntry &directory, const QString &name,
                                       QFATDirectoryEntry &found, QFATError &error)
{
    QFATDirectoryReader reader(m_volume, directory.cluster, m_strict);
    QFATDirectoryEntry entry;

    while (reader.next(entry, error)) {
        if (matchesName(entry, name)) {
            qDebug() << "[findInDirectory] Matched" << name << "to" << entry.name << "(" << entry.shortName << ")";
            found = entry;
            return true;
        }
    }

    return false;
}
