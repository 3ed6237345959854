#include "qfatfilesystem.h"
#include <QDebug>

#include <cstring>

// ============================================================================
// QFATFileReader
// ============================================================================

QFATFileReader::QFATFileReader(QFATVolume *volume, quint32 startCluster, quint32 size)
    : m_volume(volume)
    , m_chain(volume, startCluster)
    , m_size(size)
    , m_position(0)
    , m_cluster(0)
    , m_clusterIndex(-1)
    , m_failure(QFATError::None)
    , m_sectorValid(false)
    , m_sectorNumber(0)
{
}

bool QFATFileReader::isReadable(const QFATDirectoryEntry &entry, QFATError &error)
{
    if (entry.isDirectory) {
        error = QFATError::IsADirectory;
        return false;
    }
    error = QFATError::None;
    return true;
}

qint64 QFATFileReader::read(char *data, qint64 maxSize, QFATError &error)
{
    error = QFATError::None;

    if (m_failure != QFATError::None) {
        error = m_failure;
        return -1;
    }

    const QFATVolumeGeometry &geometry = m_volume->geometry();
    const quint32 bytesPerCluster = geometry.bytesPerCluster();

    qint64 total = 0;
    while (total < maxSize && m_position < m_size) {
        if (!positionCluster(error)) {
            m_failure = error;
            return -1;
        }

        quint32 clusterOffset = m_position % bytesPerCluster;
        quint32 sector = geometry.clusterToSector(m_cluster) + clusterOffset / geometry.bytesPerSector;
        quint32 sectorOffset = clusterOffset % geometry.bytesPerSector;

        qint64 chunk = qMin<qint64>(geometry.bytesPerSector - sectorOffset, m_size - m_position);
        chunk = qMin(chunk, maxSize - total);

        if (sectorOffset == 0 && chunk == geometry.bytesPerSector) {
            // Whole sector: read straight into the caller's buffer
            if (!m_volume->readSector(sector, reinterpret_cast<quint8 *>(data + total), error)) {
                m_failure = error;
                return -1;
            }
        } else {
            if (!readIntoBuffer(sector, error)) {
                m_failure = error;
                return -1;
            }
            memcpy(data + total, m_sector + sectorOffset, size_t(chunk));
        }

        total += chunk;
        m_position += quint32(chunk);
    }

    return total;
}

bool QFATFileReader::seek(quint32 offset, QFATError &error)
{
    error = QFATError::None;

    if (offset > m_size) {
        error = QFATError::RangeNotSatisfiable;
        return false;
    }

    if (offset < m_position) {
        // Streaming is forward-only; going back means walking from the start
        m_chain.restart();
        m_clusterIndex = -1;
        m_cluster = 0;
    }

    m_position = offset;
    m_failure = QFATError::None;

    if (m_position < m_size && !positionCluster(error)) {
        m_failure = error;
        return false;
    }
    return true;
}

bool QFATFileReader::positionCluster(QFATError &error)
{
    qint64 needed = m_position / m_volume->geometry().bytesPerCluster();

    if (m_clusterIndex >= needed) {
        return true;
    }

    quint32 cluster;
    if (!m_chain.advance(quint32(needed - m_clusterIndex), cluster, error)) {
        // Stay in step with the walker, which has already moved
        m_cluster = cluster;
        m_clusterIndex = qint64(m_chain.steps()) - 1;
        if (error == QFATError::None) {
            qWarning() << "[QFATFileReader] Cluster chain from" << m_chain.startCluster() << "ended at"
                       << m_position << "of" << m_size << "bytes";
            error = QFATError::ShortRead;
        }
        return false;
    }

    m_cluster = cluster;
    m_clusterIndex = needed;
    return true;
}

bool QFATFileReader::readIntoBuffer(quint32 sector, QFATError &error)
{
    if (m_sectorValid && m_sectorNumber == sector) {
        return true;
    }

    if (!m_volume->readSector(sector, m_sector, error)) {
        m_sectorValid = false;
        return false;
    }

    m_sectorValid = true;
    m_sectorNumber = sector;
    return true;
}
