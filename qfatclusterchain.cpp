#include "qfatfilesystem.h"
#include "internal_constants.h"
#include <QDebug>

// ============================================================================
// QFATClusterChain
// ============================================================================

QFATClusterChain::QFATClusterChain(QFATVolume *volume, quint32 startCluster)
    : m_volume(volume)
    , m_startCluster(startCluster)
    , m_current(0)
    , m_steps(0)
    , m_finished(false)
    , m_fatSectorValid(false)
    , m_fatSectorNumber(0)
{
}

void QFATClusterChain::restart()
{
    m_current = 0;
    m_steps = 0;
    m_finished = false;
}

bool QFATClusterChain::next(quint32 &cluster, QFATError &error)
{
    error = QFATError::None;

    if (m_finished) {
        return false;
    }

    const QFATVolumeGeometry &geometry = m_volume->geometry();

    if (m_steps == 0) {
        if (!geometry.isDataCluster(m_startCluster)) {
            qWarning() << "[QFATClusterChain] Invalid start cluster" << m_startCluster;
            error = QFATError::CorruptChain;
            m_finished = true;
            return false;
        }
        m_current = m_startCluster;
        m_steps = 1;
        cluster = m_current;
        return true;
    }

    quint32 value;
    if (!readFatEntry(m_current, value, error)) {
        m_finished = true;
        return false;
    }

    if (value >= FAT32_END_OF_CHAIN_MIN) {
        m_finished = true;
        return false;
    }

    if (value == FAT32_BAD_CLUSTER || !geometry.isDataCluster(value)) {
        qWarning() << "[QFATClusterChain] Cluster" << m_current << "links to invalid cluster" << value;
        error = QFATError::CorruptChain;
        m_finished = true;
        return false;
    }

    // A chain can never be longer than the number of clusters on the volume
    if (m_steps >= geometry.totalClusters) {
        qWarning() << "[QFATClusterChain] Chain from" << m_startCluster << "exceeds" << geometry.totalClusters
                   << "clusters";
        error = QFATError::CorruptChain;
        m_finished = true;
        return false;
    }

    m_current = value;
    m_steps++;
    cluster = m_current;
    return true;
}

bool QFATClusterChain::advance(quint32 count, quint32 &cluster, QFATError &error)
{
    error = QFATError::None;
    // Zero steps reports where the walk stands, 0 before the first step
    cluster = m_current;
    for (quint32 i = 0; i < count; i++) {
        if (!next(cluster, error)) {
            return false;
        }
    }
    return true;
}

bool QFATClusterChain::readFatEntry(quint32 cluster, quint32 &value, QFATError &error)
{
    const QFATVolumeGeometry &geometry = m_volume->geometry();

    quint32 fatOffset = cluster * FAT32_ENTRY_SIZE; // 4 bytes per cluster
    quint32 sector = geometry.fatStartSector + fatOffset / geometry.bytesPerSector;
    quint32 entryOffset = fatOffset % geometry.bytesPerSector;

    if (!m_fatSectorValid || m_fatSectorNumber != sector) {
        if (!m_volume->readSector(sector, m_fatSector, error)) {
            m_fatSectorValid = false;
            return false;
        }
        m_fatSectorValid = true;
        m_fatSectorNumber = sector;
    }

    value = quint32(m_fatSector[entryOffset]) | (quint32(m_fatSector[entryOffset + 1]) << 8)
        | (quint32(m_fatSector[entryOffset + 2]) << 16) | (quint32(m_fatSector[entryOffset + 3]) << 24);

    // Mask off high 4 bits (only use 28 bits for FAT32)
    value &= FAT32_ENTRY_MASK;
    return true;
}
