#include "qfatfilesystem.h"
#include "internal_constants.h"
#include <QDebug>

namespace {

quint16 readLE16(const quint8 *data, int offset)
{
    return quint16(data[offset] | (data[offset + 1] << 8));
}

quint32 readLE32(const quint8 *data, int offset)
{
    return quint32(data[offset]) | (quint32(data[offset + 1]) << 8) | (quint32(data[offset + 2]) << 16)
        | (quint32(data[offset + 3]) << 24);
}

bool hasBootSignature(const quint8 *sector)
{
    return sector[FAT_BOOT_SIGNATURE_OFFSET] == FAT_BOOT_SIGNATURE_LOW
        && sector[FAT_BOOT_SIGNATURE_OFFSET + 1] == FAT_BOOT_SIGNATURE_HIGH;
}

bool isPowerOfTwo(quint32 value)
{
    return value != 0 && (value & (value - 1)) == 0;
}

} // namespace

// ============================================================================
// QFATVolume
// ============================================================================

QFATVolume::QFATVolume(QFATSectorDevice *device, const QFATVolumeGeometry &geometry)
    : m_device(device)
    , m_geometry(geometry)
{
}

QScopedPointer<QFATVolume> QFATVolume::mount(QFATSectorDevice *device, QFATError &error)
{
    error = QFATError::None;

    if (!device) {
        error = QFATError::DeviceNotPresent;
        return QScopedPointer<QFATVolume>();
    }

    quint8 sector[FAT_SECTOR_SIZE];
    if (!device->readSector(0, sector, error)) {
        qWarning() << "[mount] Failed to read sector 0:" << qfatErrorString(error);
        return QScopedPointer<QFATVolume>();
    }

    if (!hasBootSignature(sector)) {
        qWarning() << "[mount] Signature 0x55AA missing in sector 0";
        error = QFATError::CorruptBootSector;
        return QScopedPointer<QFATVolume>();
    }

    // Sector 0 is either a boot sector (superfloppy layout) or an MBR
    quint32 partitionStart = 0;
    if (!looksLikeBootSector(sector)) {
        partitionStart = findPartitionStart(sector);
        if (partitionStart != 0) {
            qDebug() << "[mount] Partition table found, boot sector at" << partitionStart;
            if (!device->readSector(partitionStart, sector, error)) {
                qWarning() << "[mount] Failed to read boot sector at" << partitionStart;
                return QScopedPointer<QFATVolume>();
            }
        }
    }

    QFATVolumeGeometry geometry;
    if (!parseBootSector(sector, partitionStart, geometry, error)) {
        return QScopedPointer<QFATVolume>();
    }

    qInfo() << "[mount] FAT32 volume" << geometry.volumeLabel << "mounted:" << geometry.totalClusters
            << "clusters of" << geometry.bytesPerCluster() << "bytes, root cluster" << geometry.rootCluster;

    return QScopedPointer<QFATVolume>(new QFATVolume(device, geometry));
}

bool QFATVolume::looksLikeBootSector(const quint8 *sector)
{
    bool jump = (sector[0] == BOOT_JUMP_SHORT && sector[2] == BOOT_JUMP_NOP) || sector[0] == BOOT_JUMP_NEAR;
    if (!jump) {
        return false;
    }

    quint16 bytesPerSector = readLE16(sector, BPB_BYTES_PER_SECTOR_OFFSET);
    return isPowerOfTwo(bytesPerSector) && bytesPerSector >= BPB_MIN_BYTES_PER_SECTOR
        && bytesPerSector <= BPB_MAX_BYTES_PER_SECTOR;
}

quint32 QFATVolume::findPartitionStart(const quint8 *sector)
{
    for (int i = 0; i < MBR_PARTITION_COUNT; i++) {
        const quint8 *partition = sector + MBR_PARTITION_TABLE_OFFSET + i * MBR_PARTITION_ENTRY_SIZE;
        quint8 type = partition[MBR_PARTITION_TYPE_OFFSET];
        quint32 startLba = readLE32(partition, MBR_PARTITION_START_LBA_OFFSET);
        quint32 sectorCount = readLE32(partition, MBR_PARTITION_SECTOR_COUNT_OFFSET);

        if (type != 0 && startLba != 0 && sectorCount != 0) {
            return startLba;
        }
    }

    return 0;
}

bool QFATVolume::parseBootSector(const quint8 *sector, quint32 partitionStart, QFATVolumeGeometry &geometry,
                                 QFATError &error)
{
    if (!hasBootSignature(sector)) {
        qWarning() << "[mount] Signature 0x55AA missing in boot sector";
        error = QFATError::CorruptBootSector;
        return false;
    }

    quint16 bytesPerSector = readLE16(sector, BPB_BYTES_PER_SECTOR_OFFSET);
    quint8 sectorsPerCluster = sector[BPB_SECTORS_PER_CLUSTER_OFFSET];
    quint16 reservedSectors = readLE16(sector, BPB_RESERVED_SECTORS_OFFSET);
    quint8 numberOfFATs = sector[BPB_NUMBER_OF_FATS_OFFSET];
    quint16 rootEntryCount = readLE16(sector, BPB_ROOT_ENTRY_COUNT_OFFSET);
    quint16 totalSectors16 = readLE16(sector, BPB_TOTAL_SECTORS_16_OFFSET);
    quint16 sectorsPerFAT16 = readLE16(sector, BPB_SECTORS_PER_FAT_OFFSET);
    quint32 totalSectors32 = readLE32(sector, BPB_TOTAL_SECTORS_32_OFFSET);
    quint32 sectorsPerFAT32 = readLE32(sector, BPB_SECTORS_PER_FAT32_OFFSET);
    quint32 rootCluster = readLE32(sector, BPB_ROOT_DIRECTORY_CLUSTER_OFFSET);

    if (!isPowerOfTwo(bytesPerSector) || bytesPerSector < BPB_MIN_BYTES_PER_SECTOR
        || bytesPerSector > BPB_MAX_BYTES_PER_SECTOR) {
        qWarning() << "[mount] Invalid bytes per sector:" << bytesPerSector;
        error = QFATError::CorruptBootSector;
        return false;
    }

    if (!isPowerOfTwo(sectorsPerCluster) || sectorsPerCluster > BPB_MAX_SECTORS_PER_CLUSTER) {
        qWarning() << "[mount] Invalid sectors per cluster:" << sectorsPerCluster;
        error = QFATError::CorruptBootSector;
        return false;
    }

    if (reservedSectors == 0 || numberOfFATs == 0) {
        qWarning() << "[mount] Reserved sectors or FAT count is zero";
        error = QFATError::CorruptBootSector;
        return false;
    }

    if (bytesPerSector != FAT_SECTOR_SIZE) {
        qWarning() << "[mount] Only 512-byte sectors are supported, volume uses" << bytesPerSector;
        error = QFATError::UnsupportedVolume;
        return false;
    }

    // FAT12/16 volumes carry a 16-bit FAT size and a fixed root directory
    if (sectorsPerFAT16 != 0 || sectorsPerFAT32 == 0 || rootEntryCount != 0) {
        qWarning() << "[mount] Not a FAT32 volume";
        error = QFATError::UnsupportedVolume;
        return false;
    }

    quint32 totalSectors = totalSectors16 != 0 ? totalSectors16 : totalSectors32;
    quint64 metadataSectors = quint64(reservedSectors) + quint64(numberOfFATs) * sectorsPerFAT32;
    if (totalSectors <= metadataSectors) {
        qWarning() << "[mount] Volume has no data area";
        error = QFATError::CorruptBootSector;
        return false;
    }

    quint32 clusterCount = quint32((totalSectors - metadataSectors) / sectorsPerCluster);

    // The FAT itself may not be large enough to map every data cluster
    quint64 fatCapacity = quint64(sectorsPerFAT32) * bytesPerSector / FAT32_ENTRY_SIZE;
    if (fatCapacity < 2) {
        error = QFATError::CorruptBootSector;
        return false;
    }
    if (clusterCount > fatCapacity - 2) {
        clusterCount = quint32(fatCapacity - 2);
    }

    if (clusterCount < FAT32_MIN_CLUSTERS) {
        qWarning() << "[mount] Cluster count" << clusterCount << "is below the FAT32 threshold";
        error = QFATError::UnsupportedVolume;
        return false;
    }

    geometry.bytesPerSector = bytesPerSector;
    geometry.sectorsPerCluster = sectorsPerCluster;
    geometry.reservedSectors = reservedSectors;
    geometry.numberOfFATs = numberOfFATs;
    geometry.sectorsPerFAT = sectorsPerFAT32;
    geometry.rootCluster = rootCluster;
    geometry.totalClusters = clusterCount;
    geometry.partitionStart = partitionStart;
    geometry.fatStartSector = partitionStart + reservedSectors;
    geometry.firstDataSector = quint32(partitionStart + metadataSectors);

    if (!geometry.isDataCluster(rootCluster)) {
        qWarning() << "[mount] Root directory cluster" << rootCluster << "out of range";
        error = QFATError::UnsupportedVolume;
        return false;
    }

    if (sector[BPB_EXTENDED_SIGNATURE_OFFSET] == BPB_EXTENDED_SIGNATURE) {
        geometry.volumeLabel = QString::fromLatin1(reinterpret_cast<const char *>(sector + BPB_VOLUME_LABEL_OFFSET),
                                                   BPB_VOLUME_LABEL_LENGTH)
                                   .trimmed();
    }

    error = QFATError::None;
    return true;
}

QFATDirectoryEntry QFATVolume::rootEntry() const
{
    QFATDirectoryEntry root;
    root.name = "/";
    root.shortName = "/";
    root.isDirectory = true;
    root.isRoot = true;
    root.attributes = ENTRY_ATTRIBUTE_DIRECTORY;
    root.cluster = m_geometry.rootCluster;
    return root;
}

bool QFATVolume::readSector(quint32 sector, quint8 *buffer, QFATError &error)
{
    return m_device->readSector(sector, buffer, error);
}
