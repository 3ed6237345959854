#ifndef QFATFILESYSTEM_H
#define QFATFILESYSTEM_H

#include <QDateTime>
#include <QIODevice>
#include <QScopedPointer>
#include <QSharedPointer>
#include <QString>
#include <QStringList>

// Every sector exchanged with the medium is 512 bytes
constexpr int QFATSectorSize = 512;
// 20 long-name records of 13 UCS-2 units each
constexpr int QFATLongNameCapacity = 260;

// Error codes for FAT and serving operations
enum class QFATError {
    None,
    DeviceNotPresent,
    DeviceInitFailed,
    ReadError,
    CorruptBootSector,
    UnsupportedVolume,
    CorruptChain,
    CorruptDirectory,
    ShortRead,
    NotFound,
    NotADirectory,
    IsADirectory,
    InvalidPath,
    RequestTooLarge,
    BadRequest,
    MethodNotAllowed,
    RangeNotSatisfiable,
    Timeout,
    ConnectionClosed
};

QString qfatErrorString(QFATError error);

// Source of fixed-size sectors. Implementations never allocate; the
// caller owns the QFATSectorSize-byte buffer.
class QFATSectorDevice
{
public:
    virtual ~QFATSectorDevice() {}

    virtual bool readSector(quint32 sector, quint8 *buffer, QFATError &error) = 0;
};

// Sector device backed by a raw disk image
class QFATImageDevice : public QFATSectorDevice
{
public:
    explicit QFATImageDevice(QSharedPointer<QIODevice> device);

    // Factory method
    static QScopedPointer<QFATImageDevice> create(const QString &imagePath);

    bool readSector(quint32 sector, quint8 *buffer, QFATError &error) override;

private:
    QSharedPointer<QIODevice> m_device;
};

struct QFATVolumeGeometry {
    quint16 bytesPerSector;
    quint8 sectorsPerCluster;
    quint16 reservedSectors;
    quint8 numberOfFATs;
    quint32 sectorsPerFAT;
    quint32 rootCluster;
    quint32 totalClusters;
    quint32 partitionStart;

    // Derived absolute sector numbers
    quint32 fatStartSector;
    quint32 firstDataSector;

    QString volumeLabel;

    QFATVolumeGeometry()
        : bytesPerSector(0)
        , sectorsPerCluster(0)
        , reservedSectors(0)
        , numberOfFATs(0)
        , sectorsPerFAT(0)
        , rootCluster(0)
        , totalClusters(0)
        , partitionStart(0)
        , fatStartSector(0)
        , firstDataSector(0)
    {
    }

    bool isValid() const { return totalClusters != 0; }
    quint32 bytesPerCluster() const { return quint32(bytesPerSector) * sectorsPerCluster; }
    quint32 lastCluster() const { return totalClusters + 1; }
    bool isDataCluster(quint32 cluster) const { return cluster >= 2 && cluster <= lastCluster(); }
    quint32 clusterToSector(quint32 cluster) const
    {
        return firstDataSector + (cluster - 2) * sectorsPerCluster;
    }
};

struct QFATDirectoryEntry {
    QString name;      // long name when present, otherwise the 8.3 name
    QString shortName; // 8.3 name as stored on disk
    bool isDirectory;
    bool hasLongName;
    bool isRoot;
    quint8 attributes;
    quint32 cluster;
    quint32 size;
    QDateTime modified; // null when the entry carries no date

    QFATDirectoryEntry()
        : isDirectory(false)
        , hasLongName(false)
        , isRoot(false)
        , attributes(0)
        , cluster(0)
        , size(0)
    {
    }
};

// A mounted FAT32 volume. The geometry is fixed at mount time and shared
// read-only by every reader created over the volume.
class QFATVolume
{
public:
    QFATVolume(QFATSectorDevice *device, const QFATVolumeGeometry &geometry);

    // Reads the partition table and boot sector; returns null on failure
    static QScopedPointer<QFATVolume> mount(QFATSectorDevice *device, QFATError &error);

    const QFATVolumeGeometry &geometry() const { return m_geometry; }
    QFATDirectoryEntry rootEntry() const;

    bool readSector(quint32 sector, quint8 *buffer, QFATError &error);

private:
    static bool looksLikeBootSector(const quint8 *sector);
    static quint32 findPartitionStart(const quint8 *sector);
    static bool parseBootSector(const quint8 *sector, quint32 partitionStart,
                                QFATVolumeGeometry &geometry, QFATError &error);

    QFATSectorDevice *m_device;
    const QFATVolumeGeometry m_geometry;
};

// Lazy walk over one cluster chain. The first call to next() yields the
// start cluster; each later call follows one FAT link.
class QFATClusterChain
{
public:
    QFATClusterChain(QFATVolume *volume, quint32 startCluster);

    bool next(quint32 &cluster, QFATError &error);
    bool advance(quint32 count, quint32 &cluster, QFATError &error);
    void restart();

    quint32 startCluster() const { return m_startCluster; }
    quint32 steps() const { return m_steps; }

private:
    bool readFatEntry(quint32 cluster, quint32 &value, QFATError &error);

    QFATVolume *m_volume;
    quint32 m_startCluster;
    quint32 m_current;
    quint32 m_steps;
    bool m_finished;

    // Only the FAT sector holding the current link is kept
    bool m_fatSectorValid;
    quint32 m_fatSectorNumber;
    quint8 m_fatSector[QFATSectorSize];
};

class QFATDirectoryReader
{
public:
    QFATDirectoryReader(QFATVolume *volume, quint32 startCluster, bool strict = false);

    bool next(QFATDirectoryEntry &entry, QFATError &error);
    void restart();

private:
    bool nextRecord(const quint8 *&record, QFATError &error);
    bool finish(QFATError &error);

    // Long filename assembly
    void resetLongName();
    void appendLongNameRecord(const quint8 *record);
    bool takeLongName(const quint8 *shortRecord, QString &name);

    void parseShortEntry(const quint8 *record, QFATDirectoryEntry &entry);

    QFATVolume *m_volume;
    QFATClusterChain m_chain;
    bool m_strict;
    bool m_finished;

    bool m_haveCluster;
    quint32 m_cluster;
    quint32 m_sectorInCluster;
    bool m_sectorLoaded;
    int m_recordIndex;
    quint8 m_sector[QFATSectorSize];

    bool m_longNamePending;
    int m_longNameRecords;
    int m_longNameNext;
    quint8 m_longNameChecksum;
    quint16 m_longName[QFATLongNameCapacity];
};

// Forward streaming reader over a file's cluster chain
class QFATFileReader
{
public:
    QFATFileReader(QFATVolume *volume, quint32 startCluster, quint32 size);

    static bool isReadable(const QFATDirectoryEntry &entry, QFATError &error);

    qint64 read(char *data, qint64 maxSize, QFATError &error);
    bool seek(quint32 offset, QFATError &error);

    quint32 size() const { return m_size; }
    quint32 position() const { return m_position; }
    bool atEnd() const { return m_position >= m_size; }

private:
    bool positionCluster(QFATError &error);
    bool readIntoBuffer(quint32 sector, QFATError &error);

    QFATVolume *m_volume;
    QFATClusterChain m_chain;
    quint32 m_size;
    quint32 m_position;
    quint32 m_cluster;
    qint64 m_clusterIndex;
    QFATError m_failure;

    bool m_sectorValid;
    quint32 m_sectorNumber;
    quint8 m_sector[QFATSectorSize];
};

class QFATPathResolver
{
public:
    explicit QFATPathResolver(QFATVolume *volume, bool strict = false);

    QFATDirectoryEntry resolve(const QStringList &segments, QFATError &error);
    QFATDirectoryEntry resolve(const QString &path, QFATError &error);

    static QStringList splitPath(const QString &path);
    static bool matchesName(const QFATDirectoryEntry &entry, const QString &name);

private:
    bool findInDirectory(const QFATDirectoryEntry &directory, const QString &name,
                         QFATDirectoryEntry &found, QFATError &error);

    QFATVolume *m_volume;
    bool m_strict;
};

// Helpers shared by the readers
quint8 qfatShortNameChecksum(const quint8 *shortName);
QDateTime qfatParseDateTime(quint16 date, quint16 time);

#endif
