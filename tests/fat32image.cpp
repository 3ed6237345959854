#include "fat32image.h"

#include <cstring>

namespace {

void writeLE16(quint8 *data, int offset, quint16 value)
{
    data[offset] = quint8(value & 0xFF);
    data[offset + 1] = quint8(value >> 8);
}

void writeLE32(quint8 *data, int offset, quint32 value)
{
    for (int i = 0; i < 4; i++) {
        data[offset + i] = quint8((value >> (i * 8)) & 0xFF);
    }
}

const quint32 EndOfChain = 0x0FFFFFFF;

} // namespace

FAT32Image::FAT32Image(quint8 sectorsPerCluster, bool partitioned, quint32 clusterCount)
    : m_sectorsPerCluster(sectorsPerCluster)
    , m_clusterCount(clusterCount)
    , m_partitionStart(partitioned ? PartitionStartSector : 0)
    , m_nextFree(3)
    , m_generatedNames(0)
    , m_readCount(0)
{
    m_sectorsPerFAT = ((clusterCount + 2) * 4 + QFATSectorSize - 1) / QFATSectorSize;
    m_firstDataSector = m_partitionStart + ReservedSectors + 2 * m_sectorsPerFAT;
    quint32 totalSectors = ReservedSectors + 2 * m_sectorsPerFAT + clusterCount * sectorsPerCluster;

    writeBootSector(totalSectors);
    if (partitioned) {
        writePartitionTable(totalSectors);
    }

    setFatEntry(0, 0x0FFFFFF8);
    setFatEntry(1, EndOfChain);
    setFatEntry(rootCluster(), EndOfChain);

    Directory root;
    root.clusters.append(rootCluster());
    root.records = 0;
    m_directories.insert(rootCluster(), root);
}

bool FAT32Image::readSector(quint32 sector, quint8 *buffer, QFATError &error)
{
    m_readCount++;

    if (m_failingSectors.contains(sector)) {
        error = QFATError::ReadError;
        return false;
    }

    error = QFATError::None;
    auto it = m_sectors.constFind(sector);
    if (it == m_sectors.constEnd()) {
        memset(buffer, 0, QFATSectorSize);
    } else {
        memcpy(buffer, it.value().constData(), QFATSectorSize);
    }
    return true;
}

quint32 FAT32Image::clusterSector(quint32 cluster) const
{
    return m_firstDataSector + (cluster - 2) * m_sectorsPerCluster;
}

quint8 *FAT32Image::sectorData(quint32 sector)
{
    QByteArray &data = m_sectors[sector];
    if (data.isEmpty()) {
        data = QByteArray(QFATSectorSize, '\0');
    }
    return reinterpret_cast<quint8 *>(data.data());
}

void FAT32Image::writeBootSector(quint32 totalSectors)
{
    quint8 *boot = sectorData(m_partitionStart);

    boot[0] = 0xEB;
    boot[1] = 0x58;
    boot[2] = 0x90;
    memcpy(boot + 3, "MSWIN4.1", 8);
    writeLE16(boot, 0x0B, QFATSectorSize);
    boot[0x0D] = m_sectorsPerCluster;
    writeLE16(boot, 0x0E, ReservedSectors);
    boot[0x10] = 2;
    writeLE16(boot, 0x11, 0);
    writeLE16(boot, 0x13, 0);
    boot[0x15] = 0xF8;
    writeLE16(boot, 0x16, 0);
    writeLE16(boot, 0x18, 63);
    writeLE16(boot, 0x1A, 255);
    writeLE32(boot, 0x1C, m_partitionStart);
    writeLE32(boot, 0x20, totalSectors);
    writeLE32(boot, 0x24, m_sectorsPerFAT);
    writeLE32(boot, 0x2C, rootCluster());
    writeLE16(boot, 0x30, 1);
    writeLE16(boot, 0x32, 6);
    boot[0x40] = 0x80;
    boot[0x42] = 0x29;
    writeLE32(boot, 0x43, 0x12345678);
    memcpy(boot + 0x47, "QFATTEST   ", 11);
    memcpy(boot + 0x52, "FAT32   ", 8);
    boot[0x1FE] = 0x55;
    boot[0x1FF] = 0xAA;
}

void FAT32Image::writePartitionTable(quint32 totalSectors)
{
    quint8 *mbr = sectorData(0);
    quint8 *partition = mbr + 0x1BE;

    partition[0] = 0x00;
    partition[4] = 0x0C; // FAT32 LBA
    writeLE32(partition, 0x08, m_partitionStart);
    writeLE32(partition, 0x0C, totalSectors);
    mbr[0x1FE] = 0x55;
    mbr[0x1FF] = 0xAA;
}

void FAT32Image::setFatEntry(quint32 cluster, quint32 value)
{
    m_fat.insert(cluster, value);

    quint32 offset = cluster * 4;
    for (int copy = 0; copy < 2; copy++) {
        quint32 sector = m_partitionStart + ReservedSectors + copy * m_sectorsPerFAT + offset / QFATSectorSize;
        writeLE32(sectorData(sector), int(offset % QFATSectorSize), value);
    }
}

quint32 FAT32Image::allocateChain(int count)
{
    if (count <= 0) {
        return 0;
    }

    QList<quint32> clusters;
    for (int i = 0; i < count; i++) {
        clusters.append(m_nextFree++);
    }
    linkChain(clusters);
    return clusters.first();
}

void FAT32Image::linkChain(const QList<quint32> &clusters)
{
    for (int i = 0; i < clusters.size(); i++) {
        setFatEntry(clusters[i], i + 1 < clusters.size() ? clusters[i + 1] : EndOfChain);
        if (clusters[i] >= m_nextFree) {
            m_nextFree = clusters[i] + 1;
        }
    }
}

void FAT32Image::writeContent(quint32 startCluster, const QByteArray &content)
{
    quint32 cluster = startCluster;
    int written = 0;

    while (written < content.size() && cluster >= 2 && cluster < 0x0FFFFFF7) {
        for (quint32 s = 0; s < m_sectorsPerCluster && written < content.size(); s++) {
            int count = qMin<int>(QFATSectorSize, int(content.size()) - written);
            memcpy(sectorData(clusterSector(cluster) + s), content.constData() + written, size_t(count));
            written += count;
        }
        cluster = fatEntry(cluster);
    }
}

quint32 FAT32Image::addDirectory(quint32 parent, const QString &name, const QString &shortName)
{
    quint32 cluster = allocateChain(1);

    Directory directory;
    directory.clusters.append(cluster);
    directory.records = 0;
    m_directories.insert(cluster, directory);

    // . and .. entries; .. of a top-level directory points at cluster 0
    addShortEntry(cluster, ".", 0x10, cluster, 0);
    addShortEntry(cluster, "..", 0x10, parent == rootCluster() ? 0 : parent, 0);

    QString stored = shortName;
    quint8 ntFlags = 0;
    if (stored.isEmpty()) {
        int flags = caseFlags(name);
        if (flags >= 0) {
            stored = name.toUpper();
            ntFlags = quint8(flags);
        } else {
            stored = generateShortName(name);
        }
    }

    if (stored.compare(name, Qt::CaseInsensitive) != 0 || (ntFlags == 0 && stored != name)) {
        addLongName(parent, name, stored);
    }
    addShortEntry(parent, stored, 0x10, cluster, 0, ntFlags);
    return cluster;
}

quint32 FAT32Image::addFile(quint32 parent, const QString &name, const QByteArray &content,
                            const QString &shortName)
{
    int clusters = int((quint32(content.size()) + bytesPerCluster() - 1) / bytesPerCluster());
    quint32 cluster = allocateChain(clusters);
    writeContent(cluster, content);

    QString stored = shortName;
    quint8 ntFlags = 0;
    if (stored.isEmpty()) {
        int flags = caseFlags(name);
        if (flags >= 0) {
            stored = name.toUpper();
            ntFlags = quint8(flags);
        } else {
            stored = generateShortName(name);
        }
    }

    if (stored.compare(name, Qt::CaseInsensitive) != 0 || (ntFlags == 0 && stored != name)) {
        addLongName(parent, name, stored);
    }
    addShortEntry(parent, stored, 0x20, cluster, quint32(content.size()), ntFlags);
    return cluster;
}

void FAT32Image::addShortEntry(quint32 directory, const QString &shortName, quint8 attributes, quint32 cluster,
                               quint32 size, quint8 ntFlags)
{
    quint8 record[32];
    memset(record, 0, sizeof(record));

    QByteArray packed = packShortName(shortName);
    memcpy(record, packed.constData(), 11);
    record[0x0B] = attributes;
    record[0x0C] = ntFlags;
    writeLE16(record, 0x0E, EntryTime);
    writeLE16(record, 0x10, EntryDate);
    writeLE16(record, 0x12, EntryDate);
    writeLE16(record, 0x14, quint16(cluster >> 16));
    writeLE16(record, 0x16, EntryTime);
    writeLE16(record, 0x18, EntryDate);
    writeLE16(record, 0x1A, quint16(cluster & 0xFFFF));
    writeLE32(record, 0x1C, size);

    addRecord(directory, record);
}

void FAT32Image::addLongName(quint32 directory, const QString &longName, const QString &shortName, int checksumDelta)
{
    static const int offsets[13] = { 1, 3, 5, 7, 9, 14, 16, 18, 20, 22, 24, 28, 30 };

    quint8 sum = quint8(checksum(packShortName(shortName)) + checksumDelta);
    int length = longName.size();
    int count = (length + 12) / 13;

    for (int sequence = count; sequence >= 1; sequence--) {
        quint8 record[32];
        memset(record, 0, sizeof(record));

        record[0] = quint8(sequence | (sequence == count ? 0x40 : 0));
        record[0x0B] = 0x0F;
        record[0x0D] = sum;

        for (int i = 0; i < 13; i++) {
            int index = (sequence - 1) * 13 + i;
            quint16 unit;
            if (index < length) {
                unit = longName.at(index).unicode();
            } else if (index == length) {
                unit = 0x0000;
            } else {
                unit = 0xFFFF;
            }
            writeLE16(record, offsets[i], unit);
        }

        addRecord(directory, record);
    }
}

void FAT32Image::addRecord(quint32 directory, const quint8 *record)
{
    Directory &dir = m_directories[directory];
    const int recordsPerCluster = int(bytesPerCluster() / 32);

    // Grow the directory by one cluster when it is full
    if (dir.records == dir.clusters.size() * recordsPerCluster) {
        quint32 cluster = allocateChain(1);
        setFatEntry(dir.clusters.last(), cluster);
        dir.clusters.append(cluster);
    }

    quint32 cluster = dir.clusters[dir.records / recordsPerCluster];
    int offset = (dir.records % recordsPerCluster) * 32;
    memcpy(sectorData(clusterSector(cluster) + offset / QFATSectorSize) + offset % QFATSectorSize, record, 32);
    dir.records++;
}

QByteArray FAT32Image::packShortName(const QString &shortName)
{
    QByteArray packed(11, ' ');
    if (shortName == "." || shortName == "..") {
        memcpy(packed.data(), shortName.toLatin1().constData(), size_t(shortName.size()));
        return packed;
    }

    int dot = shortName.lastIndexOf('.');
    QByteArray base = shortName.left(dot < 0 ? shortName.size() : dot).toUpper().toLatin1().left(8);
    QByteArray ext = dot < 0 ? QByteArray() : shortName.mid(dot + 1).toUpper().toLatin1().left(3);

    memcpy(packed.data(), base.constData(), size_t(base.size()));
    memcpy(packed.data() + 8, ext.constData(), size_t(ext.size()));
    return packed;
}

quint8 FAT32Image::checksum(const QByteArray &packedName)
{
    quint8 sum = 0;
    for (int i = 0; i < 11; i++) {
        sum = quint8(((sum & 1) << 7) + (sum >> 1) + quint8(packedName.at(i)));
    }
    return sum;
}

QString FAT32Image::generateShortName(const QString &name)
{
    int dot = name.lastIndexOf('.');
    QString base = name.left(dot < 0 ? name.size() : dot).toUpper();
    QString ext = dot < 0 ? QString() : name.mid(dot + 1).toUpper().left(3);

    QString cleaned;
    for (QChar c : base) {
        ushort u = c.unicode();
        if ((u >= 'A' && u <= 'Z') || (u >= '0' && u <= '9')) {
            cleaned.append(c);
        }
    }

    m_generatedNames++;
    QString shortName = cleaned.left(6) + '~' + QString::number(m_generatedNames % 10);
    return ext.isEmpty() ? shortName : shortName + '.' + ext;
}

// Returns the NT lowercase flags for a name that fits 8.3 with a single
// case per part, or -1 when the name needs long-name records.
int FAT32Image::caseFlags(const QString &name)
{
    int dot = name.lastIndexOf('.');
    QString base = name.left(dot < 0 ? name.size() : dot);
    QString ext = dot < 0 ? QString() : name.mid(dot + 1);

    if (base.isEmpty() || base.size() > 8 || ext.size() > 3 || base.contains('.')) {
        return -1;
    }

    int flags = 0;
    const QString parts[2] = { base, ext };
    for (int i = 0; i < 2; i++) {
        bool lower = false;
        bool upper = false;
        for (QChar c : parts[i]) {
            ushort u = c.unicode();
            if (u >= 'a' && u <= 'z') {
                lower = true;
            } else if (u >= 'A' && u <= 'Z') {
                upper = true;
            } else if (!(u >= '0' && u <= '9') && u != '_' && u != '-' && u != '~') {
                return -1;
            }
        }
        if (lower && upper) {
            return -1;
        }
        if (lower) {
            flags |= (i == 0) ? 0x08 : 0x10;
        }
    }
    return flags;
}
