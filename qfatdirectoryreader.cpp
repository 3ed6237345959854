#include "qfatfilesystem.h"
#include "internal_constants.h"
#include <QDebug>

namespace {

bool isDotEntry(const quint8 *record)
{
    if (record[0] != ENTRY_CURRENT_DIRECTORY) {
        return false;
    }
    // "." or ".." padded with spaces
    int start = (record[1] == ENTRY_CURRENT_DIRECTORY) ? 2 : 1;
    for (int i = start; i < ENTRY_NAME_LENGTH; i++) {
        if (record[i] != ' ') {
            return false;
        }
    }
    return true;
}

QString decodeShortPart(const quint8 *bytes, int length)
{
    int end = length - 1;
    while (end >= 0 && bytes[end] == ' ') {
        end--;
    }

    QString part;
    for (int i = 0; i <= end; i++) {
        quint8 byte = bytes[i];
        if (i == 0 && byte == ENTRY_KANJI_E5) {
            byte = ENTRY_DELETED;
        }
        part.append(QChar(byte));
    }
    return part;
}

} // namespace

// ============================================================================
// QFATDirectoryReader
// ============================================================================

QFATDirectoryReader::QFATDirectoryReader(QFATVolume *volume, quint32 startCluster, bool strict)
    : m_volume(volume)
    , m_chain(volume, startCluster)
    , m_strict(strict)
    , m_finished(false)
    , m_haveCluster(false)
    , m_cluster(0)
    , m_sectorInCluster(0)
    , m_sectorLoaded(false)
    , m_recordIndex(0)
{
    resetLongName();
}

void QFATDirectoryReader::restart()
{
    m_chain.restart();
    m_finished = false;
    m_haveCluster = false;
    m_cluster = 0;
    m_sectorInCluster = 0;
    m_sectorLoaded = false;
    m_recordIndex = 0;
    resetLongName();
}

bool QFATDirectoryReader::next(QFATDirectoryEntry &entry, QFATError &error)
{
    error = QFATError::None;

    if (m_finished) {
        return false;
    }

    const quint8 *record = nullptr;
    while (nextRecord(record, error)) {
        quint8 first = record[ENTRY_NAME_OFFSET];

        if (first == ENTRY_END_OF_DIRECTORY) {
            return finish(error);
        }

        if (first == ENTRY_DELETED) {
            resetLongName();
            continue;
        }

        quint8 attributes = record[ENTRY_ATTRIBUTE_OFFSET];
        if ((attributes & ENTRY_ATTRIBUTE_LONG_FILE_NAME_MASK) == ENTRY_ATTRIBUTE_LONG_FILE_NAME) {
            appendLongNameRecord(record);
            continue;
        }

        // Volume labels and the . and .. pseudo-entries are never reported
        if ((attributes & ENTRY_ATTRIBUTE_VOLUME_LABEL) != 0 || isDotEntry(record)) {
            resetLongName();
            continue;
        }

        entry = QFATDirectoryEntry();
        parseShortEntry(record, entry);

        QString longName;
        if (takeLongName(record, longName)) {
            entry.name = longName;
            entry.hasLongName = true;
        }
        return true;
    }

    if (error != QFATError::None) {
        m_finished = true;
        return false;
    }

    // The cluster chain ended without an end-of-directory marker
    return finish(error);
}

bool QFATDirectoryReader::finish(QFATError &error)
{
    m_finished = true;

    if (m_longNamePending) {
        if (m_strict) {
            qWarning() << "[QFATDirectoryReader] Unterminated long filename at end of directory";
            error = QFATError::CorruptDirectory;
            return false;
        }
        qDebug() << "[QFATDirectoryReader] Dropping unterminated long filename";
        resetLongName();
    }

    error = QFATError::None;
    return false;
}

bool QFATDirectoryReader::nextRecord(const quint8 *&record, QFATError &error)
{
    const QFATVolumeGeometry &geometry = m_volume->geometry();
    const int recordsPerSector = geometry.bytesPerSector / ENTRY_SIZE;

    forever {
        if (m_sectorLoaded && m_recordIndex < recordsPerSector) {
            record = m_sector + m_recordIndex * ENTRY_SIZE;
            m_recordIndex++;
            return true;
        }

        if (!m_haveCluster || m_sectorInCluster + 1 >= geometry.sectorsPerCluster) {
            quint32 cluster;
            if (!m_chain.next(cluster, error)) {
                return false;
            }
            m_cluster = cluster;
            m_haveCluster = true;
            m_sectorInCluster = 0;
        } else {
            m_sectorInCluster++;
        }

        quint32 sector = geometry.clusterToSector(m_cluster) + m_sectorInCluster;
        if (!m_volume->readSector(sector, m_sector, error)) {
            m_sectorLoaded = false;
            return false;
        }
        m_sectorLoaded = true;
        m_recordIndex = 0;
    }
}

void QFATDirectoryReader::resetLongName()
{
    m_longNamePending = false;
    m_longNameRecords = 0;
    m_longNameNext = 0;
    m_longNameChecksum = 0;
}

void QFATDirectoryReader::appendLongNameRecord(const quint8 *record)
{
    quint8 sequenceByte = record[ENTRY_NAME_OFFSET];
    int sequence = sequenceByte & ENTRY_LFN_SEQUENCE_MASK;
    quint8 checksum = record[ENTRY_LFN_CHECKSUM_OFFSET];

    if (sequence < ENTRY_LFN_SEQUENCE_START || sequence > ENTRY_LFN_MAX_RECORDS) {
        resetLongName();
        return;
    }

    // Long filename entries appear before the short entry in reverse order;
    // the one marked with the last mask starts a new run
    if ((sequenceByte & ENTRY_LFN_SEQUENCE_LAST_MASK) != 0) {
        m_longNamePending = true;
        m_longNameRecords = sequence;
        m_longNameChecksum = checksum;
        for (int i = 0; i < QFATLongNameCapacity; i++) {
            m_longName[i] = 0xFFFF;
        }
    } else if (!m_longNamePending || sequence != m_longNameNext || checksum != m_longNameChecksum) {
        // Orphaned or out-of-order record
        resetLongName();
        return;
    }

    quint16 *chars = m_longName + (sequence - 1) * ENTRY_LFN_CHARS;
    int pos = 0;

    // Part 1: 5 characters, 10 bytes
    for (int i = 0; i < ENTRY_LFN_PART1_LENGTH / 2; i++) {
        chars[pos++] = record[ENTRY_LFN_PART1_OFFSET + i * 2] | (record[ENTRY_LFN_PART1_OFFSET + i * 2 + 1] << 8);
    }
    // Part 2: 6 characters, 12 bytes
    for (int i = 0; i < ENTRY_LFN_PART2_LENGTH / 2; i++) {
        chars[pos++] = record[ENTRY_LFN_PART2_OFFSET + i * 2] | (record[ENTRY_LFN_PART2_OFFSET + i * 2 + 1] << 8);
    }
    // Part 3: 2 characters, 4 bytes
    for (int i = 0; i < ENTRY_LFN_PART3_LENGTH / 2; i++) {
        chars[pos++] = record[ENTRY_LFN_PART3_OFFSET + i * 2] | (record[ENTRY_LFN_PART3_OFFSET + i * 2 + 1] << 8);
    }

    m_longNameNext = sequence - 1;
}

bool QFATDirectoryReader::takeLongName(const quint8 *shortRecord, QString &name)
{
    bool complete = m_longNamePending && m_longNameNext == 0;
    quint8 expected = m_longNameChecksum;
    int records = m_longNameRecords;
    resetLongName();

    if (!complete) {
        return false;
    }

    if (qfatShortNameChecksum(shortRecord + ENTRY_NAME_OFFSET) != expected) {
        qDebug() << "[QFATDirectoryReader] Long filename checksum mismatch, using short name";
        return false;
    }

    // Stop at the null terminator or the 0xFFFF padding
    int length = 0;
    int limit = records * ENTRY_LFN_CHARS;
    while (length < limit && m_longName[length] != 0x0000 && m_longName[length] != 0xFFFF) {
        length++;
    }

    if (length == 0) {
        return false;
    }

    name = QString(reinterpret_cast<const QChar *>(m_longName), length);
    return true;
}

void QFATDirectoryReader::parseShortEntry(const quint8 *record, QFATDirectoryEntry &entry)
{
    quint8 ntFlags = record[ENTRY_NT_FLAGS_OFFSET];

    QString base = decodeShortPart(record, ENTRY_BASE_NAME_LENGTH);
    QString ext = decodeShortPart(record + ENTRY_BASE_NAME_LENGTH, ENTRY_NAME_LENGTH - ENTRY_BASE_NAME_LENGTH);

    entry.shortName = ext.isEmpty() ? base : base + '.' + ext;

    // Names that fit 8.3 but are lowercase are stored with NT case flags
    QString displayBase = (ntFlags & ENTRY_NT_LOWERCASE_BASE) ? base.toLower() : base;
    QString displayExt = (ntFlags & ENTRY_NT_LOWERCASE_EXT) ? ext.toLower() : ext;
    entry.name = displayExt.isEmpty() ? displayBase : displayBase + '.' + displayExt;

    entry.attributes = record[ENTRY_ATTRIBUTE_OFFSET];
    entry.isDirectory = (entry.attributes & ENTRY_ATTRIBUTE_DIRECTORY) != 0;

    quint16 clusterLow = record[ENTRY_CLUSTER_OFFSET] | (record[ENTRY_CLUSTER_OFFSET + 1] << 8);
    quint16 clusterHigh = record[ENTRY_HIGH_ORDER_CLUSTER_ADDRESS_OFFSET]
        | (record[ENTRY_HIGH_ORDER_CLUSTER_ADDRESS_OFFSET + 1] << 8);
    entry.cluster = (quint32(clusterHigh) << 16) | clusterLow;

    // Read file size (4 bytes, Little Endian); directories always report 0
    entry.size = entry.isDirectory
        ? 0
        : (quint32(record[ENTRY_SIZE_OFFSET]) | (quint32(record[ENTRY_SIZE_OFFSET + 1]) << 8)
           | (quint32(record[ENTRY_SIZE_OFFSET + 2]) << 16) | (quint32(record[ENTRY_SIZE_OFFSET + 3]) << 24));

    quint16 modifiedTime = record[ENTRY_WRITTEN_DATE_TIME_OFFSET] | (record[ENTRY_WRITTEN_DATE_TIME_OFFSET + 1] << 8);
    quint16 modifiedDate = record[ENTRY_WRITTEN_DATE_TIME_OFFSET + 2]
        | (record[ENTRY_WRITTEN_DATE_TIME_OFFSET + 3] << 8);

    if (modifiedDate != 0) {
        entry.modified = qfatParseDateTime(modifiedDate, modifiedTime);
    }
}
