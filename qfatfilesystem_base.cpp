#include <QDebug>
#include <QFile>
#include <QString>

#include "internal_constants.h"
#include "qfatfilesystem.h"

// ============================================================================
// Shared helpers
// ============================================================================

QString qfatErrorString(QFATError error)
{
    switch (error) {
    case QFATError::None:
        return "No error";
    case QFATError::DeviceNotPresent:
        return "Device not present";
    case QFATError::DeviceInitFailed:
        return "Device initialization failed";
    case QFATError::ReadError:
        return "Read error";
    case QFATError::CorruptBootSector:
        return "Corrupt boot sector";
    case QFATError::UnsupportedVolume:
        return "Unsupported volume";
    case QFATError::CorruptChain:
        return "Corrupt cluster chain";
    case QFATError::CorruptDirectory:
        return "Corrupt directory";
    case QFATError::ShortRead:
        return "Cluster chain shorter than file size";
    case QFATError::NotFound:
        return "Not found";
    case QFATError::NotADirectory:
        return "Not a directory";
    case QFATError::IsADirectory:
        return "Is a directory";
    case QFATError::InvalidPath:
        return "Invalid path";
    case QFATError::RequestTooLarge:
        return "Request too large";
    case QFATError::BadRequest:
        return "Bad request";
    case QFATError::MethodNotAllowed:
        return "Method not allowed";
    case QFATError::RangeNotSatisfiable:
        return "Range not satisfiable";
    case QFATError::Timeout:
        return "Timed out";
    case QFATError::ConnectionClosed:
        return "Connection closed";
    default:
        return "Unknown error";
    }
}

// Checksum over the 11-byte on-disk short name, stored in every LFN record
quint8 qfatShortNameChecksum(const quint8 *shortName)
{
    quint8 checksum = 0;
    for (int i = 0; i < ENTRY_NAME_LENGTH; i++) {
        checksum = ((checksum & 1) << 7) + (checksum >> 1) + shortName[i];
    }
    return checksum;
}

QDateTime qfatParseDateTime(quint16 date, quint16 time)
{
    // date: | year (1980-2107, 7 bits) | month (1-12, 4 bits) | day (1-31, 5 bits) |
    // time: | hour (0-23, 5 bits) | minute (0-59, 6 bits) | second/2 (0-29, 5 bits) |
    int year = ENTRY_DATE_TIME_START_OF_YEAR + ((date >> 9) & MASK_7_BITS);
    int month = (date >> 5) & MASK_4_BITS;
    int day = date & MASK_5_BITS;
    int hour = (time >> 11) & MASK_5_BITS;
    int minute = (time >> 5) & MASK_6_BITS;
    int second = (time & MASK_5_BITS) * 2;
    return QDateTime(QDate(year, month, day), QTime(hour, minute, second));
}

// ============================================================================
// QFATImageDevice
// ============================================================================

QFATImageDevice::QFATImageDevice(QSharedPointer<QIODevice> device)
    : m_device(device)
{
}

QScopedPointer<QFATImageDevice> QFATImageDevice::create(const QString &imagePath)
{
    QSharedPointer<QFile> file(new QFile(imagePath));
    if (!file->open(QIODevice::ReadOnly)) {
        qWarning() << "Failed to open FAT32 image:" << imagePath;
        return QScopedPointer<QFATImageDevice>();
    }

    return QScopedPointer<QFATImageDevice>(new QFATImageDevice(file));
}

bool QFATImageDevice::readSector(quint32 sector, quint8 *buffer, QFATError &error)
{
    error = QFATError::None;

    if (m_device.isNull() || !m_device->isOpen()) {
        error = QFATError::DeviceNotPresent;
        return false;
    }

    qint64 offset = qint64(sector) * FAT_SECTOR_SIZE;
    if (!m_device->seek(offset)) {
        qWarning() << "[QFATImageDevice] Seek failed for sector" << sector;
        error = QFATError::ReadError;
        return false;
    }

    qint64 bytesRead = m_device->read(reinterpret_cast<char *>(buffer), FAT_SECTOR_SIZE);
    if (bytesRead != FAT_SECTOR_SIZE) {
        qWarning() << "[QFATImageDevice] Short read for sector" << sector << "got" << bytesRead;
        error = QFATError::ReadError;
        return false;
    }

    return true;
}
