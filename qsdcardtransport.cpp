#include "qsdcardtransport.h"
#include "internal_constants.h"
#include <QDebug>
#include <QMutexLocker>
#include <QThread>

#include <cstring>

// ============================================================================
// QSPITransaction
// ============================================================================

QSPITransaction::QSPITransaction(QSPIBus *bus)
    : m_bus(bus)
{
    m_bus->mutex()->lock();
    m_bus->select();
}

QSPITransaction::~QSPITransaction()
{
    m_bus->deselect();
    m_bus->mutex()->unlock();
}

// ============================================================================
// QSDCardTransport
// ============================================================================

QSDCardTransport::QSDCardTransport(QSPIBus *bus, quint32 clockFrequency)
    : m_bus(bus)
    , m_clockFrequency(clockFrequency)
    , m_retryBackoff(1)
    , m_initialized(false)
    , m_highCapacity(false)
    , m_busFault(false)
{
}

quint8 QSDCardTransport::crc7(const quint8 *data, int length)
{
    quint8 crc = 0;
    for (int i = 0; i < length; i++) {
        quint8 byte = data[i];
        for (int bit = 0; bit < 8; bit++) {
            crc <<= 1;
            if ((byte ^ crc) & 0x80) {
                crc ^= 0x09;
            }
            byte <<= 1;
        }
    }
    return crc & MASK_7_BITS;
}

// CRC16-CCITT (XMODEM) as used for SD data blocks
quint16 QSDCardTransport::crc16(const quint8 *data, int length)
{
    quint16 crc = 0;
    for (int i = 0; i < length; i++) {
        crc ^= quint16(data[i] << 8);
        for (int bit = 0; bit < 8; bit++) {
            crc = (crc & 0x8000) ? quint16((crc << 1) ^ 0x1021) : quint16(crc << 1);
        }
    }
    return crc;
}

quint8 QSDCardTransport::transfer(quint8 value)
{
    quint8 in = SD_IDLE_BYTE;
    if (!m_bus->exchange(&value, &in, 1)) {
        m_busFault = true;
        return SD_IDLE_BYTE;
    }
    return in;
}

bool QSDCardTransport::waitReady()
{
    // A busy card holds MISO low
    for (int i = 0; i < SD_READY_POLL_BYTES; i++) {
        if (transfer(SD_IDLE_BYTE) == SD_IDLE_BYTE) {
            return true;
        }
    }
    return false;
}

quint8 QSDCardTransport::sendCommand(quint8 command, quint32 argument)
{
    if (command != SD_CMD_GO_IDLE_STATE && !waitReady()) {
        return SD_IDLE_BYTE;
    }

    quint8 frame[SD_COMMAND_LENGTH];
    frame[0] = SD_COMMAND_START | command;
    frame[1] = quint8(argument >> 24);
    frame[2] = quint8(argument >> 16);
    frame[3] = quint8(argument >> 8);
    frame[4] = quint8(argument);
    frame[5] = quint8((crc7(frame, 5) << 1) | MASK_1_BIT);

    if (!m_bus->exchange(frame, nullptr, SD_COMMAND_LENGTH)) {
        m_busFault = true;
        return SD_IDLE_BYTE;
    }

    // R1 arrives within a few bytes; its top bit is always clear
    for (int i = 0; i < SD_RESPONSE_POLL_BYTES; i++) {
        quint8 response = transfer(SD_IDLE_BYTE);
        if ((response & SD_R1_INVALID_MASK) == 0) {
            return response;
        }
    }
    return SD_IDLE_BYTE;
}

quint8 QSDCardTransport::sendAppCommand(quint8 command, quint32 argument)
{
    quint8 response;
    {
        QSPITransaction transaction(m_bus);
        response = sendCommand(SD_CMD_APP_CMD, 0);
    }
    if (response & ~SD_R1_IDLE) {
        return response;
    }

    QSPITransaction transaction(m_bus);
    return sendCommand(command, argument);
}

bool QSDCardTransport::readDataBlock(quint8 *buffer, int length)
{
    quint8 token = SD_IDLE_BYTE;
    for (int i = 0; i < SD_TOKEN_POLL_BYTES; i++) {
        token = transfer(SD_IDLE_BYTE);
        if (token != SD_IDLE_BYTE) {
            break;
        }
    }

    if (token != SD_DATA_START_TOKEN) {
        if ((token & SD_ERROR_TOKEN_MASK) == 0) {
            qWarning() << "[QSDCardTransport] Data error token" << Qt::hex << int(token);
        } else {
            qWarning() << "[QSDCardTransport] No data token";
        }
        return false;
    }

    if (!m_bus->exchange(nullptr, buffer, length)) {
        m_busFault = true;
        return false;
    }

    quint8 crcBytes[2];
    if (!m_bus->exchange(nullptr, crcBytes, 2)) {
        m_busFault = true;
        return false;
    }

    quint16 received = quint16((crcBytes[0] << 8) | crcBytes[1]);
    if (received != crc16(buffer, length)) {
        qWarning() << "[QSDCardTransport] Data CRC mismatch";
        return false;
    }

    return true;
}

void QSDCardTransport::backoff(int attempt)
{
    if (m_retryBackoff > 0) {
        QThread::msleep(ulong(m_retryBackoff) << qMin(attempt, 6));
    }
}

bool QSDCardTransport::initialize(QFATError &error)
{
    error = QFATError::None;
    m_initialized = false;
    m_highCapacity = false;
    m_busFault = false;

    m_bus->setClockFrequency(SD_INIT_CLOCK_HZ);

    // At least 74 clocks with the card deselected to enter native mode
    {
        QMutexLocker locker(m_bus->mutex());
        quint8 idle[SD_INIT_IDLE_BYTES];
        memset(idle, SD_IDLE_BYTE, sizeof(idle));
        m_bus->deselect();
        if (!m_bus->exchange(idle, nullptr, SD_INIT_IDLE_BYTES)) {
            error = QFATError::DeviceNotPresent;
            return false;
        }
    }

    // CMD0: reset into SPI mode
    bool idle = false;
    for (int attempt = 0; attempt < SD_GO_IDLE_ATTEMPTS && !idle; attempt++) {
        quint8 response;
        {
            QSPITransaction transaction(m_bus);
            response = sendCommand(SD_CMD_GO_IDLE_STATE, 0);
        }
        idle = (response == SD_R1_IDLE);
        if (!idle) {
            backoff(attempt);
        }
    }
    if (!idle) {
        qWarning() << "[QSDCardTransport] No card responded to GO_IDLE_STATE";
        error = QFATError::DeviceNotPresent;
        return false;
    }

    // CMD8: voltage check, only understood by version 2 cards
    bool version2 = false;
    {
        QSPITransaction transaction(m_bus);
        quint8 response = sendCommand(SD_CMD_SEND_IF_COND, SD_IF_COND_PATTERN);
        if (response == (SD_R1_IDLE | SD_R1_ILLEGAL_COMMAND)) {
            version2 = false;
        } else if (response == SD_R1_IDLE) {
            quint8 r7[4];
            if (!m_bus->exchange(nullptr, r7, 4) || (r7[2] & MASK_4_BITS) != SD_IF_COND_VOLTAGE
                || r7[3] != SD_IF_COND_CHECK) {
                qWarning() << "[QSDCardTransport] SEND_IF_COND echo mismatch";
                error = QFATError::DeviceInitFailed;
                return false;
            }
            version2 = true;
        } else {
            qWarning() << "[QSDCardTransport] SEND_IF_COND rejected:" << Qt::hex << int(response);
            error = QFATError::DeviceInitFailed;
            return false;
        }
    }

    // ACMD41: wait for the card to leave the idle state
    bool ready = false;
    for (int attempt = 0; attempt < SD_OP_COND_ATTEMPTS && !ready; attempt++) {
        quint8 response = sendAppCommand(SD_ACMD_SD_SEND_OP_COND, version2 ? SD_ACMD41_HCS : 0);
        if (response == SD_R1_READY) {
            ready = true;
        } else if (response != SD_R1_IDLE) {
            qWarning() << "[QSDCardTransport] SD_SEND_OP_COND rejected:" << Qt::hex << int(response);
            error = QFATError::DeviceInitFailed;
            return false;
        } else if (m_retryBackoff > 0) {
            QThread::msleep(ulong(m_retryBackoff));
        }
    }
    if (!ready) {
        qWarning() << "[QSDCardTransport] Card did not become ready";
        error = QFATError::DeviceInitFailed;
        return false;
    }

    if (version2) {
        QSPITransaction transaction(m_bus);
        quint8 response = sendCommand(SD_CMD_READ_OCR, 0);
        quint8 ocr[4];
        if (response != SD_R1_READY || !m_bus->exchange(nullptr, ocr, 4)) {
            qWarning() << "[QSDCardTransport] READ_OCR failed";
            error = QFATError::DeviceInitFailed;
            return false;
        }
        quint32 value = (quint32(ocr[0]) << 24) | (quint32(ocr[1]) << 16) | (quint32(ocr[2]) << 8) | ocr[3];
        m_highCapacity = (value & SD_OCR_CCS) != 0;
    }

    // Byte-addressed cards need the block length pinned to one sector
    if (!m_highCapacity) {
        QSPITransaction transaction(m_bus);
        if (sendCommand(SD_CMD_SET_BLOCKLEN, FAT_SECTOR_SIZE) != SD_R1_READY) {
            qWarning() << "[QSDCardTransport] SET_BLOCKLEN failed";
            error = QFATError::DeviceInitFailed;
            return false;
        }
    }

    if (m_busFault) {
        error = QFATError::DeviceInitFailed;
        return false;
    }

    m_bus->setClockFrequency(m_clockFrequency);
    m_initialized = true;

    qInfo() << "[QSDCardTransport] Card initialized:" << (version2 ? "SD v2" : "SD v1")
            << (m_highCapacity ? "block addressed" : "byte addressed");
    return true;
}

bool QSDCardTransport::readSector(quint32 sector, quint8 *buffer, QFATError &error)
{
    error = QFATError::None;

    if (!m_initialized) {
        error = QFATError::DeviceNotPresent;
        return false;
    }

    quint32 address = m_highCapacity ? sector : sector * FAT_SECTOR_SIZE;

    for (int attempt = 0; attempt < SD_READ_ATTEMPTS; attempt++) {
        m_busFault = false;
        bool ok;
        {
            QSPITransaction transaction(m_bus);
            quint8 response = sendCommand(SD_CMD_READ_SINGLE_BLOCK, address);
            ok = response == SD_R1_READY && readDataBlock(buffer, FAT_SECTOR_SIZE);
        }
        if (ok && !m_busFault) {
            return true;
        }

        qWarning() << "[QSDCardTransport] Read of sector" << sector << "failed, attempt" << attempt + 1;
        backoff(attempt);
    }

    error = QFATError::ReadError;
    return false;
}

quint64 QSDCardTransport::cardCapacity(QFATError &error)
{
    error = QFATError::None;

    if (!m_initialized) {
        error = QFATError::DeviceNotPresent;
        return 0;
    }

    quint8 csd[SD_CSD_LENGTH];
    bool ok = false;
    for (int attempt = 0; attempt < SD_READ_ATTEMPTS && !ok; attempt++) {
        m_busFault = false;
        {
            QSPITransaction transaction(m_bus);
            ok = sendCommand(SD_CMD_SEND_CSD, 0) == SD_R1_READY && readDataBlock(csd, SD_CSD_LENGTH);
        }
        ok = ok && !m_busFault;
        if (!ok) {
            backoff(attempt);
        }
    }
    if (!ok) {
        error = QFATError::ReadError;
        return 0;
    }

    if ((csd[0] >> 6) == 1) {
        // CSD version 2: capacity = (C_SIZE + 1) * 512 KiB
        quint32 cSize = (quint32(csd[7] & MASK_6_BITS) << 16) | (quint32(csd[8]) << 8) | csd[9];
        return (quint64(cSize) + 1) * 512 * 1024;
    }

    // CSD version 1
    quint32 readBlockLength = csd[5] & MASK_4_BITS;
    quint32 cSize = (quint32(csd[6] & MASK_2_BITS) << 10) | (quint32(csd[7]) << 2) | (csd[8] >> 6);
    quint32 cSizeMultiplier = (quint32(csd[9] & MASK_2_BITS) << 1) | (csd[10] >> 7);
    return (quint64(cSize) + 1) << (cSizeMultiplier + 2 + readBlockLength);
}
