#ifndef QSDCARDTRANSPORT_H
#define QSDCARDTRANSPORT_H

#include <QMutex>
#include <QString>

#include "qfatfilesystem.h"

// Half-duplex clocked serial bus shared by every device on it.
// exchange() clocks out `length` bytes from `out` (0xFF when null) and
// stores the bytes clocked in into `in` (discarded when null).
class QSPIBus
{
public:
    virtual ~QSPIBus() {}

    virtual void select() = 0;
    virtual void deselect() = 0;
    virtual bool exchange(const quint8 *out, quint8 *in, int length) = 0;
    virtual void setClockFrequency(quint32 hz) = 0;

    QMutex *mutex() { return &m_mutex; }

private:
    QMutex m_mutex;
};

// Exclusive ownership of the bus for one complete command:
// lock + select on construction, deselect + unlock on destruction.
class QSPITransaction
{
public:
    explicit QSPITransaction(QSPIBus *bus);
    ~QSPITransaction();

private:
    Q_DISABLE_COPY(QSPITransaction)

    QSPIBus *m_bus;
};

// QSPIBus over a Linux spidev character device
class QSPIDevBus : public QSPIBus
{
public:
    explicit QSPIDevBus(const QString &devicePath);
    ~QSPIDevBus() override;

    bool open(QFATError &error);
    void close();

    void select() override;
    void deselect() override;
    bool exchange(const quint8 *out, quint8 *in, int length) override;
    void setClockFrequency(quint32 hz) override;

private:
    bool transfer(const quint8 *out, quint8 *in, int length, bool keepSelected);
    bool setMode(quint8 mode);

    QString m_devicePath;
    int m_fd;
    quint32 m_speed;
    bool m_selected;
};

// SD card in SPI mode, read-only
class QSDCardTransport : public QFATSectorDevice
{
public:
    explicit QSDCardTransport(QSPIBus *bus, quint32 clockFrequency = 25000000);

    bool initialize(QFATError &error);
    bool readSector(quint32 sector, quint8 *buffer, QFATError &error) override;
    quint64 cardCapacity(QFATError &error);

    bool isInitialized() const { return m_initialized; }
    bool isHighCapacity() const { return m_highCapacity; }

    // Base delay between retries, doubled on every attempt
    void setRetryBackoff(int milliseconds) { m_retryBackoff = milliseconds; }

    static quint8 crc7(const quint8 *data, int length);
    static quint16 crc16(const quint8 *data, int length);

private:
    quint8 transfer(quint8 value);
    bool waitReady();
    quint8 sendCommand(quint8 command, quint32 argument);
    quint8 sendAppCommand(quint8 command, quint32 argument);
    bool readDataBlock(quint8 *buffer, int length);
    void backoff(int attempt);

    QSPIBus *m_bus;
    quint32 m_clockFrequency;
    int m_retryBackoff;
    bool m_initialized;
    bool m_highCapacity;
    bool m_busFault;
};

#endif
