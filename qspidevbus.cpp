#include "qsdcardtransport.h"
#include <QDebug>
#include <QFile>

#include <cerrno>
#include <cstring>

#include <fcntl.h>
#include <linux/spi/spidev.h>
#include <sys/ioctl.h>
#include <unistd.h>

// ============================================================================
// QSPIDevBus
// ============================================================================

QSPIDevBus::QSPIDevBus(const QString &devicePath)
    : m_devicePath(devicePath)
    , m_fd(-1)
    , m_speed(400000)
    , m_selected(false)
{
}

QSPIDevBus::~QSPIDevBus()
{
    close();
}

bool QSPIDevBus::open(QFATError &error)
{
    error = QFATError::None;
    if (m_fd >= 0) {
        return true;
    }

    m_fd = ::open(QFile::encodeName(m_devicePath).constData(), O_RDWR);
    if (m_fd < 0) {
        qWarning() << "[QSPIDevBus] Cannot open" << m_devicePath << ":" << strerror(errno);
        error = QFATError::DeviceNotPresent;
        return false;
    }

    quint8 bits = 8;
    if (!setMode(SPI_MODE_0) || ioctl(m_fd, SPI_IOC_WR_BITS_PER_WORD, &bits) < 0
        || ioctl(m_fd, SPI_IOC_WR_MAX_SPEED_HZ, &m_speed) < 0) {
        qWarning() << "[QSPIDevBus] Cannot configure" << m_devicePath << ":" << strerror(errno);
        close();
        error = QFATError::DeviceNotPresent;
        return false;
    }

    qDebug() << "[QSPIDevBus] Opened" << m_devicePath;
    return true;
}

void QSPIDevBus::close()
{
    if (m_fd >= 0) {
        ::close(m_fd);
        m_fd = -1;
    }
    m_selected = false;
}

void QSPIDevBus::select()
{
    m_selected = true;
}

void QSPIDevBus::deselect()
{
    if (!m_selected) {
        return;
    }
    m_selected = false;

    // spidev only drops chip select at the end of a message, so release
    // it with one trailing idle byte
    quint8 idle = 0xFF;
    transfer(&idle, nullptr, 1, false);
}

bool QSPIDevBus::exchange(const quint8 *out, quint8 *in, int length)
{
    if (m_fd < 0 || length <= 0) {
        return length == 0;
    }

    if (m_selected) {
        return transfer(out, in, length, true);
    }

    // Clock with chip select held inactive (card power-up sequence)
    if (!setMode(SPI_MODE_0 | SPI_NO_CS)) {
        qWarning() << "[QSPIDevBus] Controller cannot clock without chip select";
    }
    bool ok = transfer(out, in, length, false);
    setMode(SPI_MODE_0);
    return ok;
}

void QSPIDevBus::setClockFrequency(quint32 hz)
{
    m_speed = hz;
    if (m_fd >= 0 && ioctl(m_fd, SPI_IOC_WR_MAX_SPEED_HZ, &m_speed) < 0) {
        qWarning() << "[QSPIDevBus] Cannot set clock to" << hz << "Hz:" << strerror(errno);
    }
}

bool QSPIDevBus::transfer(const quint8 *out, quint8 *in, int length, bool keepSelected)
{
    // spidev wants both buffers; unused directions get a scratch block
    quint8 idle[QFATSectorSize];
    quint8 discard[QFATSectorSize];

    int done = 0;
    while (done < length) {
        int chunk = qMin(length - done, QFATSectorSize);
        bool last = done + chunk >= length;

        if (!out) {
            memset(idle, 0xFF, size_t(chunk));
        }

        struct spi_ioc_transfer message;
        memset(&message, 0, sizeof(message));
        message.tx_buf = reinterpret_cast<quintptr>(out ? out + done : idle);
        message.rx_buf = reinterpret_cast<quintptr>(in ? in + done : discard);
        message.len = quint32(chunk);
        message.speed_hz = m_speed;
        message.bits_per_word = 8;
        // Keep chip select asserted between messages of one transaction
        message.cs_change = (!last || keepSelected) ? 1 : 0;

        if (ioctl(m_fd, SPI_IOC_MESSAGE(1), &message) < 0) {
            qWarning() << "[QSPIDevBus] Transfer of" << chunk << "bytes failed:" << strerror(errno);
            return false;
        }
        done += chunk;
    }

    return true;
}

bool QSPIDevBus::setMode(quint8 mode)
{
    return ioctl(m_fd, SPI_IOC_WR_MODE, &mode) >= 0;
}
