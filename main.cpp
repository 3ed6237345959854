#include "qfatfilesystem.h"
#include "qfatrequesthandler.h"
#include "qsdcardtransport.h"

#include <QCoreApplication>
#include <QDebug>
#include <QTextStream>

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);
    QCoreApplication::setApplicationName("qfatserve");

    QFATServerConfig config;
    QString message;
    if (!QFATServerConfig::fromArguments(app.arguments(), config, &message)) {
        QTextStream(config.helpRequested ? stdout : stderr) << message << "\n";
        return config.helpRequested ? 0 : 2;
    }

    QScopedPointer<QFATImageDevice> image;
    QScopedPointer<QSPIDevBus> bus;
    QScopedPointer<QSDCardTransport> card;
    QFATSectorDevice *device = nullptr;
    QFATError error = QFATError::None;

    if (!config.imagePath.isEmpty()) {
        image.reset(QFATImageDevice::create(config.imagePath).take());
        if (image.isNull()) {
            qCritical() << "Cannot open image" << config.imagePath;
            return 1;
        }
        device = image.data();
    } else {
        bus.reset(new QSPIDevBus(config.spiDevice));
        if (!bus->open(error)) {
            qCritical() << "Cannot open" << config.spiDevice << ":" << qfatErrorString(error);
            return 1;
        }

        card.reset(new QSDCardTransport(bus.data(), config.spiFrequency));
        if (!card->initialize(error)) {
            qCritical() << "SD card initialization failed:" << qfatErrorString(error);
            return 1;
        }

        quint64 capacity = card->cardCapacity(error);
        if (error == QFATError::None) {
            qInfo() << "SD card size:" << capacity / (1024 * 1024) << "MiB";
        } else {
            qWarning() << "Cannot read card size:" << qfatErrorString(error);
        }
        device = card.data();
    }

    QScopedPointer<QFATVolume> volume(QFATVolume::mount(device, error));
    if (volume.isNull()) {
        qCritical() << "Mount failed:" << qfatErrorString(error);
        return 1;
    }

    QFATServer server(volume.data(), config);
    if (!server.listen()) {
        qCritical() << "Cannot start server";
        return 1;
    }

    server.serveForever();
    return 0;
}
