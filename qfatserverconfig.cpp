#include "qfatrequesthandler.h"
#include <QCommandLineOption>
#include <QCommandLineParser>

namespace {

bool parseNumber(const QCommandLineParser &parser, const QCommandLineOption &option, qint64 minimum,
                 qint64 maximum, qint64 &value, QString *errorMessage)
{
    if (!parser.isSet(option)) {
        return true;
    }

    bool ok = false;
    QString text = parser.value(option);
    qint64 number = text.toLongLong(&ok);
    if (!ok || number < minimum || number > maximum) {
        if (errorMessage) {
            *errorMessage = QString("Invalid value for --%1: %2 (expected %3..%4)")
                                .arg(option.names().last(), text)
                                .arg(minimum)
                                .arg(maximum);
        }
        return false;
    }

    value = number;
    return true;
}

} // namespace

bool QFATServerConfig::fromArguments(const QStringList &arguments, QFATServerConfig &config, QString *errorMessage)
{
    QCommandLineParser parser;
    parser.setApplicationDescription("Serves a FAT32 volume read-only over HTTP");
    QCommandLineOption helpOption = parser.addHelpOption();

    QCommandLineOption imageOption(QStringList() << "i" << "image", "Serve a raw FAT32 disk image.", "path");
    QCommandLineOption spiOption(QStringList() << "s" << "spidev", "Serve an SD card on a spidev node.", "device");
    QCommandLineOption frequencyOption("spi-frequency", "SPI clock after card init.", "hz",
                                       QString::number(config.spiFrequency));
    QCommandLineOption portOption(QStringList() << "p" << "port", "TCP port to listen on.", "port",
                                  QString::number(config.port));
    QCommandLineOption pageOption("page-size", "Directory entries per listing page.", "entries",
                                  QString::number(config.listingPageSize));
    QCommandLineOption chunkOption("chunk-size", "Bytes per file write.", "bytes", QString::number(config.chunkSize));
    QCommandLineOption requestTimeoutOption("request-timeout", "Deadline for one whole request.", "ms",
                                            QString::number(config.requestTimeoutMs));
    QCommandLineOption readTimeoutOption("read-timeout", "Longest single socket wait.", "ms",
                                         QString::number(config.readTimeoutMs));
    QCommandLineOption strictOption("strict", "Fail listings with an unterminated long filename.");

    parser.addOption(imageOption);
    parser.addOption(spiOption);
    parser.addOption(frequencyOption);
    parser.addOption(portOption);
    parser.addOption(pageOption);
    parser.addOption(chunkOption);
    parser.addOption(requestTimeoutOption);
    parser.addOption(readTimeoutOption);
    parser.addOption(strictOption);

    if (!parser.parse(arguments)) {
        if (errorMessage) {
            *errorMessage = parser.errorText();
        }
        return false;
    }

    if (parser.isSet(helpOption)) {
        config.helpRequested = true;
        if (errorMessage) {
            *errorMessage = parser.helpText();
        }
        return false;
    }

    if (!parser.positionalArguments().isEmpty()) {
        if (errorMessage) {
            *errorMessage = QString("Unexpected argument: %1").arg(parser.positionalArguments().first());
        }
        return false;
    }

    // Exactly one medium
    if (parser.isSet(imageOption) == parser.isSet(spiOption)) {
        if (errorMessage) {
            *errorMessage = "Exactly one of --image or --spidev is required";
        }
        return false;
    }

    qint64 port = config.port;
    qint64 frequency = config.spiFrequency;
    qint64 pageSize = config.listingPageSize;
    qint64 chunkSize = config.chunkSize;
    qint64 requestTimeout = config.requestTimeoutMs;
    qint64 readTimeout = config.readTimeoutMs;

    if (!parseNumber(parser, portOption, 0, 65535, port, errorMessage)
        || !parseNumber(parser, frequencyOption, 100000, 50000000, frequency, errorMessage)
        || !parseNumber(parser, pageOption, 1, 4096, pageSize, errorMessage)
        || !parseNumber(parser, chunkOption, 1, QFATStreamBufferSize, chunkSize, errorMessage)
        || !parseNumber(parser, requestTimeoutOption, 1, 3600000, requestTimeout, errorMessage)
        || !parseNumber(parser, readTimeoutOption, 1, 3600000, readTimeout, errorMessage)) {
        return false;
    }

    config.imagePath = parser.value(imageOption);
    config.spiDevice = parser.value(spiOption);
    config.port = quint16(port);
    config.spiFrequency = quint32(frequency);
    config.listingPageSize = int(pageSize);
    config.chunkSize = int(chunkSize);
    config.requestTimeoutMs = int(requestTimeout);
    config.readTimeoutMs = int(readTimeout);
    config.strictDirectories = parser.isSet(strictOption);
    return true;
}
