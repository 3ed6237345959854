#ifndef QFATREQUESTHANDLER_H
#define QFATREQUESTHANDLER_H

#include <QByteArray>
#include <QDateTime>
#include <QDeadlineTimer>
#include <QHostAddress>
#include <QIODevice>
#include <QString>
#include <QStringList>
#include <QTcpServer>

#include "qfatfilesystem.h"

constexpr int QFATMaxRequestLine = 512;
constexpr int QFATStreamBufferSize = 8192;

struct QFATServerConfig {
    quint16 port;
    QString imagePath; // serve a raw disk image
    QString spiDevice; // serve an SD card behind a spidev node
    quint32 spiFrequency;
    int listingPageSize;
    int chunkSize;
    int requestTimeoutMs;
    int readTimeoutMs;
    bool strictDirectories;
    bool helpRequested;

    QFATServerConfig()
        : port(80)
        , spiFrequency(25000000)
        , listingPageSize(32)
        , chunkSize(2048)
        , requestTimeoutMs(30000)
        , readTimeoutMs(5000)
        , strictDirectories(false)
        , helpRequested(false)
    {
    }

    // Parses a full argument list (program name first). On failure, or
    // when help was asked for, errorMessage receives the text to print.
    static bool fromArguments(const QStringList &arguments, QFATServerConfig &config, QString *errorMessage);
};

// Serves one request per connection: directory listings and file
// contents of a mounted volume over a small HTTP/1.1 subset.
class QFATRequestHandler
{
public:
    QFATRequestHandler(QFATVolume *volume, const QFATServerConfig &config);

    // Reads one request, writes the response and closes the connection.
    // Returns false when the connection had to be aborted.
    bool handle(QIODevice *connection);

    QFATError lastError() const { return m_lastError; }
    int lastStatus() const { return m_lastStatus; }

    static int statusForError(QFATError error);
    static QByteArray reasonPhrase(int status);
    static QByteArray contentTypeFor(const QString &fileName);
    static QByteArray httpDate(const QDateTime &dateTime);

    // Single "bytes=" range; false with error None means the header is ignored
    static bool parseRange(const QByteArray &value, quint32 size, quint32 &first, quint32 &last, QFATError &error);

private:
    struct Request {
        QByteArray method;
        QString path;
        int page;
        QByteArray range;

        Request()
            : page(1)
        {
        }
    };

    bool readRequest(Request &request, QFATError &error);
    bool readHeaders(Request &request, QFATError &error);
    bool readLine(char *buffer, int capacity, int &length, QFATError &error);
    bool discardLine(int limit, int &discarded, QFATError &error);
    bool waitForData(QFATError &error);
    bool parseTarget(const QByteArray &target, Request &request, QFATError &error);

    bool respond(const Request &request, QFATError &error);
    bool serveDirectory(const Request &request, const QFATDirectoryEntry &entry, QFATError &error);
    bool serveFile(const Request &request, const QFATDirectoryEntry &entry, QFATError &error);
    qint64 renderListing(QFATDirectoryReader &reader, int page, bool write, int &count, bool &hasMore,
                         QFATError &error);

    bool sendError(QFATError error);
    bool sendHeaders(int status, const QByteArray &contentType, qint64 length, const QByteArray &extraHeaders,
                     QFATError &error);
    bool writeAll(const char *data, qint64 length, QFATError &error);
    void finish(bool aborted);

    QFATVolume *m_volume;
    QFATServerConfig m_config;

    QIODevice *m_connection;
    QDeadlineTimer m_deadline;
    bool m_headersSent;
    QByteArray m_errorHeaders;
    QFATError m_lastError;
    int m_lastStatus;

    char m_line[QFATMaxRequestLine];
    char m_chunk[QFATStreamBufferSize];
};

// Accepts and serves connections strictly one at a time
class QFATServer
{
public:
    QFATServer(QFATVolume *volume, const QFATServerConfig &config);

    bool listen(const QHostAddress &address = QHostAddress::Any);
    quint16 serverPort() const { return m_server.serverPort(); }

    // Waits up to timeoutMs for a connection and serves it fully
    bool serveNext(int timeoutMs, bool *timedOut = nullptr);
    void serveForever();

    quint64 requestCount() const { return m_requestCount; }

private:
    QFATServerConfig m_config;
    QTcpServer m_server;
    QFATRequestHandler m_handler;
    quint64 m_requestCount;
};

#endif
