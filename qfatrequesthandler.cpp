#include "qfatrequesthandler.h"
#include "internal_constants.h"
#include <QAbstractSocket>
#include <QDebug>
#include <QLocale>

#include <cstring>

namespace {

const char listingContentType[] = "text/x-directory-listing; charset=utf-8";
const char defaultContentType[] = "application/octet-stream";

struct ContentType {
    const char *extension;
    const char *type;
};

const ContentType contentTypes[] = {
    { "txt", "text/plain; charset=utf-8" },
    { "htm", "text/html; charset=utf-8" },
    { "html", "text/html; charset=utf-8" },
    { "css", "text/css" },
    { "js", "application/javascript" },
    { "json", "application/json" },
    { "xml", "application/xml" },
    { "png", "image/png" },
    { "jpg", "image/jpeg" },
    { "jpeg", "image/jpeg" },
    { "gif", "image/gif" },
    { "bmp", "image/bmp" },
    { "svg", "image/svg+xml" },
    { "ico", "image/x-icon" },
    { "pdf", "application/pdf" },
    { "wav", "audio/wav" },
    { "mp3", "audio/mpeg" },
    { "mp4", "video/mp4" },
    { "zip", "application/zip" },
};

} // namespace

// ============================================================================
// QFATRequestHandler
// ============================================================================

QFATRequestHandler::QFATRequestHandler(QFATVolume *volume, const QFATServerConfig &config)
    : m_volume(volume)
    , m_config(config)
    , m_connection(nullptr)
    , m_headersSent(false)
    , m_lastError(QFATError::None)
    , m_lastStatus(0)
{
}

int QFATRequestHandler::statusForError(QFATError error)
{
    switch (error) {
    case QFATError::None:
        return 200;
    case QFATError::NotFound:
    case QFATError::NotADirectory:
        return 404;
    case QFATError::IsADirectory:
    case QFATError::InvalidPath:
    case QFATError::BadRequest:
        return 400;
    case QFATError::MethodNotAllowed:
        return 405;
    case QFATError::RequestTooLarge:
        return 414;
    case QFATError::RangeNotSatisfiable:
        return 416;
    default:
        return 500;
    }
}

QByteArray QFATRequestHandler::reasonPhrase(int status)
{
    switch (status) {
    case 200:
        return "OK";
    case 206:
        return "Partial Content";
    case 400:
        return "Bad Request";
    case 404:
        return "Not Found";
    case 405:
        return "Method Not Allowed";
    case 414:
        return "URI Too Long";
    case 416:
        return "Range Not Satisfiable";
    default:
        return "Internal Server Error";
    }
}

QByteArray QFATRequestHandler::contentTypeFor(const QString &fileName)
{
    int dot = fileName.lastIndexOf('.');
    if (dot < 0) {
        return defaultContentType;
    }

    QString extension = fileName.mid(dot + 1).toLower();
    for (const ContentType &contentType : contentTypes) {
        if (extension == QLatin1String(contentType.extension)) {
            return contentType.type;
        }
    }
    return defaultContentType;
}

QByteArray QFATRequestHandler::httpDate(const QDateTime &dateTime)
{
    // FAT timestamps have no zone; they go out unchanged, labelled GMT
    return QLocale::c().toString(dateTime, QStringLiteral("ddd, dd MMM yyyy hh:mm:ss 'GMT'")).toLatin1();
}

bool QFATRequestHandler::parseRange(const QByteArray &value, quint32 size, quint32 &first, quint32 &last,
                                    QFATError &error)
{
    error = QFATError::None;

    if (!value.startsWith("bytes=")) {
        return false;
    }

    QByteArray ranges = value.mid(6).trimmed();
    // Multiple ranges are not supported; the whole entity is sent instead
    if (ranges.contains(',')) {
        return false;
    }

    int dash = ranges.indexOf('-');
    if (dash < 0) {
        return false;
    }

    QByteArray startText = ranges.left(dash).trimmed();
    QByteArray endText = ranges.mid(dash + 1).trimmed();
    bool ok = false;

    if (startText.isEmpty()) {
        // Suffix range: the last N bytes
        quint64 suffix = endText.toULongLong(&ok);
        if (!ok) {
            return false;
        }
        if (suffix == 0 || size == 0) {
            error = QFATError::RangeNotSatisfiable;
            return false;
        }
        first = suffix >= size ? 0 : quint32(size - suffix);
        last = size - 1;
        return true;
    }

    quint64 start = startText.toULongLong(&ok);
    if (!ok) {
        return false;
    }

    quint64 end = 0;
    if (!endText.isEmpty()) {
        end = endText.toULongLong(&ok);
        if (!ok || end < start) {
            return false;
        }
    }

    if (start >= size) {
        error = QFATError::RangeNotSatisfiable;
        return false;
    }

    first = quint32(start);
    last = (endText.isEmpty() || end >= size) ? size - 1 : quint32(end);
    return true;
}

bool QFATRequestHandler::handle(QIODevice *connection)
{
    m_connection = connection;
    m_deadline = QDeadlineTimer(m_config.requestTimeoutMs);
    m_headersSent = false;
    m_errorHeaders.clear();
    m_lastError = QFATError::None;
    m_lastStatus = 0;

    Request request;
    QFATError error = QFATError::None;

    if (readRequest(request, error) && respond(request, error)) {
        finish(false);
        return true;
    }

    m_lastError = error;

    if (m_headersSent || error == QFATError::Timeout || error == QFATError::ConnectionClosed) {
        qWarning() << "[QFATRequestHandler] Aborting" << request.method << request.path << ":"
                   << qfatErrorString(error);
        finish(true);
        return false;
    }

    qWarning() << "[QFATRequestHandler]" << request.method << request.path << "failed:" << qfatErrorString(error);

    if (!sendError(error)) {
        finish(true);
        return false;
    }

    finish(false);
    return true;
}

bool QFATRequestHandler::readRequest(Request &request, QFATError &error)
{
    int length = 0;
    if (!readLine(m_line, QFATMaxRequestLine, length, error)) {
        return false;
    }

    // METHOD SP TARGET [SP HTTP/x.y]
    QList<QByteArray> parts = QByteArray(m_line, length).simplified().split(' ');
    if (parts.size() < 2 || parts.size() > 3 || parts[0].isEmpty()) {
        error = QFATError::BadRequest;
        return false;
    }

    request.method = parts[0];

    if (parts.size() == 3) {
        if (!parts[2].startsWith("HTTP/")) {
            error = QFATError::BadRequest;
            return false;
        }
        if (!readHeaders(request, error)) {
            return false;
        }
    }

    if (request.method != "GET" && request.method != "HEAD") {
        error = QFATError::MethodNotAllowed;
        return false;
    }

    return parseTarget(parts[1], request, error);
}

bool QFATRequestHandler::readHeaders(Request &request, QFATError &error)
{
    char header[QFAT_MAX_HEADER_LINE];
    int total = 0;

    while (total < QFAT_MAX_HEADER_BYTES) {
        int length = 0;
        QFATError lineError = QFATError::None;
        if (!readLine(header, QFAT_MAX_HEADER_LINE, length, lineError)) {
            if (lineError == QFATError::RequestTooLarge) {
                // The whole line so far plus the byte that overflowed it
                total += QFAT_MAX_HEADER_LINE + 1;
                qDebug() << "[QFATRequestHandler] Skipping over-long header line";
                if (discardLine(QFAT_MAX_HEADER_BYTES, total, lineError)) {
                    continue;
                }
            }
            if (lineError == QFATError::Timeout) {
                error = lineError;
                return false;
            }
            // Header limit reached or half-closed peer: the rest is ignored
            qDebug() << "[QFATRequestHandler] Stopped reading headers:" << qfatErrorString(lineError);
            return true;
        }

        if (length == 0) {
            return true;
        }
        total += length + 2;

        QByteArray line(header, length);
        int colon = line.indexOf(':');
        if (colon > 0 && line.left(colon).trimmed().toLower() == "range") {
            request.range = line.mid(colon + 1).trimmed();
        }
    }

    qDebug() << "[QFATRequestHandler] Header limit reached, ignoring the rest";
    return true;
}

bool QFATRequestHandler::readLine(char *buffer, int capacity, int &length, QFATError &error)
{
    error = QFATError::None;
    length = 0;
    // CR that arrived with the buffer already full
    bool carriageReturn = false;

    forever {
        char c;
        if (!m_connection->getChar(&c)) {
            if (!waitForData(error)) {
                // A peer that closes after an unterminated line still sent it
                if (error == QFATError::ConnectionClosed && length > 0) {
                    error = QFATError::None;
                    return true;
                }
                return false;
            }
            continue;
        }

        if (c == '\n') {
            if (!carriageReturn && length > 0 && buffer[length - 1] == '\r') {
                length--;
            }
            return true;
        }

        if (length >= capacity) {
            if (c == '\r' && !carriageReturn) {
                carriageReturn = true;
                continue;
            }
            error = QFATError::RequestTooLarge;
            return false;
        }
        buffer[length++] = c;
    }
}

bool QFATRequestHandler::discardLine(int limit, int &discarded, QFATError &error)
{
    error = QFATError::None;

    while (discarded < limit) {
        char c;
        if (!m_connection->getChar(&c)) {
            if (!waitForData(error)) {
                return false;
            }
            continue;
        }

        discarded++;
        if (c == '\n') {
            return true;
        }
    }

    error = QFATError::RequestTooLarge;
    return false;
}

bool QFATRequestHandler::waitForData(QFATError &error)
{
    if (m_deadline.hasExpired()) {
        error = QFATError::Timeout;
        return false;
    }

    int timeout = int(qMin<qint64>(m_deadline.remainingTime(), m_config.readTimeoutMs));
    if (m_connection->waitForReadyRead(timeout)) {
        return true;
    }

    QAbstractSocket *socket = qobject_cast<QAbstractSocket *>(m_connection);
    if (socket && socket->state() == QAbstractSocket::ConnectedState) {
        error = QFATError::Timeout;
    } else {
        // Other devices hold everything they will ever deliver
        error = QFATError::ConnectionClosed;
    }
    return false;
}

bool QFATRequestHandler::parseTarget(const QByteArray &target, Request &request, QFATError &error)
{
    int question = target.indexOf('?');
    QByteArray rawPath = question < 0 ? target : target.left(question);
    QByteArray query = question < 0 ? QByteArray() : target.mid(question + 1);

    QByteArray decoded = QByteArray::fromPercentEncoding(rawPath);
    request.path = QString::fromUtf8(decoded);

    if (!rawPath.startsWith('/')) {
        error = QFATError::BadRequest;
        return false;
    }

    // No FAT name can hold a control character
    for (char c : decoded) {
        if (uchar(c) < 0x20 || uchar(c) == 0x7F) {
            error = QFATError::InvalidPath;
            return false;
        }
    }

    const QList<QByteArray> parameters = query.split('&');
    for (const QByteArray &parameter : parameters) {
        if (parameter.startsWith("page=")) {
            bool ok = false;
            int page = parameter.mid(5).toInt(&ok);
            if (!ok || page < 1) {
                error = QFATError::BadRequest;
                return false;
            }
            request.page = page;
        }
    }

    return true;
}

bool QFATRequestHandler::respond(const Request &request, QFATError &error)
{
    qDebug() << "[QFATRequestHandler]" << request.method << request.path;

    QFATPathResolver resolver(m_volume, m_config.strictDirectories);
    QFATDirectoryEntry entry = resolver.resolve(request.path, error);
    if (error != QFATError::None) {
        return false;
    }

    // Directories are always listed, never streamed as files
    if (entry.isDirectory) {
        if (!request.range.isEmpty()) {
            QFATFileReader::isReadable(entry, error);
            return false;
        }
        return serveDirectory(request, entry, error);
    }

    return serveFile(request, entry, error);
}

bool QFATRequestHandler::serveDirectory(const Request &request, const QFATDirectoryEntry &entry, QFATError &error)
{
    QFATDirectoryReader reader(m_volume, entry.cluster, m_config.strictDirectories);

    // Measure first so the length is known before anything is written
    int count = 0;
    bool hasMore = false;
    qint64 length = renderListing(reader, request.page, false, count, hasMore, error);
    if (length < 0) {
        return false;
    }

    if (count == 0 && request.page > 1) {
        error = QFATError::NotFound;
        return false;
    }

    QByteArray extraHeaders;
    if (hasMore) {
        extraHeaders = "X-Listing-Next-Page: " + QByteArray::number(request.page + 1) + "\r\n";
    }

    if (!sendHeaders(200, listingContentType, length, extraHeaders, error)) {
        return false;
    }
    if (request.method == "HEAD") {
        return true;
    }

    reader.restart();
    qint64 written = renderListing(reader, request.page, true, count, hasMore, error);
    if (written < 0) {
        return false;
    }
    if (written != length) {
        qWarning() << "[QFATRequestHandler] Listing of" << request.path << "changed from" << length << "to"
                   << written << "bytes";
        error = QFATError::CorruptDirectory;
        return false;
    }

    return true;
}

qint64 QFATRequestHandler::renderListing(QFATDirectoryReader &reader, int page, bool write, int &count,
                                         bool &hasMore, QFATError &error)
{
    const int pageSize = m_config.listingPageSize;
    const qint64 skip = qint64(page - 1) * pageSize;

    qint64 index = 0;
    qint64 total = 0;
    int pending = 0;
    count = 0;
    hasMore = false;

    QFATDirectoryEntry entry;
    while (reader.next(entry, error)) {
        if (index++ < skip) {
            continue;
        }
        if (count == pageSize) {
            hasMore = true;
            break;
        }

        QByteArray line = entry.name.toUtf8();
        if (entry.isDirectory) {
            line += '/';
        } else {
            line += ' ';
            line += QByteArray::number(entry.size);
        }
        line += '\n';

        if (write) {
            if (pending + line.size() > QFATStreamBufferSize) {
                if (!writeAll(m_chunk, pending, error)) {
                    return -1;
                }
                pending = 0;
            }
            memcpy(m_chunk + pending, line.constData(), size_t(line.size()));
            pending += line.size();
        }

        total += line.size();
        count++;
    }

    if (error != QFATError::None) {
        return -1;
    }

    if (write && pending > 0 && !writeAll(m_chunk, pending, error)) {
        return -1;
    }

    return total;
}

bool QFATRequestHandler::serveFile(const Request &request, const QFATDirectoryEntry &entry, QFATError &error)
{
    if (!QFATFileReader::isReadable(entry, error)) {
        return false;
    }

    QFATFileReader reader(m_volume, entry.cluster, entry.size);

    quint32 first = 0;
    quint32 last = entry.size > 0 ? entry.size - 1 : 0;
    qint64 length = entry.size;
    bool partial = false;

    if (!request.range.isEmpty()) {
        QFATError rangeError = QFATError::None;
        if (parseRange(request.range, entry.size, first, last, rangeError)) {
            partial = true;
            length = qint64(last) - first + 1;
        } else if (rangeError != QFATError::None) {
            m_errorHeaders = "Content-Range: bytes */" + QByteArray::number(entry.size) + "\r\n";
            error = rangeError;
            return false;
        }
    }

    // Walks the chain up to the first byte, so a broken chain is a 500
    // rather than a truncated body
    if (!reader.seek(first, error)) {
        return false;
    }

    QByteArray extraHeaders;
    if (entry.modified.isValid()) {
        extraHeaders = "Last-Modified: " + httpDate(entry.modified) + "\r\n";
    }
    if (partial) {
        extraHeaders += "Content-Range: bytes " + QByteArray::number(first) + '-' + QByteArray::number(last) + '/'
            + QByteArray::number(entry.size) + "\r\n";
    }

    if (!sendHeaders(partial ? 206 : 200, contentTypeFor(entry.name), length, extraHeaders, error)) {
        return false;
    }
    if (request.method == "HEAD") {
        return true;
    }

    const int chunkSize = qBound(1, m_config.chunkSize, QFATStreamBufferSize);
    qint64 remaining = length;

    while (remaining > 0) {
        qint64 count = reader.read(m_chunk, qMin<qint64>(chunkSize, remaining), error);
        if (count < 0) {
            qWarning() << "[QFATRequestHandler] Reading" << request.path << "failed at" << reader.position() << ":"
                       << qfatErrorString(error);
            return false;
        }
        if (count == 0) {
            error = QFATError::ShortRead;
            return false;
        }
        if (!writeAll(m_chunk, count, error)) {
            return false;
        }
        remaining -= count;
    }

    return true;
}

bool QFATRequestHandler::sendError(QFATError error)
{
    int status = statusForError(error);

    QByteArray extraHeaders = m_errorHeaders;
    if (status == 405) {
        extraHeaders += "Allow: GET, HEAD\r\n";
    }

    QFATError writeError = QFATError::None;
    if (!sendHeaders(status, QByteArray(), 0, extraHeaders, writeError)) {
        m_lastError = writeError;
        return false;
    }
    return true;
}

bool QFATRequestHandler::sendHeaders(int status, const QByteArray &contentType, qint64 length,
                                     const QByteArray &extraHeaders, QFATError &error)
{
    QByteArray head = "HTTP/1.1 " + QByteArray::number(status) + ' ' + reasonPhrase(status) + "\r\n";
    if (!contentType.isEmpty()) {
        head += "Content-Type: " + contentType + "\r\n";
    }
    head += "Content-Length: " + QByteArray::number(length) + "\r\n";
    head += extraHeaders;
    head += "Connection: close\r\n\r\n";

    m_lastStatus = status;
    m_headersSent = true;
    return writeAll(head.constData(), head.size(), error);
}

bool QFATRequestHandler::writeAll(const char *data, qint64 length, QFATError &error)
{
    qint64 written = 0;

    while (written < length) {
        if (m_deadline.hasExpired()) {
            error = QFATError::Timeout;
            return false;
        }

        qint64 count = m_connection->write(data + written, length - written);
        if (count < 0) {
            error = QFATError::ConnectionClosed;
            return false;
        }
        written += count;

        // Never queue more than one chunk inside the device
        while (m_connection->bytesToWrite() > 0) {
            if (m_deadline.hasExpired()) {
                error = QFATError::Timeout;
                return false;
            }
            int timeout = int(qMin<qint64>(m_deadline.remainingTime(), m_config.readTimeoutMs));
            if (!m_connection->waitForBytesWritten(timeout)) {
                QAbstractSocket *socket = qobject_cast<QAbstractSocket *>(m_connection);
                bool connected = socket && socket->state() == QAbstractSocket::ConnectedState;
                error = connected ? QFATError::Timeout : QFATError::ConnectionClosed;
                return false;
            }
        }
    }

    return true;
}

void QFATRequestHandler::finish(bool aborted)
{
    QAbstractSocket *socket = qobject_cast<QAbstractSocket *>(m_connection);
    if (socket) {
        if (aborted) {
            socket->abort();
        } else {
            socket->disconnectFromHost();
            if (socket->state() != QAbstractSocket::UnconnectedState) {
                socket->waitForDisconnected(int(qMin<qint64>(m_deadline.remainingTime(), m_config.readTimeoutMs)));
            }
        }
    } else {
        m_connection->close();
    }

    m_connection = nullptr;
}
