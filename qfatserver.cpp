#include "qfatrequesthandler.h"
#include <QDebug>
#include <QScopedPointer>
#include <QTcpSocket>

// ============================================================================
// QFATServer
// ============================================================================

QFATServer::QFATServer(QFATVolume *volume, const QFATServerConfig &config)
    : m_config(config)
    , m_handler(volume, config)
    , m_requestCount(0)
{
    // One connection is served at a time; the rest wait in the backlog
    m_server.setMaxPendingConnections(1);
}

bool QFATServer::listen(const QHostAddress &address)
{
    if (!m_server.listen(address, m_config.port)) {
        qWarning() << "[QFATServer] Cannot listen on port" << m_config.port << ":" << m_server.errorString();
        return false;
    }

    qInfo() << "[QFATServer] Listening on" << m_server.serverAddress().toString() << "port" << m_server.serverPort();
    return true;
}

bool QFATServer::serveNext(int timeoutMs, bool *timedOut)
{
    if (timedOut) {
        *timedOut = false;
    }

    if (!m_server.hasPendingConnections()) {
        bool waitTimedOut = false;
        if (!m_server.waitForNewConnection(timeoutMs, &waitTimedOut)) {
            if (timedOut) {
                *timedOut = waitTimedOut;
            }
            if (!waitTimedOut) {
                qWarning() << "[QFATServer] Accept failed:" << m_server.errorString();
            }
            return false;
        }
    }

    QScopedPointer<QTcpSocket> socket(m_server.nextPendingConnection());
    if (socket.isNull()) {
        return false;
    }

    m_requestCount++;
    qDebug() << "[QFATServer] Connection from" << socket->peerAddress().toString();

    bool completed = m_handler.handle(socket.data());
    qInfo() << "[QFATServer] Request #" << m_requestCount << (completed ? "completed" : "aborted") << "with status"
            << m_handler.lastStatus();
    return true;
}

void QFATServer::serveForever()
{
    while (m_server.isListening()) {
        serveNext(-1);
    }
}
