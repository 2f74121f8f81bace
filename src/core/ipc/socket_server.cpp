#include "core/ipc/socket_server.h"
#include "core/ipc/message.h"
#include "core/shared/logging.h"

namespace af {

namespace {

constexpr int kProbeTimeoutMs = 150;

// True when a live service already owns socketPath.
bool isServedElsewhere(const QString& socketPath)
{
    QLocalSocket probe;
    probe.connectToServer(socketPath);
    if (!probe.waitForConnected(kProbeTimeoutMs)) {
        return false;
    }
    probe.disconnectFromServer();
    return true;
}

} // anonymous namespace

SocketServer::SocketServer(QObject* parent)
    : QObject(parent)
    , m_server(std::make_unique<QLocalServer>(this))
{
    m_server->setSocketOptions(QLocalServer::UserAccessOption);
    connect(m_server.get(), &QLocalServer::newConnection, this, &SocketServer::acceptPending);
}

SocketServer::~SocketServer()
{
    close();
}

bool SocketServer::failListen(const QString& message)
{
    LOG_ERROR(afIpc, "%s", qUtf8Printable(message));
    emit errorOccurred(message);
    return false;
}

bool SocketServer::listen(const QString& socketPath)
{
    if (!m_server->listen(socketPath)) {
        if (m_server->serverError() != QAbstractSocket::AddressInUseError) {
            return failListen(QStringLiteral("listen on %1 failed: %2")
                                  .arg(socketPath, m_server->errorString()));
        }
        if (isServedElsewhere(socketPath)) {
            return failListen(QStringLiteral("%1 is owned by a running service").arg(socketPath));
        }
        LOG_WARN(afIpc, "Replacing stale socket %s", qUtf8Printable(socketPath));
        QLocalServer::removeServer(socketPath);
        if (!m_server->listen(socketPath)) {
            return failListen(QStringLiteral("listen on %1 failed after cleanup: %2")
                                  .arg(socketPath, m_server->errorString()));
        }
    }

    LOG_INFO(afIpc, "Listening on %s", qUtf8Printable(socketPath));
    return true;
}

void SocketServer::close()
{
    // Take the table first so disconnected() callbacks find nothing to drop.
    auto connections = std::move(m_connections);
    m_connections.clear();
    for (auto& entry : connections) {
        QLocalSocket* socket = entry.first;
        socket->disconnect(this);
        socket->abort();
        socket->deleteLater();
    }

    if (m_server->isListening()) {
        LOG_INFO(afIpc, "Closing %s", qUtf8Printable(m_server->fullServerName()));
        m_server->close();
    }
}

void SocketServer::acceptPending()
{
    while (QLocalSocket* socket = m_server->nextPendingConnection()) {
        auto connection = std::make_unique<Connection>();
        connection->socket = socket;
        m_connections.emplace(socket, std::move(connection));

        connect(socket, &QLocalSocket::readyRead, this, [this, socket]() { readFrom(socket); });
        connect(socket, &QLocalSocket::disconnected, this, [this, socket]() { drop(socket); });

        LOG_DEBUG(afIpc, "Client connected (%d open)", clientCount());
        emit clientConnected();
    }
}

void SocketServer::readFrom(QLocalSocket* socket)
{
    auto it = m_connections.find(socket);
    if (it == m_connections.end()) {
        return;
    }
    Connection& connection = *it->second;
    connection.reader.feed(socket->readAll());

    for (;;) {
        QJsonObject incoming;
        QString error;
        const FrameReader::Status status = connection.reader.next(&incoming, &error);
        if (status == FrameReader::Status::NeedMore) {
            return;
        }
        if (status == FrameReader::Status::Malformed) {
            ++m_framesRejected;
            reply(socket, IpcMessage::makeError(0, IpcErrorCode::MalformedFrame, error));
            socket->flush();
            socket->disconnectFromServer();
            return;
        }

        if (!IpcMessage::isRequest(incoming)) {
            LOG_WARN(afIpc, "Dropping non-request envelope of type '%s'",
                     qUtf8Printable(incoming.value(QStringLiteral("type")).toString()));
            continue;
        }

        ++connection.requests;
        ++m_requestsServed;
        reply(socket, answer(incoming));

        // The handler may have closed the server.
        if (m_connections.find(socket) == m_connections.end()) {
            return;
        }
    }
}

QJsonObject SocketServer::answer(const QJsonObject& request)
{
    LOG_DEBUG(afIpc, "Request %llu: %s",
              static_cast<unsigned long long>(IpcMessage::requestId(request)),
              qUtf8Printable(IpcMessage::method(request)));
    if (!m_handler) {
        return IpcMessage::makeError(IpcMessage::requestId(request), IpcErrorCode::ServiceUnavailable,
                                     QStringLiteral("no handler installed"));
    }
    return m_handler(request);
}

void SocketServer::reply(QLocalSocket* socket, const QJsonObject& envelope)
{
    QByteArray frame = FrameReader::encode(envelope);
    if (frame.isEmpty()) {
        frame = FrameReader::encode(IpcMessage::makeError(
            IpcMessage::requestId(envelope), IpcErrorCode::InternalError,
            QStringLiteral("response too large")));
    }
    socket->write(frame);
}

void SocketServer::drop(QLocalSocket* socket)
{
    auto it = m_connections.find(socket);
    if (it == m_connections.end()) {
        return;
    }
    LOG_DEBUG(afIpc, "Client disconnected after %llu requests",
              static_cast<unsigned long long>(it->second->requests));
    m_connections.erase(it);
    socket->deleteLater();
    emit clientDisconnected();
}

} // namespace af
