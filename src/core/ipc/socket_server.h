#pragma once

#include "core/ipc/frame_reader.h"

#include <QJsonObject>
#include <QLocalServer>
#include <QLocalSocket>
#include <QObject>

#include <functional>
#include <memory>
#include <unordered_map>

namespace af {

// SocketServer accepts clients on one local socket path and answers every
// request frame with the handler's reply, in arrival order per client.
// A client that sends a malformed frame gets a MALFORMED_FRAME error and
// is disconnected.
class SocketServer : public QObject {
    Q_OBJECT
public:
    using RequestHandler = std::function<QJsonObject(const QJsonObject& request)>;

    explicit SocketServer(QObject* parent = nullptr);
    ~SocketServer() override;

    // A leftover socket file is removed when nothing answers on it.
    bool listen(const QString& socketPath);
    void close();
    bool isListening() const { return m_server->isListening(); }

    void setRequestHandler(RequestHandler handler) { m_handler = std::move(handler); }

    int clientCount() const { return static_cast<int>(m_connections.size()); }
    quint64 requestsServed() const { return m_requestsServed; }
    quint64 framesRejected() const { return m_framesRejected; }

signals:
    void clientConnected();
    void clientDisconnected();
    void errorOccurred(const QString& error);

private:
    struct Connection {
        QLocalSocket* socket = nullptr;
        FrameReader reader;
        quint64 requests = 0;
    };

    void acceptPending();
    void readFrom(QLocalSocket* socket);
    void drop(QLocalSocket* socket);
    void reply(QLocalSocket* socket, const QJsonObject& envelope);
    QJsonObject answer(const QJsonObject& request);
    bool failListen(const QString& message);

    std::unique_ptr<QLocalServer> m_server;
    std::unordered_map<QLocalSocket*, std::unique_ptr<Connection>> m_connections;
    RequestHandler m_handler;
    quint64 m_requestsServed = 0;
    quint64 m_framesRejected = 0;
};

} // namespace af
