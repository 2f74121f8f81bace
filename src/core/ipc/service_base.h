#pragma once

#include "core/ipc/socket_server.h"

#include <QElapsedTimer>
#include <QJsonObject>
#include <QString>

#include <memory>

namespace af {

// ServiceBase serves "<socketDirectory()>/<name>.sock" and answers ping and
// shutdown. Subclasses override handleRequest() and hand anything they do
// not recognise back to it, which reports NOT_FOUND.
//
// Socket location:
//   ATTEMPTFLOW_SOCKET_DIR, else ATTEMPTFLOW_RUNTIME_DIR,
//   else /tmp/attemptflow-<uid>
class ServiceBase : public QObject {
    Q_OBJECT
public:
    explicit ServiceBase(const QString& serviceName, QObject* parent = nullptr);
    ~ServiceBase() override;

    // Creates the socket directory owner-only and starts listening.
    bool listen();

    // listen(), announce "ready" on stdout, run the event loop.
    int run();

    static QString runtimeDirectory();
    static QString socketDirectory();
    static QString socketPath(const QString& serviceName);

    const QString& serviceName() const { return m_serviceName; }
    const SocketServer* server() const { return m_server.get(); }

protected:
    virtual QJsonObject handleRequest(const QJsonObject& request);

    QJsonObject handlePing(const QJsonObject& request) const;
    QJsonObject handleShutdown(const QJsonObject& request);

    QString m_serviceName;
    std::unique_ptr<SocketServer> m_server;

private:
    QElapsedTimer m_uptime;
};

} // namespace af
