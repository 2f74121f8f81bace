#include "core/ipc/service_base.h"
#include "core/ipc/message.h"
#include "core/shared/logging.h"

#include <QCoreApplication>
#include <QDateTime>
#include <QDir>
#include <QFile>
#include <QFileInfo>

#include <unistd.h>

#include <cstdio>

namespace af {

namespace {

// Cleaned value of an environment override, or empty when unset/blank.
QString directoryOverride(const char* name)
{
    const QString value = qEnvironmentVariable(name).trimmed();
    return value.isEmpty() ? QString() : QDir::cleanPath(value);
}

bool ensurePrivateDirectory(const QString& path)
{
    QDir dir(path);
    if (!dir.exists() && !dir.mkpath(QStringLiteral("."))) {
        LOG_ERROR(afIpc, "Cannot create %s", qUtf8Printable(path));
        return false;
    }
    const auto ownerOnly = QFile::ReadOwner | QFile::WriteOwner | QFile::ExeOwner;
    if (QFileInfo(path).isWritable() && !QFile::setPermissions(path, ownerOnly)) {
        LOG_WARN(afIpc, "Cannot restrict permissions on %s", qUtf8Printable(path));
    }
    return true;
}

} // anonymous namespace

ServiceBase::ServiceBase(const QString& serviceName, QObject* parent)
    : QObject(parent)
    , m_serviceName(serviceName)
    , m_server(std::make_unique<SocketServer>(this))
{
    m_uptime.start();
    m_server->setRequestHandler([this](const QJsonObject& request) {
        return handleRequest(request);
    });
}

ServiceBase::~ServiceBase() = default;

QString ServiceBase::runtimeDirectory()
{
    const QString dir = directoryOverride("ATTEMPTFLOW_RUNTIME_DIR");
    return dir.isEmpty() ? QStringLiteral("/tmp/attemptflow-%1").arg(getuid()) : dir;
}

QString ServiceBase::socketDirectory()
{
    const QString dir = directoryOverride("ATTEMPTFLOW_SOCKET_DIR");
    return dir.isEmpty() ? runtimeDirectory() : dir;
}

QString ServiceBase::socketPath(const QString& serviceName)
{
    return QDir(socketDirectory()).filePath(serviceName + QStringLiteral(".sock"));
}

bool ServiceBase::listen()
{
    if (!ensurePrivateDirectory(socketDirectory())) {
        return false;
    }
    const QString path = socketPath(m_serviceName);
    if (!m_server->listen(path)) {
        LOG_ERROR(afIpc, "%s: cannot serve %s", qUtf8Printable(m_serviceName), qUtf8Printable(path));
        return false;
    }
    return true;
}

int ServiceBase::run()
{
    if (!listen()) {
        return 1;
    }
    std::fputs("ready\n", stdout);
    std::fflush(stdout);
    LOG_INFO(afIpc, "%s ready", qUtf8Printable(m_serviceName));
    return QCoreApplication::exec();
}

QJsonObject ServiceBase::handleRequest(const QJsonObject& request)
{
    const QString method = IpcMessage::method(request);
    if (method == QLatin1String("ping")) {
        return handlePing(request);
    }
    if (method == QLatin1String("shutdown")) {
        return handleShutdown(request);
    }

    LOG_WARN(afIpc, "%s: no method '%s'", qUtf8Printable(m_serviceName), qUtf8Printable(method));
    return IpcMessage::makeError(IpcMessage::requestId(request), IpcErrorCode::NotFound,
                                 QStringLiteral("Unknown method: %1").arg(method));
}

QJsonObject ServiceBase::handlePing(const QJsonObject& request) const
{
    return IpcMessage::makeResponse(IpcMessage::requestId(request), QJsonObject{
        {QStringLiteral("pong"), true},
        {QStringLiteral("service"), m_serviceName},
        {QStringLiteral("timestamp"), QDateTime::currentMSecsSinceEpoch()},
        {QStringLiteral("uptimeMs"), m_uptime.elapsed()},
        {QStringLiteral("requestsServed"), static_cast<qint64>(m_server->requestsServed())},
    });
}

QJsonObject ServiceBase::handleShutdown(const QJsonObject& request)
{
    LOG_INFO(afIpc, "%s: shutdown requested", qUtf8Printable(m_serviceName));
    // Queued so the reply is written before the loop exits.
    QMetaObject::invokeMethod(QCoreApplication::instance(), &QCoreApplication::quit,
                              Qt::QueuedConnection);
    return IpcMessage::makeResponse(IpcMessage::requestId(request),
                                    QJsonObject{{QStringLiteral("shutting_down"), true}});
}

} // namespace af
