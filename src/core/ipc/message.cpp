#include "core/ipc/message.h"

namespace af {

namespace {

QJsonObject envelope(const char* type, uint64_t id)
{
    return QJsonObject{
        {QStringLiteral("type"), QLatin1String(type)},
        {QStringLiteral("id"), static_cast<qint64>(id)},
    };
}

} // anonymous namespace

QJsonObject IpcMessage::makeRequest(uint64_t id, const QString& method, const QJsonObject& params)
{
    QJsonObject json = envelope("request", id);
    json.insert(QStringLiteral("method"), method);
    if (!params.isEmpty()) {
        json.insert(QStringLiteral("params"), params);
    }
    return json;
}

QJsonObject IpcMessage::makeResponse(uint64_t id, const QJsonObject& result)
{
    QJsonObject json = envelope("response", id);
    json.insert(QStringLiteral("result"), result);
    return json;
}

QJsonObject IpcMessage::makeError(uint64_t id, IpcErrorCode code, const QString& message)
{
    QJsonObject json = envelope("error", id);
    json.insert(QStringLiteral("error"), QJsonObject{
        {QStringLiteral("code"), static_cast<int>(code)},
        {QStringLiteral("codeString"), ipcErrorCodeToString(code)},
        {QStringLiteral("message"), message},
    });
    return json;
}

bool IpcMessage::isRequest(const QJsonObject& envelope)
{
    return envelope.value(QStringLiteral("type")).toString() == QLatin1String("request");
}

uint64_t IpcMessage::requestId(const QJsonObject& envelope)
{
    return static_cast<uint64_t>(envelope.value(QStringLiteral("id")).toInteger());
}

QString IpcMessage::method(const QJsonObject& request)
{
    return request.value(QStringLiteral("method")).toString();
}

QJsonObject IpcMessage::params(const QJsonObject& request)
{
    return request.value(QStringLiteral("params")).toObject();
}

} // namespace af
