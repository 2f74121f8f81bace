#pragma once

#include "core/ipc/ipc_error.h"

#include <QJsonObject>
#include <QString>

#include <cstdint>

namespace af {

// Request, response and error envelopes exchanged with pipeline clients.
//
//   {"type":"request",  "id":N, "method":"...", "params":{...}}
//   {"type":"response", "id":N, "result":{...}}
//   {"type":"error",    "id":N, "error":{"code":C, "codeString":"...", "message":"..."}}
class IpcMessage {
public:
    static QJsonObject makeRequest(uint64_t id, const QString& method, const QJsonObject& params = {});
    static QJsonObject makeResponse(uint64_t id, const QJsonObject& result);
    static QJsonObject makeError(uint64_t id, IpcErrorCode code, const QString& message);

    static bool isRequest(const QJsonObject& envelope);
    static uint64_t requestId(const QJsonObject& envelope);
    static QString method(const QJsonObject& request);
    static QJsonObject params(const QJsonObject& request);
};

} // namespace af
