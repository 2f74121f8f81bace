#pragma once

#include <QString>

namespace af {

// Error codes carried in "error" envelopes. The numeric values are wire
// format; gaps are codes the pipeline never raises.
enum class IpcErrorCode : int {
    InvalidParams      = 1,
    MalformedFrame     = 2,
    NotFound           = 4,
    InternalError      = 6,
    ServiceUnavailable = 9,
};

namespace detail {

struct IpcErrorName {
    IpcErrorCode code;
    const char* name;
};

constexpr IpcErrorName kIpcErrorNames[] = {
    {IpcErrorCode::InvalidParams,      "INVALID_PARAMS"},
    {IpcErrorCode::MalformedFrame,     "MALFORMED_FRAME"},
    {IpcErrorCode::NotFound,           "NOT_FOUND"},
    {IpcErrorCode::InternalError,      "INTERNAL_ERROR"},
    {IpcErrorCode::ServiceUnavailable, "SERVICE_UNAVAILABLE"},
};

} // namespace detail

inline QString ipcErrorCodeToString(IpcErrorCode code)
{
    for (const auto& entry : detail::kIpcErrorNames) {
        if (entry.code == code) {
            return QString::fromLatin1(entry.name);
        }
    }
    return QStringLiteral("UNKNOWN");
}

// InternalError for names this build does not know.
inline IpcErrorCode ipcErrorCodeFromString(const QString& name)
{
    for (const auto& entry : detail::kIpcErrorNames) {
        if (name == QLatin1String(entry.name)) {
            return entry.code;
        }
    }
    return IpcErrorCode::InternalError;
}

} // namespace af
