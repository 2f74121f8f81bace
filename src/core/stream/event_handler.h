#pragma once

#include <QString>

namespace af {

struct LogEntry;

// EventHandler processes one delivered log entry. Returning false leaves the
// entry unacknowledged; the consumer counts the failure and retries it.
class EventHandler {
public:
    virtual ~EventHandler() = default;

    virtual bool handle(const LogEntry& entry, QString* errorOut) = 0;
};

} // namespace af
