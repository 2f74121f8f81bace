#include "core/store/savepoint.h"
#include "core/shared/logging.h"

#include <sqlite3.h>

namespace af {

Savepoint::Savepoint(sqlite3* db, const char* name)
    : m_db(db)
    , m_name(name)
{
    m_active = m_db && exec(QByteArray("SAVEPOINT ") + m_name);
}

Savepoint::~Savepoint()
{
    if (!m_active) {
        return;
    }
    if (!exec(QByteArray("ROLLBACK TO ") + m_name)
        || !exec(QByteArray("RELEASE ") + m_name)) {
        LOG_ERROR(afStore, "Failed to roll back savepoint %s", m_name.constData());
    }
}

bool Savepoint::commit()
{
    if (!m_active) {
        return false;
    }
    if (!exec(QByteArray("RELEASE ") + m_name)) {
        return false;
    }
    m_active = false;
    return true;
}

bool Savepoint::exec(const QByteArray& sql)
{
    char* errMsg = nullptr;
    const int rc = sqlite3_exec(m_db, sql.constData(), nullptr, nullptr, &errMsg);
    if (rc != SQLITE_OK) {
        LOG_ERROR(afStore, "Savepoint SQL failed (%s): %s",
                  sql.constData(), errMsg ? errMsg : "unknown");
        sqlite3_free(errMsg);
        return false;
    }
    return true;
}

} // namespace af
