#pragma once

#include <QByteArray>
#include <QString>

struct sqlite3;

namespace af {

// Savepoint scopes a group of writes. Destroying an uncommitted savepoint
// rolls every write in it back. Savepoints nest, so a component that opens
// one inside a caller's savepoint only commits into the outer scope.
class Savepoint {
public:
    Savepoint(sqlite3* db, const char* name);
    ~Savepoint();

    Savepoint(const Savepoint&) = delete;
    Savepoint& operator=(const Savepoint&) = delete;

    bool isActive() const { return m_active; }

    // RELEASE the savepoint. Returns false if it was never opened or the
    // release failed (in which case the destructor still rolls back).
    bool commit();

private:
    bool exec(const QByteArray& sql);

    sqlite3* m_db = nullptr;
    QByteArray m_name;
    bool m_active = false;
};

} // namespace af
