#pragma once

#include <QString>
#include <QStringList>

#include <optional>
#include <vector>

struct sqlite3;

namespace af {

struct MemoryItem {
    QString memoryId;
    QString userId;
    QString key;
    QString value;
    QString status;          // "active" or "superseded"
    QString supersededBy;
    qint64 createdAtMs = 0;
    qint64 updatedAtMs = 0;

    bool isActive() const { return status == QLatin1String("active"); }
};

// MemoryStore -- long-term key/value facts per user (job title, tech stack).
// Several active items may share a key until hygiene supersedes the older
// ones; superseded items are kept, never deleted.
class MemoryStore {
public:
    explicit MemoryStore(sqlite3* db);

    // Returns the new memory id.
    std::optional<QString> add(const QString& userId, const QString& key, const QString& value,
                               qint64 nowMs);

    std::optional<MemoryItem> item(const QString& memoryId) const;

    // Newest first. An empty key lists every key.
    std::vector<MemoryItem> items(const QString& userId, const QString& key = QString(),
                                  bool activeOnly = true) const;

    // Keys with more than one active item.
    QStringList duplicatedKeys(const QString& userId) const;
    QStringList users() const;

    // Marks the given item superseded by supersededBy. Returns false if the
    // item was not active.
    bool markSuperseded(const QString& memoryId, const QString& supersededBy, qint64 nowMs);

private:
    sqlite3* m_db = nullptr;
};

} // namespace af
