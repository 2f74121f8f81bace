#pragma once

#include <QString>
#include <QStringList>

#include <optional>
#include <vector>

struct sqlite3;

namespace af {

struct StrategyDefinition {
    QString strategy;
    QString instruction;
};

// StrategyCatalog -- the versioned strategy table the bandit selects over.
// Each version is a complete, ordered set; publishing writes a new version
// and makes it current. The order of strategies() is the bandit's
// tie-breaking order.
class StrategyCatalog {
public:
    explicit StrategyCatalog(sqlite3* db);

    int version() const;

    // Active strategies of the current version, in ordinal order.
    std::vector<StrategyDefinition> definitions() const;
    QStringList strategies() const;

    std::optional<QString> instruction(const QString& strategy) const;
    bool contains(const QString& strategy) const;

    // Writes definitions as version()+1 and makes it current.
    bool publish(const std::vector<StrategyDefinition>& definitions, QString* errorOut = nullptr);

private:
    sqlite3* m_db = nullptr;
};

} // namespace af
