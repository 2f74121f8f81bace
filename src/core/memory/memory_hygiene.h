#pragma once

#include <QJsonObject>
#include <QString>
#include <QStringList>

#include <map>

namespace af {

class MemoryStore;
class PolicyPatternIndex;

// MemoryHygiene -- periodic maintenance over long-term memory and the policy
// pattern index. Decay multiplies scores down; superseding flips older
// memories with the same key to inactive. Nothing here deletes memories.
class MemoryHygiene {
public:
    struct Options {
        double decayFactor = 0.8;
        int decayUnusedDays = 14;
        double patternScoreFloor = 0.01;
    };

    struct CycleReport {
        int usersVisited = 0;
        int memoriesSuperseded = 0;
        int patternsDecayed = 0;
        int patternsPruned = 0;

        QJsonObject toJson() const;
    };

    MemoryHygiene(MemoryStore* memories, PolicyPatternIndex* patterns, Options options);

    // Marks every other active memory of (user, key) superseded by newMemoryId.
    // Returns the ids that changed.
    QStringList supersedeMemory(const QString& userId, const QString& key,
                                const QString& newMemoryId, qint64 nowMs);

    // Decays patterns not served in the last decayUnusedDays. Per-domain counts.
    std::map<QString, int> decayUnusedPatterns(const QString& userId, qint64 nowMs);

    int decaySpecificDomain(const QString& userId, const QString& domain);
    int decaySpecificDomain(const QString& userId, const QString& domain, double factor);

    // Full pass over every known user: supersede duplicated keys (newest
    // wins), decay unused patterns, prune patterns at or below the floor.
    CycleReport runCycle(qint64 nowMs);

    const Options& options() const { return m_options; }

private:
    MemoryStore* m_memories = nullptr;
    PolicyPatternIndex* m_patterns = nullptr;
    Options m_options;
};

} // namespace af
