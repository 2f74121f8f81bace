#include "core/memory/memory_hygiene.h"
#include "core/learning/policy_pattern_index.h"
#include "core/memory/memory_store.h"
#include "core/shared/logging.h"

#include <QSet>

#include <algorithm>

namespace af {

QJsonObject MemoryHygiene::CycleReport::toJson() const
{
    QJsonObject json;
    json[QStringLiteral("usersVisited")] = usersVisited;
    json[QStringLiteral("memoriesSuperseded")] = memoriesSuperseded;
    json[QStringLiteral("patternsDecayed")] = patternsDecayed;
    json[QStringLiteral("patternsPruned")] = patternsPruned;
    return json;
}

MemoryHygiene::MemoryHygiene(MemoryStore* memories, PolicyPatternIndex* patterns, Options options)
    : m_memories(memories)
    , m_patterns(patterns)
    , m_options(options)
{
}

QStringList MemoryHygiene::supersedeMemory(const QString& userId, const QString& key,
                                           const QString& newMemoryId, qint64 nowMs)
{
    QStringList superseded;
    if (!m_memories) {
        return superseded;
    }

    for (const MemoryItem& item : m_memories->items(userId, key, true)) {
        if (item.memoryId == newMemoryId) {
            continue;
        }
        if (m_memories->markSuperseded(item.memoryId, newMemoryId, nowMs)) {
            superseded.append(item.memoryId);
        }
    }

    if (!superseded.isEmpty()) {
        LOG_INFO(afCore, "Superseded %lld old memories for key '%s'",
                 static_cast<long long>(superseded.size()), qUtf8Printable(key));
    }
    return superseded;
}

std::map<QString, int> MemoryHygiene::decayUnusedPatterns(const QString& userId, qint64 nowMs)
{
    if (!m_patterns) {
        return {};
    }
    const qint64 cutoff = nowMs - static_cast<qint64>(m_options.decayUnusedDays) * 24 * 60 * 60 * 1000;
    return m_patterns->decayUnused(userId, m_options.decayFactor, cutoff);
}

int MemoryHygiene::decaySpecificDomain(const QString& userId, const QString& domain)
{
    return decaySpecificDomain(userId, domain, m_options.decayFactor);
}

int MemoryHygiene::decaySpecificDomain(const QString& userId, const QString& domain, double factor)
{
    if (!m_patterns) {
        return 0;
    }
    return std::max(0, m_patterns->decayDomain(userId, domain, factor));
}

MemoryHygiene::CycleReport MemoryHygiene::runCycle(qint64 nowMs)
{
    CycleReport report;

    QSet<QString> users;
    if (m_memories) {
        for (const QString& user : m_memories->users()) {
            users.insert(user);
        }
    }
    if (m_patterns) {
        for (const QString& user : m_patterns->users()) {
            users.insert(user);
        }
    }

    for (const QString& userId : users) {
        ++report.usersVisited;

        if (m_memories) {
            for (const QString& key : m_memories->duplicatedKeys(userId)) {
                const std::vector<MemoryItem> active = m_memories->items(userId, key, true);
                if (active.empty()) {
                    continue;
                }
                // items() is newest first.
                report.memoriesSuperseded +=
                    static_cast<int>(supersedeMemory(userId, key, active.front().memoryId, nowMs).size());
            }
        }

        for (const auto& entry : decayUnusedPatterns(userId, nowMs)) {
            report.patternsDecayed += entry.second;
        }
    }

    if (m_patterns) {
        report.patternsPruned = std::max(0, m_patterns->pruneBelow(m_options.patternScoreFloor));
    }

    LOG_INFO(afCore, "Hygiene cycle: users=%d superseded=%d decayed=%d pruned=%d",
             report.usersVisited, report.memoriesSuperseded,
             report.patternsDecayed, report.patternsPruned);
    return report;
}

} // namespace af
