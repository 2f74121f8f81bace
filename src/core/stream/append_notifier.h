#pragma once

#include <condition_variable>
#include <cstdint>
#include <mutex>

namespace af {

// AppendNotifier wakes consumers blocked on an idle log. Shared by every
// EventLog handle open on the same database, since each thread uses its own
// connection and cannot observe another connection's appends directly.
class AppendNotifier {
public:
    AppendNotifier() = default;

    AppendNotifier(const AppendNotifier&) = delete;
    AppendNotifier& operator=(const AppendNotifier&) = delete;

    void notify();

    uint64_t generation() const;

    // Blocks until the generation moves past seenGeneration or timeoutMs
    // elapses. Returns true when woken by a notify().
    bool waitForAppend(uint64_t seenGeneration, int timeoutMs);

private:
    mutable std::mutex m_mutex;
    std::condition_variable m_cv;
    uint64_t m_generation = 0;
};

} // namespace af
