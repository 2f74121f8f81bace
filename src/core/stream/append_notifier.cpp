#include "core/stream/append_notifier.h"

#include <chrono>

namespace af {

void AppendNotifier::notify()
{
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        ++m_generation;
    }
    m_cv.notify_all();
}

uint64_t AppendNotifier::generation() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_generation;
}

bool AppendNotifier::waitForAppend(uint64_t seenGeneration, int timeoutMs)
{
    std::unique_lock<std::mutex> lock(m_mutex);
    return m_cv.wait_for(lock, std::chrono::milliseconds(timeoutMs), [&] {
        return m_generation != seenGeneration;
    });
}

} // namespace af
