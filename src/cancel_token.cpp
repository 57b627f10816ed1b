#include "ost/cancel_token.hpp"

namespace ost {

void cancel_token::cancel()
{
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_cancelled) {
            return;
        }
        m_cancelled = true;
    }
    m_cv.notify_all();
}

bool cancel_token::cancelled() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_cancelled;
}

bool cancel_token::wait_until(clock::time_point deadline) const
{
    std::unique_lock<std::mutex> lock(m_mutex);
    return m_cv.wait_until(lock, deadline, [this] { return m_cancelled; });
}

} // namespace ost
