#pragma once

#include <chrono>
#include <condition_variable>
#include <mutex>

namespace ost {

// One-shot cancellation flag. Every wait on it wakes as soon as cancel() is
// called, so a skip never has to sit out a whole sleep.
class cancel_token {
public:
    using clock = std::chrono::steady_clock;

    cancel_token() = default;
    cancel_token(const cancel_token&) = delete;
    cancel_token& operator=(const cancel_token&) = delete;

    void cancel();
    bool cancelled() const;

    // Returns true if the token was cancelled before the deadline.
    bool wait_until(clock::time_point deadline) const;

    template <typename Rep, typename Period>
    bool wait_for(const std::chrono::duration<Rep, Period>& timeout) const
    {
        return wait_until(clock::now() + std::chrono::duration_cast<clock::duration>(timeout));
    }

private:
    mutable std::mutex              m_mutex;
    mutable std::condition_variable m_cv;
    bool                            m_cancelled = false;
};

} // namespace ost
