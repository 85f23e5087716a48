#include "bucketsync/daemon/cancellation.hpp"

namespace bucketsync::daemon
{

    void CancellationToken::request_stop() noexcept
    {
        {
            std::lock_guard lock(mutex_);
            stopped_.store(true, std::memory_order_release);
        }
        cv_.notify_all();
    }

    bool CancellationToken::sleep_for(std::chrono::milliseconds duration)
    {
        std::unique_lock lock(mutex_);
        return !cv_.wait_for(lock, duration, [this]
                             { return stopped_.load(std::memory_order_acquire); });
    }

} // namespace bucketsync::daemon
