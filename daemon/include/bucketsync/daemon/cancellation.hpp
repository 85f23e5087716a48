#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>

namespace bucketsync::daemon
{

    // Cooperative stop flag shared by the controller and both loops.
    class CancellationToken
    {
    public:
        void request_stop() noexcept;

        bool stop_requested() const noexcept
        {
            return stopped_.load(std::memory_order_acquire);
        }

        // Sleeps up to duration. Returns false if stop was requested before or
        // during the wait.
        bool sleep_for(std::chrono::milliseconds duration);

    private:
        std::atomic<bool> stopped_{false};
        std::mutex mutex_;
        std::condition_variable cv_;
    };

} // namespace bucketsync::daemon
