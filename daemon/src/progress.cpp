#include "bucketsync/daemon/progress.hpp"

#include <memory>
#include <mutex>

namespace bucketsync::daemon
{

    namespace
    {
        std::mutex &console_mutex()
        {
            static std::mutex mutex;
            return mutex;
        }

        struct ProgressState
        {
            int last_percent{-1};
            bool finished{false};
        };
    } // namespace

    ProgressCallback console_progress(std::ostream &out, std::string verb, std::string name)
    {
        auto state = std::make_shared<ProgressState>();
        return [&out, verb = std::move(verb), name = std::move(name), state](std::uint64_t done, std::uint64_t total)
        {
            if (state->finished || total == 0)
            {
                return;
            }
            const auto percent = static_cast<int>(done * 100 / total);
            if (percent == state->last_percent)
            {
                return;
            }
            state->last_percent = percent;
            std::lock_guard lock(console_mutex());
            out << "\r" << verb << " " << name << ": " << done << " / " << total << " bytes (" << percent << "%)";
            if (done >= total)
            {
                state->finished = true;
                out << std::endl;
            }
            else
            {
                out << std::flush;
            }
        };
    }

} // namespace bucketsync::daemon
