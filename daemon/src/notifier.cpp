#include "bucketsync/daemon/notifier.hpp"

#include <cstdlib>
#include <iostream>
#include <stdexcept>

#include <sys/wait.h>

namespace bucketsync::daemon
{

    BellNotifier::BellNotifier(std::ostream &out) : out_(out) {}

    void BellNotifier::notify(const std::string & /*name*/)
    {
        out_ << '\a' << std::flush;
    }

    CommandNotifier::CommandNotifier(std::string command) : command_(std::move(command)) {}

    void CommandNotifier::notify(const std::string & /*name*/)
    {
        const int status = std::system(command_.c_str());
        if (status == -1)
        {
            throw std::runtime_error("Could not spawn notification command");
        }
        if (!WIFEXITED(status) || WEXITSTATUS(status) != 0)
        {
            throw std::runtime_error("Notification command '" + command_ + "' exited with status " +
                                     std::to_string(WIFEXITED(status) ? WEXITSTATUS(status) : status));
        }
    }

    std::unique_ptr<Notifier> make_notifier(const std::string &command)
    {
        if (command.empty())
        {
            return std::make_unique<BellNotifier>(std::cout);
        }
        return std::make_unique<CommandNotifier>(command);
    }

} // namespace bucketsync::daemon
