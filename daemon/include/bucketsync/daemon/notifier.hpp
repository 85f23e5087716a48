#pragma once

#include <memory>
#include <ostream>
#include <string>

namespace bucketsync::daemon
{

    // Completion signal for the operator. Implementations may throw; callers
    // treat any failure as non-fatal.
    class Notifier
    {
    public:
        virtual ~Notifier() = default;
        virtual void notify(const std::string &name) = 0;
    };

    // Rings the terminal bell.
    class BellNotifier : public Notifier
    {
    public:
        explicit BellNotifier(std::ostream &out);
        void notify(const std::string &name) override;

    private:
        std::ostream &out_;
    };

    // Runs a shell command, e.g. "paplay /usr/share/sounds/notify.oga".
    class CommandNotifier : public Notifier
    {
    public:
        explicit CommandNotifier(std::string command);
        void notify(const std::string &name) override;

    private:
        std::string command_;
    };

    std::unique_ptr<Notifier> make_notifier(const std::string &command);

} // namespace bucketsync::daemon
