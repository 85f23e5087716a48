#include "bucketsync/daemon/logging.hpp"

#include <memory>
#include <vector>

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace bucketsync::daemon
{

    void configure_logging(const std::optional<std::filesystem::path> &log_file, const std::string &level)
    {
        std::vector<spdlog::sink_ptr> sinks;
        sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
        if (log_file)
        {
            sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(log_file->string(), false));
        }
        auto logger = std::make_shared<spdlog::logger>("bucketsync", sinks.begin(), sinks.end());
        logger->set_level(spdlog::level::from_str(level));
        logger->set_pattern("%Y-%m-%d %H:%M:%S [%^%l%$] %v");
        logger->flush_on(spdlog::level::warn);
        spdlog::set_default_logger(logger);
    }

} // namespace bucketsync::daemon
