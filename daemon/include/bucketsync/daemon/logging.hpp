#pragma once

#include <filesystem>
#include <optional>
#include <string>

namespace bucketsync::daemon
{

    // Installs the default spdlog logger: colored stdout plus an optional file.
    void configure_logging(const std::optional<std::filesystem::path> &log_file, const std::string &level);

} // namespace bucketsync::daemon
