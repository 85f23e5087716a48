#pragma once

#include <chrono>
#include <filesystem>
#include <optional>
#include <string>

namespace bucketsync::daemon
{

    enum class Backend
    {
        S3,
        Local
    };

    // Upper bound for sleep_interval and transfer_timeout.
    inline constexpr std::chrono::seconds kMaxDurationSetting{std::chrono::hours{24}};

    struct DaemonConfig
    {
        std::string upload_bucket;
        std::string download_bucket;

        std::filesystem::path input{"input"};
        std::optional<std::filesystem::path> archive; // defaults to "<input>_archive"
        std::filesystem::path output{"output"};
        std::filesystem::path upload_history{"upload_history.json"};
        std::filesystem::path download_history{"download_history.json"};

        std::chrono::milliseconds sleep_interval{std::chrono::seconds{10}};
        std::chrono::seconds transfer_timeout{0};

        Backend backend{Backend::S3};
        std::optional<std::filesystem::path> local_root;
        std::string endpoint; // empty: https://s3.<region>.amazonaws.com
        std::string region{"us-east-1"};
        std::string access_key_id;
        std::string secret_access_key;

        std::string notify_command;
        bool show_progress{true};
        std::optional<std::filesystem::path> log_file;
        std::string log_level{"info"};

        std::filesystem::path archive_dir() const;
        std::string resolved_endpoint() const;
    };

    struct CommandLine
    {
        DaemonConfig config;
        bool show_help{};
        bool show_version{};
    };

    // Layers defaults, config file, credentials file, environment and flags.
    // Throws ConfigError on any invalid or missing setting.
    CommandLine parse_arguments(int argc, char *argv[]);

    // Merges a JSON config file into config. Missing keys keep their value.
    void load_config_file(const std::filesystem::path &path, DaemonConfig &config);

    // Reads {"aws": {"access_key_id": ..., "secret_access_key": ...}}.
    void load_credentials_file(const std::filesystem::path &path, DaemonConfig &config);

    void apply_environment(DaemonConfig &config);

    void validate(const DaemonConfig &config);

    std::string usage(const char *program_name);

} // namespace bucketsync::daemon
