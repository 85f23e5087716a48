#include "bucketsync/daemon/config.hpp"

#include <algorithm>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>

#include "bucketsync/error_codes.hpp"

namespace bucketsync::daemon
{

    namespace
    {
        constexpr auto kDefaultConfigFile = "bucketsync.json";

        nlohmann::json read_json_file(const std::filesystem::path &path)
        {
            std::ifstream in(path);
            if (!in.is_open())
            {
                throw ConfigError("Cannot open configuration file " + path.string());
            }
            try
            {
                nlohmann::json json;
                in >> json;
                if (!json.is_object())
                {
                    throw ConfigError("Configuration file " + path.string() + " must hold a JSON object");
                }
                return json;
            }
            catch (const nlohmann::json::exception &ex)
            {
                throw ConfigError("Cannot parse " + path.string() + ": " + ex.what());
            }
        }

        std::string string_value(const nlohmann::json &json, const char *key, const std::string &fallback)
        {
            if (!json.contains(key))
            {
                return fallback;
            }
            const auto &value = json.at(key);
            if (!value.is_string())
            {
                throw ConfigError(std::string("Setting '") + key + "' must be a string");
            }
            return value.get<std::string>();
        }

        long long seconds_value(const nlohmann::json &json, const char *key, long long fallback)
        {
            if (!json.contains(key))
            {
                return fallback;
            }
            const auto &value = json.at(key);
            if (!value.is_number_integer() || value.get<long long>() < 0)
            {
                throw ConfigError(std::string("Setting '") + key + "' must be a non-negative integer");
            }
            if (value.get<long long>() > kMaxDurationSetting.count())
            {
                throw ConfigError(std::string("Setting '") + key + "' must not exceed " +
                                  std::to_string(kMaxDurationSetting.count()) + " seconds");
            }
            return value.get<long long>();
        }

        Backend parse_backend(const std::string &value)
        {
            if (value == "s3")
            {
                return Backend::S3;
            }
            if (value == "local")
            {
                return Backend::Local;
            }
            throw ConfigError("Unknown backend '" + value + "' (expected s3 or local)");
        }

        long long parse_seconds(const std::string &flag, const std::string &value)
        {
            std::size_t consumed = 0;
            long long parsed = 0;
            try
            {
                parsed = std::stoll(value, &consumed);
            }
            catch (const std::exception &)
            {
                throw ConfigError(flag + " expects a number of seconds, got '" + value + "'");
            }
            if (consumed != value.size() || parsed < 0)
            {
                throw ConfigError(flag + " expects a number of seconds, got '" + value + "'");
            }
            if (parsed > kMaxDurationSetting.count())
            {
                throw ConfigError(flag + " must not exceed " + std::to_string(kMaxDurationSetting.count()) +
                                  " seconds");
            }
            return parsed;
        }

        void apply_credentials(const nlohmann::json &json, DaemonConfig &config)
        {
            if (!json.contains("aws"))
            {
                return;
            }
            const auto &aws = json.at("aws");
            if (!aws.is_object())
            {
                throw ConfigError("Setting 'aws' must be an object");
            }
            config.access_key_id = string_value(aws, "access_key_id", config.access_key_id);
            config.secret_access_key = string_value(aws, "secret_access_key", config.secret_access_key);
        }

    } // namespace

    std::filesystem::path DaemonConfig::archive_dir() const
    {
        if (archive)
        {
            return *archive;
        }
        auto path = input;
        while (!path.empty() && !path.has_filename() && path.has_parent_path() && path != path.root_path())
        {
            path = path.parent_path();
        }
        path += "_archive";
        return path;
    }

    std::string DaemonConfig::resolved_endpoint() const
    {
        if (!endpoint.empty())
        {
            return endpoint;
        }
        return "https://s3." + region + ".amazonaws.com";
    }

    void load_config_file(const std::filesystem::path &path, DaemonConfig &config)
    {
        const auto json = read_json_file(path);

        config.upload_bucket = string_value(json, "upload_bucket", config.upload_bucket);
        config.download_bucket = string_value(json, "download_bucket", config.download_bucket);
        config.input = string_value(json, "input", config.input.string());
        if (json.contains("archive"))
        {
            config.archive = string_value(json, "archive", {});
        }
        config.output = string_value(json, "output", config.output.string());
        config.upload_history = string_value(json, "upload_history", config.upload_history.string());
        config.download_history = string_value(json, "download_history", config.download_history.string());

        const auto interval = seconds_value(
            json, "sleep_interval", std::chrono::duration_cast<std::chrono::seconds>(config.sleep_interval).count());
        config.sleep_interval = std::chrono::seconds{interval};
        config.transfer_timeout = std::chrono::seconds{
            seconds_value(json, "transfer_timeout", config.transfer_timeout.count())};

        if (json.contains("backend"))
        {
            config.backend = parse_backend(string_value(json, "backend", {}));
        }
        if (json.contains("local_root"))
        {
            config.local_root = string_value(json, "local_root", {});
        }
        if (json.contains("s3"))
        {
            const auto &s3 = json.at("s3");
            if (!s3.is_object())
            {
                throw ConfigError("Setting 's3' must be an object");
            }
            config.endpoint = string_value(s3, "endpoint", config.endpoint);
            config.region = string_value(s3, "region", config.region);
            // Bucket names may also live next to the endpoint.
            config.upload_bucket = string_value(s3, "input_bucket", config.upload_bucket);
            config.download_bucket = string_value(s3, "output_bucket", config.download_bucket);
        }
        apply_credentials(json, config);

        config.notify_command = string_value(json, "notify_command", config.notify_command);
        if (json.contains("show_progress"))
        {
            if (!json.at("show_progress").is_boolean())
            {
                throw ConfigError("Setting 'show_progress' must be a boolean");
            }
            config.show_progress = json.at("show_progress").get<bool>();
        }
        if (json.contains("log_file"))
        {
            config.log_file = string_value(json, "log_file", {});
        }
        config.log_level = string_value(json, "log_level", config.log_level);
    }

    void load_credentials_file(const std::filesystem::path &path, DaemonConfig &config)
    {
        apply_credentials(read_json_file(path), config);
    }

    void apply_environment(DaemonConfig &config)
    {
        if (const char *key = std::getenv("AWS_ACCESS_KEY_ID"); key && *key)
        {
            config.access_key_id = key;
        }
        if (const char *secret = std::getenv("AWS_SECRET_ACCESS_KEY"); secret && *secret)
        {
            config.secret_access_key = secret;
        }
        if (const char *region = std::getenv("AWS_REGION"); region && *region)
        {
            config.region = region;
        }
    }

    void validate(const DaemonConfig &config)
    {
        if (config.upload_bucket.empty())
        {
            throw ConfigError("Missing upload bucket (upload_bucket / --upload-bucket)");
        }
        if (config.download_bucket.empty())
        {
            throw ConfigError("Missing download bucket (download_bucket / --download-bucket)");
        }
        if (config.sleep_interval.count() <= 0 || config.sleep_interval > kMaxDurationSetting)
        {
            throw ConfigError("sleep_interval must be positive and at most one day");
        }
        if (config.transfer_timeout.count() < 0 || config.transfer_timeout > kMaxDurationSetting)
        {
            throw ConfigError("transfer_timeout must be between 0 and one day");
        }
        if (config.input.empty() || config.output.empty())
        {
            throw ConfigError("Input and output directories must be set");
        }
        if (config.upload_history == config.download_history)
        {
            throw ConfigError("Upload and download history must be different files");
        }
        if (config.backend == Backend::Local && !config.local_root)
        {
            throw ConfigError("The local backend requires local_root / --local-root");
        }
        if (config.backend == Backend::S3 && (config.access_key_id.empty() || config.secret_access_key.empty()))
        {
            throw ConfigError("S3 credentials missing: set aws.access_key_id and aws.secret_access_key "
                              "or AWS_ACCESS_KEY_ID and AWS_SECRET_ACCESS_KEY");
        }
        static const std::vector<std::string> kLevels{"trace", "debug", "info", "warn", "error", "critical", "off"};
        if (std::find(kLevels.begin(), kLevels.end(), config.log_level) == kLevels.end())
        {
            throw ConfigError("Unknown log level '" + config.log_level + "'");
        }
    }

    CommandLine parse_arguments(int argc, char *argv[])
    {
        CommandLine result;
        std::optional<std::filesystem::path> config_file;
        std::optional<std::filesystem::path> credentials_file;
        std::vector<std::pair<std::string, std::string>> overrides;

        static const std::vector<std::string> kValueFlags{
            "--upload-bucket", "--download-bucket", "--input", "--archive", "--output", "--upload-history",
            "--download-history", "--interval", "--transfer-timeout", "--backend", "--local-root", "--endpoint",
            "--region", "--notify-command", "--log", "--log-level"};

        int index = 1;
        while (index < argc)
        {
            const std::string arg = argv[index++];
            if (arg == "--help" || arg == "-h")
            {
                result.show_help = true;
            }
            else if (arg == "--version")
            {
                result.show_version = true;
            }
            else if (arg == "--no-progress")
            {
                overrides.emplace_back(arg, std::string{});
            }
            else if (arg == "--config" || arg == "--credentials")
            {
                if (index >= argc)
                {
                    throw ConfigError(arg + " requires a file path");
                }
                (arg == "--config" ? config_file : credentials_file) = std::filesystem::path(argv[index++]);
            }
            else if (std::find(kValueFlags.begin(), kValueFlags.end(), arg) != kValueFlags.end())
            {
                if (index >= argc)
                {
                    throw ConfigError(arg + " requires a value");
                }
                overrides.emplace_back(arg, argv[index++]);
            }
            else
            {
                throw ConfigError("Unknown argument: " + arg);
            }
        }

        if (result.show_help || result.show_version)
        {
            return result;
        }

        auto &config = result.config;
        if (config_file)
        {
            load_config_file(*config_file, config);
        }
        else if (std::filesystem::exists(kDefaultConfigFile))
        {
            load_config_file(kDefaultConfigFile, config);
        }
        if (credentials_file)
        {
            load_credentials_file(*credentials_file, config);
        }
        apply_environment(config);

        for (const auto &[flag, value] : overrides)
        {
            if (flag == "--upload-bucket")
                config.upload_bucket = value;
            else if (flag == "--download-bucket")
                config.download_bucket = value;
            else if (flag == "--input")
                config.input = value;
            else if (flag == "--archive")
                config.archive = std::filesystem::path(value);
            else if (flag == "--output")
                config.output = value;
            else if (flag == "--upload-history")
                config.upload_history = value;
            else if (flag == "--download-history")
                config.download_history = value;
            else if (flag == "--interval")
                config.sleep_interval = std::chrono::seconds{parse_seconds(flag, value)};
            else if (flag == "--transfer-timeout")
                config.transfer_timeout = std::chrono::seconds{parse_seconds(flag, value)};
            else if (flag == "--backend")
                config.backend = parse_backend(value);
            else if (flag == "--local-root")
                config.local_root = std::filesystem::path(value);
            else if (flag == "--endpoint")
                config.endpoint = value;
            else if (flag == "--region")
                config.region = value;
            else if (flag == "--notify-command")
                config.notify_command = value;
            else if (flag == "--no-progress")
                config.show_progress = false;
            else if (flag == "--log")
                config.log_file = std::filesystem::path(value);
            else if (flag == "--log-level")
                config.log_level = value;
        }

        validate(config);
        return result;
    }

    std::string usage(const char *program_name)
    {
        std::ostringstream out;
        out << "Usage: " << program_name << " [--config <file>] [--credentials <file>] [options]\n"
            << "  --upload-bucket <name>      bucket receiving files from the input directory\n"
            << "  --download-bucket <name>    bucket polled for new objects\n"
            << "  --input <dir>               input directory (default ./input)\n"
            << "  --archive <dir>             archive directory (default <input>_archive)\n"
            << "  --output <dir>              output directory (default ./output)\n"
            << "  --upload-history <file>     upload ledger (default upload_history.json)\n"
            << "  --download-history <file>   download ledger (default download_history.json)\n"
            << "  --interval <seconds>        polling interval (default 10)\n"
            << "  --transfer-timeout <secs>   per-transfer timeout, 0 disables (default 0)\n"
            << "  --backend <s3|local>        blob store backend (default s3)\n"
            << "  --local-root <dir>          root directory of the local backend\n"
            << "  --endpoint <url>            S3 endpoint (default https://s3.<region>.amazonaws.com)\n"
            << "  --region <region>           S3 region (default us-east-1)\n"
            << "  --notify-command <cmd>      command run after each download (default: terminal bell)\n"
            << "  --no-progress               do not print transfer progress\n"
            << "  --log <file>                also log to file\n"
            << "  --log-level <level>         trace, debug, info, warn, error (default info)\n"
            << "  --version                   print version\n"
            << "  -h, --help                  show this help\n";
        return out.str();
    }

} // namespace bucketsync::daemon
