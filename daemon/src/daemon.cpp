#include "bucketsync/daemon/daemon.hpp"

#include <csignal>
#include <stdexcept>

#include <spdlog/spdlog.h>

#include "bucketsync/local_blob_store.hpp"
#include "bucketsync/s3_blob_store.hpp"

namespace bucketsync::daemon
{

    std::string_view to_string(DaemonState state) noexcept
    {
        switch (state)
        {
        case DaemonState::Starting:
            return "starting";
        case DaemonState::Running:
            return "running";
        case DaemonState::Stopping:
            return "stopping";
        case DaemonState::Stopped:
            return "stopped";
        }
        return "unknown";
    }

    std::unique_ptr<BlobStore> make_blob_store(const DaemonConfig &config)
    {
        if (config.backend == Backend::Local)
        {
            spdlog::info("Using local blob store at {}", config.local_root->string());
            return std::make_unique<LocalBlobStore>(*config.local_root);
        }
        S3Options options{
            .endpoint = config.resolved_endpoint(),
            .credentials = {.access_key_id = config.access_key_id,
                            .secret_access_key = config.secret_access_key,
                            .region = config.region},
            .transfer_timeout = config.transfer_timeout,
        };
        spdlog::info("Using S3 endpoint {} ({})", options.endpoint, config.region);
        return std::make_unique<S3BlobStore>(std::move(options));
    }

    Daemon::Daemon(DaemonConfig config, std::unique_ptr<BlobStore> store, std::unique_ptr<Notifier> notifier)
        : config_(std::move(config)),
          store_(std::move(store)),
          notifier_(std::move(notifier)),
          signals_(io_context_)
    {
    }

    Daemon::~Daemon()
    {
        if (upload_thread_.joinable() || download_thread_.joinable())
        {
            request_stop();
            wait();
        }
    }

    void Daemon::start()
    {
        if (state() != DaemonState::Starting)
        {
            throw std::logic_error("Daemon already started");
        }
        try
        {
            prepare_directories();
            upload_ledger_ = std::make_unique<HistoryLedger>(config_.upload_history);
            download_ledger_ = std::make_unique<HistoryLedger>(config_.download_history);
            spdlog::info("Loaded {} upload and {} download history entries", upload_ledger_->size(),
                         download_ledger_->size());

            upload_loop_ = std::make_unique<UploadLoop>(
                UploadLoopSettings{.input_dir = config_.input,
                                   .archive_dir = config_.archive_dir(),
                                   .bucket = config_.upload_bucket,
                                   .interval = config_.sleep_interval,
                                   .show_progress = config_.show_progress},
                *store_, *upload_ledger_);
            download_loop_ = std::make_unique<DownloadLoop>(
                DownloadLoopSettings{.output_dir = config_.output,
                                     .bucket = config_.download_bucket,
                                     .interval = config_.sleep_interval,
                                     .show_progress = config_.show_progress},
                *store_, *download_ledger_, *notifier_);
        }
        catch (...)
        {
            state_.store(DaemonState::Stopped, std::memory_order_release);
            throw;
        }

        state_.store(DaemonState::Running, std::memory_order_release);
        upload_thread_ = std::thread([this]
                                     { upload_loop_->run(token_); });
        download_thread_ = std::thread([this]
                                       { download_loop_->run(token_); });
        spdlog::info("Sync loops running, polling every {}s",
                     std::chrono::duration_cast<std::chrono::seconds>(config_.sleep_interval).count());
    }

    void Daemon::request_stop() noexcept
    {
        auto expected = DaemonState::Running;
        if (state_.compare_exchange_strong(expected, DaemonState::Stopping, std::memory_order_acq_rel))
        {
            spdlog::info("Stopping, waiting for current transfers to finish");
        }
        token_.request_stop();
        io_context_.stop();
    }

    void Daemon::wait()
    {
        if (upload_thread_.joinable())
        {
            upload_thread_.join();
        }
        if (download_thread_.joinable())
        {
            download_thread_.join();
        }
        state_.store(DaemonState::Stopped, std::memory_order_release);
        spdlog::info("Stopped");
    }

    void Daemon::run()
    {
        start();

        signals_.add(SIGINT);
        signals_.add(SIGTERM);
        signals_.async_wait([this](const std::error_code &ec, int signal)
                            {
        if (!ec) {
            spdlog::info("Received signal {}", signal);
            request_stop();
        } });

        // Returns once a signal arrived or request_stop() stopped the context.
        if (!token_.stop_requested())
        {
            io_context_.run();
        }
        wait();
    }

    void Daemon::prepare_directories() const
    {
        for (const auto &dir : {config_.input, config_.archive_dir(), config_.output})
        {
            if (!std::filesystem::exists(dir))
            {
                spdlog::info("Creating directory {}", dir.string());
            }
            std::filesystem::create_directories(dir);
            if (!std::filesystem::is_directory(dir))
            {
                throw std::runtime_error(dir.string() + " exists but is not a directory");
            }
        }
    }

} // namespace bucketsync::daemon
