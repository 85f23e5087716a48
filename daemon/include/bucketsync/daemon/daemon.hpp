#pragma once

#include <asio/io_context.hpp>
#include <asio/signal_set.hpp>

#include <atomic>
#include <memory>
#include <string_view>
#include <thread>

#include "bucketsync/blob_store.hpp"
#include "bucketsync/daemon/cancellation.hpp"
#include "bucketsync/daemon/config.hpp"
#include "bucketsync/daemon/download_loop.hpp"
#include "bucketsync/daemon/notifier.hpp"
#include "bucketsync/daemon/upload_loop.hpp"
#include "bucketsync/history_ledger.hpp"

namespace bucketsync::daemon
{

    enum class DaemonState
    {
        Starting,
        Running,
        Stopping,
        Stopped
    };

    std::string_view to_string(DaemonState state) noexcept;

    std::unique_ptr<BlobStore> make_blob_store(const DaemonConfig &config);

    /**
     * Lifecycle controller: prepares directories and ledgers, runs the upload
     * and download loops on their own threads and stops them cooperatively.
     */
    class Daemon
    {
    public:
        Daemon(DaemonConfig config, std::unique_ptr<BlobStore> store, std::unique_ptr<Notifier> notifier);
        ~Daemon();

        Daemon(const Daemon &) = delete;
        Daemon &operator=(const Daemon &) = delete;

        // Starting -> Running. Throws (and ends in Stopped) if directories or
        // ledgers cannot be prepared.
        void start();

        // Safe from any thread, including signal handlers run by asio.
        void request_stop() noexcept;

        // Joins both loops; ends in Stopped.
        void wait();

        // start(), block until SIGINT/SIGTERM or request_stop(), then wait().
        void run();

        DaemonState state() const noexcept { return state_.load(std::memory_order_acquire); }

        const HistoryLedger *upload_ledger() const noexcept { return upload_ledger_.get(); }
        const HistoryLedger *download_ledger() const noexcept { return download_ledger_.get(); }

    private:
        void prepare_directories() const;

        DaemonConfig config_;
        std::unique_ptr<BlobStore> store_;
        std::unique_ptr<Notifier> notifier_;

        std::unique_ptr<HistoryLedger> upload_ledger_;
        std::unique_ptr<HistoryLedger> download_ledger_;
        std::unique_ptr<UploadLoop> upload_loop_;
        std::unique_ptr<DownloadLoop> download_loop_;

        CancellationToken token_;
        std::atomic<DaemonState> state_{DaemonState::Starting};

        asio::io_context io_context_;
        asio::signal_set signals_;

        std::thread upload_thread_;
        std::thread download_thread_;
    };

} // namespace bucketsync::daemon
