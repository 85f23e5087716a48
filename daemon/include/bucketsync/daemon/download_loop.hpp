#pragma once

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <string>

#include "bucketsync/blob_store.hpp"
#include "bucketsync/daemon/cancellation.hpp"
#include "bucketsync/daemon/notifier.hpp"
#include "bucketsync/history_ledger.hpp"

namespace bucketsync::daemon
{

    struct DownloadLoopSettings
    {
        std::filesystem::path output_dir;
        std::string bucket;
        std::chrono::milliseconds interval{std::chrono::seconds{10}};
        bool show_progress{true};
    };

    struct DownloadReport
    {
        std::size_t downloaded{};
        std::size_t failed{};
        std::size_t skipped{};
        bool listing_failed{};
    };

    // Fetches every remote key missing from the ledger into the output directory.
    class DownloadLoop
    {
    public:
        DownloadLoop(DownloadLoopSettings settings, BlobStore &store, HistoryLedger &ledger, Notifier &notifier);

        DownloadReport run_once();

        void run(CancellationToken &token);

    private:
        void process(const std::string &key);

        DownloadLoopSettings settings_;
        BlobStore &store_;
        HistoryLedger &ledger_;
        Notifier &notifier_;
    };

} // namespace bucketsync::daemon
