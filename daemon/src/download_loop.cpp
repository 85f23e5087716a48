#include "bucketsync/daemon/download_loop.hpp"

#include <iostream>
#include <system_error>
#include <vector>

#include <spdlog/spdlog.h>

#include "bucketsync/daemon/progress.hpp"

namespace bucketsync::daemon
{

    DownloadLoop::DownloadLoop(DownloadLoopSettings settings, BlobStore &store, HistoryLedger &ledger,
                               Notifier &notifier)
        : settings_(std::move(settings)), store_(store), ledger_(ledger), notifier_(notifier)
    {
    }

    DownloadReport DownloadLoop::run_once()
    {
        DownloadReport report;

        std::vector<std::string> keys;
        try
        {
            keys = store_.list_keys(settings_.bucket);
        }
        catch (const std::exception &ex)
        {
            report.listing_failed = true;
            spdlog::error("Cannot list bucket {}: {}", settings_.bucket, ex.what());
            return report;
        }

        for (const auto &key : keys)
        {
            if (ledger_.contains(key))
            {
                ++report.skipped;
                continue;
            }
            try
            {
                process(key);
                ++report.downloaded;
            }
            catch (const std::exception &ex)
            {
                ++report.failed;
                spdlog::error("Download of {} failed, will retry: {}", key, ex.what());
            }
        }

        if (report.downloaded > 0 || report.failed > 0)
        {
            spdlog::info("Download pass finished: {} downloaded, {} failed", report.downloaded, report.failed);
        }
        return report;
    }

    void DownloadLoop::run(CancellationToken &token)
    {
        spdlog::info("Polling bucket {} for downloads into {}", settings_.bucket, settings_.output_dir.string());
        while (!token.stop_requested())
        {
            try
            {
                run_once();
            }
            catch (const std::exception &ex)
            {
                spdlog::error("Download pass aborted: {}", ex.what());
            }
            if (!token.sleep_for(settings_.interval))
            {
                break;
            }
        }
        spdlog::info("Download loop stopped");
    }

    void DownloadLoop::process(const std::string &key)
    {
        const auto target = resolve_key(settings_.output_dir, key);
        std::filesystem::create_directories(target.parent_path());

        auto part_path = target;
        part_path += ".part";

        spdlog::info("Downloading {} from {}", key, settings_.bucket);
        ProgressCallback progress;
        if (settings_.show_progress)
        {
            progress = console_progress(std::cout, "Downloading", key);
        }
        try
        {
            store_.download(settings_.bucket, key, part_path, progress);
            std::filesystem::rename(part_path, target);
        }
        catch (...)
        {
            std::error_code ec;
            std::filesystem::remove(part_path, ec);
            throw;
        }

        try
        {
            notifier_.notify(key);
        }
        catch (const std::exception &ex)
        {
            spdlog::warn("Notification for {} failed: {}", key, ex.what());
        }

        ledger_.record(key);
        spdlog::info("Downloaded {} to {}", key, target.string());
    }

} // namespace bucketsync::daemon
