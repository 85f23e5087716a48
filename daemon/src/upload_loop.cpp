#include "bucketsync/daemon/upload_loop.hpp"

#include <algorithm>
#include <iostream>
#include <system_error>
#include <vector>

#include <spdlog/spdlog.h>

#include "bucketsync/daemon/progress.hpp"

namespace bucketsync::daemon
{

    std::string normalize_filename(const std::string &name)
    {
        std::string normalized = name;
        std::replace(normalized.begin(), normalized.end(), ' ', '_');
        return normalized;
    }

    std::filesystem::path unique_destination(const std::filesystem::path &dir, const std::string &name)
    {
        auto candidate = dir / name;
        if (!std::filesystem::exists(candidate))
        {
            return candidate;
        }
        const std::filesystem::path original(name);
        const auto stem = original.stem().string();
        const auto extension = original.extension().string();
        for (std::size_t n = 1;; ++n)
        {
            candidate = dir / (stem + "_" + std::to_string(n) + extension);
            if (!std::filesystem::exists(candidate))
            {
                return candidate;
            }
        }
    }

    UploadLoop::UploadLoop(UploadLoopSettings settings, BlobStore &store, HistoryLedger &ledger)
        : settings_(std::move(settings)), store_(store), ledger_(ledger)
    {
    }

    UploadReport UploadLoop::run_once()
    {
        UploadReport report;

        std::vector<std::filesystem::path> candidates;
        std::error_code ec;
        for (std::filesystem::directory_iterator it(settings_.input_dir, ec), end; !ec && it != end; it.increment(ec))
        {
            if (!it->is_regular_file())
            {
                spdlog::debug("Ignoring {}: not a regular file", it->path().string());
                continue;
            }
            candidates.push_back(it->path());
        }
        if (ec)
        {
            spdlog::error("Cannot scan input directory {}: {}", settings_.input_dir.string(), ec.message());
            return report;
        }

        std::sort(candidates.begin(), candidates.end(), [](const auto &lhs, const auto &rhs)
                  { return lhs.filename() < rhs.filename(); });

        for (const auto &file : candidates)
        {
            try
            {
                if (process(file))
                {
                    ++report.uploaded;
                }
                else
                {
                    ++report.skipped;
                }
            }
            catch (const std::exception &ex)
            {
                ++report.failed;
                spdlog::error("Upload of {} failed, will retry: {}", file.filename().string(), ex.what());
            }
        }

        if (report.uploaded > 0 || report.failed > 0)
        {
            spdlog::info("Upload pass finished: {} uploaded, {} failed, {} skipped", report.uploaded, report.failed,
                         report.skipped);
        }
        return report;
    }

    void UploadLoop::run(CancellationToken &token)
    {
        spdlog::info("Watching {} for uploads to bucket {}", settings_.input_dir.string(), settings_.bucket);
        while (!token.stop_requested())
        {
            try
            {
                run_once();
            }
            catch (const std::exception &ex)
            {
                spdlog::error("Upload pass aborted: {}", ex.what());
            }
            if (!token.sleep_for(settings_.interval))
            {
                break;
            }
        }
        spdlog::info("Upload loop stopped");
    }

    bool UploadLoop::process(std::filesystem::path file)
    {
        auto name = file.filename().string();
        const auto normalized = normalize_filename(name);
        if (normalized != name)
        {
            const auto renamed = file.parent_path() / normalized;
            if (std::filesystem::exists(renamed))
            {
                spdlog::warn("Cannot rename {} to {}: target already exists", name, normalized);
                return false;
            }
            std::filesystem::rename(file, renamed);
            spdlog::info("Renamed {} to {}", name, normalized);
            file = renamed;
            name = normalized;
        }

        spdlog::info("Uploading {} to {}", name, settings_.bucket);
        ProgressCallback progress;
        if (settings_.show_progress)
        {
            progress = console_progress(std::cout, "Uploading", name);
        }
        store_.upload(file, settings_.bucket, name, progress);

        if (!ledger_.record(name))
        {
            spdlog::debug("{} already present in {}", name, ledger_.path().string());
        }
        archive(file, name);
        return true;
    }

    void UploadLoop::archive(const std::filesystem::path &file, const std::string &name)
    {
        const auto destination = unique_destination(settings_.archive_dir, name);
        if (destination.filename() != name)
        {
            spdlog::warn("{} already exists in {}, archiving as {}", name, settings_.archive_dir.string(),
                         destination.filename().string());
        }

        std::error_code ec;
        std::filesystem::rename(file, destination, ec);
        if (ec == std::errc::cross_device_link)
        {
            std::filesystem::copy_file(file, destination);
            std::filesystem::remove(file);
        }
        else if (ec)
        {
            throw std::filesystem::filesystem_error("Cannot archive uploaded file", file, destination, ec);
        }
        spdlog::debug("Archived {} to {}", name, destination.string());
    }

} // namespace bucketsync::daemon
