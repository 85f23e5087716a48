#pragma once

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <string>

#include "bucketsync/blob_store.hpp"
#include "bucketsync/daemon/cancellation.hpp"
#include "bucketsync/history_ledger.hpp"

namespace bucketsync::daemon
{

    struct UploadLoopSettings
    {
        std::filesystem::path input_dir;
        std::filesystem::path archive_dir;
        std::string bucket;
        std::chrono::milliseconds interval{std::chrono::seconds{10}};
        bool show_progress{true};
    };

    struct UploadReport
    {
        std::size_t uploaded{};
        std::size_t failed{};
        std::size_t skipped{};
    };

    // Replaces every space with an underscore.
    std::string normalize_filename(const std::string &name);

    // dir/name if free, otherwise dir/<stem>_<n><ext> with the smallest free n.
    std::filesystem::path unique_destination(const std::filesystem::path &dir, const std::string &name);

    /**
     * Moves files from the input directory to the upload bucket. Each file is
     * uploaded under its (space-normalized) filename, recorded in the ledger
     * and then moved to the archive directory. Files are processed one at a
     * time in lexical order; a failure only affects the file concerned, which
     * stays in the input directory and is retried on the next pass.
     */
    class UploadLoop
    {
    public:
        UploadLoop(UploadLoopSettings settings, BlobStore &store, HistoryLedger &ledger);

        UploadReport run_once();

        // Polls until the token is cancelled; the current pass always completes.
        void run(CancellationToken &token);

    private:
        bool process(std::filesystem::path file);
        void archive(const std::filesystem::path &file, const std::string &name);

        UploadLoopSettings settings_;
        BlobStore &store_;
        HistoryLedger &ledger_;
    };

} // namespace bucketsync::daemon
