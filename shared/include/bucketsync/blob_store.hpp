/**
 * BucketSync - Remote object store abstraction consumed by the sync loops.
 */
#pragma once

#include <cstdint>
#include <filesystem>
#include <functional>
#include <string>
#include <vector>

namespace bucketsync
{

    // Invoked with (bytes transferred so far, total bytes or 0 if unknown).
    using ProgressCallback = std::function<void(std::uint64_t, std::uint64_t)>;

    /**
     * put/get/list over named buckets. Every failure is reported as a
     * TransferError; implementations never return partial success.
     */
    class BlobStore
    {
    public:
        virtual ~BlobStore() = default;

        virtual void upload(const std::filesystem::path &local_path, const std::string &bucket,
                            const std::string &key, const ProgressCallback &progress) = 0;

        virtual void download(const std::string &bucket, const std::string &key,
                              const std::filesystem::path &local_path, const ProgressCallback &progress) = 0;

        // An empty bucket yields an empty list, not an error.
        virtual std::vector<std::string> list_keys(const std::string &bucket) = 0;
    };

    // Maps an object key onto a path below base. Rejects empty keys, keys
    // ending in '/', absolute keys and any ".." component with
    // TransferError(InvalidKey).
    std::filesystem::path resolve_key(const std::filesystem::path &base, const std::string &key);

} // namespace bucketsync
