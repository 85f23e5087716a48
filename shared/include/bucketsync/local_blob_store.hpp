#pragma once

#include <filesystem>
#include <string>
#include <vector>

#include "bucketsync/blob_store.hpp"

namespace bucketsync
{

    // Blob store backed by a local directory: <root>/<bucket>/<key>.
    // Uploads are staged under <root>/.staging/<bucket>/<key> until complete.
    class LocalBlobStore : public BlobStore
    {
    public:
        explicit LocalBlobStore(std::filesystem::path root);

        void upload(const std::filesystem::path &local_path, const std::string &bucket, const std::string &key,
                    const ProgressCallback &progress) override;

        void download(const std::string &bucket, const std::string &key, const std::filesystem::path &local_path,
                      const ProgressCallback &progress) override;

        std::vector<std::string> list_keys(const std::string &bucket) override;

    private:
        std::filesystem::path bucket_path(const std::string &bucket) const;

        std::filesystem::path root_;
    };

} // namespace bucketsync
