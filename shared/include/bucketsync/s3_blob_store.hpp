#pragma once

#include <chrono>
#include <filesystem>
#include <map>
#include <string>
#include <vector>

#include "bucketsync/blob_store.hpp"
#include "bucketsync/s3_signing.hpp"

namespace bucketsync
{

    struct S3Options
    {
        std::string endpoint;  // e.g. https://s3.eu-west-1.amazonaws.com, path-style addressing
        s3::Credentials credentials;
        std::chrono::seconds transfer_timeout{0}; // 0 disables the per-request timeout
    };

    // S3-compatible blob store speaking the REST API through libcurl.
    class S3BlobStore : public BlobStore
    {
    public:
        explicit S3BlobStore(S3Options options);

        void upload(const std::filesystem::path &local_path, const std::string &bucket, const std::string &key,
                    const ProgressCallback &progress) override;

        void download(const std::string &bucket, const std::string &key, const std::filesystem::path &local_path,
                      const ProgressCallback &progress) override;

        std::vector<std::string> list_keys(const std::string &bucket) override;

        // Extracts keys and the continuation token from one ListObjectsV2 page.
        static std::vector<std::string> parse_list_page(const std::string &xml, std::string &next_token);

    private:
        std::map<std::string, std::string> signed_headers(const std::string &method, const std::string &canonical_uri,
                                                          const std::map<std::string, std::string> &query,
                                                          const std::string &payload_hash) const;

        S3Options options_;
        std::string host_;
    };

} // namespace bucketsync
