#include "bucketsync/local_blob_store.hpp"

#include <algorithm>
#include <fstream>
#include <system_error>

#include "bucketsync/error_codes.hpp"

namespace bucketsync
{

    namespace
    {
        constexpr std::size_t kChunkSize = 64 * 1024;
        constexpr auto kPartSuffix = ".part";
        // Bucket names never start with '.', so staged uploads cannot show up as keys.
        constexpr auto kStagingDir = ".staging";

        ErrorCode classify(const std::error_code &ec)
        {
            if (ec == std::errc::no_such_file_or_directory)
            {
                return ErrorCode::NotFound;
            }
            if (ec == std::errc::permission_denied || ec == std::errc::operation_not_permitted)
            {
                return ErrorCode::PermissionDenied;
            }
            return ErrorCode::FileIo;
        }

        // Streams source into temp_path and renames it to destination on success.
        void copy_with_progress(const std::filesystem::path &source, const std::filesystem::path &destination,
                                const std::filesystem::path &temp_path, const ProgressCallback &progress)
        {
            std::error_code ec;
            const auto total = std::filesystem::file_size(source, ec);
            if (ec)
            {
                throw TransferError(classify(ec), "Cannot stat " + source.string() + ": " + ec.message());
            }

            std::ifstream in(source, std::ios::binary);
            if (!in.is_open())
            {
                throw TransferError(ErrorCode::FileIo, "Cannot open " + source.string());
            }

            for (const auto &path : {destination, temp_path})
            {
                if (!path.has_parent_path())
                {
                    continue;
                }
                std::filesystem::create_directories(path.parent_path(), ec);
                if (ec)
                {
                    throw TransferError(classify(ec), "Cannot create " + path.parent_path().string() + ": " +
                                                          ec.message());
                }
            }

            std::ofstream out(temp_path, std::ios::binary | std::ios::trunc);
            if (!out.is_open())
            {
                throw TransferError(ErrorCode::FileIo, "Cannot write " + temp_path.string());
            }

            std::vector<char> buffer(kChunkSize);
            std::uint64_t copied = 0;
            while (in)
            {
                in.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
                const auto read_count = static_cast<std::size_t>(in.gcount());
                if (read_count == 0)
                {
                    break;
                }
                out.write(buffer.data(), static_cast<std::streamsize>(read_count));
                if (!out)
                {
                    break;
                }
                copied += read_count;
                if (progress)
                {
                    progress(copied, total);
                }
            }
            out.close();

            if (!out || copied != total)
            {
                std::filesystem::remove(temp_path, ec);
                throw TransferError(ErrorCode::FileIo, "Short copy from " + source.string() + " to " +
                                                           destination.string());
            }

            std::filesystem::rename(temp_path, destination, ec);
            if (ec)
            {
                const auto code = classify(ec);
                const auto reason = ec.message();
                std::filesystem::remove(temp_path, ec);
                throw TransferError(code, "Cannot finalize " + destination.string() + ": " + reason);
            }
        }

    } // namespace

    LocalBlobStore::LocalBlobStore(std::filesystem::path root) : root_(std::move(root))
    {
        std::filesystem::create_directories(root_);
    }

    void LocalBlobStore::upload(const std::filesystem::path &local_path, const std::string &bucket,
                                const std::string &key, const ProgressCallback &progress)
    {
        const auto target = resolve_key(bucket_path(bucket), key);
        const auto staged = resolve_key(root_ / kStagingDir / bucket, key);
        copy_with_progress(local_path, target, staged, progress);
    }

    void LocalBlobStore::download(const std::string &bucket, const std::string &key,
                                  const std::filesystem::path &local_path, const ProgressCallback &progress)
    {
        const auto source = resolve_key(bucket_path(bucket), key);
        if (!std::filesystem::is_regular_file(source))
        {
            throw TransferError(ErrorCode::NotFound, "No object '" + key + "' in bucket " + bucket);
        }
        auto temp_path = local_path;
        temp_path += kPartSuffix;
        copy_with_progress(source, local_path, temp_path, progress);
    }

    std::vector<std::string> LocalBlobStore::list_keys(const std::string &bucket)
    {
        const auto base = bucket_path(bucket);
        if (!std::filesystem::is_directory(base))
        {
            throw TransferError(ErrorCode::NotFound, "Bucket " + bucket + " does not exist");
        }

        std::vector<std::string> keys;
        std::error_code ec;
        for (std::filesystem::recursive_directory_iterator it(base, ec), end; !ec && it != end; it.increment(ec))
        {
            if (!it->is_regular_file())
            {
                continue;
            }
            keys.push_back(it->path().lexically_relative(base).generic_string());
        }
        if (ec)
        {
            throw TransferError(classify(ec), "Cannot list bucket " + bucket + ": " + ec.message());
        }
        std::sort(keys.begin(), keys.end());
        return keys;
    }

    std::filesystem::path LocalBlobStore::bucket_path(const std::string &bucket) const
    {
        if (bucket.empty() || bucket.front() == '.' || bucket.find('/') != std::string::npos)
        {
            throw TransferError(ErrorCode::InvalidKey, "Invalid bucket name '" + bucket + "'");
        }
        return root_ / bucket;
    }

} // namespace bucketsync
