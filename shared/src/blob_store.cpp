#include "bucketsync/blob_store.hpp"

#include "bucketsync/error_codes.hpp"

namespace bucketsync
{

    std::filesystem::path resolve_key(const std::filesystem::path &base, const std::string &key)
    {
        if (key.empty() || key.back() == '/')
        {
            throw TransferError(ErrorCode::InvalidKey, "Object key '" + key + "' does not name a file");
        }
        const std::filesystem::path relative(key);
        if (relative.is_absolute() || key.front() == '/')
        {
            throw TransferError(ErrorCode::InvalidKey, "Object key '" + key + "' is absolute");
        }

        std::filesystem::path resolved = base;
        for (const auto &part : relative)
        {
            const auto part_string = part.generic_string();
            if (part_string.empty() || part_string == ".")
            {
                continue;
            }
            if (part_string == "..")
            {
                throw TransferError(ErrorCode::InvalidKey, "Object key '" + key + "' escapes its directory");
            }
            resolved /= part;
        }
        if (resolved == base)
        {
            throw TransferError(ErrorCode::InvalidKey, "Object key '" + key + "' does not name a file");
        }
        return resolved;
    }

} // namespace bucketsync
