#include "bucketsync/history_ledger.hpp"

#include <cerrno>
#include <fstream>
#include <system_error>

#include <fcntl.h>
#include <unistd.h>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "bucketsync/error_codes.hpp"

namespace bucketsync
{

    namespace
    {
        // fsync(2) on a file or directory; returns 0 or the errno value.
        int sync_to_disk(const std::filesystem::path &path, int flags)
        {
            const int fd = ::open(path.c_str(), flags | O_CLOEXEC);
            if (fd < 0)
            {
                return errno;
            }
            const int status = ::fsync(fd) == 0 ? 0 : errno;
            ::close(fd);
            return status;
        }
    } // namespace

    HistoryLedger::HistoryLedger(std::filesystem::path path) : path_(std::move(path))
    {
        load();
    }

    const std::vector<std::string> &HistoryLedger::load()
    {
        entries_.clear();
        index_.clear();

        std::error_code ec;
        if (!std::filesystem::exists(path_, ec))
        {
            spdlog::info("History file {} not found, creating", path_.string());
            save();
            return entries_;
        }

        std::ifstream in(path_);
        if (!in.is_open())
        {
            throw LedgerError(ErrorCode::FileIo, "Cannot open history file " + path_.string());
        }

        nlohmann::json json;
        try
        {
            in >> json;
        }
        catch (const nlohmann::json::parse_error &ex)
        {
            throw LedgerError(ErrorCode::CorruptState,
                              "History file " + path_.string() + " is not valid JSON: " + ex.what());
        }
        if (!json.is_array())
        {
            throw LedgerError(ErrorCode::CorruptState, "History file " + path_.string() + " must hold a JSON array");
        }

        for (const auto &item : json)
        {
            if (!item.is_string())
            {
                throw LedgerError(ErrorCode::CorruptState,
                                  "History file " + path_.string() + " contains a non-string entry");
            }
            auto id = item.get<std::string>();
            // Older files may carry duplicates; keep the first occurrence.
            if (index_.insert(id).second)
            {
                entries_.push_back(std::move(id));
            }
        }
        spdlog::debug("Loaded {} entries from {}", entries_.size(), path_.string());
        return entries_;
    }

    bool HistoryLedger::contains(const std::string &id) const
    {
        return index_.contains(id);
    }

    bool HistoryLedger::record(const std::string &id)
    {
        if (index_.contains(id))
        {
            return false;
        }
        entries_.push_back(id);
        try
        {
            save();
        }
        catch (...)
        {
            entries_.pop_back();
            throw;
        }
        index_.insert(id);
        return true;
    }

    void HistoryLedger::save() const
    {
        const auto dir = path_.parent_path();
        if (!dir.empty())
        {
            std::error_code ec;
            std::filesystem::create_directories(dir, ec);
        }

        nlohmann::json json = nlohmann::json::array();
        for (const auto &entry : entries_)
        {
            json.push_back(entry);
        }

        auto temp_path = path_;
        temp_path += ".part";
        {
            std::ofstream out(temp_path, std::ios::trunc);
            if (!out.is_open())
            {
                throw LedgerError(ErrorCode::FileIo, "Cannot write history file " + temp_path.string());
            }
            out << json.dump();
            out.flush();
            if (!out)
            {
                throw LedgerError(ErrorCode::FileIo, "Failed writing history file " + temp_path.string());
            }
        }

        std::error_code ec;
        if (const int err = sync_to_disk(temp_path, O_RDONLY); err != 0)
        {
            std::filesystem::remove(temp_path, ec);
            throw LedgerError(ErrorCode::FileIo, "Cannot sync history file " + temp_path.string() + ": " +
                                                     std::generic_category().message(err));
        }

        std::filesystem::rename(temp_path, path_, ec);
        if (ec)
        {
            const auto reason = ec.message();
            std::filesystem::remove(temp_path, ec);
            throw LedgerError(ErrorCode::FileIo, "Failed to replace history file " + path_.string() + ": " + reason);
        }

        // Persist the rename itself.
        const auto parent = dir.empty() ? std::filesystem::path(".") : dir;
        if (const int err = sync_to_disk(parent, O_RDONLY | O_DIRECTORY); err != 0)
        {
            spdlog::warn("Cannot sync directory {}: {}", parent.string(), std::generic_category().message(err));
        }
    }

} // namespace bucketsync
