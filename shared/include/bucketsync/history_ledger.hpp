#pragma once

#include <cstddef>
#include <filesystem>
#include <string>
#include <unordered_set>
#include <vector>

namespace bucketsync
{

    /**
     * Append-only list of processed identifiers persisted as a JSON array of
     * strings. Every record() rewrites the whole file before returning.
     * Not synchronized: each ledger is owned by a single loop.
     */
    class HistoryLedger
    {
    public:
        // Loads the ledger, creating an empty one if the file is missing.
        // Throws LedgerError if the file exists but cannot be parsed.
        explicit HistoryLedger(std::filesystem::path path);

        const std::vector<std::string> &load();

        bool contains(const std::string &id) const;

        // Returns false when the id was already recorded (no write happens).
        bool record(const std::string &id);

        const std::vector<std::string> &entries() const noexcept { return entries_; }
        std::size_t size() const noexcept { return entries_.size(); }
        const std::filesystem::path &path() const noexcept { return path_; }

    private:
        void save() const;

        std::filesystem::path path_;
        std::vector<std::string> entries_;
        std::unordered_set<std::string> index_;
    };

} // namespace bucketsync
