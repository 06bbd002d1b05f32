#pragma once

/**
 * FileTradeStore - trades in a local JSON file
 *
 * The file holds one JSON array of rows in the "trades" table shape
 * (see trade_json.hpp). Every call reads the file; every write replaces
 * it through "<path>.tmp" and a rename, so a crash never leaves half a file.
 * A missing file is an empty store.
 *
 * Usage:
 *   FileTradeStore store("trades.json");
 *   store.insert(rows);
 *   auto existing = store.query_existing(owner, account);
 */

#include "trade_json.hpp"
#include "trade_store.hpp"

#include <cstdio>
#include <fstream>
#include <iterator>
#include <string>
#include <vector>

namespace journal::storage {

class FileTradeStore {
public:
    explicit FileTradeStore(std::string path) : path_(std::move(path)) {}

    std::vector<StoredTrade> query_existing(const std::string& owner, const std::string& account) const {
        std::vector<StoredTrade> out;
        for (const auto& row : load()) {
            if (detail::text_field(row, "user_id") == owner && detail::text_field(row, "source_account") == account)
                out.push_back(stored_from_json(row));
        }
        return out;
    }

    size_t insert(const std::vector<TradeRecord>& rows) {
        json all = load();
        for (const auto& r : rows)
            all.push_back(to_json(r));
        save(all);
        return rows.size();
    }

    size_t remove(const std::string& owner, const std::string& account) {
        json all = load();
        json kept = json::array();
        size_t removed = 0;
        for (auto& row : all) {
            if (detail::text_field(row, "user_id") == owner && detail::text_field(row, "source_account") == account)
                ++removed;
            else
                kept.push_back(std::move(row));
        }
        if (removed > 0)
            save(kept);
        return removed;
    }

    std::vector<SourceRow> query_sources(const std::string& owner) const {
        std::vector<SourceRow> out;
        for (const auto& row : load()) {
            if (detail::text_field(row, "user_id") == owner)
                out.push_back(source_from_json(row));
        }
        return out;
    }

    // Every stored row, all owners
    std::vector<TradeRecord> all() const {
        std::vector<TradeRecord> out;
        for (const auto& row : load())
            out.push_back(record_from_json(row));
        return out;
    }

    const std::string& path() const { return path_; }

private:
    std::string path_;

    json load() const {
        std::ifstream in(path_);
        if (!in.is_open())
            return json::array();

        std::string content((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
        if (content.find_first_not_of(" \t\r\n") == std::string::npos)
            return json::array();

        json data;
        try {
            data = json::parse(content);
        } catch (const json::exception& e) {
            throw StorageError("Corrupt trade file " + path_ + ": " + e.what());
        }
        if (!data.is_array())
            throw StorageError("Trade file " + path_ + " is not a JSON array");
        return data;
    }

    void save(const json& rows) const {
        // Write to temp file first, then rename (atomic on POSIX)
        std::string temp_path = path_ + ".tmp";
        {
            std::ofstream out(temp_path);
            if (!out.is_open())
                throw StorageError("Cannot write trade file " + temp_path);
            out << rows.dump(2) << "\n";
            if (!out.good())
                throw StorageError("Failed writing trade file " + temp_path);
        }

        if (std::rename(temp_path.c_str(), path_.c_str()) != 0) {
            std::remove(temp_path.c_str());
            throw StorageError("Cannot replace trade file " + path_);
        }
    }
};

static_assert(TradeStore<FileTradeStore>, "FileTradeStore must satisfy TradeStore");

} // namespace journal::storage
