#pragma once

#include "trade_json.hpp"
#include "trade_store.hpp"

#include <algorithm>
#include <optional>
#include <string>
#include <vector>

namespace journal::storage {

/**
 * MemoryTradeStore - Test implementation
 *
 * Keeps rows in a vector and counts calls.
 * Can be configured to fail the next query, insert or remove.
 */
class MemoryTradeStore {
public:
    std::vector<StoredTrade> query_existing(const std::string& owner, const std::string& account) {
        ++query_calls_;
        throw_if_armed(fail_query_);

        std::vector<StoredTrade> out;
        for (const auto& r : rows_) {
            if (r.owner == owner && r.source_account == account)
                out.push_back(to_stored(r));
        }
        return out;
    }

    size_t insert(const std::vector<TradeRecord>& rows) {
        ++insert_calls_;
        throw_if_armed(fail_insert_);

        rows_.insert(rows_.end(), rows.begin(), rows.end());
        return rows.size();
    }

    size_t remove(const std::string& owner, const std::string& account) {
        ++remove_calls_;
        throw_if_armed(fail_remove_);

        auto it = std::remove_if(rows_.begin(), rows_.end(), [&](const TradeRecord& r) {
            return r.owner == owner && r.source_account == account;
        });
        size_t removed = static_cast<size_t>(rows_.end() - it);
        rows_.erase(it, rows_.end());
        return removed;
    }

    std::vector<SourceRow> query_sources(const std::string& owner) {
        ++query_calls_;
        throw_if_armed(fail_query_);

        std::vector<SourceRow> out;
        for (const auto& r : rows_) {
            if (r.owner == owner)
                out.push_back({r.source_account, r.source_broker,
                               r.entry_ts ? util::format_iso_ms(*r.entry_ts) : std::string()});
        }
        return out;
    }

    // Test helpers
    const std::vector<TradeRecord>& rows() const { return rows_; }
    size_t size() const { return rows_.size(); }
    size_t query_calls() const { return query_calls_; }
    size_t insert_calls() const { return insert_calls_; }
    size_t remove_calls() const { return remove_calls_; }

    void clear() { rows_.clear(); }

    // Simulate failures
    void fail_next_query(std::string message) { fail_query_ = std::move(message); }
    void fail_next_insert(std::string message) { fail_insert_ = std::move(message); }
    void fail_next_remove(std::string message) { fail_remove_ = std::move(message); }

private:
    std::vector<TradeRecord> rows_;
    size_t query_calls_ = 0;
    size_t insert_calls_ = 0;
    size_t remove_calls_ = 0;
    std::optional<std::string> fail_query_;
    std::optional<std::string> fail_insert_;
    std::optional<std::string> fail_remove_;

    static void throw_if_armed(std::optional<std::string>& armed) {
        if (!armed)
            return;
        std::string message = std::move(*armed);
        armed.reset();
        throw StorageError(message);
    }
};

static_assert(TradeStore<MemoryTradeStore>, "MemoryTradeStore must satisfy TradeStore");

} // namespace journal::storage
