#pragma once

/**
 * DedupGate - idempotent imports
 *
 * Every trade gets a fingerprint over its normalized fields:
 *
 *   iso-timestamp | ticker | side | type | qty | pnl | change
 *
 * joined with the ASCII unit separator (0x1F). Strings are lower-cased,
 * numbers use 4 decimals, absent values are empty. The gate is seeded with
 * the account's stored trades and then admits each candidate at most once,
 * so re-importing an overlapping statement inserts only the new rows.
 *
 * Usage:
 *   DedupGate gate;
 *   gate.seed(store.query_existing(owner, account));
 *   for (auto& r : records)
 *       if (gate.admit(r)) fresh.push_back(r);
 */

#include "../config/defaults.hpp"
#include "../ingest/timestamp.hpp"
#include "../types.hpp"
#include "../util/string_utils.hpp"
#include "../util/time_utils.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <unordered_set>
#include <vector>

namespace journal::reconcile {

namespace detail {

inline void append_text(std::string& key, std::string_view value, bool first = false) {
    if (!first)
        key.push_back(config::dedup::KEY_DELIMITER);
    key += util::to_lower(value);
}

inline void append_number(std::string& key, const std::optional<double>& value) {
    key.push_back(config::dedup::KEY_DELIMITER);
    if (value)
        key += util::format_fixed(*value, config::dedup::NUMBER_DECIMALS);
}

inline std::string build_key(const std::optional<TimestampMs>& ts, std::string_view ticker, std::string_view side,
                             std::string_view type, const std::optional<double>& qty,
                             const std::optional<double>& pnl, std::string_view change) {
    std::string key;
    append_text(key, ts ? util::format_iso_ms(*ts) : std::string(), true);
    append_text(key, ticker);
    append_text(key, side);
    append_text(key, type);
    append_number(key, qty);
    append_number(key, pnl);
    append_text(key, change);
    return key;
}

} // namespace detail

inline std::string trade_key(const PartialTrade& t) {
    return detail::build_key(t.entry_ts, t.ticker, t.side, t.type, t.qty, t.pnl, t.change);
}

inline std::string trade_key(const TradeRecord& t) {
    return detail::build_key(t.entry_ts, t.ticker, t.side, t.type, t.qty, t.pnl, t.change);
}

// Stored timestamps are re-normalized, so "+00:00" and "Z" spellings key alike
inline std::string trade_key(const StoredTrade& t) {
    return detail::build_key(ingest::parse_timestamp(t.entry_ts), t.ticker, t.side, t.type, t.qty, t.pnl,
                             t.change);
}

class DedupGate {
public:
    void seed(const std::vector<StoredTrade>& stored) {
        for (const auto& t : stored)
            keys_.insert(trade_key(t));
    }

    // True the first time a key is seen
    template <typename Trade>
    bool admit(const Trade& trade) {
        return keys_.insert(trade_key(trade)).second;
    }

    template <typename Trade>
    bool contains(const Trade& trade) const {
        return keys_.count(trade_key(trade)) > 0;
    }

    size_t size() const { return keys_.size(); }
    void clear() { keys_.clear(); }

private:
    std::unordered_set<std::string> keys_;
};

} // namespace journal::reconcile
