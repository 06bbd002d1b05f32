#pragma once

/**
 * JSON shape of a stored trade
 *
 * Column names follow the "trades" table:
 *   user_id, entry_ts, side, ticker, type, qty, pnl, change,
 *   source_account, source_broker
 * Blank strings and absent numbers are written as null.
 */

#include "../ingest/timestamp.hpp"
#include "../types.hpp"
#include "../util/string_utils.hpp"
#include "../util/time_utils.hpp"

#include <nlohmann/json.hpp>

#include <optional>
#include <string>

namespace journal::storage {

using json = nlohmann::json;

namespace detail {

inline json text_or_null(const std::string& value) {
    return value.empty() ? json(nullptr) : json(value);
}

inline json number_or_null(const std::optional<double>& value) {
    return value ? json(*value) : json(nullptr);
}

inline std::string text_field(const json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || !it->is_string())
        return {};
    return it->get<std::string>();
}

// PostgREST returns numeric columns as numbers, some setups as strings
inline std::optional<double> number_field(const json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null())
        return std::nullopt;
    if (it->is_number())
        return it->get<double>();
    if (it->is_string())
        return util::parse_number(it->get<std::string>());
    return std::nullopt;
}

} // namespace detail

inline json to_json(const TradeRecord& t) {
    return json{
        {"user_id", t.owner},
        {"entry_ts", t.entry_ts ? json(util::format_iso_ms(*t.entry_ts)) : json(nullptr)},
        {"side", detail::text_or_null(t.side)},
        {"ticker", detail::text_or_null(t.ticker)},
        {"type", detail::text_or_null(t.type)},
        {"qty", detail::number_or_null(t.qty)},
        {"pnl", detail::number_or_null(t.pnl)},
        {"change", t.change},
        {"source_account", t.source_account},
        {"source_broker", t.source_broker},
    };
}

inline TradeRecord record_from_json(const json& j) {
    TradeRecord t;
    t.owner = detail::text_field(j, "user_id");
    t.entry_ts = ingest::parse_timestamp(detail::text_field(j, "entry_ts"));
    if (t.entry_ts) {
        t.date = util::format_date(*t.entry_ts);
        t.time = util::format_time_hm(*t.entry_ts);
    }
    t.side = detail::text_field(j, "side");
    t.ticker = detail::text_field(j, "ticker");
    t.type = detail::text_field(j, "type");
    t.qty = detail::number_field(j, "qty");
    t.pnl = detail::number_field(j, "pnl");
    t.change = detail::text_field(j, "change");
    t.source_account = detail::text_field(j, "source_account");
    t.source_broker = detail::text_field(j, "source_broker");
    return t;
}

inline StoredTrade stored_from_json(const json& j) {
    StoredTrade t;
    t.entry_ts = detail::text_field(j, "entry_ts");
    t.ticker = detail::text_field(j, "ticker");
    t.side = detail::text_field(j, "side");
    t.type = detail::text_field(j, "type");
    t.qty = detail::number_field(j, "qty");
    t.pnl = detail::number_field(j, "pnl");
    t.change = detail::text_field(j, "change");
    return t;
}

inline StoredTrade to_stored(const TradeRecord& t) {
    StoredTrade s;
    s.entry_ts = t.entry_ts ? util::format_iso_ms(*t.entry_ts) : std::string();
    s.ticker = t.ticker;
    s.side = t.side;
    s.type = t.type;
    s.qty = t.qty;
    s.pnl = t.pnl;
    s.change = t.change;
    return s;
}

inline SourceRow source_from_json(const json& j) {
    return SourceRow{detail::text_field(j, "source_account"), detail::text_field(j, "source_broker"),
                     detail::text_field(j, "entry_ts")};
}

} // namespace journal::storage
