#pragma once

/**
 * ColumnHints - broker-declared columns per canonical field
 *
 * A broker profile may name the statement column that fills a field
 * ("Action" -> side, "Time" -> entry_ts). Hinted columns are tried, in
 * declaration order, before the built-in matcher tables:
 *
 *   hints:   side <- [action]
 *   record:  action=Buy, side=
 *   result:  side "Buy"
 */

#include "../util/string_utils.hpp"
#include "csv_reader.hpp"
#include "header_normalizer.hpp"

#include <algorithm>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace journal::ingest {

// Canonical field names accepted as hint targets
namespace fields {
constexpr const char* ENTRY_TS = "entry_ts";
constexpr const char* DATE = "date";
constexpr const char* TIME = "time";
constexpr const char* TICKER = "ticker";
constexpr const char* SIDE = "side";
constexpr const char* TYPE = "type";
constexpr const char* QTY = "qty";
constexpr const char* PNL = "pnl";
constexpr const char* CHANGE = "change";
constexpr const char* PRICE = "price";
constexpr const char* COMMISSION = "commission";
} // namespace fields

class ColumnHints {
public:
    // label is the raw statement header; it is normalized here
    void add(const std::string& field, std::string_view label) {
        std::string column = normalize_header(label);
        if (field.empty() || column.empty())
            return;
        auto& columns = columns_[field];
        if (std::find(columns.begin(), columns.end(), column) == columns.end())
            columns.push_back(std::move(column));
    }

    const std::vector<std::string>& columns(const std::string& field) const {
        static const std::vector<std::string> none;
        auto it = columns_.find(field);
        return it == columns_.end() ? none : it->second;
    }

    /**
     * First non-blank hinted value for the field, trimmed.
     */
    std::optional<std::string> resolve(const RawRecord& record, const std::string& field) const {
        for (const auto& column : columns(field)) {
            std::string value = util::trim(record.get(column));
            if (!value.empty())
                return value;
        }
        return std::nullopt;
    }

    bool empty() const { return columns_.empty(); }

private:
    std::map<std::string, std::vector<std::string>> columns_;
};

} // namespace journal::ingest
