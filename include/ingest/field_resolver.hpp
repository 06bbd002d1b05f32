#pragma once

/**
 * FieldResolver - broker-agnostic column lookup
 *
 * Each logical field (quantity, P&L, ticker, ...) is described by an
 * ordered table of column matchers. Resolution tries matchers in order;
 * for each matcher every column of the record is scanned, and the first
 * matching column with non-blank content wins. Matcher priority therefore
 * outranks column order:
 *
 *   record:  filled_qty=3, qty=1
 *   table:   [qty, quantity, ..., filled_qty]
 *   result:  "1"
 *
 * New broker layouts are supported by extending the tables, not by adding
 * branches to the mapper.
 */

#include "../util/string_utils.hpp"
#include "csv_reader.hpp"

#include <functional>
#include <initializer_list>
#include <optional>
#include <regex>
#include <string>
#include <utility>
#include <vector>

namespace journal::ingest {

class ColumnMatcher {
public:
    enum class Kind : uint8_t { Exact, Pattern, Predicate };
    using Predicate = std::function<bool(const std::string&)>;

    static ColumnMatcher exact(std::string name) {
        ColumnMatcher m(Kind::Exact);
        m.name_ = std::move(name);
        return m;
    }

    static ColumnMatcher pattern(const std::string& regex) {
        ColumnMatcher m(Kind::Pattern);
        m.name_ = regex;
        m.regex_ = std::regex(regex, std::regex::ECMAScript | std::regex::optimize);
        return m;
    }

    static ColumnMatcher predicate(std::string description, Predicate fn) {
        ColumnMatcher m(Kind::Predicate);
        m.name_ = std::move(description);
        m.predicate_ = std::move(fn);
        return m;
    }

    bool matches(const std::string& column) const {
        switch (kind_) {
        case Kind::Exact:
            return column == name_;
        case Kind::Pattern:
            return std::regex_search(column, regex_);
        case Kind::Predicate:
            return predicate_ && predicate_(column);
        }
        return false;
    }

    Kind kind() const { return kind_; }
    const std::string& name() const { return name_; }

private:
    explicit ColumnMatcher(Kind kind) : kind_(kind) {}

    Kind kind_;
    std::string name_; // column name, regex source, or description
    std::regex regex_;
    Predicate predicate_;
};

using MatcherTable = std::vector<ColumnMatcher>;

inline MatcherTable exact_columns(std::initializer_list<const char*> names) {
    MatcherTable table;
    table.reserve(names.size());
    for (const char* n : names)
        table.push_back(ColumnMatcher::exact(n));
    return table;
}

/**
 * First non-blank value selected by the matcher table, trimmed.
 */
inline std::optional<std::string> resolve_field(const RawRecord& record, const MatcherTable& matchers) {
    for (const auto& matcher : matchers) {
        for (const auto& [column, value] : record.entries()) {
            if (!matcher.matches(column))
                continue;
            std::string trimmed = util::trim(value);
            if (!trimmed.empty())
                return trimmed;
        }
    }
    return std::nullopt;
}

// =============================================================================
// Matcher tables
// =============================================================================
namespace matchers {

inline const MatcherTable& quantity() {
    static const MatcherTable table = [] {
        auto t = exact_columns({"qty", "quantity", "contracts", "shares", "size", "filledqty", "filled_qty"});
        t.push_back(ColumnMatcher::pattern("(^|_)(qty|quantity|contracts?|shares?)($|_)"));
        return t;
    }();
    return table;
}

inline const MatcherTable& pnl() {
    static const MatcherTable table = [] {
        auto t = exact_columns({"pnl", "p_l", "pl", "net_profit", "gross_profit", "realized_pnl", "realized_pl",
                                "net_pnl", "pnl_usd", "p_l_usd", "profit", "profit_loss"});
        t.push_back(ColumnMatcher::pattern("(^|_)pnl($|_)"));
        t.push_back(ColumnMatcher::pattern("(^|_)p_l($|_)"));
        t.push_back(ColumnMatcher::pattern("(^|_)profit($|_)"));
        return t;
    }();
    return table;
}

inline const MatcherTable& change() {
    static const MatcherTable table = [] {
        auto t = exact_columns({"change", "status", "result"});
        t.push_back(ColumnMatcher::predicate(
            "ends with _status", [](const std::string& column) { return util::ends_with(column, "_status"); }));
        return t;
    }();
    return table;
}

inline const MatcherTable& ticker() {
    static const MatcherTable table =
        exact_columns({"ticker", "symbol", "instrument", "product", "contract", "product_description"});
    return table;
}

inline const MatcherTable& side() {
    static const MatcherTable table = exact_columns({"side", "b_s", "buy_sell", "order_action"});
    return table;
}

inline const MatcherTable& type() {
    static const MatcherTable table = exact_columns({"type", "asset_type", "product"});
    return table;
}

inline const MatcherTable& fill_price() {
    static const MatcherTable table = exact_columns({"fill_price", "fillprice", "price", "execution_price", "_price",
                                                     "avgprice", "avg_fill_price", "decimalfillavg"});
    return table;
}

inline const MatcherTable& commission() {
    static const MatcherTable table = exact_columns({"commission", "fee", "fees"});
    return table;
}

} // namespace matchers

} // namespace journal::ingest
