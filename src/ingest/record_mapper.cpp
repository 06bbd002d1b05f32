#include "../../include/ingest/record_mapper.hpp"
#include "../../include/ingest/field_resolver.hpp"
#include "../../include/ingest/timestamp.hpp"
#include "../../include/util/string_utils.hpp"

#include <cmath>
#include <optional>
#include <string>

namespace journal::ingest {

namespace {

// Hinted columns first, then the built-in table
std::optional<std::string> resolve(const RawRecord& record, const ColumnHints& hints, const char* field,
                                   const MatcherTable& matchers) {
    if (auto hinted = hints.resolve(record, field))
        return hinted;
    return resolve_field(record, matchers);
}

std::optional<double> resolve_number(const RawRecord& record, const ColumnHints& hints, const char* field,
                                     const MatcherTable& matchers) {
    auto text = resolve(record, hints, field, matchers);
    if (!text)
        return std::nullopt;
    return util::parse_number(*text);
}

// P&L column, else the change column when the statement has one, else status
std::optional<Money> resolve_pnl(const RawRecord& record, const ColumnHints& hints) {
    if (auto text = resolve(record, hints, fields::PNL, matchers::pnl()))
        return util::parse_number(*text);
    if (record.has("change"))
        return util::parse_number(record.get("change"));
    return util::parse_number(record.get("status"));
}

} // namespace

std::string normalize_side(std::string_view raw) {
    std::string side = util::to_lower(raw);
    if (side == "buy" || side == "long")
        return trade_side_to_string(TradeSide::Long);
    if (side == "sell" || side == "short")
        return trade_side_to_string(TradeSide::Short);
    return std::string(raw);
}

TradeSide side_of(std::string_view normalized) {
    if (normalized == trade_side_to_string(TradeSide::Long))
        return TradeSide::Long;
    if (normalized == trade_side_to_string(TradeSide::Short))
        return TradeSide::Short;
    return TradeSide::Unknown;
}

MappedRow map_record(const RawRecord& record, const InstrumentTable& instruments, const ColumnHints& hints) {
    MappedRow row;
    PartialTrade& trade = row.trade;

    ReconstructedTime when = reconstruct_timestamp(record, hints);
    trade.entry_ts = when.instant;
    trade.date = when.date;
    trade.time = when.time;

    if (auto qty = resolve_number(record, hints, fields::QTY, matchers::quantity()))
        trade.qty = std::fabs(*qty);
    trade.pnl = resolve_pnl(record, hints);

    trade.ticker = instruments.normalize(resolve(record, hints, fields::TICKER, matchers::ticker()).value_or(""));
    trade.side = normalize_side(resolve(record, hints, fields::SIDE, matchers::side()).value_or(""));
    trade.type = resolve(record, hints, fields::TYPE, matchers::type()).value_or("");
    trade.change = resolve(record, hints, fields::CHANGE, matchers::change()).value_or("");

    RowMeta& meta = row.meta;
    meta.side = trade.side;
    meta.qty = trade.qty;
    meta.fill_price = resolve_number(record, hints, fields::PRICE, matchers::fill_price());
    Money commission = resolve_number(record, hints, fields::COMMISSION, matchers::commission()).value_or(0.0);
    meta.total_fee = commission;
    meta.fee_per_unit = (trade.qty && *trade.qty != 0 && commission != 0) ? commission / *trade.qty : 0.0;
    meta.multiplier = instruments.multiplier(trade.ticker);

    return row;
}

bool has_content(const PartialTrade& trade) {
    return trade.entry_ts.has_value() || !trade.ticker.empty() || !trade.side.empty() || !trade.type.empty() ||
           !trade.change.empty() || trade.qty.has_value() || trade.pnl.has_value();
}

std::vector<MappedRow> map_statement(std::string_view text, const InstrumentTable& instruments,
                                     const ColumnHints& hints) {
    CsvTable table = read_csv(text);

    std::vector<MappedRow> rows;
    rows.reserve(table.records.size());
    for (const auto& record : table.records) {
        MappedRow row = map_record(record, instruments, hints);
        if (has_content(row.trade))
            rows.push_back(std::move(row));
    }
    return rows;
}

} // namespace journal::ingest
