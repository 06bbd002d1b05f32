#pragma once

/**
 * RecordMapper - one partial trade per statement row
 *
 * Pipeline per statement:
 *   read_csv -> normalized headers -> for each record:
 *     timestamp, quantity, P&L text, ticker, side, type, change
 *     + RowMeta for the reconciler (fill price, fees, multiplier)
 *
 * Columns hinted by the broker profile are tried before the built-in
 * matcher tables. Rows with nothing usable are dropped.
 */

#include "../types.hpp"
#include "column_hints.hpp"
#include "csv_reader.hpp"
#include "instrument.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace journal::ingest {

/**
 * buy/long -> "Long", sell/short -> "Short" (case-insensitive);
 * anything else is returned unchanged.
 */
std::string normalize_side(std::string_view raw);

// Side of a normalized value, Unknown for anything unrecognized
TradeSide side_of(std::string_view normalized);

// Map one keyed record; the caller applies the keep filter
MappedRow map_record(const RawRecord& record, const InstrumentTable& instruments, const ColumnHints& hints = {});

// Whether a mapped row carries anything worth importing
bool has_content(const PartialTrade& trade);

std::vector<MappedRow> map_statement(std::string_view text, const InstrumentTable& instruments,
                                     const ColumnHints& hints = {});

} // namespace journal::ingest
