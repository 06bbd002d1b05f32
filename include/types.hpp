#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

namespace journal {

// Milliseconds since Unix epoch, UTC
using TimestampMs = int64_t;
using Quantity = double;
using Money = double;

// Sort key used for rows without a reconstructed timestamp
constexpr TimestampMs NO_TIMESTAMP = 0;

/**
 * Canonical trade shape produced by the mapper.
 *
 * Every field a statement may omit is optional; string fields are empty
 * when the statement has nothing for them.
 */
struct PartialTrade {
    std::optional<TimestampMs> entry_ts;
    std::string date; // YYYY-MM-DD when entry_ts is set, raw text otherwise
    std::string time; // HH:MM when entry_ts is set, raw text otherwise
    std::string side; // "Long" / "Short" or the raw value
    std::string type;
    std::string ticker;
    std::optional<Quantity> qty;
    std::optional<Money> pnl;
    std::string change;

    TimestampMs sort_key() const { return entry_ts.value_or(NO_TIMESTAMP); }
};

/**
 * Per-row facts needed only while reconciling fills.
 */
struct RowMeta {
    std::string side;
    std::optional<Quantity> qty;
    std::optional<double> fill_price;
    double fee_per_unit = 0;
    Money total_fee = 0;
    double multiplier = 1;
};

struct MappedRow {
    PartialTrade trade;
    RowMeta meta;
};

/**
 * Persisted canonical record.
 */
struct TradeRecord {
    std::string owner;
    std::optional<TimestampMs> entry_ts;
    std::string date;
    std::string time;
    std::string side;
    std::string type;
    std::string ticker;
    std::optional<Quantity> qty;
    std::optional<Money> pnl;
    std::string change;
    std::string source_account;
    std::string source_broker;
};

/**
 * Subset of a stored trade used to seed duplicate detection.
 * The timestamp is kept as stored text; it is re-normalized before keying.
 */
struct StoredTrade {
    std::string entry_ts;
    std::string ticker;
    std::string side;
    std::string type;
    std::optional<Quantity> qty;
    std::optional<Money> pnl;
    std::string change;
};

/**
 * One (account, broker) pair as seen in storage.
 */
struct SourceRow {
    std::string account;
    std::string broker;
    std::string entry_ts;
};

enum class TradeSide : uint8_t { Long = 0, Short = 1, Unknown = 2 };

inline const char* trade_side_to_string(TradeSide side) {
    switch (side) {
    case TradeSide::Long:
        return "Long";
    case TradeSide::Short:
        return "Short";
    default:
        return "Unknown";
    }
}

// How a broker's statement reports realized P&L
enum class PnlSource : uint8_t {
    FifoFromFills = 0, // Raw fills, P&L derived by lot matching
    ReportedPerRow = 1 // Rows already carry P&L
};

inline const char* pnl_source_to_string(PnlSource source) {
    switch (source) {
    case PnlSource::FifoFromFills:
        return "fifo_from_fills";
    case PnlSource::ReportedPerRow:
        return "reported_per_row";
    default:
        return "unknown";
    }
}

// Which words a broker uses for direction
enum class SideConvention : uint8_t { BuySell = 0, LongShort = 1 };

inline const char* side_convention_to_string(SideConvention convention) {
    switch (convention) {
    case SideConvention::BuySell:
        return "buy_sell";
    case SideConvention::LongShort:
        return "long_short";
    default:
        return "unknown";
    }
}

// Import operation result
enum class ImportStatus : uint8_t {
    Imported = 0,
    MissingOwner,       // No owner id supplied
    MissingAccount,     // Account name blank after trimming
    EmptyStatement,     // No usable rows in the CSV
    AllFilteredByDate,  // Every row predates the cutoff
    AllDuplicates,      // Every row already stored for the account
    StorageQueryFailed, // Existing-trade lookup failed
    StorageInsertFailed // Final insert failed
};

inline const char* import_status_to_string(ImportStatus status) {
    switch (status) {
    case ImportStatus::Imported:
        return "Imported";
    case ImportStatus::MissingOwner:
        return "MissingOwner";
    case ImportStatus::MissingAccount:
        return "MissingAccount";
    case ImportStatus::EmptyStatement:
        return "EmptyStatement";
    case ImportStatus::AllFilteredByDate:
        return "AllFilteredByDate";
    case ImportStatus::AllDuplicates:
        return "AllDuplicates";
    case ImportStatus::StorageQueryFailed:
        return "StorageQueryFailed";
    case ImportStatus::StorageInsertFailed:
        return "StorageInsertFailed";
    default:
        return "Unknown";
    }
}

// Outcomes that leave storage untouched but are not failures
inline bool is_noop_status(ImportStatus status) {
    return status == ImportStatus::EmptyStatement || status == ImportStatus::AllFilteredByDate ||
           status == ImportStatus::AllDuplicates;
}

} // namespace journal
