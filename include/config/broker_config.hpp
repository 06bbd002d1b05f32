#pragma once

#include "../ingest/column_hints.hpp"
#include "../ingest/instrument.hpp"
#include "../types.hpp"
#include "../util/string_utils.hpp"
#include "defaults.hpp"

#include <nlohmann/json.hpp>

#include <cstdlib>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace journal {
namespace config {

using json = nlohmann::json;

/**
 * One documented statement column. A non-empty maps_to makes the column a
 * parsing hint for that canonical field (see ingest::ColumnHints).
 */
struct SchemaColumn {
    std::string label;
    std::string description;
    std::string sample;
    std::string maps_to; // canonical field, empty if informational
    bool required = false;
};

/**
 * Broker profile - conventions of one statement source
 */
struct BrokerProfile {
    std::string name;
    std::string file_pattern;
    std::string notes;
    PnlSource pnl_source = PnlSource::ReportedPerRow;
    SideConvention side_convention = SideConvention::LongShort;
    std::vector<SchemaColumn> columns;
    std::vector<std::string> instructions; // how to export the statement

    bool uses_fifo() const { return pnl_source == PnlSource::FifoFromFills; }

    // Declared columns as parsing hints, in schema order
    ingest::ColumnHints column_hints() const {
        ingest::ColumnHints hints;
        for (const auto& column : columns) {
            if (!column.maps_to.empty())
                hints.add(column.maps_to, column.label);
        }
        return hints;
    }
};

/**
 * Storage backend selection
 */
struct StoreSettings {
    std::string backend = "file"; // "file" or "rest"
    std::string path = store::DEFAULT_FILE;
    std::string url;
    std::string table = store::DEFAULT_TABLE;
    std::string api_key;
};

inline std::vector<BrokerProfile> builtin_brokers() {
    std::vector<BrokerProfile> profiles;

    BrokerProfile tradingview;
    tradingview.name = "TradingView";
    tradingview.file_pattern = "paper-trading-order-history-*.csv";
    tradingview.notes = "TradingView exports include both placing and closing timestamps. The closing time is used "
                        "as the trade timestamp when available.";
    tradingview.pnl_source = PnlSource::FifoFromFills;
    tradingview.side_convention = SideConvention::BuySell;
    tradingview.columns = {
        {"Symbol", "Instrument identifier including market prefix.", "CME_MINI:NQ1!", "ticker", true},
        {"Side", "Direction of the order (Buy, Sell, Long, Short).", "Buy / Sell", "side", true},
        {"Type", "Order type such as Market, Limit, Stop.", "Market", "type", true},
        {"Qty", "Filled quantity for the order.", "1", "qty", true},
        {"Limit Price", "Limit price attached to conditional orders.", "24576", "", false},
        {"Stop Price", "Stop trigger price for stop or stop-limit orders.", "24656", "", false},
        {"Fill Price", "Actual fill price recorded by TradingView.", "24576", "", false},
        {"Status", "Filled, Cancelled, or other order status.", "Filled", "change", false},
        {"Commission", "Commission paid for the order in account currency.", "0.85", "", false},
        {"Placing Time", "ISO timestamp for when the order was submitted.", "2025-11-18T18:02:12Z", "", false},
        {"Closing Time", "ISO timestamp for when the order completed.", "2025-11-18T18:02:12Z", "entry_ts", false},
        {"Order ID", "Numeric identifier for each order instance.", "2479188880", "", false},
        {"Leverage", "Leverage applied to the order.", "10:1", "", false},
        {"Margin", "Margin requirement recorded in the export.", "49,152.00 USD", "", false},
    };
    tradingview.instructions = {"Go to the Trading or Paper Trading tab.",
                                "Click the TradingView logo in the top-left corner.",
                                "Open History, then choose Export to download the CSV."};
    profiles.push_back(tradingview);

    BrokerProfile tradovate;
    tradovate.name = "Tradovate";
    tradovate.file_pattern = "fills-*.csv";
    tradovate.notes = "Tradovate exports include raw metadata columns (prefixed with an underscore) and readable "
                      "columns such as Contract and Timestamp. Contract/Product populate the ticker.";
    tradovate.pnl_source = PnlSource::FifoFromFills;
    tradovate.side_convention = SideConvention::BuySell;
    tradovate.columns = {
        {"Account", "Account receiving fills.", "APEX344...0010", "source_account", true},
        {"B/S", "Fill direction.", "Buy / Sell", "side", true},
        {"Contract", "Contract symbol (e.g., MNQZ5, NQZ5).", "MNQZ5", "ticker", true},
        {"Product", "Root symbol (MNQ, NQ).", "MNQ", "", false},
        {"avgPrice", "Average price from the broker for the order.", "", "", false},
        {"filledQty", "Number of contracts filled in this row.", "", "", false},
        {"Fill Time", "Human-readable timestamp of the fill.", "", "", false},
        {"Status", "Final status (Filled, Cancelled, etc.).", "", "change", false},
        {"_tickSize", "Tick size for the contract (e.g., 0.25).", "", "", false},
        {"Timestamp", "Local timestamp (MM/DD/YYYY HH:MM:SS).", "", "", false},
        {"Date", "Date portion (MM/DD/YY).", "", "date", true},
        {"Quantity", "Quantity column provided in some exports.", "1", "qty", false},
        {"Type", "Order type (Market, Limit, etc.).", "", "type", false},
        {"Avg Fill Price", "Average fill price across the order.", "", "", false},
        {"commission", "Commission or fee per fill.", "1.04", "", false},
    };
    tradovate.instructions = {"Log into Tradovate.", "Navigate to Reports -> Account Statements.",
                              "Export the statement covering the range you need."};
    profiles.push_back(tradovate);

    BrokerProfile generic;
    generic.name = "Generic CSV Format";
    generic.notes = "Use this structure when manually formatting a CSV. Only the required columns are necessary.";
    generic.pnl_source = PnlSource::ReportedPerRow;
    generic.side_convention = SideConvention::LongShort;
    generic.columns = {
        {"Date", "ISO formatted date (YYYY-MM-DD).", "2025-11-18", "date", true},
        {"Time", "24h time (HH:MM). Seconds optional.", "18:02", "time", true},
        {"Ticker / Symbol", "Ticker symbol of the traded instrument.", "NQ", "ticker", true},
        {"Side", "Long/Short, Buy/Sell, or similar notation.", "Long / Short", "side", true},
        {"Asset Type", "Classification such as Option, Stock, Future.", "Future", "type", false},
        {"Quantity", "Size of the trade.", "1", "qty", false},
        {"P&L", "Realized profit or loss for the record.", "150.25", "pnl", false},
        {"Status / Notes", "Any free-form column containing notes or order status.", "Closed", "change", false},
    };
    profiles.push_back(generic);

    BrokerProfile fallback;
    fallback.name = brokers::DEFAULT_PROFILE;
    fallback.notes = "No dedicated schema yet. Follow the generic CSV format so the data maps automatically.";
    fallback.pnl_source = PnlSource::ReportedPerRow;
    fallback.instructions = {"Log into your broker account.", "Export your order or trade history as CSV.",
                             "Upload the CSV here to import trades."};
    profiles.push_back(fallback);

    return profiles;
}

/**
 * BrokerRegistry - name lookup with fallback to the Default profile
 */
class BrokerRegistry {
public:
    BrokerRegistry() : brokers_(builtin_brokers()) {}
    explicit BrokerRegistry(std::vector<BrokerProfile> brokers) : brokers_(std::move(brokers)) {}

    void add(BrokerProfile profile) {
        for (auto& existing : brokers_) {
            if (same_name(existing.name, profile.name)) {
                existing = std::move(profile);
                return;
            }
        }
        brokers_.push_back(std::move(profile));
    }

    // Case-insensitive, surrounding whitespace ignored
    const BrokerProfile* find(const std::string& name) const {
        for (const auto& b : brokers_) {
            if (same_name(b.name, name))
                return &b;
        }
        return nullptr;
    }

    // Unknown names resolve to the Default profile (reported P&L)
    const BrokerProfile& resolve(const std::string& name) const {
        if (const auto* b = find(name))
            return *b;
        if (const auto* d = find(brokers::DEFAULT_PROFILE))
            return *d;
        static const BrokerProfile empty{brokers::DEFAULT_PROFILE};
        return empty;
    }

    const std::vector<BrokerProfile>& brokers() const { return brokers_; }

private:
    std::vector<BrokerProfile> brokers_;

    static bool same_name(const std::string& a, const std::string& b) {
        return util::to_lower(util::trim(a)) == util::to_lower(util::trim(b));
    }
};

/**
 * Complete configuration for the import tool
 */
struct JournalConfig {
    BrokerRegistry brokers;
    ingest::InstrumentTable instruments = ingest::InstrumentTable::builtin();
    StoreSettings store;
};

inline PnlSource string_to_pnl_source(const std::string& s) {
    if (s == "fifo_from_fills" || s == "fifo")
        return PnlSource::FifoFromFills;
    if (s == "reported_per_row" || s == "reported")
        return PnlSource::ReportedPerRow;
    throw std::runtime_error("Unknown pnl_source: " + s);
}

inline SideConvention string_to_side_convention(const std::string& s) {
    if (s == "buy_sell")
        return SideConvention::BuySell;
    if (s == "long_short")
        return SideConvention::LongShort;
    throw std::runtime_error("Unknown side_convention: " + s);
}

/**
 * JSON config parser
 *
 * Format:
 * {
 *   "brokers": [
 *     { "name": "NinjaTrader", "pnl_source": "fifo_from_fills",
 *       "side_convention": "buy_sell", "file_pattern": "*.csv",
 *       "columns": [ { "label": "Instrument", "maps_to": "ticker", "required": true } ],
 *       "instructions": [ "..." ] }
 *   ],
 *   "instruments": [
 *     { "symbol": "ES", "multiplier": 50, "aliases": ["CME_MINI:ES"] }
 *   ],
 *   "store": { "backend": "rest", "url": "https://x.supabase.co", "table": "trades" }
 * }
 *
 * Brokers and instruments override built-ins with the same name.
 * JOURNAL_STORE_URL / JOURNAL_STORE_KEY override the store section.
 */
class ConfigParser {
public:
    static JournalConfig load(const std::string& filename) {
        std::ifstream file(filename);
        if (!file.is_open()) {
            throw std::runtime_error("Cannot open config file: " + filename);
        }

        std::stringstream buffer;
        buffer << file.rdbuf();
        return parse(buffer.str());
    }

    static JournalConfig parse(const std::string& text) {
        JournalConfig config;

        json root;
        try {
            root = json::parse(text);
        } catch (const json::exception& e) {
            throw std::runtime_error(std::string("Invalid config JSON: ") + e.what());
        }
        if (!root.is_object()) {
            throw std::runtime_error("Config root must be an object");
        }

        try {
            if (root.contains("brokers")) {
                for (const auto& b : root.at("brokers")) {
                    config.brokers.add(parse_broker(b));
                }
            }
            if (root.contains("instruments")) {
                for (const auto& i : root.at("instruments")) {
                    config.instruments.add(parse_instrument(i));
                }
            }
            if (root.contains("store")) {
                config.store = parse_store(root.at("store"));
            }
        } catch (const json::exception& e) {
            throw std::runtime_error(std::string("Invalid config value: ") + e.what());
        }

        apply_env(config.store);
        return config;
    }

    /**
     * Defaults with environment overrides, used when no file is given
     */
    static JournalConfig defaults() {
        JournalConfig config;
        apply_env(config.store);
        return config;
    }

private:
    static BrokerProfile parse_broker(const json& j) {
        if (!j.contains("name") || !j.at("name").is_string()) {
            throw std::runtime_error("Broker entry needs a string 'name'");
        }
        BrokerProfile b;
        b.name = j.at("name").get<std::string>();
        b.file_pattern = j.value("file_pattern", std::string());
        b.notes = j.value("notes", std::string());
        b.pnl_source = string_to_pnl_source(j.value("pnl_source", std::string("reported_per_row")));
        b.side_convention = string_to_side_convention(j.value("side_convention", std::string("long_short")));

        if (j.contains("columns")) {
            for (const auto& c : j.at("columns")) {
                SchemaColumn col;
                col.label = c.value("label", std::string());
                col.description = c.value("description", std::string());
                col.sample = c.value("sample", std::string());
                col.maps_to = c.value("maps_to", std::string());
                col.required = c.value("required", false);
                b.columns.push_back(col);
            }
        }
        if (j.contains("instructions")) {
            b.instructions = j.at("instructions").get<std::vector<std::string>>();
        }
        return b;
    }

    static ingest::InstrumentSpec parse_instrument(const json& j) {
        if (!j.contains("symbol") || !j.at("symbol").is_string()) {
            throw std::runtime_error("Instrument entry needs a string 'symbol'");
        }
        ingest::InstrumentSpec spec;
        spec.symbol = j.at("symbol").get<std::string>();
        spec.multiplier = j.value("multiplier", instruments::DEFAULT_MULTIPLIER);
        if (spec.multiplier <= 0) {
            throw std::runtime_error("Instrument " + spec.symbol + " needs a positive multiplier");
        }
        if (j.contains("aliases")) {
            spec.aliases = j.at("aliases").get<std::vector<std::string>>();
        }
        spec.match_prefix = j.value("match_prefix", true);
        return spec;
    }

    static StoreSettings parse_store(const json& j) {
        StoreSettings s;
        s.backend = j.value("backend", s.backend);
        s.path = j.value("path", s.path);
        s.url = j.value("url", s.url);
        s.table = j.value("table", s.table);
        s.api_key = j.value("api_key", s.api_key);
        if (s.backend != "file" && s.backend != "rest") {
            throw std::runtime_error("Unknown store backend: " + s.backend);
        }
        return s;
    }

    static void apply_env(StoreSettings& s) {
        if (const char* url = std::getenv(store::URL_ENV); url && *url) {
            s.url = url;
            s.backend = "rest";
        }
        if (const char* key = std::getenv(store::KEY_ENV); key && *key) {
            s.api_key = key;
        }
    }
};

} // namespace config
} // namespace journal
