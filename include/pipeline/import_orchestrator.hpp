#pragma once

/**
 * ImportOrchestrator - one statement in, new trades stored
 *
 * Steps:
 *   1. validate owner and account
 *   2. parse and map the statement
 *   3. FIFO reconciliation when the broker reports fills only
 *   4. earliest-date cutoff (rows without a timestamp are kept)
 *   5. extra per-contract fee on futures rows
 *   6. seed the dedup gate from the account's stored trades
 *   7. stamp owner/account/broker, drop duplicates
 *   8. single insert
 *
 * Nothing is written before step 8, so any failure leaves storage as it was.
 * Imports for the same (owner, account) are serialized; different accounts
 * run independently. A per-account lock lives only while an import holds it.
 *
 * Rows are stamped with the profile name when the broker is known
 * (matched case-insensitively), otherwise with the name the caller gave,
 * even though such rows are parsed with the Default profile.
 *
 * Usage:
 *   MemoryTradeStore store;
 *   ImportOrchestrator<MemoryTradeStore> importer(store, config);
 *   auto outcome = importer.run({owner, "Tradovate", "APEX-1", csv_text});
 *   std::cout << describe(outcome) << "\n";
 */

#include "../config/broker_config.hpp"
#include "../ingest/record_mapper.hpp"
#include "../logging/async_logger.hpp"
#include "../reconcile/dedup_gate.hpp"
#include "../reconcile/fifo_reconciler.hpp"
#include "../storage/trade_store.hpp"
#include "../types.hpp"
#include "../util/string_utils.hpp"

#include <cmath>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace journal::pipeline {

struct ImportRequest {
    std::string owner;
    std::string broker;
    std::string account;
    std::string text;                    // statement contents
    std::optional<double> fee_per_unit;  // extra fee per contract, futures only
    std::optional<TimestampMs> earliest; // rows before this instant are skipped
};

struct ImportOutcome {
    ImportStatus status = ImportStatus::Imported;
    size_t inserted_count = 0;
    std::string message; // storage error text for the failure statuses
    std::string account; // trimmed account name
    std::string broker;  // broker stamped on the rows
    std::string profile; // broker profile actually applied

    // Row counts per stage
    size_t parsed_rows = 0;
    size_t after_date_filter = 0;
    size_t duplicate_rows = 0;

    bool ok() const { return status == ImportStatus::Imported || is_noop_status(status); }
};

/**
 * User-facing one-line summary of an outcome
 */
inline std::string describe(const ImportOutcome& outcome) {
    switch (outcome.status) {
    case ImportStatus::Imported:
        return "Imported " + std::to_string(outcome.inserted_count) + " trades into " + outcome.account + ".";
    case ImportStatus::MissingOwner:
        return "Please sign in to import.";
    case ImportStatus::MissingAccount:
        return "Enter an account name before importing.";
    case ImportStatus::EmptyStatement:
        return "No rows found in CSV.";
    case ImportStatus::AllFilteredByDate:
        return "No rows match the filters provided.";
    case ImportStatus::AllDuplicates:
        return "All trades in this CSV already exist for this account.";
    case ImportStatus::StorageQueryFailed:
        return "Unable to check existing trades: " + outcome.message;
    case ImportStatus::StorageInsertFailed:
        return "Import failed: " + outcome.message;
    default:
        return import_status_to_string(outcome.status);
    }
}

/**
 * Extra fee on futures rows: pnl -= fee * |qty|.
 * Applied on top of any commission already charged by reconciliation.
 */
inline void apply_fee_override(PartialTrade& trade, double fee_per_unit) {
    if (fee_per_unit == 0 || !trade.pnl || !trade.qty || *trade.qty == 0)
        return;
    if (!util::contains(util::to_lower(trade.type), "future"))
        return;
    *trade.pnl -= fee_per_unit * std::fabs(*trade.qty);
}

template <storage::TradeStore Store>
class ImportOrchestrator {
public:
    ImportOrchestrator(Store& store, const config::JournalConfig& config, logging::AsyncLogger* logger = nullptr)
        : store_(store), config_(config), logger_(logger) {}

    ImportOrchestrator(const ImportOrchestrator&) = delete;
    ImportOrchestrator& operator=(const ImportOrchestrator&) = delete;

    ImportOutcome run(const ImportRequest& request) {
        ImportOutcome outcome;
        outcome.account = util::trim(request.account);

        if (util::trim(request.owner).empty())
            return finish(outcome, ImportStatus::MissingOwner);
        if (outcome.account.empty())
            return finish(outcome, ImportStatus::MissingAccount);

        const config::BrokerProfile& profile = config_.brokers.resolve(request.broker);
        outcome.profile = profile.name;
        if (const auto* known = config_.brokers.find(request.broker)) {
            outcome.broker = known->name;
        } else {
            outcome.broker = util::trim(request.broker);
            if (outcome.broker.empty())
                outcome.broker = profile.name;
            log(logging::LogLevel::Warn, logging::LogCategory::Config,
                "unknown broker '%s', using the %s profile", outcome.broker.c_str(), profile.name.c_str());
        }

        const std::string key = request.owner + '\x1f' + outcome.account;
        std::shared_ptr<std::mutex> slot = acquire_account_lock(key);
        ImportStatus status;
        {
            std::lock_guard<std::mutex> account_lock(*slot);
            status = import_locked(request, profile, outcome);
        }
        slot.reset();
        release_account_lock(key);
        return finish(outcome, status);
    }

    // Accounts with an import in progress
    size_t locked_accounts() const {
        std::lock_guard<std::mutex> guard(locks_mutex_);
        return account_locks_.size();
    }

private:
    Store& store_;
    const config::JournalConfig& config_;
    logging::AsyncLogger* logger_;

    mutable std::mutex locks_mutex_;
    std::map<std::string, std::shared_ptr<std::mutex>> account_locks_;
    std::mutex log_mutex_; // logger is single-producer

    std::shared_ptr<std::mutex> acquire_account_lock(const std::string& key) {
        std::lock_guard<std::mutex> guard(locks_mutex_);
        auto& slot = account_locks_[key];
        if (!slot)
            slot = std::make_shared<std::mutex>();
        return slot;
    }

    // Drops the entry once only the map still references it
    void release_account_lock(const std::string& key) {
        std::lock_guard<std::mutex> guard(locks_mutex_);
        auto it = account_locks_.find(key);
        if (it != account_locks_.end() && it->second.use_count() == 1)
            account_locks_.erase(it);
    }

    ImportStatus import_locked(const ImportRequest& request, const config::BrokerProfile& profile,
                               ImportOutcome& outcome) {
        // Parse
        std::vector<MappedRow> rows = ingest::map_statement(request.text, config_.instruments, profile.column_hints());
        outcome.parsed_rows = rows.size();
        log(logging::LogLevel::Info, logging::LogCategory::Parse, "mapped %zu rows (broker %s)", rows.size(),
            profile.name.c_str());
        if (rows.empty())
            return ImportStatus::EmptyStatement;

        // Reconcile
        if (profile.uses_fifo()) {
            reconcile::FifoReconciler reconciler;
            auto result = reconciler.reconcile(rows);
            log(logging::LogLevel::Info, logging::LogCategory::Reconcile,
                "fifo: %zu rows priced, %zu closing, %zu without data, %zu open tickers", result.rows_reconciled,
                result.rows_closed, result.rows_insufficient, result.open_lots.size());
        }

        // Date cutoff
        std::vector<PartialTrade> trades;
        trades.reserve(rows.size());
        for (auto& row : rows) {
            if (request.earliest && row.trade.entry_ts && *row.trade.entry_ts < *request.earliest)
                continue;
            trades.push_back(std::move(row.trade));
        }
        outcome.after_date_filter = trades.size();
        if (trades.empty())
            return ImportStatus::AllFilteredByDate;

        // Existing trades
        reconcile::DedupGate gate;
        try {
            gate.seed(store_.query_existing(request.owner, outcome.account));
        } catch (const storage::StorageError& e) {
            outcome.message = e.what();
            return ImportStatus::StorageQueryFailed;
        }
        log(logging::LogLevel::Debug, logging::LogCategory::Dedup, "seeded %zu stored keys for %s", gate.size(),
            outcome.account.c_str());

        // Stamp, adjust fees, dedup
        std::vector<TradeRecord> fresh;
        fresh.reserve(trades.size());
        for (auto& trade : trades) {
            if (request.fee_per_unit)
                apply_fee_override(trade, *request.fee_per_unit);

            TradeRecord record = stamp(std::move(trade), request.owner, outcome.account, outcome.broker);
            if (!gate.admit(record)) {
                ++outcome.duplicate_rows;
                continue;
            }
            fresh.push_back(std::move(record));
        }
        if (fresh.empty())
            return ImportStatus::AllDuplicates;

        // Insert
        try {
            outcome.inserted_count = store_.insert(fresh);
        } catch (const storage::StorageError& e) {
            outcome.message = e.what();
            return ImportStatus::StorageInsertFailed;
        }
        return ImportStatus::Imported;
    }

    static TradeRecord stamp(PartialTrade&& trade, const std::string& owner, const std::string& account,
                             const std::string& broker) {
        TradeRecord r;
        r.owner = owner;
        r.entry_ts = trade.entry_ts;
        r.date = std::move(trade.date);
        r.time = std::move(trade.time);
        r.side = std::move(trade.side);
        r.type = std::move(trade.type);
        r.ticker = std::move(trade.ticker);
        r.qty = trade.qty;
        r.pnl = trade.pnl;
        r.change = std::move(trade.change);
        r.source_account = account;
        r.source_broker = broker;
        return r;
    }

    template <typename... Args>
    void log(logging::LogLevel level, uint8_t category, const char* fmt, Args... args) {
        if (!logger_)
            return;
        std::lock_guard<std::mutex> guard(log_mutex_);
        logger_->logf(level, category, fmt, args...);
    }

    ImportOutcome& finish(ImportOutcome& outcome, ImportStatus status) {
        outcome.status = status;
        if (status == ImportStatus::Imported) {
            log(logging::LogLevel::Info, logging::LogCategory::Import, "%s", describe(outcome).c_str());
        } else if (outcome.ok()) {
            log(logging::LogLevel::Warn, logging::LogCategory::Import, "%s", describe(outcome).c_str());
        } else {
            log(logging::LogLevel::Error, logging::LogCategory::Import, "%s", describe(outcome).c_str());
        }
        return outcome;
    }
};

} // namespace journal::pipeline
