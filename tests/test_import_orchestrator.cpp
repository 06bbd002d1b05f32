/**
 * Import Orchestrator Test Suite
 *
 * End-to-end imports against the in-memory store: FIFO statements,
 * re-imports, date cutoff, fee override, validation and storage failures.
 *
 * Run with: ./test_import_orchestrator
 */

#include <cassert>
#include <cmath>
#include <iostream>
#include <string>
#include <thread>
#include <vector>

#include "../include/config/broker_config.hpp"
#include "../include/logging/async_logger.hpp"
#include "../include/pipeline/import_orchestrator.hpp"
#include "../include/storage/memory_trade_store.hpp"
#include "../include/util/time_utils.hpp"

using namespace journal;
using namespace journal::pipeline;
using journal::storage::MemoryTradeStore;

#ifndef JOURNAL_SOURCE_DIR
#define JOURNAL_SOURCE_DIR "."
#endif

#define TEST(name) void name()

#define RUN_TEST(name) do { \
    std::cout << "  " << #name << "... "; \
    name(); \
    std::cout << "PASSED\n"; \
} while(0)

#define ASSERT_EQ(a, b) do { \
    if ((a) != (b)) { \
        std::cerr << "\nFAIL: " << #a << " != " << #b \
                  << " (" << (a) << " vs " << (b) << ")\n"; \
        assert(false); \
    } \
} while(0)

#define ASSERT_EQ_ENUM(a, b) do { \
    if ((a) != (b)) { \
        std::cerr << "\nFAIL: " << #a << " (" << static_cast<int>(a) << ") != " << #b << " (" << static_cast<int>(b) << ")\n"; \
        assert(false); \
    } \
} while(0)

#define ASSERT_NEAR(a, b, tol) do { \
    if (std::abs((a) - (b)) > (tol)) { \
        std::cerr << "\nFAIL: " << #a << " != " << #b \
                  << " (" << (a) << " vs " << (b) << ")\n"; \
        assert(false); \
    } \
} while(0)

#define ASSERT_TRUE(expr) do { \
    if (!(expr)) { \
        std::cerr << "\nFAIL: " << #expr << " is false\n"; \
        assert(false); \
    } \
} while(0)

// Tradovate fills: one NQ round trip, one open MNQ fill
static const char* TRADOVATE_FILLS =
    "Account,B/S,Contract,Product,avgPrice,filledQty,Fill Time,Status,commission\n"
    "APEX-1,Buy,NQZ5,NQ,100,2,11/18/2025 06:00:00 PM,Filled,2\n"
    "APEX-1,Sell,NQZ5,NQ,105,2,11/18/2025 06:05:00 PM,Filled,2\n"
    "APEX-1,Buy,MNQZ5,MNQ,24000,1,11/19/2025 02:00:00 PM,Filled,0.5\n";

static ImportRequest request(const std::string& broker, const std::string& text) {
    ImportRequest r;
    r.owner = "user-1";
    r.broker = broker;
    r.account = "APEX-1";
    r.text = text;
    return r;
}

static const TradeRecord* find_row(const MemoryTradeStore& store, const std::string& side, const std::string& ticker) {
    for (const auto& r : store.rows()) {
        if (r.side == side && r.ticker == ticker)
            return &r;
    }
    return nullptr;
}

// =============================================================================
// TEST 1: FIFO statements
// =============================================================================
TEST(tradovate_fills_get_fifo_pnl) {
    MemoryTradeStore store;
    config::JournalConfig cfg;
    ImportOrchestrator<MemoryTradeStore> importer(store, cfg);

    auto outcome = importer.run(request("Tradovate", TRADOVATE_FILLS));
    ASSERT_EQ_ENUM(outcome.status, ImportStatus::Imported);
    ASSERT_EQ(outcome.inserted_count, 3u);
    ASSERT_EQ(store.size(), 3u);

    const TradeRecord* close = find_row(store, "Short", "NQ");
    ASSERT_TRUE(close != nullptr);
    ASSERT_NEAR(close->pnl.value_or(-1), 196.0, 1e-9);
    ASSERT_EQ(close->source_account, "APEX-1");
    ASSERT_EQ(close->source_broker, "Tradovate");
    ASSERT_EQ(close->owner, "user-1");

    const TradeRecord* open = find_row(store, "Long", "MNQ");
    ASSERT_NEAR(open->pnl.value_or(-1), 0.0, 1e-12);
    ASSERT_EQ(describe(outcome), "Imported 3 trades into APEX-1.");
}

TEST(reimport_is_all_duplicates) {
    MemoryTradeStore store;
    config::JournalConfig cfg;
    ImportOrchestrator<MemoryTradeStore> importer(store, cfg);

    ASSERT_EQ_ENUM(importer.run(request("Tradovate", TRADOVATE_FILLS)).status, ImportStatus::Imported);
    auto second = importer.run(request("Tradovate", TRADOVATE_FILLS));
    ASSERT_EQ_ENUM(second.status, ImportStatus::AllDuplicates);
    ASSERT_EQ(second.inserted_count, 0u);
    ASSERT_EQ(second.duplicate_rows, 3u);
    ASSERT_EQ(store.size(), 3u);
    ASSERT_EQ(store.insert_calls(), 1u);
}

TEST(overlapping_statement_inserts_only_new_rows) {
    MemoryTradeStore store;
    config::JournalConfig cfg;
    ImportOrchestrator<MemoryTradeStore> importer(store, cfg);

    std::string first =
        "B/S,Contract,avgPrice,filledQty,Fill Time\n"
        "Buy,NQZ5,100,1,11/18/2025 06:00:00 PM\n";
    std::string second = first + "Sell,NQZ5,101,1,11/18/2025 06:01:00 PM\n";

    ASSERT_EQ(importer.run(request("Tradovate", first)).inserted_count, 1u);
    auto outcome = importer.run(request("Tradovate", second));
    ASSERT_EQ_ENUM(outcome.status, ImportStatus::Imported);
    ASSERT_EQ(outcome.inserted_count, 1u);
    ASSERT_NEAR(find_row(store, "Short", "NQ")->pnl.value_or(-1), 20.0, 1e-9);
}

TEST(same_statement_other_account_is_not_duplicate) {
    MemoryTradeStore store;
    config::JournalConfig cfg;
    ImportOrchestrator<MemoryTradeStore> importer(store, cfg);

    importer.run(request("Tradovate", TRADOVATE_FILLS));
    auto other = request("Tradovate", TRADOVATE_FILLS);
    other.account = "APEX-2";
    ASSERT_EQ(importer.run(other).inserted_count, 3u);
}

// =============================================================================
// TEST 2: Reported P&L brokers
// =============================================================================
TEST(unknown_broker_uses_reported_pnl) {
    MemoryTradeStore store;
    config::JournalConfig cfg;
    ImportOrchestrator<MemoryTradeStore> importer(store, cfg);

    auto outcome = importer.run(request(" SomeBroker ", TRADOVATE_FILLS));
    ASSERT_EQ_ENUM(outcome.status, ImportStatus::Imported);
    ASSERT_EQ(outcome.broker, "SomeBroker");
    ASSERT_EQ(outcome.profile, "Default");
    for (const auto& r : store.rows()) {
        ASSERT_TRUE(!r.pnl.has_value());
        ASSERT_EQ(r.source_broker, "SomeBroker");
    }
}

TEST(broker_name_is_case_insensitive) {
    MemoryTradeStore store;
    config::JournalConfig cfg;
    ImportOrchestrator<MemoryTradeStore> importer(store, cfg);

    auto outcome = importer.run(request("tradovate", TRADOVATE_FILLS));
    ASSERT_EQ_ENUM(outcome.status, ImportStatus::Imported);
    ASSERT_EQ(outcome.profile, "Tradovate");
    ASSERT_EQ(outcome.broker, "Tradovate");
    ASSERT_NEAR(find_row(store, "Short", "NQ")->pnl.value_or(-1), 196.0, 1e-9);
    ASSERT_EQ(find_row(store, "Short", "NQ")->source_broker, "Tradovate");
}

// Columns declared in a config-file profile drive parsing
TEST(example_config_profile_columns) {
    auto cfg = config::ConfigParser::load(std::string(JOURNAL_SOURCE_DIR) + "/config/brokers.example.json");
    MemoryTradeStore store;
    ImportOrchestrator<MemoryTradeStore> importer(store, cfg);

    auto outcome = importer.run(request("NinjaTrader",
                                        "Instrument,Action,Quantity,Price,Time,Commission\n"
                                        "NQ 12-25,Buy,2,100,11/18/2025 6:02:12 PM,2\n"
                                        "NQ 12-25,Sell,2,105,11/18/2025 6:05:00 PM,2\n"));
    ASSERT_EQ_ENUM(outcome.status, ImportStatus::Imported);
    ASSERT_EQ(outcome.inserted_count, 2u);

    const TradeRecord* open = find_row(store, "Long", "NQ");
    const TradeRecord* close = find_row(store, "Short", "NQ");
    ASSERT_TRUE(open != nullptr);
    ASSERT_TRUE(close != nullptr);
    ASSERT_EQ(open->entry_ts.value_or(0), 1763488932000LL); // 2025-11-18T18:02:12Z
    ASSERT_NEAR(open->pnl.value_or(-1), 0.0, 1e-12);
    ASSERT_NEAR(close->pnl.value_or(-1), 196.0, 1e-9);
    ASSERT_EQ(close->source_broker, "NinjaTrader");
}

TEST(generic_rows_pass_through) {
    MemoryTradeStore store;
    config::JournalConfig cfg;
    ImportOrchestrator<MemoryTradeStore> importer(store, cfg);

    auto outcome = importer.run(request("Generic CSV Format",
                                        "Date,Time,Ticker,Side,Asset Type,Quantity,P&L\n"
                                        "2025-11-18,18:02,AAPL,Long,Stock,10,150.25\n"));
    ASSERT_EQ(outcome.inserted_count, 1u);
    ASSERT_NEAR(store.rows()[0].pnl.value_or(0), 150.25, 1e-12);
    ASSERT_EQ(store.rows()[0].entry_ts.value_or(0), 1763488920000LL);
}

// =============================================================================
// TEST 3: Date cutoff and fees
// =============================================================================
TEST(date_cutoff_keeps_undated_rows) {
    MemoryTradeStore store;
    config::JournalConfig cfg;
    ImportOrchestrator<MemoryTradeStore> importer(store, cfg);

    auto r = request("Generic CSV Format",
                     "Date,Ticker,Side,P&L\n"
                     "2025-11-17,NQ,Long,10\n"
                     "2025-11-19,NQ,Long,20\n"
                     ",NQ,Short,30\n");
    r.earliest = util::make_utc_ms(2025, 11, 18);

    auto outcome = importer.run(r);
    ASSERT_EQ_ENUM(outcome.status, ImportStatus::Imported);
    ASSERT_EQ(outcome.parsed_rows, 3u);
    ASSERT_EQ(outcome.after_date_filter, 2u);
    ASSERT_TRUE(find_row(store, "Long", "NQ")->pnl == 20.0);
    ASSERT_TRUE(find_row(store, "Short", "NQ") != nullptr);
}

TEST(everything_before_cutoff) {
    MemoryTradeStore store;
    config::JournalConfig cfg;
    ImportOrchestrator<MemoryTradeStore> importer(store, cfg);

    auto r = request("Tradovate", TRADOVATE_FILLS);
    r.earliest = util::make_utc_ms(2026, 1, 1);
    auto outcome = importer.run(r);
    ASSERT_EQ_ENUM(outcome.status, ImportStatus::AllFilteredByDate);
    ASSERT_EQ(store.query_calls(), 0u);
}

TEST(fee_override_stacks_on_commission) {
    MemoryTradeStore store;
    config::JournalConfig cfg;
    ImportOrchestrator<MemoryTradeStore> importer(store, cfg);

    auto r = request("Tradovate",
                     "B/S,Contract,Type,avgPrice,filledQty,Fill Time,commission\n"
                     "Buy,NQZ5,Future,100,2,11/18/2025 06:00:00 PM,2\n"
                     "Sell,NQZ5,Future,105,2,11/18/2025 06:05:00 PM,2\n");
    r.fee_per_unit = 1.0;
    importer.run(r);

    // 196 after both commissions, then 1 * |2| more
    ASSERT_NEAR(find_row(store, "Short", "NQ")->pnl.value_or(0), 194.0, 1e-9);
    ASSERT_NEAR(find_row(store, "Long", "NQ")->pnl.value_or(0), -2.0, 1e-9);
}

TEST(fee_override_skips_non_futures) {
    PartialTrade stock;
    stock.type = "Stock";
    stock.qty = 10;
    stock.pnl = 50;
    apply_fee_override(stock, 1.0);
    ASSERT_NEAR(stock.pnl.value_or(0), 50.0, 1e-12);

    PartialTrade future;
    future.type = "FUTURES";
    future.qty = 3;
    apply_fee_override(future, 1.0);
    ASSERT_TRUE(!future.pnl.has_value());

    future.pnl = 10;
    apply_fee_override(future, 0.5);
    ASSERT_NEAR(future.pnl.value_or(0), 8.5, 1e-12);
}

// =============================================================================
// TEST 4: Validation and empty input
// =============================================================================
TEST(missing_owner_and_account) {
    MemoryTradeStore store;
    config::JournalConfig cfg;
    ImportOrchestrator<MemoryTradeStore> importer(store, cfg);

    auto r = request("Tradovate", TRADOVATE_FILLS);
    r.owner = "";
    ASSERT_EQ_ENUM(importer.run(r).status, ImportStatus::MissingOwner);

    r = request("Tradovate", TRADOVATE_FILLS);
    r.account = "   ";
    ASSERT_EQ_ENUM(importer.run(r).status, ImportStatus::MissingAccount);
    ASSERT_EQ(store.query_calls(), 0u);
}

TEST(account_name_is_trimmed) {
    MemoryTradeStore store;
    config::JournalConfig cfg;
    ImportOrchestrator<MemoryTradeStore> importer(store, cfg);

    auto r = request("Tradovate", TRADOVATE_FILLS);
    r.account = "  APEX-1 ";
    importer.run(r);
    ASSERT_EQ(store.rows()[0].source_account, "APEX-1");
}

TEST(empty_statement_never_queries_store) {
    MemoryTradeStore store;
    config::JournalConfig cfg;
    ImportOrchestrator<MemoryTradeStore> importer(store, cfg);

    auto outcome = importer.run(request("Tradovate", "B/S,Contract,avgPrice\n,,\n"));
    ASSERT_EQ_ENUM(outcome.status, ImportStatus::EmptyStatement);
    ASSERT_TRUE(outcome.ok());
    ASSERT_EQ(store.query_calls(), 0u);
    ASSERT_EQ(describe(outcome), "No rows found in CSV.");
}

// =============================================================================
// TEST 5: Storage failures
// =============================================================================
TEST(query_failure_aborts_before_insert) {
    MemoryTradeStore store;
    config::JournalConfig cfg;
    ImportOrchestrator<MemoryTradeStore> importer(store, cfg);

    store.fail_next_query("permission denied for table trades");
    auto outcome = importer.run(request("Tradovate", TRADOVATE_FILLS));
    ASSERT_EQ_ENUM(outcome.status, ImportStatus::StorageQueryFailed);
    ASSERT_EQ(outcome.message, "permission denied for table trades");
    ASSERT_TRUE(!outcome.ok());
    ASSERT_EQ(store.insert_calls(), 0u);
    ASSERT_EQ(describe(outcome), "Unable to check existing trades: permission denied for table trades");
}

TEST(insert_failure_reports_message) {
    MemoryTradeStore store;
    config::JournalConfig cfg;
    ImportOrchestrator<MemoryTradeStore> importer(store, cfg);

    store.fail_next_insert("duplicate key value");
    auto outcome = importer.run(request("Tradovate", TRADOVATE_FILLS));
    ASSERT_EQ_ENUM(outcome.status, ImportStatus::StorageInsertFailed);
    ASSERT_EQ(outcome.message, "duplicate key value");
    ASSERT_EQ(outcome.inserted_count, 0u);
    ASSERT_EQ(store.size(), 0u);

    // next attempt goes through
    ASSERT_EQ_ENUM(importer.run(request("Tradovate", TRADOVATE_FILLS)).status, ImportStatus::Imported);
}

// =============================================================================
// TEST 6: Concurrency
// =============================================================================
TEST(same_account_imports_are_serialized) {
    for (int round = 0; round < 20; ++round) {
        MemoryTradeStore store;
        config::JournalConfig cfg;
        ImportOrchestrator<MemoryTradeStore> importer(store, cfg);

        ImportOutcome first;
        ImportOutcome second;
        std::thread a([&] { first = importer.run(request("Tradovate", TRADOVATE_FILLS)); });
        std::thread b([&] { second = importer.run(request("Tradovate", TRADOVATE_FILLS)); });
        a.join();
        b.join();

        // One import stores everything, the other finds it all stored
        int imported = (first.status == ImportStatus::Imported) + (second.status == ImportStatus::Imported);
        int duplicates =
            (first.status == ImportStatus::AllDuplicates) + (second.status == ImportStatus::AllDuplicates);
        ASSERT_EQ(imported, 1);
        ASSERT_EQ(duplicates, 1);
        ASSERT_EQ(first.inserted_count + second.inserted_count, 3u);
        ASSERT_EQ(store.size(), 3u);
        ASSERT_EQ(store.insert_calls(), 1u);
        ASSERT_EQ(importer.locked_accounts(), 0u);
    }
}

TEST(account_locks_are_released) {
    MemoryTradeStore store;
    config::JournalConfig cfg;
    ImportOrchestrator<MemoryTradeStore> importer(store, cfg);

    for (int i = 0; i < 50; ++i) {
        auto r = request("Tradovate", TRADOVATE_FILLS);
        r.account = "ACCT-" + std::to_string(i);
        ASSERT_EQ_ENUM(importer.run(r).status, ImportStatus::Imported);
    }
    ASSERT_EQ(importer.locked_accounts(), 0u);

    // Failures release too
    store.fail_next_query("offline");
    ASSERT_EQ_ENUM(importer.run(request("Tradovate", TRADOVATE_FILLS)).status, ImportStatus::StorageQueryFailed);
    ASSERT_EQ(importer.locked_accounts(), 0u);
}

// =============================================================================
// TEST 7: Logging
// =============================================================================
TEST(failures_are_logged) {
    MemoryTradeStore store;
    config::JournalConfig cfg;
    logging::AsyncLogger logger;
    std::vector<std::string> errors;
    logger.set_output_callback([&](const logging::LogEntry& e) {
        if (e.level == logging::LogLevel::Error)
            errors.push_back(e.message);
    });

    ImportOrchestrator<MemoryTradeStore> importer(store, cfg, &logger);
    store.fail_next_insert("timeout");
    importer.run(request("Tradovate", TRADOVATE_FILLS));
    logger.flush();

    ASSERT_EQ(errors.size(), 1u);
    ASSERT_EQ(errors[0], "Import failed: timeout");
}

int main() {
    std::cout << "\n=== Import Orchestrator Tests ===\n\n";

    std::cout << "FIFO statements:\n";
    RUN_TEST(tradovate_fills_get_fifo_pnl);
    RUN_TEST(reimport_is_all_duplicates);
    RUN_TEST(overlapping_statement_inserts_only_new_rows);
    RUN_TEST(same_statement_other_account_is_not_duplicate);

    std::cout << "\nReported P&L:\n";
    RUN_TEST(unknown_broker_uses_reported_pnl);
    RUN_TEST(broker_name_is_case_insensitive);
    RUN_TEST(example_config_profile_columns);
    RUN_TEST(generic_rows_pass_through);

    std::cout << "\nDate cutoff and fees:\n";
    RUN_TEST(date_cutoff_keeps_undated_rows);
    RUN_TEST(everything_before_cutoff);
    RUN_TEST(fee_override_stacks_on_commission);
    RUN_TEST(fee_override_skips_non_futures);

    std::cout << "\nValidation:\n";
    RUN_TEST(missing_owner_and_account);
    RUN_TEST(account_name_is_trimmed);
    RUN_TEST(empty_statement_never_queries_store);

    std::cout << "\nStorage failures:\n";
    RUN_TEST(query_failure_aborts_before_insert);
    RUN_TEST(insert_failure_reports_message);

    std::cout << "\nConcurrency:\n";
    RUN_TEST(same_account_imports_are_serialized);
    RUN_TEST(account_locks_are_released);

    std::cout << "\nLogging:\n";
    RUN_TEST(failures_are_logged);

    std::cout << "\n=== All tests PASSED! ===\n\n";
    return 0;
}
