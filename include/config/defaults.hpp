#pragma once

#include <cstddef>
#include <cstdint>

/**
 * Centralized defaults for the statement import pipeline.
 *
 * Values are organized by category:
 * - instruments: built-in contract multipliers
 * - reconcile:   lot matching tolerances
 * - dedup:       trade key formatting
 * - store:       storage backend defaults
 */

namespace journal::config {

// =============================================================================
// Instruments (per-point dollar value)
// =============================================================================
namespace instruments {
constexpr double NQ_MULTIPLIER = 20.0;     // E-mini Nasdaq-100
constexpr double MNQ_MULTIPLIER = 1.0;     // Micro E-mini Nasdaq-100
constexpr double DEFAULT_MULTIPLIER = 1.0; // Anything not in the table
} // namespace instruments

// =============================================================================
// FIFO reconciliation
// =============================================================================
namespace reconcile {
// Lots at or below this remaining quantity are treated as closed
constexpr double LOT_EPSILON = 1e-8;
} // namespace reconcile

// =============================================================================
// Duplicate detection
// =============================================================================
namespace dedup {
constexpr char KEY_DELIMITER = '\x1f'; // ASCII unit separator
constexpr int NUMBER_DECIMALS = 4;
} // namespace dedup

// =============================================================================
// Storage
// =============================================================================
namespace store {
constexpr const char* DEFAULT_FILE = "trades.json";
constexpr const char* DEFAULT_TABLE = "trades";
constexpr long HTTP_TIMEOUT_SEC = 30;
constexpr size_t PAGE_SIZE = 1000; // rows per GET; PostgREST max-rows default
constexpr const char* URL_ENV = "JOURNAL_STORE_URL";
constexpr const char* KEY_ENV = "JOURNAL_STORE_KEY";
} // namespace store

// =============================================================================
// Brokers
// =============================================================================
namespace brokers {
constexpr const char* DEFAULT_PROFILE = "Default";
constexpr const char* UNKNOWN_BROKER = "Unknown";
} // namespace brokers

// =============================================================================
// Command line
// =============================================================================
namespace cli {
constexpr const char* DEFAULT_OWNER = "local";
} // namespace cli

} // namespace journal::config
