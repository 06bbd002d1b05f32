#pragma once

/**
 * CLI utilities for journal_import
 *
 * Provides command-line argument parsing and related utilities.
 */

#include "../config/defaults.hpp"
#include "../types.hpp"
#include "time_utils.hpp"

#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>

namespace journal {
namespace util {

enum class Command : uint8_t { None = 0, Import, Sources, Delete, Brokers };

/**
 * Command-line arguments for journal_import.
 */
struct CLIArgs {
    Command command = Command::None;
    bool help = false;
    bool verbose = false;
    std::string broker;
    std::string account;
    std::string file;
    std::string owner = config::cli::DEFAULT_OWNER;
    std::optional<double> fee;            // extra fee per futures contract
    std::optional<TimestampMs> since;     // earliest trade date, UTC midnight
    std::string config_path;
    std::string store;                    // file path or http(s) URL
};

/**
 * Print help message for journal_import.
 */
inline void print_help() {
    std::cout << R"(
Trade Journal Statement Import
==============================

Usage: journal_import <command> [options]

Commands:
  import                 Import a broker statement (CSV)
  sources                List import sources (account, broker, last trade)
  delete                 Delete every trade of one account
  brokers                Show broker profiles and their CSV columns

Import options:
  -b, --broker NAME      Broker profile (e.g. Tradovate, TradingView)
  -a, --account NAME     Account the trades are filed under
  -f, --file PATH        Statement CSV
  --fee USD              Extra fee per contract, deducted from futures P&L
  --since YYYY-MM-DD     Skip trades before this date

Common options:
  -o, --owner ID         Owner id (default: local)
  -c, --config PATH      JSON config (brokers, instruments, store)
  --store PATH|URL       Trade file, or PostgREST base URL
  -v, --verbose          Debug logging
  -h, --help             Show this help

Environment:
  JOURNAL_STORE_URL      PostgREST base URL (selects the REST store)
  JOURNAL_STORE_KEY      API key for the REST store

Examples:
  journal_import import -b Tradovate -a APEX-1 -f fills-2025-11-18.csv
  journal_import import -b TradingView -a paper -f history.csv --since 2025-11-01
  journal_import sources
  journal_import delete -a APEX-1
)";
}

/**
 * Parse "YYYY-MM-DD" as UTC midnight.
 *
 * @throws std::invalid_argument on malformed dates
 */
inline TimestampMs parse_date_arg(const std::string& s) {
    int y = 0, m = 0, d = 0;
    char tail = 0;
    if (s.size() != 10 || std::sscanf(s.c_str(), "%4d-%2d-%2d%c", &y, &m, &d, &tail) != 3) {
        throw std::invalid_argument("Invalid date (expected YYYY-MM-DD): " + s);
    }
    auto ts = make_utc_ms(y, m, d);
    if (!ts) {
        throw std::invalid_argument("Invalid date: " + s);
    }
    return *ts;
}

/**
 * Parse a per-contract fee. The whole argument must be a finite,
 * non-negative number.
 *
 * @throws std::invalid_argument otherwise
 */
inline double parse_fee_arg(const std::string& s) {
    char* end = nullptr;
    double fee = std::strtod(s.c_str(), &end);
    if (s.empty() || end != s.c_str() + s.size() || !std::isfinite(fee) || fee < 0) {
        throw std::invalid_argument("Invalid fee (expected a non-negative number): " + s);
    }
    return fee;
}

inline Command parse_command(const std::string& s) {
    if (s == "import")
        return Command::Import;
    if (s == "sources")
        return Command::Sources;
    if (s == "delete")
        return Command::Delete;
    if (s == "brokers")
        return Command::Brokers;
    return Command::None;
}

/**
 * Parse command-line arguments into CLIArgs struct.
 *
 * @param argc Argument count
 * @param argv Argument values
 * @param args Output argument struct
 * @return true if parsing succeeded, false on error
 * @throws std::invalid_argument on malformed numbers or dates
 */
inline bool parse_args(int argc, char* argv[], CLIArgs& args) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--help" || arg == "-h") {
            args.help = true;
        }
        else if (arg == "--verbose" || arg == "-v") {
            args.verbose = true;
        }
        else if ((arg == "--broker" || arg == "-b") && i + 1 < argc) {
            args.broker = argv[++i];
        }
        else if ((arg == "--account" || arg == "-a") && i + 1 < argc) {
            args.account = argv[++i];
        }
        else if ((arg == "--file" || arg == "-f") && i + 1 < argc) {
            args.file = argv[++i];
        }
        else if ((arg == "--owner" || arg == "-o") && i + 1 < argc) {
            args.owner = argv[++i];
        }
        else if (arg == "--fee" && i + 1 < argc) {
            args.fee = parse_fee_arg(argv[++i]);
        }
        else if (arg == "--since" && i + 1 < argc) {
            args.since = parse_date_arg(argv[++i]);
        }
        else if ((arg == "--config" || arg == "-c") && i + 1 < argc) {
            args.config_path = argv[++i];
        }
        else if (arg == "--store" && i + 1 < argc) {
            args.store = argv[++i];
        }
        else if (args.command == Command::None && parse_command(arg) != Command::None) {
            args.command = parse_command(arg);
        }
        else {
            std::cerr << "Unknown option: " << arg << "\n";
            std::cerr << "Use --help for usage information.\n";
            return false;
        }
    }
    return true;
}

}  // namespace util
}  // namespace journal
