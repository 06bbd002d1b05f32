/**
 * journal_import - import broker statements into the trade journal
 *
 * Usage:
 *   journal_import import -b Tradovate -a APEX-1 -f fills.csv [--fee 0.5] [--since 2025-11-01]
 *   journal_import sources
 *   journal_import delete -a APEX-1
 *   journal_import brokers
 *
 * Storage is a local JSON file unless a PostgREST URL is configured
 * (--store https://..., the config file, or JOURNAL_STORE_URL).
 */
#include "../include/config/broker_config.hpp"
#include "../include/logging/async_logger.hpp"
#include "../include/pipeline/import_orchestrator.hpp"
#include "../include/pipeline/source_manager.hpp"
#include "../include/storage/file_trade_store.hpp"
#include "../include/storage/rest_trade_store.hpp"
#include "../include/util/cli.hpp"
#include "../include/util/string_utils.hpp"
#include "../include/util/time_utils.hpp"

#include <fstream>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <string>

using namespace journal;

namespace {

std::string read_file(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in.is_open()) {
        throw std::runtime_error("Cannot open statement: " + path);
    }
    std::stringstream buffer;
    buffer << in.rdbuf();
    return buffer.str();
}

void print_brokers(const config::JournalConfig& cfg) {
    for (const auto& b : cfg.brokers.brokers()) {
        std::cout << "\n" << b.name << "\n";
        std::cout << std::string(b.name.size(), '-') << "\n";
        std::cout << "  P&L:        " << pnl_source_to_string(b.pnl_source) << "\n";
        std::cout << "  Sides:      " << side_convention_to_string(b.side_convention) << "\n";
        if (!b.file_pattern.empty())
            std::cout << "  File:       " << b.file_pattern << "\n";
        if (!b.notes.empty())
            std::cout << "  Notes:      " << b.notes << "\n";

        if (!b.columns.empty()) {
            std::cout << "  Columns:\n";
            for (const auto& c : b.columns) {
                std::cout << "    " << std::left << std::setw(18) << c.label << (c.required ? "required " : "optional ")
                          << c.description;
                if (!c.maps_to.empty())
                    std::cout << " [" << c.maps_to << "]";
                std::cout << "\n";
            }
        }
        if (!b.instructions.empty()) {
            std::cout << "  Export:\n";
            int step = 1;
            for (const auto& line : b.instructions)
                std::cout << "    " << step++ << ". " << line << "\n";
        }
    }

    std::cout << "\nInstruments:\n";
    for (const auto& spec : cfg.instruments.specs()) {
        std::cout << "  " << std::left << std::setw(8) << spec.symbol << "$" << spec.multiplier << " per point\n";
    }
}

template <storage::TradeStore Store>
int run_command(Store& store, const util::CLIArgs& args, const config::JournalConfig& cfg,
                logging::AsyncLogger& logger) {
    switch (args.command) {
    case util::Command::Import: {
        if (args.file.empty()) {
            std::cerr << "Error: --file is required\n";
            return 1;
        }
        pipeline::ImportRequest request;
        request.owner = args.owner;
        request.broker = args.broker;
        request.account = args.account;
        request.text = read_file(args.file);
        request.fee_per_unit = args.fee;
        request.earliest = args.since;

        pipeline::ImportOrchestrator<Store> importer(store, cfg, &logger);
        auto outcome = importer.run(request);

        logger.stop();
        std::cout << pipeline::describe(outcome) << "\n";
        if (args.verbose) {
            std::cout << "  broker:     " << outcome.broker << " (profile " << outcome.profile << ")\n"
                      << "  parsed:     " << outcome.parsed_rows << "\n"
                      << "  in range:   " << outcome.after_date_filter << "\n"
                      << "  duplicates: " << outcome.duplicate_rows << "\n";
        }
        return outcome.ok() ? 0 : 1;
    }

    case util::Command::Sources: {
        pipeline::SourceManager<Store> manager(store, &logger);
        auto listing = manager.list_sources(args.owner);
        logger.stop();
        if (!listing.ok) {
            std::cerr << "Unable to load import sources: " << listing.message << "\n";
            return 1;
        }
        if (listing.sources.empty()) {
            std::cout << "No import sources yet.\n";
            return 0;
        }
        std::cout << std::left << std::setw(24) << "Account" << std::setw(22) << "Broker" << std::setw(8)
                  << "Trades" << "Last Updated\n";
        for (const auto& s : listing.sources) {
            std::cout << std::left << std::setw(24) << s.account << std::setw(22) << s.broker << std::setw(8)
                      << s.trade_count << (s.latest ? util::format_iso_ms(*s.latest) : std::string("-")) << "\n";
        }
        return 0;
    }

    case util::Command::Delete: {
        pipeline::SourceManager<Store> manager(store, &logger);
        auto outcome = manager.delete_source(args.owner, args.account);
        logger.stop();
        std::cout << pipeline::describe(outcome) << "\n";
        return outcome.status == pipeline::DeleteStatus::Deleted ||
                       outcome.status == pipeline::DeleteStatus::NothingToDelete
                   ? 0
                   : 1;
    }

    default:
        util::print_help();
        return 1;
    }
}

} // namespace

int main(int argc, char* argv[]) {
    try {
        util::CLIArgs args;
        if (!util::parse_args(argc, argv, args)) {
            return 1;
        }
        if (args.help) {
            util::print_help();
            return 0;
        }
        if (args.command == util::Command::None) {
            util::print_help();
            return 1;
        }

        config::JournalConfig cfg =
            args.config_path.empty() ? config::ConfigParser::defaults() : config::ConfigParser::load(args.config_path);

        if (args.command == util::Command::Brokers) {
            print_brokers(cfg);
            return 0;
        }

        if (!args.store.empty()) {
            if (util::starts_with(args.store, "http://") || util::starts_with(args.store, "https://")) {
                cfg.store.backend = "rest";
                cfg.store.url = args.store;
            } else {
                cfg.store.backend = "file";
                cfg.store.path = args.store;
            }
        }

        logging::AsyncLogger logger;
        logger.set_min_level(args.verbose ? logging::LogLevel::Debug : logging::LogLevel::Warn);
        logger.start();

        if (cfg.store.backend == "rest") {
            if (cfg.store.url.empty()) {
                std::cerr << "Error: REST store needs a URL (--store or " << config::store::URL_ENV << ")\n";
                return 1;
            }
            storage::RestTradeStore store(cfg.store.url, cfg.store.api_key, cfg.store.table);
            LOGF_CATEGORY(logger, Debug, Storage, "REST store %s", store.endpoint().c_str());
            return run_command(store, args, cfg, logger);
        }

        storage::FileTradeStore store(cfg.store.path);
        LOGF_CATEGORY(logger, Debug, Storage, "file store %s", store.path().c_str());
        return run_command(store, args, cfg, logger);

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}
