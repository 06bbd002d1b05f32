#pragma once

/**
 * SourceManager - import sources of one owner
 *
 * A source is an (account, broker) pair that trades were imported under.
 * Listing groups the owner's stored trades by that pair and reports the
 * newest trade timestamp of each group, newest group first. Deleting a
 * source removes every trade of the account.
 */

#include "../config/defaults.hpp"
#include "../ingest/timestamp.hpp"
#include "../logging/async_logger.hpp"
#include "../storage/trade_store.hpp"
#include "../types.hpp"
#include "../util/string_utils.hpp"

#include <algorithm>
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace journal::pipeline {

struct ImportSource {
    std::string account;
    std::string broker;
    std::optional<TimestampMs> latest; // newest trade, absent if none is timestamped
    std::string latest_text;           // as stored
    size_t trade_count = 0;
};

struct SourceListing {
    bool ok = true;
    std::string message; // storage error text when !ok
    std::vector<ImportSource> sources;
};

enum class DeleteStatus : uint8_t { Deleted = 0, NothingToDelete, MissingAccount, StorageFailed };

inline const char* delete_status_to_string(DeleteStatus status) {
    switch (status) {
    case DeleteStatus::Deleted:
        return "Deleted";
    case DeleteStatus::NothingToDelete:
        return "NothingToDelete";
    case DeleteStatus::MissingAccount:
        return "MissingAccount";
    case DeleteStatus::StorageFailed:
        return "StorageFailed";
    default:
        return "Unknown";
    }
}

struct DeleteOutcome {
    DeleteStatus status = DeleteStatus::Deleted;
    size_t deleted_count = 0;
    std::string account;
    std::string message;
};

inline std::string describe(const DeleteOutcome& outcome) {
    switch (outcome.status) {
    case DeleteStatus::Deleted:
        return "Deleted " + std::to_string(outcome.deleted_count) + " trades from " + outcome.account + ".";
    case DeleteStatus::NothingToDelete:
        return "No trades found for " + outcome.account + ".";
    case DeleteStatus::MissingAccount:
        return "Enter an account name to delete.";
    case DeleteStatus::StorageFailed:
        return "Unable to delete trades for " + outcome.account + ": " + outcome.message;
    default:
        return delete_status_to_string(outcome.status);
    }
}

/**
 * Group raw source rows. Rows without an account are ignored; a blank
 * broker is reported as "Unknown".
 */
inline std::vector<ImportSource> group_sources(const std::vector<SourceRow>& rows) {
    std::vector<ImportSource> groups;
    std::map<std::pair<std::string, std::string>, size_t> index;

    for (const auto& row : rows) {
        if (row.account.empty())
            continue;
        std::string broker = row.broker.empty() ? config::brokers::UNKNOWN_BROKER : row.broker;

        auto key = std::make_pair(row.account, broker);
        auto it = index.find(key);
        if (it == index.end()) {
            it = index.emplace(key, groups.size()).first;
            groups.push_back({row.account, broker, std::nullopt, {}, 0});
        }

        ImportSource& group = groups[it->second];
        ++group.trade_count;
        auto ts = ingest::parse_timestamp(row.entry_ts);
        if (ts && (!group.latest || *ts > *group.latest)) {
            group.latest = ts;
            group.latest_text = row.entry_ts;
        }
    }

    std::stable_sort(groups.begin(), groups.end(), [](const ImportSource& a, const ImportSource& b) {
        if (!a.latest)
            return false;
        if (!b.latest)
            return true;
        return *a.latest > *b.latest;
    });
    return groups;
}

template <storage::TradeStore Store>
class SourceManager {
public:
    explicit SourceManager(Store& store, logging::AsyncLogger* logger = nullptr) : store_(store), logger_(logger) {}

    SourceListing list_sources(const std::string& owner) {
        SourceListing listing;
        try {
            listing.sources = group_sources(store_.query_sources(owner));
        } catch (const storage::StorageError& e) {
            listing.ok = false;
            listing.message = e.what();
            if (logger_)
                logger_->logf(logging::LogLevel::Error, logging::LogCategory::Storage,
                              "Unable to load import sources: %s", e.what());
            return listing;
        }
        if (logger_)
            logger_->logf(logging::LogLevel::Debug, logging::LogCategory::Storage, "%zu import sources",
                          listing.sources.size());
        return listing;
    }

    DeleteOutcome delete_source(const std::string& owner, const std::string& account) {
        DeleteOutcome outcome;
        outcome.account = util::trim(account);
        if (outcome.account.empty()) {
            outcome.status = DeleteStatus::MissingAccount;
            return outcome;
        }

        try {
            outcome.deleted_count = store_.remove(owner, outcome.account);
        } catch (const storage::StorageError& e) {
            outcome.status = DeleteStatus::StorageFailed;
            outcome.message = e.what();
            if (logger_)
                logger_->logf(logging::LogLevel::Error, logging::LogCategory::Storage, "%s",
                              describe(outcome).c_str());
            return outcome;
        }

        outcome.status = outcome.deleted_count > 0 ? DeleteStatus::Deleted : DeleteStatus::NothingToDelete;
        if (logger_)
            logger_->logf(logging::LogLevel::Info, logging::LogCategory::Storage, "%s", describe(outcome).c_str());
        return outcome;
    }

private:
    Store& store_;
    logging::AsyncLogger* logger_;
};

} // namespace journal::pipeline
