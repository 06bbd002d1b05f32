#pragma once

/**
 * Trade store contract
 *
 * Storage collaborator of the import pipeline. Any type with these four
 * operations can back an ImportOrchestrator or SourceManager:
 *
 *   query_existing(owner, account) -> std::vector<StoredTrade>
 *   insert(rows)                   -> size_t inserted (all or nothing)
 *   remove(owner, account)         -> size_t deleted
 *   query_sources(owner)           -> std::vector<SourceRow>
 *
 * Failures are reported by throwing StorageError; its message is shown to
 * the user verbatim.
 *
 * Implementations:
 *   - MemoryTradeStore (tests, failure injection)
 *   - FileTradeStore   (local JSON file)
 *   - RestTradeStore   (PostgREST / Supabase over libcurl)
 */

#include "../types.hpp"

#include <concepts>
#include <cstddef>
#include <stdexcept>
#include <string>
#include <vector>

namespace journal::storage {

class StorageError : public std::runtime_error {
public:
    explicit StorageError(const std::string& message) : std::runtime_error(message) {}
};

template <typename T>
concept TradeStore = requires(T& store, const std::string& owner, const std::string& account,
                              const std::vector<TradeRecord>& rows) {
    { store.query_existing(owner, account) } -> std::convertible_to<std::vector<StoredTrade>>;
    { store.insert(rows) } -> std::convertible_to<size_t>;
    { store.remove(owner, account) } -> std::convertible_to<size_t>;
    { store.query_sources(owner) } -> std::convertible_to<std::vector<SourceRow>>;
};

} // namespace journal::storage
