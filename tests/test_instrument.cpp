/**
 * Instrument Table Test Suite
 *
 * Tests ticker normalization (qualified aliases, dated contracts,
 * micro vs full-size roots) and per-point multipliers.
 *
 * Run with: ./test_instrument
 */

#include <cassert>
#include <iostream>
#include <string>

#include "../include/ingest/instrument.hpp"

using namespace journal::ingest;

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

#define ASSERT_TRUE(expr) do { \
    if (!(expr)) { \
        std::cerr << "\nFAIL: " << #expr << " is false\n"; \
        assert(false); \
    } \
} while(0)

// =============================================================================
// TEST 1: Normalization
// =============================================================================
TEST(qualified_alias_collapses_to_root) {
    auto table = InstrumentTable::builtin();
    ASSERT_EQ(table.normalize("CME_MINI:NQ1!"), "NQ");
    ASSERT_EQ(table.normalize("CME_MINI:MNQ1!"), "MNQ");
}

TEST(dated_contracts_collapse_to_root) {
    auto table = InstrumentTable::builtin();
    ASSERT_EQ(table.normalize("NQZ5"), "NQ");
    ASSERT_EQ(table.normalize("MNQZ5"), "MNQ");
    ASSERT_EQ(table.normalize("mnqh6"), "MNQ");
}

TEST(unknown_ticker_passes_through_trimmed) {
    auto table = InstrumentTable::builtin();
    ASSERT_EQ(table.normalize("  AAPL "), "AAPL");
    ASSERT_EQ(table.normalize("esZ5"), "esZ5");
    ASSERT_EQ(table.normalize(""), "");
}

// =============================================================================
// TEST 2: Multipliers
// =============================================================================
TEST(builtin_multipliers) {
    auto table = InstrumentTable::builtin();
    ASSERT_EQ(table.multiplier("CME_MINI:NQ1!"), 20.0);
    ASSERT_EQ(table.multiplier("NQ"), 20.0);
    ASSERT_EQ(table.multiplier("MNQZ5"), 1.0);
    ASSERT_EQ(table.multiplier("AAPL"), 1.0);
}

TEST(added_instrument_is_resolved) {
    auto table = InstrumentTable::builtin();
    table.add({"ES", 50.0, {"CME_MINI:ES"}, true});
    table.add({"MES", 5.0, {"CME_MINI:MES"}, true});
    ASSERT_EQ(table.normalize("ESZ5"), "ES");
    ASSERT_EQ(table.normalize("MESZ5"), "MES");
    ASSERT_EQ(table.multiplier("CME_MINI:ES1!"), 50.0);
    ASSERT_EQ(table.multiplier("MESZ5"), 5.0);
}

TEST(add_replaces_existing_symbol) {
    auto table = InstrumentTable::builtin();
    size_t before = table.size();
    table.add({"nq", 25.0, {}, true});
    ASSERT_EQ(table.size(), before);
    ASSERT_EQ(table.multiplier("NQZ5"), 25.0);
}

TEST(prefix_matching_can_be_disabled) {
    InstrumentTable table;
    table.add({"GC", 100.0, {"COMEX:GC"}, false});
    ASSERT_EQ(table.normalize("GCZ5"), "GCZ5");
    ASSERT_EQ(table.normalize("COMEX:GC1!"), "GC");
}

int main() {
    std::cout << "\n=== Instrument Tests ===\n\n";

    std::cout << "Normalization:\n";
    RUN_TEST(qualified_alias_collapses_to_root);
    RUN_TEST(dated_contracts_collapse_to_root);
    RUN_TEST(unknown_ticker_passes_through_trimmed);

    std::cout << "\nMultipliers:\n";
    RUN_TEST(builtin_multipliers);
    RUN_TEST(added_instrument_is_resolved);
    RUN_TEST(add_replaces_existing_symbol);
    RUN_TEST(prefix_matching_can_be_disabled);

    std::cout << "\n=== All tests PASSED! ===\n\n";
    return 0;
}
