/**
 * Timestamp Reconstruction Test Suite
 *
 * Tests ISO and US statement formats, zone offsets, and the column
 * priority used to rebuild a row's instant.
 *
 * Run with: ./test_timestamp
 */

#include <cassert>
#include <iostream>
#include <string>

#include "../include/ingest/csv_reader.hpp"
#include "../include/ingest/timestamp.hpp"
#include "../include/util/time_utils.hpp"

using namespace journal;
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

// 2025-11-18T18:02:12Z
constexpr TimestampMs T0 = 1763488932000LL;

// =============================================================================
// TEST 1: ISO shapes
// =============================================================================
TEST(iso_with_zulu) {
    ASSERT_EQ(parse_timestamp("2025-11-18T18:02:12Z").value_or(0), T0);
}

TEST(iso_without_zone_is_utc) {
    ASSERT_EQ(parse_timestamp("2025-11-18T18:02:12").value_or(0), T0);
    ASSERT_EQ(parse_timestamp("2025-11-18 18:02:12").value_or(0), T0);
}

TEST(iso_offsets) {
    ASSERT_EQ(parse_timestamp("2025-11-18T19:02:12+01:00").value_or(0), T0);
    ASSERT_EQ(parse_timestamp("2025-11-18T13:02:12-0500").value_or(0), T0);
    ASSERT_EQ(parse_timestamp("2025-11-18T18:02:12+00").value_or(0), T0);
}

TEST(iso_fraction_truncated_to_millis) {
    ASSERT_EQ(parse_timestamp("2025-11-18T18:02:12.123Z").value_or(0), T0 + 123);
    ASSERT_EQ(parse_timestamp("2025-11-18T18:02:12.123456+00:00").value_or(0), T0 + 123);
    ASSERT_EQ(parse_timestamp("2025-11-18T18:02:12.5Z").value_or(0), T0 + 500);
}

TEST(date_only_is_midnight) {
    ASSERT_EQ(parse_timestamp("2025-11-18").value_or(0), 1763424000000LL);
}

TEST(hour_minute_only) {
    ASSERT_EQ(parse_timestamp("2025-11-18 18:02").value_or(0), T0 - 12000);
}

// =============================================================================
// TEST 2: US statement shapes
// =============================================================================
TEST(us_date_with_meridiem) {
    ASSERT_EQ(parse_timestamp("11/18/2025 06:02:12 PM").value_or(0), T0);
    ASSERT_EQ(parse_timestamp("11/18/2025 6:02:12 pm").value_or(0), T0);
    ASSERT_EQ(parse_timestamp("11/18/2025 12:30:00 AM").value_or(0), 1763425800000LL);
}

TEST(us_date_24h_and_two_digit_year) {
    ASSERT_EQ(parse_timestamp("11/18/25 18:02:12").value_or(0), T0);
    ASSERT_EQ(parse_timestamp("1/5/2025").value_or(0), 1736035200000LL);
}

// =============================================================================
// TEST 3: Rejections
// =============================================================================
TEST(garbage_is_absent) {
    ASSERT_TRUE(!parse_timestamp("").has_value());
    ASSERT_TRUE(!parse_timestamp("Filled").has_value());
    ASSERT_TRUE(!parse_timestamp("2025-13-01").has_value());
    ASSERT_TRUE(!parse_timestamp("2025-02-30T00:00:00Z").has_value());
    ASSERT_TRUE(!parse_timestamp("2025-11-18T25:00:00Z").has_value());
    ASSERT_TRUE(!parse_timestamp("11/18/2025 13:00:00 PM").has_value());
    ASSERT_TRUE(!parse_timestamp("2025-11-18T18:02:12Z trailing").has_value());
}

// =============================================================================
// TEST 4: Column priority and date/time fallback
// =============================================================================
TEST(entry_ts_beats_other_columns) {
    RawRecord r;
    r.set("fill_time", "2025-01-05T00:00:00Z");
    r.set("entry_ts", "2025-11-18T18:02:12Z");
    auto t = reconstruct_timestamp(r);
    ASSERT_EQ(t.instant.value_or(0), T0);
    ASSERT_EQ(t.date, "2025-11-18");
    ASSERT_EQ(t.time, "18:02");
}

TEST(unparseable_candidate_falls_through) {
    RawRecord r;
    r.set("timestamp", "n/a");
    r.set("closing_time", "2025-11-18 18:02:12");
    ASSERT_EQ(reconstruct_timestamp(r).instant.value_or(0), T0);
}

TEST(date_and_time_columns_combine) {
    RawRecord r;
    r.set("date", "2025-11-18");
    r.set("time", "12:05");
    auto t = reconstruct_timestamp(r);
    ASSERT_EQ(t.instant.value_or(0), 1763467500000LL);
    ASSERT_EQ(t.time, "12:05");
}

TEST(raw_date_passes_through_when_unparseable) {
    RawRecord r;
    r.set("date", "Nov 18");
    r.set("time", "noon");
    auto t = reconstruct_timestamp(r);
    ASSERT_TRUE(!t.instant.has_value());
    ASSERT_EQ(t.date, "Nov 18");
    ASSERT_EQ(t.time, "noon");
}

TEST(iso_formatting) {
    ASSERT_EQ(util::format_iso_ms(T0 + 7), "2025-11-18T18:02:12.007Z");
    ASSERT_EQ(util::format_date(T0), "2025-11-18");
    ASSERT_EQ(util::format_time_hm(T0), "18:02");
}

int main() {
    std::cout << "\n=== Timestamp Tests ===\n\n";

    std::cout << "ISO:\n";
    RUN_TEST(iso_with_zulu);
    RUN_TEST(iso_without_zone_is_utc);
    RUN_TEST(iso_offsets);
    RUN_TEST(iso_fraction_truncated_to_millis);
    RUN_TEST(date_only_is_midnight);
    RUN_TEST(hour_minute_only);

    std::cout << "\nUS statements:\n";
    RUN_TEST(us_date_with_meridiem);
    RUN_TEST(us_date_24h_and_two_digit_year);

    std::cout << "\nRejections:\n";
    RUN_TEST(garbage_is_absent);

    std::cout << "\nColumns:\n";
    RUN_TEST(entry_ts_beats_other_columns);
    RUN_TEST(unparseable_candidate_falls_through);
    RUN_TEST(date_and_time_columns_combine);
    RUN_TEST(raw_date_passes_through_when_unparseable);
    RUN_TEST(iso_formatting);

    std::cout << "\n=== All tests PASSED! ===\n\n";
    return 0;
}
