#pragma once

/**
 * TimestampReconstructor
 *
 * Builds a UTC instant for a statement row from whichever timestamp-like
 * columns the broker exports. Candidate columns are tried in a fixed
 * priority order, after any columns the broker profile hints for entry_ts;
 * when none parses, separate date and time columns are combined.
 *
 * Text without an explicit zone is taken as UTC. Accepted shapes:
 *   2025-11-18T18:02:12Z          ISO-8601, optional fraction and offset
 *   2025-11-18 18:02:12           space instead of 'T'
 *   2025-11-18T18:02:12+01:00     offsets as +HH, +HHMM or +HH:MM
 *   11/18/2025 06:02:12 PM        US statement dates, 2- or 4-digit year
 *   2025-11-18                    date only, midnight
 */

#include "../types.hpp"
#include "column_hints.hpp"
#include "csv_reader.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace journal::ingest {

struct ReconstructedTime {
    std::optional<TimestampMs> instant;
    std::string date; // YYYY-MM-DD from the instant, else the raw date column
    std::string time; // HH:MM from the instant, else the raw time column
};

/**
 * Parse one timestamp text. Returns nullopt for blank or unrecognized input.
 */
std::optional<TimestampMs> parse_timestamp(std::string_view text);

/**
 * Columns holding a full timestamp, highest priority first.
 */
const std::vector<std::string>& timestamp_columns();

ReconstructedTime reconstruct_timestamp(const RawRecord& record, const ColumnHints& hints = {});

} // namespace journal::ingest
