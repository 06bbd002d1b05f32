#pragma once

/**
 * CSV statement reader
 *
 * Splits statement text into rows of trimmed cells and pairs them with
 * normalized headers.
 *
 * Format:
 *   - optional UTF-8 byte-order mark
 *   - records end with "\n" or "\r\n"
 *   - fields separated by ','
 *   - a field may be wrapped in double quotes; inside quotes ',' and line
 *     breaks are literal and "" is a literal quote
 *   - blank records are skipped; the first non-blank record is the header
 */

#include "../util/string_utils.hpp"
#include "header_normalizer.hpp"

#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

namespace journal::ingest {

/**
 * RawRecord - one data row keyed by normalized column name
 *
 * Keeps the statement's column order. A repeated column name keeps its
 * first position but takes the later cell's value.
 */
class RawRecord {
public:
    using Entry = std::pair<std::string, std::string>;

    void set(const std::string& column, std::string value) {
        auto it = index_.find(column);
        if (it != index_.end()) {
            entries_[it->second].second = std::move(value);
            return;
        }
        index_.emplace(column, entries_.size());
        entries_.emplace_back(column, std::move(value));
    }

    bool has(const std::string& column) const { return index_.count(column) > 0; }

    // Value of the column, empty when the column is missing
    const std::string& get(const std::string& column) const {
        static const std::string empty;
        auto it = index_.find(column);
        return it == index_.end() ? empty : entries_[it->second].second;
    }

    const std::vector<Entry>& entries() const { return entries_; }
    size_t size() const { return entries_.size(); }
    bool empty() const { return entries_.empty(); }

private:
    std::vector<Entry> entries_;
    std::unordered_map<std::string, size_t> index_;
};

struct CsvTable {
    std::vector<std::string> headers; // normalized
    std::vector<RawRecord> records;
};

/**
 * Split text into records of raw (untrimmed) cells.
 */
inline std::vector<std::vector<std::string>> split_csv(std::string_view text) {
    std::vector<std::vector<std::string>> rows;
    std::vector<std::string> cells;
    std::string current;
    bool in_quotes = false;

    auto end_record = [&]() {
        cells.push_back(std::move(current));
        current.clear();
        bool blank = true;
        for (const auto& c : cells) {
            if (!util::trim(c).empty()) {
                blank = false;
                break;
            }
        }
        if (!blank)
            rows.push_back(std::move(cells));
        cells.clear();
    };

    text = strip_bom(text);
    for (size_t i = 0; i < text.size(); ++i) {
        char c = text[i];
        if (c == '"') {
            if (in_quotes && i + 1 < text.size() && text[i + 1] == '"') {
                current.push_back('"');
                ++i;
            } else {
                in_quotes = !in_quotes;
            }
            continue;
        }
        if (!in_quotes) {
            if (c == ',') {
                cells.push_back(std::move(current));
                current.clear();
                continue;
            }
            if (c == '\r' && i + 1 < text.size() && text[i + 1] == '\n') {
                continue; // handled by the '\n'
            }
            if (c == '\n') {
                end_record();
                continue;
            }
        }
        current.push_back(c);
    }
    if (!current.empty() || !cells.empty())
        end_record();

    return rows;
}

/**
 * Parse statement text into normalized headers and keyed records.
 * Missing trailing cells read as empty; surplus cells are ignored.
 */
inline CsvTable read_csv(std::string_view text) {
    CsvTable table;
    auto rows = split_csv(text);
    if (rows.empty())
        return table;

    table.headers = normalize_headers(rows.front());
    table.records.reserve(rows.size() - 1);

    for (size_t r = 1; r < rows.size(); ++r) {
        const auto& cells = rows[r];
        RawRecord record;
        for (size_t i = 0; i < table.headers.size(); ++i) {
            record.set(table.headers[i], i < cells.size() ? util::trim(cells[i]) : std::string());
        }
        table.records.push_back(std::move(record));
    }
    return table;
}

} // namespace journal::ingest
