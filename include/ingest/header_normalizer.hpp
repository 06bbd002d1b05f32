#pragma once

#include "../util/string_utils.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace journal::ingest {

constexpr std::string_view UTF8_BOM = "\xEF\xBB\xBF";

inline std::string_view strip_bom(std::string_view text) {
    if (util::starts_with(text, UTF8_BOM))
        text.remove_prefix(UTF8_BOM.size());
    return text;
}

/**
 * Canonical column name: BOM stripped, trimmed, lower-cased, and every
 * run of non-alphanumeric characters collapsed to a single '_'.
 *
 *   "B/S"            -> "b_s"
 *   "Avg Fill Price" -> "avg_fill_price"
 *   "_priceFormat"   -> "_priceformat"
 */
inline std::string normalize_header(std::string_view raw) {
    std::string trimmed = util::trim(strip_bom(raw));

    std::string out;
    out.reserve(trimmed.size());
    bool in_run = false;
    for (char ch : trimmed) {
        unsigned char c = static_cast<unsigned char>(ch);
        if (c >= 'A' && c <= 'Z')
            c = static_cast<unsigned char>(c - 'A' + 'a');

        bool alnum = (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9');
        if (alnum) {
            out.push_back(static_cast<char>(c));
            in_run = false;
        } else if (!in_run) {
            out.push_back('_');
            in_run = true;
        }
    }
    return out;
}

inline std::vector<std::string> normalize_headers(const std::vector<std::string>& raw) {
    std::vector<std::string> out;
    out.reserve(raw.size());
    for (const auto& h : raw)
        out.push_back(normalize_header(h));
    return out;
}

} // namespace journal::ingest
