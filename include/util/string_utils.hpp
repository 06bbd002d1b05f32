#pragma once

/**
 * String utilities for statement parsing
 *
 * Trimming, case folding and lenient number parsing shared by the
 * CSV reader, field resolver and storage backends.
 */

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <optional>
#include <string>
#include <string_view>

namespace journal {
namespace util {

inline bool is_space(char c) {
    return c == ' ' || c == '\t' || c == '\r' || c == '\n' || c == '\f' || c == '\v';
}

inline std::string trim(std::string_view s) {
    size_t start = 0;
    size_t end = s.size();
    while (start < end && is_space(s[start]))
        ++start;
    while (end > start && is_space(s[end - 1]))
        --end;
    return std::string(s.substr(start, end - start));
}

inline std::string to_lower(std::string_view s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

inline std::string to_upper(std::string_view s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return out;
}

inline bool starts_with(std::string_view s, std::string_view prefix) {
    return s.size() >= prefix.size() && s.compare(0, prefix.size(), prefix) == 0;
}

inline bool ends_with(std::string_view s, std::string_view suffix) {
    return s.size() >= suffix.size() && s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

inline bool contains(std::string_view s, std::string_view needle) {
    return s.find(needle) != std::string_view::npos;
}

/**
 * Lenient number parsing used for statement cells.
 *
 * Everything except digits, '.' and '-' is stripped first, so currency
 * symbols, thousands separators and unit suffixes are tolerated:
 *   "$1,234.50"     -> 1234.5
 *   "49,152.00 USD" -> 49152
 *   "Filled"        -> nullopt
 * The remainder must parse completely, otherwise the value is absent.
 */
inline std::optional<double> parse_number(std::string_view value) {
    std::string cleaned;
    cleaned.reserve(value.size());
    for (char c : value) {
        if ((c >= '0' && c <= '9') || c == '.' || c == '-')
            cleaned.push_back(c);
    }
    if (cleaned.empty())
        return std::nullopt;

    char* end = nullptr;
    double result = std::strtod(cleaned.c_str(), &end);
    if (end == cleaned.c_str() || *end != '\0' || !std::isfinite(result))
        return std::nullopt;
    return result;
}

/**
 * Fixed-point formatting, e.g. format_fixed(1.5, 4) -> "1.5000"
 */
inline std::string format_fixed(double value, int decimals) {
    char buf[64];
    if (value == 0)
        value = 0.0; // no "-0.0000"
    std::snprintf(buf, sizeof(buf), "%.*f", decimals, value);
    return buf;
}

} // namespace util
} // namespace journal
