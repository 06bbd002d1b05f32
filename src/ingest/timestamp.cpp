#include "../../include/ingest/timestamp.hpp"
#include "../../include/util/string_utils.hpp"
#include "../../include/util/time_utils.hpp"

#include <cctype>

namespace journal::ingest {

namespace {

// =============================================================================
// Cursor over timestamp text
// =============================================================================
class Cursor {
public:
    explicit Cursor(std::string_view text) : text_(text), pos_(0) {}

    bool done() const { return pos_ >= text_.size(); }
    char peek() const { return done() ? '\0' : text_[pos_]; }

    bool accept(char c) {
        if (peek() == c) {
            ++pos_;
            return true;
        }
        return false;
    }

    bool accept_ci(char c) {
        if (std::tolower(static_cast<unsigned char>(peek())) == c) {
            ++pos_;
            return true;
        }
        return false;
    }

    void skip_digits() {
        while (!done() && std::isdigit(static_cast<unsigned char>(text_[pos_])))
            ++pos_;
    }

    void skip_spaces() {
        while (!done() && text_[pos_] == ' ')
            ++pos_;
    }

    // Reads between min and max digits; nullopt if fewer than min
    std::optional<int> digits(size_t min, size_t max, size_t* count = nullptr) {
        size_t start = pos_;
        int value = 0;
        while (!done() && pos_ - start < max && std::isdigit(static_cast<unsigned char>(text_[pos_]))) {
            value = value * 10 + (text_[pos_] - '0');
            ++pos_;
        }
        size_t n = pos_ - start;
        if (count)
            *count = n;
        if (n < min) {
            pos_ = start;
            return std::nullopt;
        }
        return value;
    }

private:
    std::string_view text_;
    size_t pos_;
};

struct Clock {
    int hour = 0;
    int minute = 0;
    int second = 0;
    int millis = 0;
};

// HH:MM[:SS[.fff...]]
bool parse_clock(Cursor& c, Clock& out) {
    auto hour = c.digits(1, 2);
    if (!hour || !c.accept(':'))
        return false;
    auto minute = c.digits(2, 2);
    if (!minute)
        return false;
    out.hour = *hour;
    out.minute = *minute;

    if (c.accept(':')) {
        auto second = c.digits(2, 2);
        if (!second)
            return false;
        out.second = *second;
        if (c.accept('.') || c.accept(',')) {
            size_t n = 0;
            auto frac = c.digits(1, 3, &n);
            if (!frac)
                return false;
            int ms = *frac;
            for (size_t i = n; i < 3; ++i)
                ms *= 10;
            out.millis = ms;
            c.skip_digits(); // precision beyond milliseconds is dropped
        }
    }
    return true;
}

// 12-hour suffix, applied in place
bool parse_meridiem(Cursor& c, Clock& clock) {
    c.skip_spaces();
    bool pm = false;
    if (c.accept_ci('p')) {
        pm = true;
    } else if (!c.accept_ci('a')) {
        return true; // no suffix
    }
    if (!c.accept_ci('m'))
        return false;
    if (clock.hour < 1 || clock.hour > 12)
        return false;
    if (pm && clock.hour != 12)
        clock.hour += 12;
    if (!pm && clock.hour == 12)
        clock.hour = 0;
    return true;
}

// Z | +HH | +HHMM | +HH:MM ; absent zone means UTC
bool parse_zone(Cursor& c, int& offset_minutes) {
    offset_minutes = 0;
    c.skip_spaces();
    if (c.done())
        return true;
    if (c.accept_ci('z'))
        return true;

    int sign = 0;
    if (c.accept('+'))
        sign = 1;
    else if (c.accept('-'))
        sign = -1;
    else
        return false;

    auto hours = c.digits(2, 2);
    if (!hours || *hours > 23)
        return false;
    int minutes = 0;
    c.accept(':');
    if (auto mm = c.digits(2, 2)) {
        if (*mm > 59)
            return false;
        minutes = *mm;
    }
    offset_minutes = sign * (*hours * 60 + minutes);
    return true;
}

std::optional<TimestampMs> finish(Cursor& c, int year, int month, int day, Clock clock, bool has_clock,
                                  bool allow_meridiem) {
    if (has_clock && allow_meridiem && !parse_meridiem(c, clock))
        return std::nullopt;

    int offset = 0;
    if (!parse_zone(c, offset))
        return std::nullopt;
    c.skip_spaces();
    if (!c.done())
        return std::nullopt;

    auto ts = util::make_utc_ms(year, month, day, clock.hour, clock.minute, clock.second, clock.millis);
    if (!ts)
        return std::nullopt;
    return *ts - static_cast<TimestampMs>(offset) * 60 * 1000;
}

// YYYY-MM-DD[(T| )HH:MM[:SS[.fff]]][zone]
std::optional<TimestampMs> parse_iso(std::string_view text) {
    Cursor c(text);
    auto year = c.digits(4, 4);
    if (!year || !c.accept('-'))
        return std::nullopt;
    auto month = c.digits(1, 2);
    if (!month || !c.accept('-'))
        return std::nullopt;
    auto day = c.digits(1, 2);
    if (!day)
        return std::nullopt;

    Clock clock;
    bool has_clock = false;
    if (c.accept('T') || c.accept('t') || c.accept(' ')) {
        c.skip_spaces();
        if (!parse_clock(c, clock))
            return std::nullopt;
        has_clock = true;
    }
    return finish(c, *year, *month, *day, clock, has_clock, false);
}

// MM/DD/YYYY or MM/DD/YY, optional clock with AM/PM
std::optional<TimestampMs> parse_us(std::string_view text) {
    Cursor c(text);
    auto month = c.digits(1, 2);
    if (!month || !c.accept('/'))
        return std::nullopt;
    auto day = c.digits(1, 2);
    if (!day || !c.accept('/'))
        return std::nullopt;
    size_t year_len = 0;
    auto year = c.digits(2, 4, &year_len);
    if (!year || (year_len != 2 && year_len != 4))
        return std::nullopt;
    int full_year = year_len == 2 ? 2000 + *year : *year;

    Clock clock;
    bool has_clock = false;
    if (c.accept('T') || c.accept(' ')) {
        c.skip_spaces();
        if (!parse_clock(c, clock))
            return std::nullopt;
        has_clock = true;
    }
    return finish(c, full_year, *month, *day, clock, has_clock, true);
}

} // namespace

std::optional<TimestampMs> parse_timestamp(std::string_view text) {
    std::string trimmed = util::trim(text);
    if (trimmed.empty())
        return std::nullopt;

    if (trimmed.find('/') != std::string::npos)
        return parse_us(trimmed);
    return parse_iso(trimmed);
}

const std::vector<std::string>& timestamp_columns() {
    static const std::vector<std::string> columns = {"entry_ts",     "timestamp",  "fill_time", "closing_time",
                                                     "placing_time", "close_time", "open_time", "trade_time"};
    return columns;
}

ReconstructedTime reconstruct_timestamp(const RawRecord& record, const ColumnHints& hints) {
    ReconstructedTime result;

    for (const auto& column : hints.columns(fields::ENTRY_TS)) {
        if (auto ts = parse_timestamp(record.get(column))) {
            result.instant = ts;
            break;
        }
    }

    if (!result.instant) {
        for (const auto& column : timestamp_columns()) {
            if (auto ts = parse_timestamp(record.get(column))) {
                result.instant = ts;
                break;
            }
        }
    }

    std::string date = hints.resolve(record, fields::DATE).value_or(util::trim(record.get("date")));
    std::string time = hints.resolve(record, fields::TIME).value_or(util::trim(record.get("time")));
    if (!result.instant && !date.empty()) {
        result.instant = parse_timestamp(time.empty() ? date : date + " " + time);
    }

    if (result.instant) {
        result.date = util::format_date(*result.instant);
        result.time = util::format_time_hm(*result.instant);
    } else {
        result.date = date;
        result.time = time;
    }
    return result;
}

} // namespace journal::ingest
