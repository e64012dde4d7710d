#include "core/time/timestamp.hpp"

#include <cctype>
#include <chrono>

namespace agentcli::core::time {

namespace {

// Days since 1970-01-01 for a proleptic Gregorian date.
std::int64_t days_from_civil(std::int64_t year, const unsigned month,
                             const unsigned day) {
    year -= month <= 2 ? 1 : 0;
    const std::int64_t era = (year >= 0 ? year : year - 399) / 400;
    const auto yoe = static_cast<unsigned>(year - era * 400);
    const unsigned doy = (153 * (month + (month > 2 ? -3 : 9)) + 2) / 5 + day - 1;
    const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + static_cast<std::int64_t>(doe) - 719468;
}

bool read_digits(const std::string& text, std::size_t& pos, const std::size_t count,
                 int& out) {
    if (pos + count > text.size()) {
        return false;
    }
    int value = 0;
    for (std::size_t i = 0; i < count; ++i) {
        const char c = text[pos + i];
        if (std::isdigit(static_cast<unsigned char>(c)) == 0) {
            return false;
        }
        value = value * 10 + (c - '0');
    }
    pos += count;
    out = value;
    return true;
}

bool expect(const std::string& text, std::size_t& pos, const char c) {
    if (pos >= text.size() || text[pos] != c) {
        return false;
    }
    ++pos;
    return true;
}

}  // namespace

std::int64_t now_unix_ms() {
    const auto now = std::chrono::system_clock::now();
    const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                        now.time_since_epoch())
                        .count();
    return static_cast<std::int64_t>(ms);
}

std::optional<std::int64_t> parse_iso8601_ms(const std::string& text) {
    std::size_t pos = 0;
    int year = 0;
    int month = 0;
    int day = 0;
    if (!read_digits(text, pos, 4, year) || !expect(text, pos, '-') ||
        !read_digits(text, pos, 2, month) || !expect(text, pos, '-') ||
        !read_digits(text, pos, 2, day)) {
        return std::nullopt;
    }
    if (month < 1 || month > 12 || day < 1 || day > 31) {
        return std::nullopt;
    }

    int hour = 0;
    int minute = 0;
    int second = 0;
    int millis = 0;
    int offset_minutes = 0;

    if (pos < text.size() && (text[pos] == 'T' || text[pos] == 't' || text[pos] == ' ')) {
        ++pos;
        if (!read_digits(text, pos, 2, hour) || !expect(text, pos, ':') ||
            !read_digits(text, pos, 2, minute)) {
            return std::nullopt;
        }
        if (pos < text.size() && text[pos] == ':') {
            ++pos;
            if (!read_digits(text, pos, 2, second)) {
                return std::nullopt;
            }
        }
        if (pos < text.size() && text[pos] == '.') {
            ++pos;
            int scale = 100;
            bool any = false;
            while (pos < text.size() &&
                   std::isdigit(static_cast<unsigned char>(text[pos])) != 0) {
                millis += (text[pos] - '0') * scale;
                scale /= 10;
                ++pos;
                any = true;
            }
            if (!any) {
                return std::nullopt;
            }
        }
        if (pos < text.size()) {
            const char zone = text[pos];
            if (zone == 'Z' || zone == 'z') {
                ++pos;
            } else if (zone == '+' || zone == '-') {
                ++pos;
                int off_h = 0;
                int off_m = 0;
                if (!read_digits(text, pos, 2, off_h)) {
                    return std::nullopt;
                }
                if (pos < text.size() && text[pos] == ':') {
                    ++pos;
                }
                if (!read_digits(text, pos, 2, off_m)) {
                    return std::nullopt;
                }
                offset_minutes = (off_h * 60 + off_m) * (zone == '-' ? -1 : 1);
            }
        }
    }

    if (pos != text.size()) {
        return std::nullopt;
    }
    if (hour > 23 || minute > 59 || second > 60) {
        return std::nullopt;
    }

    const std::int64_t days =
        days_from_civil(year, static_cast<unsigned>(month), static_cast<unsigned>(day));
    const std::int64_t seconds = days * 86400 + hour * 3600 + minute * 60 + second -
                                 static_cast<std::int64_t>(offset_minutes) * 60;
    return seconds * 1000 + millis;
}

}  // namespace agentcli::core::time
