#include "core/TimeUtils.hpp"

#include <cctype>
#include <charconv>
#include <cstdio>
#include <ctime>

namespace core {
namespace {

#if defined(_WIN32)
std::time_t timegm_compat(std::tm* tm) {
    return _mkgmtime(tm);
}
#else
std::time_t timegm_compat(std::tm* tm) {
    return timegm(tm);
}
#endif

std::tm safeGmtime(std::time_t time) {
    std::tm tm{};
#if defined(_WIN32)
    gmtime_s(&tm, &time);
#else
    gmtime_r(&time, &tm);
#endif
    return tm;
}

bool readFixedDigits(std::string_view text, std::size_t& pos, std::size_t width, int& out) {
    if (pos + width > text.size()) {
        return false;
    }
    const char* begin = text.data() + pos;
    const char* end = begin + width;
    for (const char* it = begin; it != end; ++it) {
        if (std::isdigit(static_cast<unsigned char>(*it)) == 0) {
            return false;
        }
    }
    auto [ptr, ec] = std::from_chars(begin, end, out);
    if (ec != std::errc() || ptr != end) {
        return false;
    }
    pos += width;
    return true;
}

bool expectChar(std::string_view text, std::size_t& pos, char expected) {
    if (pos >= text.size() || text[pos] != expected) {
        return false;
    }
    ++pos;
    return true;
}

}  // namespace

std::string formatUtcMillis(std::int64_t epochMs) {
    std::int64_t seconds = epochMs / TimeUtils::kMillisPerSecond;
    std::int64_t millis = epochMs % TimeUtils::kMillisPerSecond;
    if (millis < 0) {
        millis += TimeUtils::kMillisPerSecond;
        --seconds;
    }

    const auto tm = safeGmtime(static_cast<std::time_t>(seconds));

    char buffer[40];
    if (millis == 0) {
        std::snprintf(buffer, sizeof(buffer), "%04d-%02d-%02d %02d:%02d:%02d", tm.tm_year + 1900, tm.tm_mon + 1,
                      tm.tm_mday, tm.tm_hour, tm.tm_min, tm.tm_sec);
    } else {
        std::snprintf(buffer, sizeof(buffer), "%04d-%02d-%02d %02d:%02d:%02d.%03d", tm.tm_year + 1900,
                      tm.tm_mon + 1, tm.tm_mday, tm.tm_hour, tm.tm_min, tm.tm_sec, static_cast<int>(millis));
    }
    return buffer;
}

std::optional<std::int64_t> parseUtcMillis(std::string_view text) {
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.front())) != 0) {
        text.remove_prefix(1);
    }
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.back())) != 0) {
        text.remove_suffix(1);
    }
    if (!text.empty() && (text.back() == 'Z' || text.back() == 'z')) {
        text.remove_suffix(1);
    }

    std::size_t pos = 0;
    int year = 0;
    int month = 0;
    int day = 0;
    if (!readFixedDigits(text, pos, 4, year) || !expectChar(text, pos, '-') ||
        !readFixedDigits(text, pos, 2, month) || !expectChar(text, pos, '-') ||
        !readFixedDigits(text, pos, 2, day)) {
        return std::nullopt;
    }

    int hour = 0;
    int minute = 0;
    int second = 0;
    int millis = 0;
    if (pos < text.size()) {
        if (text[pos] != ' ' && text[pos] != 'T') {
            return std::nullopt;
        }
        ++pos;
        if (!readFixedDigits(text, pos, 2, hour) || !expectChar(text, pos, ':') ||
            !readFixedDigits(text, pos, 2, minute)) {
            return std::nullopt;
        }
        if (pos < text.size() && text[pos] == ':') {
            ++pos;
            if (!readFixedDigits(text, pos, 2, second)) {
                return std::nullopt;
            }
            if (pos < text.size() && text[pos] == '.') {
                ++pos;
                std::size_t digits = 0;
                while (pos < text.size() && std::isdigit(static_cast<unsigned char>(text[pos])) != 0) {
                    if (digits < 3) {
                        millis = millis * 10 + (text[pos] - '0');
                    }
                    ++digits;
                    ++pos;
                }
                if (digits == 0) {
                    return std::nullopt;
                }
                for (; digits < 3; ++digits) {
                    millis *= 10;
                }
            }
        }
    }
    if (pos != text.size()) {
        return std::nullopt;
    }

    if (month < 1 || month > 12 || day < 1 || day > 31 || hour > 23 || minute > 59 || second > 60) {
        return std::nullopt;
    }

    std::tm tm{};
    tm.tm_year = year - 1900;
    tm.tm_mon = month - 1;
    tm.tm_mday = day;
    tm.tm_hour = hour;
    tm.tm_min = minute;
    tm.tm_sec = second;
    tm.tm_isdst = 0;
    const auto raw = timegm_compat(&tm);
    if (tm.tm_mday != day) {
        // timegm normalised an impossible date such as 2024-02-31.
        return std::nullopt;
    }
    return static_cast<std::int64_t>(raw) * TimeUtils::kMillisPerSecond + millis;
}

}  // namespace core
