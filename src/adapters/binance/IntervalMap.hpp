#pragma once

#include <array>
#include <string>
#include <string_view>

namespace adapters::binance {

// Kline granularities accepted by the klines endpoint. "1m" is a minute, "1M" a month.
inline constexpr std::array<std::string_view, 15> kSupportedIntervals{
    "1m", "3m", "5m", "15m", "30m", "1h", "2h", "4h", "6h", "8h", "12h", "1d", "3d", "1w", "1M",
};

constexpr bool is_supported_interval(std::string_view value) {
    for (auto interval : kSupportedIntervals) {
        if (interval == value) {
            return true;
        }
    }
    return false;
}

// Sorted, comma separated list for error messages.
std::string supported_intervals_list();

static_assert(is_supported_interval("1m"));
static_assert(is_supported_interval("1M"));
static_assert(is_supported_interval("8h"));
static_assert(!is_supported_interval("1H"));
static_assert(!is_supported_interval("2d"));

}  // namespace adapters::binance
