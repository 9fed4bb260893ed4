#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace core {

namespace TimeUtils {
constexpr std::int64_t kMillisPerSecond = 1000;
}  // namespace TimeUtils

// UTC calendar rendering of an epoch-millisecond instant: "YYYY-MM-DD HH:MM:SS", with ".mmm"
// appended only when the millisecond part is non-zero.
std::string formatUtcMillis(std::int64_t epochMs);

// Accepts "YYYY-MM-DD", "YYYY-MM-DD HH:MM[:SS[.fff...]]" (or 'T' as separator) and an optional
// trailing 'Z'. Fractions beyond milliseconds are truncated.
std::optional<std::int64_t> parseUtcMillis(std::string_view text);

}  // namespace core
