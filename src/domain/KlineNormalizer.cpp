#include "domain/KlineNormalizer.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cmath>
#include <cstdint>
#include <limits>
#include <sstream>
#include <string>
#include <utility>

#include <boost/json/array.hpp>

#include "common/Errors.hpp"

namespace domain {
namespace {

// Instants must stay representable as int64 nanoseconds.
constexpr TimestampMs kMaxAbsEpochMillis = std::numeric_limits<std::int64_t>::max() / 1'000'000;

std::string_view trimView(std::string_view text) {
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.front())) != 0) {
        text.remove_prefix(1);
    }
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.back())) != 0) {
        text.remove_suffix(1);
    }
    return text;
}

std::optional<TimestampMs> checkedInstant(double value) {
    if (!std::isfinite(value) || std::fabs(value) > static_cast<double>(kMaxAbsEpochMillis)) {
        return std::nullopt;
    }
    return static_cast<TimestampMs>(std::llround(value));
}

std::optional<TimestampMs> checkedInstant(std::int64_t value) {
    if (value > kMaxAbsEpochMillis || value < -kMaxAbsEpochMillis) {
        return std::nullopt;
    }
    return static_cast<TimestampMs>(value);
}

std::optional<TradeCount> integralCount(double value) {
    if (!std::isfinite(value) || std::trunc(value) != value ||
        std::fabs(value) >= static_cast<double>(std::numeric_limits<TradeCount>::max())) {
        return std::nullopt;
    }
    return static_cast<TradeCount>(value);
}

KlineRecord parseRow(const boost::json::array& row) {
    KlineRecord record;
    for (std::size_t index = 0; index < kWireFields.size(); ++index) {
        const Field field = kWireFields[index];
        const auto& cell = row[index];
        switch (fieldKind(field)) {
        case FieldKind::Instant:
            *mutableInstantCell(record, field) = epochMillisFromJson(cell);
            break;
        case FieldKind::Decimal:
            *mutableDecimalCell(record, field) = decimalFromJson(cell);
            break;
        case FieldKind::Count:
            record.trades = countFromJson(cell);
            break;
        case FieldKind::Opaque:
            break;
        }
    }
    return record;
}

std::string describeDefects(const vambex::DefectCounts& defects) {
    std::ostringstream oss;
    oss << '{';
    bool first = true;
    for (auto field : kRequiredNumericFields) {
        const auto it = defects.find(std::string{fieldName(field)});
        if (it == defects.end()) {
            continue;
        }
        if (!first) {
            oss << ", ";
        }
        oss << it->first << ": " << it->second;
        first = false;
    }
    oss << '}';
    return oss.str();
}

void enforceNoNulls(const std::vector<KlineRecord>& rows, const vambex::log::Logger& logger) {
    vambex::DefectCounts defects;
    for (auto field : kRequiredNumericFields) {
        const auto nulls = static_cast<std::size_t>(
            std::count_if(rows.begin(), rows.end(), [field](const KlineRecord& record) {
                return isNullCell(record, field);
            }));
        if (nulls > 0) {
            defects.emplace(std::string{fieldName(field)}, nulls);
        }
    }

    if (defects.empty()) {
        return;
    }

    const auto summary = describeDefects(defects);
    VAMBEX_LOG_ERR(logger, "Malformed numeric data received: " << summary);
    throw vambex::DataIntegrityError("Malformed numeric data in columns: " + summary, std::move(defects));
}

}  // namespace

const char* to_string(Strictness strictness) noexcept {
    switch (strictness) {
    case Strictness::Strict:
        return "strict";
    case Strictness::Lenient:
        return "lenient";
    }
    return "unknown";
}

std::optional<double> parseDecimalText(std::string_view text) {
    auto trimmed = trimView(text);
    if (!trimmed.empty() && trimmed.front() == '+') {
        trimmed.remove_prefix(1);
        if (trimmed.empty() || trimmed.front() == '+' || trimmed.front() == '-') {
            return std::nullopt;
        }
    }
    if (trimmed.empty()) {
        return std::nullopt;
    }
    // Always '.' as the decimal separator, whatever the process locale.
    double value = 0.0;
    const char* begin = trimmed.data();
    const char* end = begin + trimmed.size();
    auto [ptr, ec] = std::from_chars(begin, end, value);
    if (ec != std::errc() || ptr != end || std::isnan(value)) {
        return std::nullopt;
    }
    return value;
}

std::optional<TradeCount> parseCountText(std::string_view text) {
    const auto trimmed = trimView(text);
    if (trimmed.empty()) {
        return std::nullopt;
    }
    TradeCount value = 0;
    const char* begin = trimmed.data();
    const char* end = begin + trimmed.size();
    auto [ptr, ec] = std::from_chars(begin, end, value);
    if (ec == std::errc() && ptr == end) {
        return value;
    }
    // "12.0" is still a whole count.
    const auto decimal = parseDecimalText(trimmed);
    if (!decimal) {
        return std::nullopt;
    }
    return integralCount(*decimal);
}

std::optional<TimestampMs> parseEpochMillisText(std::string_view text) {
    const auto trimmed = trimView(text);
    if (trimmed.empty()) {
        return std::nullopt;
    }
    std::int64_t value = 0;
    const char* begin = trimmed.data();
    const char* end = begin + trimmed.size();
    auto [ptr, ec] = std::from_chars(begin, end, value);
    if (ec == std::errc() && ptr == end) {
        return checkedInstant(value);
    }
    const auto decimal = parseDecimalText(trimmed);
    if (!decimal) {
        return std::nullopt;
    }
    return checkedInstant(*decimal);
}

std::optional<double> decimalFromJson(const boost::json::value& cell) {
    if (cell.is_double()) {
        return cell.as_double();
    }
    if (cell.is_int64()) {
        return static_cast<double>(cell.as_int64());
    }
    if (cell.is_uint64()) {
        return static_cast<double>(cell.as_uint64());
    }
    if (cell.is_string()) {
        const auto& str = cell.as_string();
        return parseDecimalText(std::string_view{str.data(), str.size()});
    }
    return std::nullopt;
}

std::optional<TradeCount> countFromJson(const boost::json::value& cell) {
    if (cell.is_int64()) {
        return static_cast<TradeCount>(cell.as_int64());
    }
    if (cell.is_uint64()) {
        const auto value = cell.as_uint64();
        if (value > static_cast<std::uint64_t>(std::numeric_limits<TradeCount>::max())) {
            return std::nullopt;
        }
        return static_cast<TradeCount>(value);
    }
    if (cell.is_double()) {
        return integralCount(cell.as_double());
    }
    if (cell.is_string()) {
        const auto& str = cell.as_string();
        return parseCountText(std::string_view{str.data(), str.size()});
    }
    return std::nullopt;
}

std::optional<TimestampMs> epochMillisFromJson(const boost::json::value& cell) {
    if (cell.is_int64()) {
        return checkedInstant(cell.as_int64());
    }
    if (cell.is_uint64()) {
        const auto value = cell.as_uint64();
        if (value > static_cast<std::uint64_t>(kMaxAbsEpochMillis)) {
            return std::nullopt;
        }
        return static_cast<TimestampMs>(value);
    }
    if (cell.is_double()) {
        return checkedInstant(cell.as_double());
    }
    if (cell.is_string()) {
        const auto& str = cell.as_string();
        return parseEpochMillisText(std::string_view{str.data(), str.size()});
    }
    return std::nullopt;
}

KlineTable finalizeTable(std::vector<KlineRecord> rows, const vambex::log::Logger& logger) {
    std::stable_sort(rows.begin(), rows.end(), [](const KlineRecord& lhs, const KlineRecord& rhs) {
        if (!lhs.openTime || !rhs.openTime) {
            return lhs.openTime.has_value() && !rhs.openTime.has_value();
        }
        return *lhs.openTime < *rhs.openTime;
    });

    KlineTable table;
    table.rows.reserve(rows.size());
    std::size_t collapsed = 0;
    for (auto& record : rows) {
        if (record.openTime && !table.rows.empty() && table.rows.back().openTime == record.openTime) {
            table.rows.back() = std::move(record);
            ++collapsed;
            continue;
        }
        table.rows.push_back(std::move(record));
    }

    if (collapsed > 0) {
        VAMBEX_LOG_WARN(logger, "Collapsed " << collapsed << " duplicate open_time rows (keeping the last occurrence)");
    }
    return table;
}

KlineTable normalize(const boost::json::value& payload,
                     Strictness strictness,
                     const vambex::log::Logger& logger) {
    if (!payload.is_array()) {
        throw vambex::InvalidArgument("kline payload must be an array of rows returned by the klines endpoint");
    }

    const auto& outer = payload.as_array();
    if (outer.empty()) {
        VAMBEX_LOG_WARN(logger, "No kline rows to normalize");
        return KlineTable{};
    }

    std::vector<KlineRecord> rows;
    rows.reserve(outer.size());
    for (std::size_t index = 0; index < outer.size(); ++index) {
        const auto& rowValue = outer[index];
        if (!rowValue.is_array() || rowValue.as_array().size() != kWireArity) {
            std::ostringstream oss;
            oss << "kline row " << index << " must be an array of " << kWireArity << " fields";
            throw vambex::InvalidArgument(oss.str());
        }
        rows.push_back(parseRow(rowValue.as_array()));
    }

    if (strictness == Strictness::Strict) {
        enforceNoNulls(rows, logger);
    }

    auto table = finalizeTable(std::move(rows), logger);
    VAMBEX_LOG_DEBUG(logger, "Normalized " << table.size() << " kline rows (" << to_string(strictness) << ")");
    return table;
}

}  // namespace domain
