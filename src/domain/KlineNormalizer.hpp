#pragma once

#include <optional>
#include <string_view>
#include <vector>

#include <boost/json/value.hpp>

#include "common/Log.hpp"
#include "domain/Kline.hpp"

namespace domain {

enum class Strictness {
    // Any null numeric or trades cell rejects the whole batch with DataIntegrityError.
    Strict,
    // Unparseable cells stay null; used for artifacts that are trusted as already clean.
    Lenient,
};

const char* to_string(Strictness strictness) noexcept;

// Converts a decoded kline payload (array of 12-field rows) into a sorted table.
// Throws vambex::InvalidArgument when the payload is not an array of 12-element arrays and
// vambex::DataIntegrityError when the strict gate trips.
KlineTable normalize(const boost::json::value& payload,
                     Strictness strictness,
                     const vambex::log::Logger& logger);

// Sorts by open_time (rows without one go last, in input order) and collapses duplicate keys,
// keeping the row that came last in the input.
KlineTable finalizeTable(std::vector<KlineRecord> rows, const vambex::log::Logger& logger);

std::optional<double> parseDecimalText(std::string_view text);
std::optional<TradeCount> parseCountText(std::string_view text);
std::optional<TimestampMs> parseEpochMillisText(std::string_view text);

std::optional<double> decimalFromJson(const boost::json::value& cell);
std::optional<TradeCount> countFromJson(const boost::json::value& cell);
std::optional<TimestampMs> epochMillisFromJson(const boost::json::value& cell);

}  // namespace domain
