#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "domain/KlineSchema.hpp"

namespace domain {

using TimestampMs = long long;
using TradeCount = std::int64_t;

struct KlineRecord {
    std::optional<TimestampMs> openTime;
    std::optional<double> open;
    std::optional<double> high;
    std::optional<double> low;
    std::optional<double> close;
    std::optional<double> volume;
    std::optional<TimestampMs> closeTime;
    std::optional<double> quoteVolume;
    std::optional<TradeCount> trades;
    std::optional<double> takerBuyVolume;
    std::optional<double> takerBuyQuoteVolume;

    // Both instants present and open_time < close_time.
    bool isWellFormed() const noexcept;
};

// Sorted ascending by open_time once produced by the normalizer or a loader.
struct KlineTable {
    std::vector<KlineRecord> rows;

    bool empty() const noexcept { return rows.empty(); }
    std::size_t size() const noexcept { return rows.size(); }
    const KlineRecord& operator[](std::size_t index) const { return rows[index]; }
};

std::optional<double> decimalCell(const KlineRecord& record, Field field);
std::optional<TimestampMs> instantCell(const KlineRecord& record, Field field);
std::optional<double>* mutableDecimalCell(KlineRecord& record, Field field);
std::optional<TimestampMs>* mutableInstantCell(KlineRecord& record, Field field);

bool isNullCell(const KlineRecord& record, Field field);

// Exact comparison; two null cells compare equal.
bool cellEquals(const KlineRecord& lhs, const KlineRecord& rhs, Field field);

// Text form used by the CSV export and the divergence report. Null renders as "".
std::string formatCell(const KlineRecord& record, Field field);
std::string formatDecimal(double value);

}  // namespace domain
