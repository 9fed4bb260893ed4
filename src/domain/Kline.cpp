#include "domain/Kline.hpp"

#include <array>
#include <charconv>
#include <cmath>

#include "core/TimeUtils.hpp"

namespace domain {

bool KlineRecord::isWellFormed() const noexcept {
    return openTime.has_value() && closeTime.has_value() && *openTime < *closeTime;
}

namespace {

template <typename Record>
auto decimalSlot(Record& record, Field field) -> decltype(&record.open) {
    switch (field) {
    case Field::Open:
        return &record.open;
    case Field::High:
        return &record.high;
    case Field::Low:
        return &record.low;
    case Field::Close:
        return &record.close;
    case Field::Volume:
        return &record.volume;
    case Field::QuoteVolume:
        return &record.quoteVolume;
    case Field::TakerBuyVolume:
        return &record.takerBuyVolume;
    case Field::TakerBuyQuoteVolume:
        return &record.takerBuyQuoteVolume;
    default:
        return nullptr;
    }
}

template <typename Record>
auto instantSlot(Record& record, Field field) -> decltype(&record.openTime) {
    switch (field) {
    case Field::OpenTime:
        return &record.openTime;
    case Field::CloseTime:
        return &record.closeTime;
    default:
        return nullptr;
    }
}

}  // namespace

std::optional<double>* mutableDecimalCell(KlineRecord& record, Field field) {
    return decimalSlot(record, field);
}

std::optional<TimestampMs>* mutableInstantCell(KlineRecord& record, Field field) {
    return instantSlot(record, field);
}

std::optional<double> decimalCell(const KlineRecord& record, Field field) {
    const auto* cell = decimalSlot(record, field);
    if (cell == nullptr) {
        return std::nullopt;
    }
    return *cell;
}

std::optional<TimestampMs> instantCell(const KlineRecord& record, Field field) {
    const auto* cell = instantSlot(record, field);
    if (cell == nullptr) {
        return std::nullopt;
    }
    return *cell;
}

bool isNullCell(const KlineRecord& record, Field field) {
    switch (fieldKind(field)) {
    case FieldKind::Instant:
        return !instantCell(record, field).has_value();
    case FieldKind::Decimal:
        return !decimalCell(record, field).has_value();
    case FieldKind::Count:
        return !record.trades.has_value();
    case FieldKind::Opaque:
        break;
    }
    return true;
}

bool cellEquals(const KlineRecord& lhs, const KlineRecord& rhs, Field field) {
    switch (fieldKind(field)) {
    case FieldKind::Instant:
        return instantCell(lhs, field) == instantCell(rhs, field);
    case FieldKind::Decimal:
        return decimalCell(lhs, field) == decimalCell(rhs, field);
    case FieldKind::Count:
        return lhs.trades == rhs.trades;
    case FieldKind::Opaque:
        break;
    }
    return true;
}

std::string formatDecimal(double value) {
    if (!std::isfinite(value)) {
        return std::isnan(value) ? "nan" : (value > 0 ? "inf" : "-inf");
    }
    std::array<char, 64> buffer{};
    auto [ptr, ec] = std::to_chars(buffer.data(), buffer.data() + buffer.size(), value);
    if (ec != std::errc()) {
        return std::to_string(value);
    }
    return std::string(buffer.data(), ptr);
}

std::string formatCell(const KlineRecord& record, Field field) {
    switch (fieldKind(field)) {
    case FieldKind::Instant: {
        const auto instant = instantCell(record, field);
        return instant ? core::formatUtcMillis(*instant) : std::string{};
    }
    case FieldKind::Decimal: {
        const auto decimal = decimalCell(record, field);
        return decimal ? formatDecimal(*decimal) : std::string{};
    }
    case FieldKind::Count:
        return record.trades ? std::to_string(*record.trades) : std::string{};
    case FieldKind::Opaque:
        break;
    }
    return {};
}

}  // namespace domain
