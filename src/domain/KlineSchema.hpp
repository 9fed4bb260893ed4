#pragma once

#include <array>
#include <cstddef>
#include <optional>
#include <string_view>

namespace domain {

// Bump when either field-order table below changes.
inline constexpr int kSchemaVersion = 1;

enum class Field {
    OpenTime,
    Open,
    High,
    Low,
    Close,
    Volume,
    CloseTime,
    QuoteVolume,
    Trades,
    TakerBuyVolume,
    TakerBuyQuoteVolume,
    Ignore,
};

enum class FieldKind { Instant, Decimal, Count, Opaque };

constexpr std::string_view fieldName(Field field) {
    switch (field) {
    case Field::OpenTime:
        return "open_time";
    case Field::Open:
        return "open";
    case Field::High:
        return "high";
    case Field::Low:
        return "low";
    case Field::Close:
        return "close";
    case Field::Volume:
        return "volume";
    case Field::CloseTime:
        return "close_time";
    case Field::QuoteVolume:
        return "quote_volume";
    case Field::Trades:
        return "trades";
    case Field::TakerBuyVolume:
        return "taker_buy_volume";
    case Field::TakerBuyQuoteVolume:
        return "taker_buy_quote_volume";
    case Field::Ignore:
        return "ignore";
    }
    return "";
}

constexpr FieldKind fieldKind(Field field) {
    switch (field) {
    case Field::OpenTime:
    case Field::CloseTime:
        return FieldKind::Instant;
    case Field::Trades:
        return FieldKind::Count;
    case Field::Ignore:
        return FieldKind::Opaque;
    default:
        return FieldKind::Decimal;
    }
}

// Positional layout of one row of the exchange kline payload.
inline constexpr std::array<Field, 12> kWireFields{
    Field::OpenTime,    Field::Open,   Field::High,           Field::Low,
    Field::Close,       Field::Volume, Field::CloseTime,      Field::QuoteVolume,
    Field::Trades,      Field::TakerBuyVolume, Field::TakerBuyQuoteVolume, Field::Ignore,
};

// Column order of the canonical table and its CSV export.
inline constexpr std::array<Field, 11> kCanonicalFields{
    Field::OpenTime,    Field::Open,   Field::High,      Field::Low,
    Field::Close,       Field::Volume, Field::CloseTime, Field::QuoteVolume,
    Field::Trades,      Field::TakerBuyVolume, Field::TakerBuyQuoteVolume,
};

// Columns subject to the strict null gate.
inline constexpr std::array<Field, 9> kRequiredNumericFields{
    Field::Open,   Field::High,        Field::Low,    Field::Close,          Field::Volume,
    Field::QuoteVolume, Field::TakerBuyVolume, Field::TakerBuyQuoteVolume, Field::Trades,
};

inline constexpr std::size_t kWireArity = kWireFields.size();

constexpr std::size_t wireIndex(Field field) {
    for (std::size_t i = 0; i < kWireFields.size(); ++i) {
        if (kWireFields[i] == field) {
            return i;
        }
    }
    return kWireFields.size();
}

constexpr std::size_t canonicalIndex(Field field) {
    for (std::size_t i = 0; i < kCanonicalFields.size(); ++i) {
        if (kCanonicalFields[i] == field) {
            return i;
        }
    }
    return kCanonicalFields.size();
}

constexpr bool isCanonical(Field field) {
    return canonicalIndex(field) < kCanonicalFields.size();
}

std::optional<Field> canonicalFieldFromName(std::string_view name);

static_assert(wireIndex(Field::OpenTime) == 0);
static_assert(wireIndex(Field::Close) == 4);
static_assert(wireIndex(Field::CloseTime) == 6);
static_assert(wireIndex(Field::Trades) == 8);
static_assert(wireIndex(Field::Ignore) == 11);
static_assert(canonicalIndex(Field::Close) == wireIndex(Field::Close));
static_assert(!isCanonical(Field::Ignore));
static_assert(kCanonicalFields.size() + 1 == kWireFields.size());

}  // namespace domain
