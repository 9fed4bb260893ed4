#include "domain/KlineSchema.hpp"

namespace domain {

std::optional<Field> canonicalFieldFromName(std::string_view name) {
    for (auto field : kCanonicalFields) {
        if (fieldName(field) == name) {
            return field;
        }
    }
    return std::nullopt;
}

}  // namespace domain
