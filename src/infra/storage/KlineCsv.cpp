#include "infra/storage/KlineCsv.hpp"

#include <array>
#include <fstream>
#include <optional>
#include <sstream>
#include <system_error>
#include <utility>

#include "common/Errors.hpp"
#include "core/TimeUtils.hpp"
#include "domain/KlineNormalizer.hpp"

namespace infra::storage {
namespace {

using domain::Field;
using domain::FieldKind;

bool isBlank(std::string_view line) {
    for (char ch : line) {
        if (ch != ' ' && ch != '\t') {
            return false;
        }
    }
    return true;
}

std::string quoteIfNeeded(const std::string& value) {
    if (value.find_first_of(",\"") == std::string::npos) {
        return value;
    }
    std::string quoted{"\""};
    for (char ch : value) {
        if (ch == '"') {
            quoted.push_back('"');
        }
        quoted.push_back(ch);
    }
    quoted.push_back('"');
    return quoted;
}

[[noreturn]] void throwCellError(std::size_t line, Field field, const std::string& value) {
    std::ostringstream oss;
    oss << "line " << line << ", column " << domain::fieldName(field) << ": cannot parse '" << value << "'";
    throw vambex::SchemaError(oss.str());
}

}  // namespace

std::vector<std::string> split_csv_line(std::string_view line) {
    std::vector<std::string> fields;
    std::string current;
    bool inQuotes = false;
    for (std::size_t i = 0; i < line.size(); ++i) {
        const char ch = line[i];
        if (inQuotes) {
            if (ch == '"') {
                if (i + 1 < line.size() && line[i + 1] == '"') {
                    current.push_back('"');
                    ++i;
                } else {
                    inQuotes = false;
                }
            } else {
                current.push_back(ch);
            }
        } else if (ch == '"') {
            inQuotes = true;
        } else if (ch == ',') {
            fields.push_back(std::move(current));
            current.clear();
        } else {
            current.push_back(ch);
        }
    }
    fields.push_back(std::move(current));
    return fields;
}

CsvDocument read_csv(const std::filesystem::path& path) {
    std::ifstream input(path);
    if (!input) {
        throw vambex::InputError("Cannot open file: " + path.string());
    }

    CsvDocument document;
    bool haveHeader = false;
    std::string line;
    std::size_t lineNumber = 0;
    while (std::getline(input, line)) {
        ++lineNumber;
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (isBlank(line)) {
            continue;
        }

        auto fields = split_csv_line(line);
        if (!haveHeader) {
            document.header = std::move(fields);
            haveHeader = true;
            continue;
        }

        if (fields.size() != document.header.size()) {
            std::ostringstream oss;
            oss << path.string() << ": line " << lineNumber << " has " << fields.size() << " fields, header has "
                << document.header.size();
            throw vambex::SchemaError(oss.str());
        }
        document.rows.push_back(CsvRow{lineNumber, std::move(fields)});
    }

    if (input.bad()) {
        throw vambex::InputError("Failed while reading file: " + path.string());
    }
    if (!haveHeader) {
        throw vambex::SchemaError(path.string() + ": missing header row");
    }
    return document;
}

std::vector<domain::KlineRecord> read_canonical_records(const CsvDocument& document) {
    std::array<std::optional<std::size_t>, domain::kCanonicalFields.size()> columnOf{};
    for (std::size_t h = 0; h < document.header.size(); ++h) {
        const auto field = domain::canonicalFieldFromName(document.header[h]);
        if (!field) {
            continue;
        }
        auto& slot = columnOf[domain::canonicalIndex(*field)];
        if (!slot) {
            slot = h;
        }
    }
    for (auto field : domain::kCanonicalFields) {
        if (!columnOf[domain::canonicalIndex(field)]) {
            throw vambex::SchemaError("Canonical header is missing column '" + std::string{domain::fieldName(field)} +
                                      "'");
        }
    }

    std::vector<domain::KlineRecord> records;
    records.reserve(document.rows.size());
    for (const auto& row : document.rows) {
        domain::KlineRecord record;
        for (std::size_t c = 0; c < domain::kCanonicalFields.size(); ++c) {
            const auto field = domain::kCanonicalFields[c];
            const auto& text = row.fields[*columnOf[c]];
            if (isBlank(text)) {
                continue;
            }

            switch (domain::fieldKind(field)) {
            case FieldKind::Instant: {
                auto instant = core::parseUtcMillis(text);
                if (!instant) {
                    throwCellError(row.line, field, text);
                }
                *domain::mutableInstantCell(record, field) = instant;
                break;
            }
            case FieldKind::Decimal: {
                auto decimal = domain::parseDecimalText(text);
                if (!decimal) {
                    throwCellError(row.line, field, text);
                }
                *domain::mutableDecimalCell(record, field) = decimal;
                break;
            }
            case FieldKind::Count: {
                auto count = domain::parseCountText(text);
                if (!count) {
                    throwCellError(row.line, field, text);
                }
                record.trades = count;
                break;
            }
            case FieldKind::Opaque:
                break;
            }
        }
        records.push_back(record);
    }
    return records;
}

void write_canonical_csv(const domain::KlineTable& table, const std::filesystem::path& path) {
    if (!path.parent_path().empty()) {
        std::error_code ec;
        std::filesystem::create_directories(path.parent_path(), ec);
        if (ec) {
            throw vambex::InputError("Cannot create directory " + path.parent_path().string() + ": " + ec.message());
        }
    }

    std::ofstream output(path, std::ios::out | std::ios::trunc);
    if (!output) {
        throw vambex::InputError("Cannot open file for writing: " + path.string());
    }

    for (std::size_t c = 0; c < domain::kCanonicalFields.size(); ++c) {
        if (c > 0) {
            output << ',';
        }
        output << domain::fieldName(domain::kCanonicalFields[c]);
    }
    output << '\n';

    for (const auto& record : table.rows) {
        for (std::size_t c = 0; c < domain::kCanonicalFields.size(); ++c) {
            if (c > 0) {
                output << ',';
            }
            output << quoteIfNeeded(domain::formatCell(record, domain::kCanonicalFields[c]));
        }
        output << '\n';
    }

    output.flush();
    if (!output) {
        throw vambex::InputError("Failed while writing file: " + path.string());
    }
}

}  // namespace infra::storage
