#pragma once

#include <cstddef>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

#include "domain/Kline.hpp"

namespace infra::storage {

struct CsvRow {
    // 1-based physical line in the file; the header is line 1.
    std::size_t line = 0;
    std::vector<std::string> fields;
};

struct CsvDocument {
    std::vector<std::string> header;
    std::vector<CsvRow> rows;
};

std::vector<std::string> split_csv_line(std::string_view line);

// Reads a comma separated file with a header row. Every record is one physical line: quoted fields
// may hold commas and doubled quotes but not line breaks. Blank lines are skipped.
// Throws vambex::InputError when the file cannot be read and vambex::SchemaError when it has no
// header or a row's field count differs from the header's.
CsvDocument read_csv(const std::filesystem::path& path);

// Maps every canonical column by header name and parses the typed cells. Empty cells become null.
// Throws vambex::SchemaError for a missing canonical column or a cell that does not parse.
std::vector<domain::KlineRecord> read_canonical_records(const CsvDocument& document);

// Header plus one line per record, canonical column order, no index column.
// Throws vambex::InputError when the file cannot be written.
void write_canonical_csv(const domain::KlineTable& table, const std::filesystem::path& path);

}  // namespace infra::storage
