#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <string>
#include <vector>

#include "common/Errors.hpp"
#include "domain/Kline.hpp"
#include "infra/storage/KlineCsv.hpp"

namespace {

namespace fs = std::filesystem;

const char* kHeader =
    "open_time,open,high,low,close,volume,close_time,quote_volume,trades,taker_buy_volume,taker_buy_quote_volume";

fs::path writeFile(const fs::path& path, const std::string& content) {
    fs::create_directories(path.parent_path());
    std::ofstream output(path, std::ios::out | std::ios::trunc);
    output << content;
    return path;
}

std::string readFile(const fs::path& path) {
    std::ifstream input(path);
    return std::string{std::istreambuf_iterator<char>(input), std::istreambuf_iterator<char>()};
}

template <typename Exception>
bool throwsOn(const fs::path& path) {
    try {
        (void)infra::storage::read_canonical_records(infra::storage::read_csv(path));
    } catch (const Exception&) {
        return true;
    }
    return false;
}

}  // namespace

int main() {
    const auto dir = fs::temp_directory_path() / "vambex_test_kline_csv";
    fs::remove_all(dir);

    // Quoted fields.
    {
        const auto fields = infra::storage::split_csv_line("a,\"b,c\",\"say \"\"hi\"\"\",");
        if (fields.size() != 4 || fields[1] != "b,c" || fields[2] != "say \"hi\"" || !fields[3].empty()) {
            std::cerr << "Unexpected CSV split\n";
            return 1;
        }
    }

    // Export then reload through the canonical loader.
    {
        domain::KlineRecord first;
        first.openTime = 1704067200000LL;
        first.open = 42000.5;
        first.high = 42100.0;
        first.low = 41950.25;
        first.close = 0.1;
        first.volume = 12.5;
        first.closeTime = 1704067259999LL;
        first.quoteVolume = 525000.0;
        first.trades = 321;
        first.takerBuyVolume = 6.25;
        first.takerBuyQuoteVolume = 262500.0;

        domain::KlineRecord second = first;
        second.openTime = 1704067260000LL;
        second.closeTime = 1704067319999LL;
        second.volume.reset();

        domain::KlineTable table;
        table.rows = {first, second};

        const auto path = dir / "export" / "klines.csv";
        infra::storage::write_canonical_csv(table, path);

        const auto content = readFile(path);
        const auto expectedStart = std::string{kHeader} + "\n2024-01-01 00:00:00,42000.5,42100,41950.25,0.1,12.5,"
                                                          "2024-01-01 00:00:59.999,525000,321,6.25,262500\n";
        if (content.rfind(expectedStart, 0) != 0) {
            std::cerr << "Unexpected export:\n" << content << "\n";
            return 1;
        }
        if (content.find("2024-01-01 00:01:00,42000.5,42100,41950.25,0.1,,") == std::string::npos) {
            std::cerr << "Expected a null volume to be exported as an empty cell\n";
            return 1;
        }

        const auto document = infra::storage::read_csv(path);
        if (document.rows.size() != 2 || document.rows[0].line != 2 || document.rows[1].line != 3) {
            std::cerr << "Unexpected document line numbers\n";
            return 1;
        }
        const auto records = infra::storage::read_canonical_records(document);
        if (records.size() != 2) {
            std::cerr << "Expected two records\n";
            return 1;
        }
        for (auto field : domain::kCanonicalFields) {
            if (!domain::cellEquals(records[0], first, field) || !domain::cellEquals(records[1], second, field)) {
                std::cerr << "Column " << domain::fieldName(field) << " did not survive export\n";
                return 1;
            }
        }
    }

    // Header columns are matched by name; extra columns are ignored; blank lines are skipped.
    {
        const auto path = writeFile(dir / "reordered.csv",
                                    "trades,extra,close,open_time,open,high,low,volume,close_time,quote_volume,"
                                    "taker_buy_volume,taker_buy_quote_volume\r\n"
                                    "\r\n"
                                    "7,zzz,1.25,2024-01-01T00:00:00Z,1,2,0.5,10,2024-01-01 00:00:59.999,11,3,4\r\n");
        const auto document = infra::storage::read_csv(path);
        const auto records = infra::storage::read_canonical_records(document);
        if (records.size() != 1 || records[0].trades != 7 || records[0].close != 1.25 ||
            records[0].openTime != 1704067200000LL || document.rows[0].line != 3) {
            std::cerr << "Unexpected reordered parse\n";
            return 1;
        }
    }

    // Error taxonomy.
    if (!throwsOn<vambex::InputError>(dir / "missing.csv")) {
        std::cerr << "Expected InputError for a missing file\n";
        return 1;
    }
    if (!throwsOn<vambex::SchemaError>(writeFile(dir / "empty.csv", ""))) {
        std::cerr << "Expected SchemaError for an empty file\n";
        return 1;
    }
    if (!throwsOn<vambex::SchemaError>(writeFile(dir / "no_trades.csv",
                                                 "open_time,open,high,low,close,volume,close_time,quote_volume,"
                                                 "taker_buy_volume,taker_buy_quote_volume\n"))) {
        std::cerr << "Expected SchemaError for a missing column\n";
        return 1;
    }
    {
        const auto path =
            writeFile(dir / "ragged.csv", std::string{kHeader} + "\n2024-01-01,1,2,3,4,5,2024-01-01,6,7,8,9\n1,2\n");
        try {
            (void)infra::storage::read_csv(path);
            std::cerr << "Expected SchemaError for a ragged row\n";
            return 1;
        } catch (const vambex::SchemaError& ex) {
            if (std::string{ex.what()}.find("line 3") == std::string::npos) {
                std::cerr << "Expected the error to name line 3: " << ex.what() << "\n";
                return 1;
            }
        }
    }
    {
        const auto path =
            writeFile(dir / "bad_cell.csv", std::string{kHeader} + "\n2024-01-01,1,2,3,abc,5,2024-01-01,6,7,8,9\n");
        try {
            (void)infra::storage::read_canonical_records(infra::storage::read_csv(path));
            std::cerr << "Expected SchemaError for an unparseable cell\n";
            return 1;
        } catch (const vambex::SchemaError& ex) {
            const std::string message = ex.what();
            if (message.find("line 2") == std::string::npos || message.find("close") == std::string::npos) {
                std::cerr << "Expected the error to name line and column: " << message << "\n";
                return 1;
            }
        }
    }

    // Records are single-line: a quoted field spanning two lines leaves a short row behind.
    {
        const auto path = writeFile(dir / "multiline.csv",
                                    std::string{kHeader} + "\n\"2024-01-01\n00:00:00\",1,2,3,4,5,2024-01-01,6,7,8,9\n");
        try {
            (void)infra::storage::read_csv(path);
            std::cerr << "Expected SchemaError for a field spanning two lines\n";
            return 1;
        } catch (const vambex::SchemaError& ex) {
            if (std::string{ex.what()}.find("line 2") == std::string::npos) {
                std::cerr << "Expected the error to name line 2: " << ex.what() << "\n";
                return 1;
            }
        }

        const auto quoted = writeFile(dir / "quoted.csv",
                                      std::string{kHeader} + "\n\"2024-01-01\",\"1\",2,3,4,5,2024-01-01,6,7,8,9\n");
        const auto records = infra::storage::read_canonical_records(infra::storage::read_csv(quoted));
        if (records.size() != 1 || records[0].open != 1.0 || records[0].openTime != 1704067200000LL) {
            std::cerr << "Expected quoted single-line fields to parse\n";
            return 1;
        }
    }

    // Empty cells become nulls.
    {
        const auto path =
            writeFile(dir / "nulls.csv", std::string{kHeader} + "\n2024-01-01,,2,3,4,5,2024-01-01 00:00:59,6,,8,9\n");
        const auto records = infra::storage::read_canonical_records(infra::storage::read_csv(path));
        if (records.size() != 1 || records[0].open.has_value() || records[0].trades.has_value() ||
            records[0].high != 2.0) {
            std::cerr << "Expected empty cells to be null\n";
            return 1;
        }
    }

    fs::remove_all(dir);
    return 0;
}
