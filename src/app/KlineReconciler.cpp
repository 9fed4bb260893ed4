#include "app/KlineReconciler.hpp"

#include <fstream>
#include <iterator>
#include <sstream>
#include <string>
#include <utility>

#include <boost/json/parse.hpp>

#include "common/Errors.hpp"
#include "core/TimeUtils.hpp"
#include "domain/KlineNormalizer.hpp"
#include "infra/storage/KlineCsv.hpp"

namespace app {
namespace {

std::string readWholeFile(const std::filesystem::path& path) {
    std::ifstream input(path, std::ios::in | std::ios::binary);
    if (!input) {
        throw vambex::InputError("Cannot open file: " + path.string());
    }
    std::string content{std::istreambuf_iterator<char>(input), std::istreambuf_iterator<char>()};
    if (input.bad()) {
        throw vambex::InputError("Failed while reading file: " + path.string());
    }
    return content;
}

struct AlignedPair {
    const domain::KlineRecord* reference = nullptr;
    const domain::KlineRecord* canonical = nullptr;
};

// Both tables are sorted by open_time with unique keys and keyless rows at the end.
std::vector<AlignedPair> intersectByOpenTime(const domain::KlineTable& reference,
                                             const domain::KlineTable& canonical) {
    std::vector<AlignedPair> pairs;
    std::size_t r = 0;
    std::size_t c = 0;
    while (r < reference.size() && c < canonical.size()) {
        const auto& refKey = reference[r].openTime;
        const auto& canKey = canonical[c].openTime;
        if (!refKey || !canKey) {
            break;
        }
        if (*refKey < *canKey) {
            ++r;
        } else if (*canKey < *refKey) {
            ++c;
        } else {
            pairs.push_back(AlignedPair{&reference[r], &canonical[c]});
            ++r;
            ++c;
        }
    }
    return pairs;
}

std::string reportCell(const domain::KlineRecord& record, domain::Field field) {
    auto text = domain::formatCell(record, field);
    return text.empty() ? std::string{"null"} : text;
}

}  // namespace

const char* to_string(ReconcileOutcome outcome) noexcept {
    switch (outcome) {
    case ReconcileOutcome::NoCommonTimestamps:
        return "no_common_timestamps";
    case ReconcileOutcome::Match:
        return "match";
    case ReconcileOutcome::Divergent:
        return "divergent";
    }
    return "unknown";
}

KlineReconciler::KlineReconciler(vambex::log::Logger logger) : logger_(std::move(logger)) {}

domain::KlineTable KlineReconciler::load_reference_artifact(const std::filesystem::path& path, bool dropLast) const {
    const auto content = readWholeFile(path);

    boost::system::error_code ec;
    auto payload = boost::json::parse(content, ec);
    if (ec) {
        throw vambex::InputError("Malformed JSON in " + path.string() + ": " + ec.message());
    }

    if (!payload.is_array()) {
        throw vambex::SchemaError(path.string() + ": expected a JSON array of kline rows");
    }
    auto& rows = payload.as_array();
    for (std::size_t index = 0; index < rows.size(); ++index) {
        if (!rows[index].is_array() || rows[index].as_array().size() != domain::kWireArity) {
            std::ostringstream oss;
            oss << path.string() << ": row " << index << " must be an array of " << domain::kWireArity << " fields";
            throw vambex::SchemaError(oss.str());
        }
    }

    if (dropLast && !rows.empty()) {
        rows.pop_back();
    }

    auto table = domain::normalize(payload, domain::Strictness::Lenient, logger_);
    VAMBEX_LOG_DEBUG(logger_, "Loaded reference artifact " << path.string() << " with " << table.size() << " rows");
    return table;
}

domain::KlineTable KlineReconciler::load_canonical_artifact(const std::filesystem::path& path, bool dropLast) const {
    const auto document = infra::storage::read_csv(path);

    std::vector<domain::KlineRecord> records;
    try {
        records = infra::storage::read_canonical_records(document);
    } catch (const vambex::SchemaError& ex) {
        throw vambex::SchemaError(path.string() + ": " + ex.what());
    }

    if (dropLast && !records.empty()) {
        records.pop_back();
    }

    auto table = domain::finalizeTable(std::move(records), logger_);
    VAMBEX_LOG_DEBUG(logger_, "Loaded canonical artifact " << path.string() << " with " << table.size() << " rows");
    return table;
}

std::map<domain::TimestampMs, std::size_t> KlineReconciler::canonical_line_map(
    const std::filesystem::path& path) const {
    const auto document = infra::storage::read_csv(path);

    std::optional<std::size_t> openTimeColumn;
    for (std::size_t h = 0; h < document.header.size(); ++h) {
        if (document.header[h] == domain::fieldName(domain::Field::OpenTime)) {
            openTimeColumn = h;
            break;
        }
    }
    if (!openTimeColumn) {
        throw vambex::SchemaError(path.string() + ": canonical header is missing column 'open_time'");
    }

    std::map<domain::TimestampMs, std::size_t> lines;
    for (const auto& row : document.rows) {
        if (const auto key = core::parseUtcMillis(row.fields[*openTimeColumn])) {
            lines[*key] = row.line;
        }
    }
    return lines;
}

DivergenceReport KlineReconciler::compare(const std::filesystem::path& referencePath,
                                          const std::filesystem::path& canonicalPath,
                                          bool dropLast) const {
    const auto lineMap = canonical_line_map(canonicalPath);
    const auto reference = load_reference_artifact(referencePath, dropLast);
    const auto canonical = load_canonical_artifact(canonicalPath, dropLast);

    DivergenceReport report;
    report.dropLast = dropLast;
    report.referenceRows = reference.size();
    report.canonicalRows = canonical.size();

    const auto pairs = intersectByOpenTime(reference, canonical);
    report.commonRows = pairs.size();

    if (pairs.empty()) {
        report.outcome = ReconcileOutcome::NoCommonTimestamps;
        VAMBEX_LOG_INFO(logger_, "No common timestamps to compare");
        return report;
    }

    if (report.sizesDiffer()) {
        VAMBEX_LOG_WARN(logger_, "Different sizes (reference=" << report.referenceRows << ", canonical="
                                                               << report.canonicalRows << "). Comparing "
                                                               << report.commonRows << " common timestamps.");
    }

    for (std::size_t index = 0; index < pairs.size(); ++index) {
        const auto& pair = pairs[index];
        RowDivergence divergence;
        for (auto field : domain::kCanonicalFields) {
            if (field == domain::Field::OpenTime) {
                continue;
            }
            if (domain::cellEquals(*pair.reference, *pair.canonical, field)) {
                continue;
            }
            divergence.cells.push_back(CellDifference{std::string{domain::fieldName(field)},
                                                      reportCell(*pair.reference, field),
                                                      reportCell(*pair.canonical, field)});
        }
        if (divergence.cells.empty()) {
            continue;
        }

        divergence.openTime = *pair.canonical->openTime;
        divergence.position = index + 1;
        if (const auto it = lineMap.find(divergence.openTime); it != lineMap.end()) {
            divergence.sourceLine = it->second;
        }
        report.rows.push_back(std::move(divergence));
    }

    if (report.rows.empty()) {
        report.outcome = ReconcileOutcome::Match;
        VAMBEX_LOG_INFO(logger_, "Data matches across " << report.commonRows << " common timestamps");
    } else {
        report.outcome = ReconcileOutcome::Divergent;
        VAMBEX_LOG_WARN(logger_, "Differences found in " << report.rows.size() << " of " << report.commonRows
                                                         << " common rows");
    }
    return report;
}

void render_report(const DivergenceReport& report, std::ostream& out) {
    if (report.outcome == ReconcileOutcome::NoCommonTimestamps) {
        out << "No common timestamps to compare.\n";
        return;
    }

    if (report.sizesDiffer()) {
        out << "Warning: different sizes (reference=" << report.referenceRows << ", canonical="
            << report.canonicalRows << "). Comparing " << report.commonRows << " common timestamps.\n";
    }

    if (report.outcome == ReconcileOutcome::Match) {
        out << "OK: data matches" << (report.dropLast ? " (ignoring the last line)." : ".") << '\n';
        return;
    }

    out << "Differences found in " << report.rows.size() << " rows.\n";
    for (const auto& row : report.rows) {
        out << "\nRow " << row.position << " (timestamp " << core::formatUtcMillis(row.openTime)
            << ", canonical line ";
        if (row.sourceLine) {
            out << *row.sourceLine;
        } else {
            out << "n/a";
        }
        out << "):\n";
        for (const auto& cell : row.cells) {
            out << "  " << cell.column << ": reference=" << cell.reference << " canonical=" << cell.canonical
                << '\n';
        }
    }
}

}  // namespace app
