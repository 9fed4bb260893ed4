#pragma once

#include <cstddef>
#include <filesystem>
#include <map>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

#include "common/Log.hpp"
#include "domain/Kline.hpp"

namespace app {

enum class ReconcileOutcome {
    NoCommonTimestamps,
    Match,
    Divergent,
};

const char* to_string(ReconcileOutcome outcome) noexcept;

struct CellDifference {
    std::string column;
    std::string reference;
    std::string canonical;
};

struct RowDivergence {
    domain::TimestampMs openTime = 0;
    // 1-based position within the intersected, sorted table.
    std::size_t position = 0;
    // 1-based line in the canonical file (header is line 1), when known.
    std::optional<std::size_t> sourceLine;
    std::vector<CellDifference> cells;
};

struct DivergenceReport {
    ReconcileOutcome outcome = ReconcileOutcome::NoCommonTimestamps;
    std::size_t referenceRows = 0;
    std::size_t canonicalRows = 0;
    std::size_t commonRows = 0;
    bool dropLast = false;
    std::vector<RowDivergence> rows;

    bool sizesDiffer() const noexcept {
        return commonRows != referenceRows || commonRows != canonicalRows;
    }
};

// Aligns a reference JSON dump with a canonical CSV export by open_time and reports every row
// whose shared columns differ.
class KlineReconciler {
public:
    explicit KlineReconciler(vambex::log::Logger logger);

    // JSON array of 12-field rows, normalized leniently.
    // Throws vambex::InputError (unreadable file, malformed JSON) or vambex::SchemaError (shape).
    domain::KlineTable load_reference_artifact(const std::filesystem::path& path, bool dropLast) const;

    // Canonical CSV with header. Throws vambex::InputError or vambex::SchemaError.
    domain::KlineTable load_canonical_artifact(const std::filesystem::path& path, bool dropLast) const;

    // open_time -> 1-based file line, computed from the raw file before any row is dropped.
    std::map<domain::TimestampMs, std::size_t> canonical_line_map(const std::filesystem::path& path) const;

    DivergenceReport compare(const std::filesystem::path& referencePath,
                             const std::filesystem::path& canonicalPath,
                             bool dropLast) const;

private:
    vambex::log::Logger logger_;
};

void render_report(const DivergenceReport& report, std::ostream& out);

}  // namespace app
