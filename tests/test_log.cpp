#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include "common/Errors.hpp"
#include "common/Log.hpp"

namespace {

namespace fs = std::filesystem;

std::size_t countLines(const fs::path& path) {
    std::ifstream input(path);
    std::size_t lines = 0;
    std::string line;
    while (std::getline(input, line)) {
        ++lines;
    }
    return lines;
}

}  // namespace

int main() {
    using vambex::log::Level;

    // Level parsing accepts the usual aliases and rejects anything else.
    if (vambex::log::levelFromString("WARNING") != Level::Warn || vambex::log::levelFromString("err") != Level::Error ||
        vambex::log::levelFromString("Debug") != Level::Debug) {
        std::cerr << "Unexpected level parsing result\n";
        return 1;
    }
    try {
        (void)vambex::log::levelFromString("trace");
        std::cerr << "Expected 'trace' to be rejected\n";
        return 1;
    } catch (const vambex::ConfigError&) {
    }

    // Line format.
    {
        vambex::log::Record record;
        record.level = Level::Warn;
        record.channel = "fetcher";
        record.timestamp = std::chrono::system_clock::now();
        record.message = "limit adjusted";
        const auto line = vambex::log::formatRecord(record);
        if (line.rfind("[VAMBEX] ", 0) != 0) {
            std::cerr << "Expected line to start with the [VAMBEX] tag: " << line << "\n";
            return 1;
        }
        if (line.find(" | WARNING | fetcher | limit adjusted") == std::string::npos) {
            std::cerr << "Unexpected formatted line: " << line << "\n";
            return 1;
        }
        // "[VAMBEX] " + "YYYY-MM-DD HH:MM:SS"
        if (line.size() < 28 || line[13] != '-' || line[19] != ' ' || line[22] != ':') {
            std::cerr << "Unexpected timestamp layout: " << line << "\n";
            return 1;
        }
    }

    // Threshold filtering and child channels share sinks.
    {
        auto memory = std::make_shared<vambex::log::MemorySink>();
        vambex::log::Logger logger("root", Level::Info, {memory});
        VAMBEX_LOG_DEBUG(logger, "hidden " << 1);
        VAMBEX_LOG_INFO(logger, "visible " << 2);
        auto child = logger.child("reconciler");
        VAMBEX_LOG_WARN(child, "careful");

        const auto records = memory->records();
        if (records.size() != 2) {
            std::cerr << "Expected 2 records but got " << records.size() << "\n";
            return 1;
        }
        if (records[0].message != "visible 2" || records[0].channel != "root") {
            std::cerr << "Unexpected first record: " << records[0].message << "\n";
            return 1;
        }
        if (records[1].channel != "reconciler" || records[1].level != Level::Warn) {
            std::cerr << "Expected child record on channel 'reconciler'\n";
            return 1;
        }
        if (memory->count(Level::Warn) != 1 || memory->count(Level::Debug) != 0) {
            std::cerr << "Unexpected per-level counts\n";
            return 1;
        }
    }

    // The null logger never formats anything.
    {
        auto logger = vambex::log::Logger::null();
        bool evaluated = false;
        auto touch = [&evaluated]() {
            evaluated = true;
            return "x";
        };
        VAMBEX_LOG_ERR(logger, touch());
        if (evaluated || logger.shouldLog(Level::Error)) {
            std::cerr << "Expected the null logger to skip formatting\n";
            return 1;
        }
    }

    // Rotation keeps at most backupCount old files.
    {
        const auto dir = fs::temp_directory_path() / "vambex_test_log_rotation";
        fs::remove_all(dir);
        const auto path = dir / "nested" / "vambex.log";
        {
            auto fileSink = std::make_shared<vambex::log::RotatingFileSink>(path, 200, 2);
            vambex::log::Logger logger("rotation", Level::Debug, {fileSink});
            for (int i = 0; i < 40; ++i) {
                VAMBEX_LOG_INFO(logger, "line number " << i);
            }
        }
        if (!fs::exists(path) || !fs::exists(dir / "nested" / "vambex.log.1") ||
            !fs::exists(dir / "nested" / "vambex.log.2")) {
            std::cerr << "Expected the active log file and two backups\n";
            return 1;
        }
        if (fs::exists(dir / "nested" / "vambex.log.3")) {
            std::cerr << "Expected no more than two backups\n";
            return 1;
        }
        if (fs::file_size(path) > 200 || countLines(path) == 0) {
            std::cerr << "Expected the active file to stay within maxBytes\n";
            return 1;
        }
        fs::remove_all(dir);
    }

    return 0;
}
