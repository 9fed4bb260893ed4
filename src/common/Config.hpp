#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

#include "common/Log.hpp"

namespace vambex::common {

enum class Command {
    Run,
    Fetch,
    Compare,
};

const char* to_string(Command command) noexcept;

struct Config {
    Command command = Command::Run;

    vambex::log::Level logLevel = vambex::log::Level::Info;
    std::string logDir = "logs";
    std::string logFile = "vambex.log";
    std::size_t logMaxBytes = 5'000'000;
    std::size_t logBackups = 5;

    std::string restHost = "data-api.binance.vision";
    std::string restPath = "/api/v3/klines";
    std::uint32_t connectTimeoutMs = 3000;
    std::uint32_t readTimeoutMs = 10000;

    std::string symbol;
    std::string interval;
    long long limit = 1000;
    std::string outPath;

    std::string referencePath;
    std::string canonicalPath;
    bool dropLast = true;

    // Environment first, then flags; flags win. Throws vambex::ConfigError on bad values.
    static Config fromArgs(int argc, char** argv);
};

}  // namespace vambex::common
