#include "common/Config.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <limits>
#include <stdexcept>
#include <string>
#include <utility>

#include "common/Errors.hpp"

namespace vambex::common {
namespace {

std::string toLower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return value;
}

std::string trim(std::string value) {
    auto isSpace = [](unsigned char ch) { return std::isspace(ch) != 0; };
    value.erase(value.begin(), std::find_if(value.begin(), value.end(), [&](unsigned char ch) {
                   return !isSpace(ch);
               }));
    value.erase(std::find_if(value.rbegin(), value.rend(), [&](unsigned char ch) {
                    return !isSpace(ch);
                }).base(),
                value.end());
    return value;
}

std::uint32_t parseDurationMs(const std::string& value, const std::string& label) {
    try {
        std::size_t consumed = 0;
        const auto parsed = std::stoul(value, &consumed);
        if (consumed != value.size() || parsed == 0U || parsed > std::numeric_limits<std::uint32_t>::max()) {
            throw std::out_of_range("duration out of range");
        }
        return static_cast<std::uint32_t>(parsed);
    } catch (const std::exception&) {
        throw ConfigError("Invalid value for " + label + ": " + value);
    }
}

std::size_t parseSize(const std::string& value, const std::string& label) {
    try {
        std::size_t consumed = 0;
        const auto parsed = std::stoull(value, &consumed);
        if (consumed != value.size()) {
            throw std::invalid_argument("trailing characters");
        }
        return static_cast<std::size_t>(parsed);
    } catch (const std::exception&) {
        throw ConfigError("Invalid value for " + label + ": " + value);
    }
}

long long parseLimit(const std::string& value) {
    const auto trimmed = trim(value);
    try {
        std::size_t consumed = 0;
        const auto parsed = std::stoll(trimmed, &consumed);
        if (consumed != trimmed.size()) {
            throw std::invalid_argument("trailing characters");
        }
        return parsed;
    } catch (const std::exception&) {
        throw ConfigError("limit must be an integer, got: " + value);
    }
}

bool parseBool(const std::string& value) {
    const auto normalized = toLower(value);
    if (normalized == "true" || normalized == "1" || normalized == "yes" || normalized == "on") {
        return true;
    }
    if (normalized == "false" || normalized == "0" || normalized == "no" || normalized == "off") {
        return false;
    }
    throw ConfigError("Invalid boolean value: " + value);
}

Command parseCommand(const std::string& value) {
    const auto normalized = toLower(value);
    if (normalized == "run") {
        return Command::Run;
    }
    if (normalized == "fetch") {
        return Command::Fetch;
    }
    if (normalized == "compare") {
        return Command::Compare;
    }
    throw ConfigError("Unknown command: " + value);
}

std::string valueFromArgs(int argc, char** argv, const std::string& key) {
    const std::string withEquals = key + '=';
    for (int i = 1; i < argc; ++i) {
        std::string arg{argv[i]};
        if (arg == key && i + 1 < argc) {
            return argv[i + 1];
        }
        if (arg.rfind(withEquals, 0) == 0) {
            return arg.substr(withEquals.size());
        }
    }
    return {};
}

bool hasFlag(int argc, char** argv, const std::string& key) {
    for (int i = 1; i < argc; ++i) {
        if (key == argv[i]) {
            return true;
        }
    }
    return false;
}

// Flags that are followed by a separate value argument.
bool takesValue(const std::string& arg) {
    static const char* kValueFlags[] = {
        "--log-level", "--log-dir",  "--log-file", "--log-max-bytes", "--log-backups",
        "--rest-host", "--rest-path", "--connect-timeout-ms", "--read-timeout-ms",
        "--symbol",    "--interval", "--limit",    "--out",           "--reference",
        "--canonical", "--drop-last",
    };
    for (const char* flag : kValueFlags) {
        if (arg == flag) {
            return true;
        }
    }
    return false;
}

std::string firstPositional(int argc, char** argv) {
    for (int i = 1; i < argc; ++i) {
        std::string arg{argv[i]};
        if (arg.rfind("--", 0) == 0) {
            if (arg.find('=') == std::string::npos && takesValue(arg)) {
                ++i;
            }
            continue;
        }
        return arg;
    }
    return {};
}

}  // namespace

const char* to_string(Command command) noexcept {
    switch (command) {
    case Command::Run:
        return "run";
    case Command::Fetch:
        return "fetch";
    case Command::Compare:
        return "compare";
    }
    return "run";
}

Config Config::fromArgs(int argc, char** argv) {
    Config config{};

    if (const char* envLogLevel = std::getenv("VAMBEX_LOG_LEVEL")) {
        config.logLevel = vambex::log::levelFromString(envLogLevel);
    }
    if (const char* envLogDir = std::getenv("VAMBEX_LOG_DIR")) {
        auto dir = trim(envLogDir);
        if (!dir.empty()) {
            config.logDir = std::move(dir);
        }
    }
    if (const char* envHost = std::getenv("VAMBEX_REST_HOST")) {
        auto host = trim(envHost);
        if (!host.empty()) {
            config.restHost = std::move(host);
        }
    }

    if (auto command = firstPositional(argc, argv); !command.empty()) {
        config.command = parseCommand(command);
    }

    if (auto levelArg = valueFromArgs(argc, argv, "--log-level"); !levelArg.empty()) {
        config.logLevel = vambex::log::levelFromString(levelArg);
    }
    if (auto dirArg = valueFromArgs(argc, argv, "--log-dir"); !dirArg.empty()) {
        config.logDir = trim(dirArg);
    }
    if (auto fileArg = valueFromArgs(argc, argv, "--log-file"); !fileArg.empty()) {
        config.logFile = trim(fileArg);
    }
    if (auto maxBytesArg = valueFromArgs(argc, argv, "--log-max-bytes"); !maxBytesArg.empty()) {
        config.logMaxBytes = parseSize(maxBytesArg, "--log-max-bytes");
    }
    if (auto backupsArg = valueFromArgs(argc, argv, "--log-backups"); !backupsArg.empty()) {
        config.logBackups = parseSize(backupsArg, "--log-backups");
    }
    if (auto hostArg = valueFromArgs(argc, argv, "--rest-host"); !hostArg.empty()) {
        config.restHost = trim(hostArg);
    }
    if (auto pathArg = valueFromArgs(argc, argv, "--rest-path"); !pathArg.empty()) {
        config.restPath = trim(pathArg);
    }
    if (auto connectArg = valueFromArgs(argc, argv, "--connect-timeout-ms"); !connectArg.empty()) {
        config.connectTimeoutMs = parseDurationMs(connectArg, "--connect-timeout-ms");
    }
    if (auto readArg = valueFromArgs(argc, argv, "--read-timeout-ms"); !readArg.empty()) {
        config.readTimeoutMs = parseDurationMs(readArg, "--read-timeout-ms");
    }

    if (auto symbolArg = valueFromArgs(argc, argv, "--symbol"); !symbolArg.empty()) {
        config.symbol = symbolArg;
    }
    if (auto intervalArg = valueFromArgs(argc, argv, "--interval"); !intervalArg.empty()) {
        config.interval = trim(intervalArg);
    }
    if (auto limitArg = valueFromArgs(argc, argv, "--limit"); !limitArg.empty()) {
        config.limit = parseLimit(limitArg);
    }
    if (auto outArg = valueFromArgs(argc, argv, "--out"); !outArg.empty()) {
        config.outPath = trim(outArg);
    }

    if (auto referenceArg = valueFromArgs(argc, argv, "--reference"); !referenceArg.empty()) {
        config.referencePath = trim(referenceArg);
    }
    if (auto canonicalArg = valueFromArgs(argc, argv, "--canonical"); !canonicalArg.empty()) {
        config.canonicalPath = trim(canonicalArg);
    }
    if (auto dropLastArg = valueFromArgs(argc, argv, "--drop-last"); !dropLastArg.empty()) {
        config.dropLast = parseBool(dropLastArg);
    }
    if (hasFlag(argc, argv, "--keep-last")) {
        config.dropLast = false;
    }

    if (config.command == Command::Fetch) {
        if (trim(config.symbol).empty()) {
            throw ConfigError("The fetch command requires --symbol");
        }
        if (config.interval.empty()) {
            throw ConfigError("The fetch command requires --interval");
        }
    }
    if (config.command == Command::Compare) {
        if (config.referencePath.empty()) {
            throw ConfigError("The compare command requires --reference");
        }
        if (config.canonicalPath.empty()) {
            throw ConfigError("The compare command requires --canonical");
        }
    }

    return config;
}

}  // namespace vambex::common
