#include <algorithm>
#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <exception>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "adapters/binance/KlineFetcher.hpp"
#include "app/KlineReconciler.hpp"
#include "common/Config.hpp"
#include "common/Log.hpp"
#include "infra/http/TlsHttpClient.hpp"
#include "infra/storage/KlineCsv.hpp"

namespace {

constexpr std::size_t kPreviewRows = 5;

vambex::log::Logger buildLogger(const vambex::common::Config& config) {
    std::vector<std::shared_ptr<vambex::log::Sink>> sinks;
    sinks.push_back(std::make_shared<vambex::log::ConsoleSink>());
    const auto logPath = std::filesystem::path(config.logDir) / config.logFile;
    sinks.push_back(std::make_shared<vambex::log::RotatingFileSink>(logPath, config.logMaxBytes, config.logBackups));
    return vambex::log::Logger("vambex", config.logLevel, std::move(sinks));
}

void logConfig(const vambex::log::Logger& logger, const vambex::common::Config& config) {
    VAMBEX_LOG_DEBUG(logger, "Configuration loaded");
    VAMBEX_LOG_DEBUG(logger, "  Command: " << vambex::common::to_string(config.command));
    VAMBEX_LOG_DEBUG(logger, "  Schema version: " << domain::kSchemaVersion);
    VAMBEX_LOG_DEBUG(logger, "  Log level: " << vambex::log::levelToString(config.logLevel));
    VAMBEX_LOG_DEBUG(logger, "  Log file: " << (std::filesystem::path(config.logDir) / config.logFile).string()
                                            << " (max " << config.logMaxBytes << " bytes, " << config.logBackups
                                            << " backups)");
    VAMBEX_LOG_DEBUG(logger, "  REST: " << config.restHost << config.restPath << " connect="
                                        << config.connectTimeoutMs << " ms read=" << config.readTimeoutMs << " ms");
    if (!config.symbol.empty()) {
        VAMBEX_LOG_DEBUG(logger, "  Request: symbol=" << config.symbol << " interval=" << config.interval
                                                      << " limit=" << config.limit);
    }
    if (!config.outPath.empty()) {
        VAMBEX_LOG_DEBUG(logger, "  Export: " << config.outPath);
    }
    if (config.command == vambex::common::Command::Compare) {
        VAMBEX_LOG_DEBUG(logger, "  Reference: " << config.referencePath);
        VAMBEX_LOG_DEBUG(logger, "  Canonical: " << config.canonicalPath);
        VAMBEX_LOG_DEBUG(logger, "  Drop last: " << (config.dropLast ? "true" : "false"));
    }
}

void runFetch(const vambex::common::Config& config, const vambex::log::Logger& logger) {
    adapters::binance::FetcherOptions options;
    options.host = config.restHost;
    options.path = config.restPath;
    options.timeouts.connect = std::chrono::milliseconds(config.connectTimeoutMs);
    options.timeouts.read = std::chrono::milliseconds(config.readTimeoutMs);

    infra::http::TlsHttpClient client;
    adapters::binance::KlineFetcher fetcher(config.symbol, config.interval, config.limit, client,
                                            logger.child("fetcher"), options);
    const auto table = fetcher.fetch_and_normalize();

    VAMBEX_LOG_INFO(logger, "Fetched " << table.size() << " klines for " << fetcher.symbol() << ' '
                                       << fetcher.interval());
    const auto preview = std::min(kPreviewRows, table.size());
    for (std::size_t i = 0; i < preview; ++i) {
        const auto& row = table[i];
        VAMBEX_LOG_INFO(logger, "  " << domain::formatCell(row, domain::Field::OpenTime)
                                     << " o=" << domain::formatCell(row, domain::Field::Open)
                                     << " h=" << domain::formatCell(row, domain::Field::High)
                                     << " l=" << domain::formatCell(row, domain::Field::Low)
                                     << " c=" << domain::formatCell(row, domain::Field::Close)
                                     << " v=" << domain::formatCell(row, domain::Field::Volume)
                                     << " trades=" << domain::formatCell(row, domain::Field::Trades));
    }

    if (!config.outPath.empty()) {
        infra::storage::write_canonical_csv(table, config.outPath);
        VAMBEX_LOG_INFO(logger, "Exported " << table.size() << " rows to " << config.outPath);
    }
}

void runCompare(const vambex::common::Config& config, const vambex::log::Logger& logger) {
    app::KlineReconciler reconciler(logger.child("reconciler"));
    const auto report = reconciler.compare(config.referencePath, config.canonicalPath, config.dropLast);
    app::render_report(report, std::cout);
    std::cout.flush();
    VAMBEX_LOG_DEBUG(logger, "Comparison outcome: " << app::to_string(report.outcome));
}

}  // namespace

int main(int argc, char** argv) {
    std::set_terminate([] {
        try {
            auto eptr = std::current_exception();
            if (eptr) {
                try {
                    std::rethrow_exception(eptr);
                } catch (const std::exception& ex) {
                    std::fprintf(stderr, "std::terminate: %s\n", ex.what());
                } catch (...) {
                    std::fprintf(stderr, "std::terminate: unknown exception\n");
                }
            } else {
                std::fprintf(stderr, "std::terminate without current_exception\n");
            }
        } catch (...) {
        }
        std::_Exit(1);
    });

    vambex::common::Config config;
    try {
        config = vambex::common::Config::fromArgs(argc, argv);
    } catch (const std::exception& ex) {
        std::fprintf(stderr, "vambex: %s\n", ex.what());
        return EXIT_FAILURE;
    }

    auto logger = vambex::log::Logger::null();
    try {
        logger = buildLogger(config);
    } catch (const std::exception& ex) {
        std::fprintf(stderr, "vambex: cannot set up logging: %s\n", ex.what());
        return EXIT_FAILURE;
    }

    try {
        logConfig(logger, config);

        switch (config.command) {
        case vambex::common::Command::Fetch:
            runFetch(config, logger);
            break;
        case vambex::common::Command::Compare:
            runCompare(config, logger);
            break;
        case vambex::common::Command::Run:
            VAMBEX_LOG_DEBUG(logger, "Start");
            VAMBEX_LOG_INFO(logger, "Starting VAMBEX system...");
            if (!config.symbol.empty()) {
                runFetch(config, logger);
            }
            VAMBEX_LOG_INFO(logger, "VAMBEX execution completed.");
            VAMBEX_LOG_DEBUG(logger, "Finish");
            break;
        }
    } catch (const std::exception& ex) {
        VAMBEX_LOG_ERR(logger, "Unhandled execution error: " << ex.what());
        return EXIT_FAILURE;
    }

    return EXIT_SUCCESS;
}
