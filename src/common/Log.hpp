#pragma once

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <fstream>
#include <memory>
#include <mutex>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

namespace vambex::log {

enum class Level : int {
    Debug = 0,
    Info = 1,
    Warn = 2,
    Error = 3,
};

const char* levelToString(Level level) noexcept;
Level levelFromString(std::string_view text);

struct Record {
    Level level = Level::Info;
    std::string channel;
    std::chrono::system_clock::time_point timestamp{};
    std::string message;
};

// "[VAMBEX] 2025-12-17 10:00:00 | INFO | fetcher | message"
std::string formatRecord(const Record& record);

class Sink {
public:
    virtual ~Sink() = default;
    virtual void write(const Record& record) = 0;
};

class ConsoleSink : public Sink {
public:
    void write(const Record& record) override;

private:
    std::mutex mutex_;
};

class RotatingFileSink : public Sink {
public:
    static constexpr std::size_t kDefaultMaxBytes = 5'000'000;
    static constexpr std::size_t kDefaultBackupCount = 5;

    explicit RotatingFileSink(std::filesystem::path path,
                              std::size_t maxBytes = kDefaultMaxBytes,
                              std::size_t backupCount = kDefaultBackupCount);
    ~RotatingFileSink() override;

    void write(const Record& record) override;

    const std::filesystem::path& path() const noexcept { return path_; }

private:
    void openUnlocked_();
    void rotateUnlocked_();

    std::filesystem::path path_;
    std::size_t maxBytes_;
    std::size_t backupCount_;
    std::mutex mutex_;
    std::ofstream stream_;
    std::size_t size_ = 0;
};

class MemorySink : public Sink {
public:
    void write(const Record& record) override;

    std::vector<Record> records() const;
    std::size_t count(Level level) const;

private:
    mutable std::mutex mutex_;
    std::vector<Record> records_;
};

class Logger {
public:
    Logger(std::string channel, Level level, std::vector<std::shared_ptr<Sink>> sinks);

    // Discards every record. Handy for callers that do not care about diagnostics.
    static Logger null();

    Logger child(std::string channel) const;

    bool shouldLog(Level level) const noexcept;
    void log(Level level, const std::string& message) const;

    const std::string& channel() const noexcept { return channel_; }
    Level level() const noexcept { return level_; }

private:
    std::string channel_;
    Level level_;
    std::shared_ptr<const std::vector<std::shared_ptr<Sink>>> sinks_;
};

}  // namespace vambex::log

#define VAMBEX_LOG_IMPL(logger, level, expr)                                               \
    do {                                                                                   \
        if ((logger).shouldLog(level)) {                                                   \
            std::ostringstream vambex_log_stream__;                                        \
            vambex_log_stream__ << expr;                                                   \
            (logger).log(level, vambex_log_stream__.str());                                \
        }                                                                                  \
    } while (false)

#define VAMBEX_LOG_DEBUG(logger, expr) VAMBEX_LOG_IMPL(logger, ::vambex::log::Level::Debug, expr)
#define VAMBEX_LOG_INFO(logger, expr) VAMBEX_LOG_IMPL(logger, ::vambex::log::Level::Info, expr)
#define VAMBEX_LOG_WARN(logger, expr) VAMBEX_LOG_IMPL(logger, ::vambex::log::Level::Warn, expr)
#define VAMBEX_LOG_ERR(logger, expr) VAMBEX_LOG_IMPL(logger, ::vambex::log::Level::Error, expr)
