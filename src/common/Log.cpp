#include "common/Log.hpp"

#include <cctype>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <system_error>
#include <utility>

#include "common/Errors.hpp"

namespace vambex::log {
namespace {

const char* kLevelLabels[] = {"DEBUG", "INFO", "WARNING", "ERROR"};

std::tm safeLocaltime(std::time_t time) {
    std::tm tm{};
#if defined(_WIN32)
    localtime_s(&tm, &time);
#else
    localtime_r(&time, &tm);
#endif
    return tm;
}

std::ostream& streamFor(Level level) {
    if (level == Level::Warn || level == Level::Error) {
        return std::cerr;
    }
    return std::cout;
}

}  // namespace

const char* levelToString(Level level) noexcept {
    const auto index = static_cast<std::size_t>(level);
    if (index < (sizeof(kLevelLabels) / sizeof(kLevelLabels[0]))) {
        return kLevelLabels[index];
    }
    return "INFO";
}

Level levelFromString(std::string_view text) {
    std::string lower{text};
    for (auto& ch : lower) {
        ch = static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
    }

    if (lower == "debug") {
        return Level::Debug;
    }
    if (lower == "info") {
        return Level::Info;
    }
    if (lower == "warn" || lower == "warning") {
        return Level::Warn;
    }
    if (lower == "err" || lower == "error") {
        return Level::Error;
    }

    throw ConfigError("Unknown log level: " + std::string{text});
}

std::string formatRecord(const Record& record) {
    const auto seconds = std::chrono::system_clock::to_time_t(record.timestamp);
    const auto tm = safeLocaltime(seconds);

    std::ostringstream line;
    line << "[VAMBEX] " << std::put_time(&tm, "%Y-%m-%d %H:%M:%S") << " | " << levelToString(record.level)
         << " | " << record.channel << " | " << record.message;
    return line.str();
}

void ConsoleSink::write(const Record& record) {
    const auto line = formatRecord(record);
    std::lock_guard<std::mutex> lock(mutex_);
    streamFor(record.level) << line << std::endl;
}

RotatingFileSink::RotatingFileSink(std::filesystem::path path, std::size_t maxBytes, std::size_t backupCount)
    : path_(std::move(path)), maxBytes_(maxBytes), backupCount_(backupCount) {
    std::lock_guard<std::mutex> lock(mutex_);
    openUnlocked_();
}

RotatingFileSink::~RotatingFileSink() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (stream_.is_open()) {
        stream_.flush();
        stream_.close();
    }
}

void RotatingFileSink::openUnlocked_() {
    namespace fs = std::filesystem;
    std::error_code ec;
    if (!path_.parent_path().empty()) {
        fs::create_directories(path_.parent_path(), ec);
        if (ec) {
            throw std::runtime_error("Cannot create log directory " + path_.parent_path().string() + ": " +
                                     ec.message());
        }
    }

    stream_.open(path_, std::ios::out | std::ios::app);
    if (!stream_) {
        throw std::runtime_error("Cannot open log file " + path_.string());
    }

    size_ = fs::exists(path_, ec) ? static_cast<std::size_t>(fs::file_size(path_, ec)) : 0U;
    if (ec) {
        size_ = 0;
    }
}

void RotatingFileSink::rotateUnlocked_() {
    namespace fs = std::filesystem;
    std::error_code ec;
    if (stream_.is_open()) {
        stream_.flush();
        stream_.close();
    }

    if (backupCount_ == 0) {
        fs::remove(path_, ec);
        size_ = 0;
        return;
    }

    // name.N is dropped, name.(i) -> name.(i+1), name -> name.1
    auto backupPath = [this](std::size_t index) {
        fs::path rotated = path_;
        rotated += "." + std::to_string(index);
        return rotated;
    };

    fs::remove(backupPath(backupCount_), ec);
    for (std::size_t index = backupCount_ - 1; index >= 1; --index) {
        const auto from = backupPath(index);
        if (fs::exists(from, ec)) {
            fs::rename(from, backupPath(index + 1), ec);
        }
    }
    fs::rename(path_, backupPath(1), ec);
    size_ = 0;
}

void RotatingFileSink::write(const Record& record) {
    const auto line = formatRecord(record);
    const std::size_t lineBytes = line.size() + 1;

    std::lock_guard<std::mutex> lock(mutex_);
    if (maxBytes_ > 0 && size_ > 0 && size_ + lineBytes > maxBytes_) {
        rotateUnlocked_();
        openUnlocked_();
    }
    if (!stream_.is_open()) {
        return;
    }

    stream_ << line << '\n';
    stream_.flush();
    size_ += lineBytes;
}

void MemorySink::write(const Record& record) {
    std::lock_guard<std::mutex> lock(mutex_);
    records_.push_back(record);
}

std::vector<Record> MemorySink::records() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return records_;
}

std::size_t MemorySink::count(Level level) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::size_t total = 0;
    for (const auto& record : records_) {
        if (record.level == level) {
            ++total;
        }
    }
    return total;
}

Logger::Logger(std::string channel, Level level, std::vector<std::shared_ptr<Sink>> sinks)
    : channel_(std::move(channel)),
      level_(level),
      sinks_(std::make_shared<const std::vector<std::shared_ptr<Sink>>>(std::move(sinks))) {}

Logger Logger::null() {
    return Logger("null", Level::Error, {});
}

Logger Logger::child(std::string channel) const {
    Logger copy(*this);
    copy.channel_ = std::move(channel);
    return copy;
}

bool Logger::shouldLog(Level level) const noexcept {
    return !sinks_->empty() && static_cast<int>(level) >= static_cast<int>(level_);
}

void Logger::log(Level level, const std::string& message) const {
    if (!shouldLog(level)) {
        return;
    }

    Record record;
    record.level = level;
    record.channel = channel_;
    record.timestamp = std::chrono::system_clock::now();
    record.message = message;

    for (const auto& sink : *sinks_) {
        if (sink) {
            sink->write(record);
        }
    }
}

}  // namespace vambex::log
