#pragma once

#include <cstddef>
#include <map>
#include <stdexcept>
#include <string>
#include <utility>

namespace vambex {

class InvalidArgument : public std::invalid_argument {
public:
    using std::invalid_argument::invalid_argument;
};

class TransportError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class RemoteError : public std::runtime_error {
public:
    static constexpr std::size_t kMaxBodyPreview = 500;

    RemoteError(unsigned status, const std::string& body, const std::string& context)
        : std::runtime_error(context + ": HTTP " + std::to_string(status) + ", body: " +
                             body.substr(0, kMaxBodyPreview)),
          status_(status),
          bodyPreview_(body.substr(0, kMaxBodyPreview)) {}

    unsigned status() const noexcept { return status_; }
    const std::string& bodyPreview() const noexcept { return bodyPreview_; }

private:
    unsigned status_ = 0U;
    std::string bodyPreview_;
};

// Per-column count of cells that failed to parse.
using DefectCounts = std::map<std::string, std::size_t>;

class DataIntegrityError : public std::runtime_error {
public:
    DataIntegrityError(const std::string& message, DefectCounts defects)
        : std::runtime_error(message), defects_(std::move(defects)) {}

    const DefectCounts& defects() const noexcept { return defects_; }

private:
    DefectCounts defects_;
};

class InputError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class SchemaError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class ConfigError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

}  // namespace vambex
