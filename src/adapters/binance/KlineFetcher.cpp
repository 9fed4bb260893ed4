#include "adapters/binance/KlineFetcher.hpp"

#include <algorithm>
#include <cctype>
#include <exception>
#include <string>
#include <utility>

#include <boost/json/parse.hpp>

#include "adapters/binance/IntervalMap.hpp"
#include "common/Errors.hpp"
#include "domain/KlineNormalizer.hpp"

namespace adapters::binance {
namespace {

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

std::string toUpper(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) {
        return static_cast<char>(std::toupper(c));
    });
    return value;
}

bool isSuccess(unsigned status) {
    return status >= 200U && status < 300U;
}

}  // namespace

KlineFetcher::KlineFetcher(const std::string& symbol,
                           const std::string& interval,
                           long long limit,
                           infra::http::HttpClient& client,
                           vambex::log::Logger logger,
                           FetcherOptions options)
    : client_(client), logger_(std::move(logger)), options_(std::move(options)) {
    auto normalizedSymbol = toUpper(trim(symbol));
    if (normalizedSymbol.empty()) {
        throw vambex::InvalidArgument("symbol must be a non-empty string");
    }

    if (!is_supported_interval(interval)) {
        throw vambex::InvalidArgument("interval must be one of: " + supported_intervals_list());
    }

    if (limit < 1) {
        throw vambex::InvalidArgument("limit must be at least 1");
    }

    if (limit > kMaxLimit) {
        VAMBEX_LOG_WARN(logger_, "Limit is set to " << limit << ", but the maximum supported by the endpoint is "
                                                    << kMaxLimit << ". Adjusting to " << kMaxLimit << ".");
        limit = kMaxLimit;
    }

    symbol_ = std::move(normalizedSymbol);
    interval_ = interval;
    limit_ = limit;

    VAMBEX_LOG_INFO(logger_, "Initialized kline fetcher for " << symbol_ << " with interval " << interval_
                                                              << " and limit " << limit_);
}

std::string KlineFetcher::request_target() const {
    return infra::http::build_target(options_.path, {
                                                        {"symbol", symbol_},
                                                        {"interval", interval_},
                                                        {"limit", std::to_string(limit_)},
                                                    });
}

boost::json::value KlineFetcher::fetch_raw() {
    const auto target = request_target();
    VAMBEX_LOG_DEBUG(logger_, "Fetching data for " << symbol_ << " with interval " << interval_ << " and limit "
                                                   << limit_ << " (https://" << options_.host << target << ")");

    infra::http::HttpResponse response;
    try {
        response = client_.get(options_.host, target, options_.timeouts);
    } catch (const vambex::TransportError& ex) {
        VAMBEX_LOG_ERR(logger_, "Request failed for " << symbol_ << "/" << interval_ << " (limit=" << limit_
                                                      << "): " << ex.what());
        throw;
    }

    if (!response.final_host.empty() &&
        (response.final_host != options_.host || response.final_target != target)) {
        VAMBEX_LOG_INFO(logger_, "Kline request for " << symbol_ << " was redirected to https://"
                                                      << response.final_host << response.final_target);
    }

    if (!isSuccess(response.status)) {
        const auto preview = response.body.substr(0, vambex::RemoteError::kMaxBodyPreview);
        VAMBEX_LOG_ERR(logger_, "Endpoint returned HTTP " << response.status << " for " << symbol_ << " (interval="
                                                          << interval_ << ", limit=" << limit_
                                                          << "). Body preview: " << preview);
        throw vambex::RemoteError(response.status, response.body, "Kline request for " + symbol_ + " failed");
    }

    boost::json::value payload;
    try {
        payload = boost::json::parse(response.body);
    } catch (const std::exception& ex) {
        VAMBEX_LOG_ERR(logger_, "Undecodable kline payload for " << symbol_ << "/" << interval_ << ": " << ex.what());
        throw vambex::RemoteError(response.status, response.body,
                                  std::string{"Kline response is not valid JSON ("} + ex.what() + ")");
    }

    VAMBEX_LOG_INFO(logger_, "Data fetched successfully for " << symbol_ << " with interval " << interval_);
    return payload;
}

domain::KlineTable KlineFetcher::normalize(const boost::json::value& payload) const {
    auto table = domain::normalize(payload, domain::Strictness::Strict, logger_);
    VAMBEX_LOG_INFO(logger_, "Data converted to a kline table for " << symbol_ << " with " << table.size()
                                                                    << " rows");
    return table;
}

domain::KlineTable KlineFetcher::fetch_and_normalize() {
    return normalize(fetch_raw());
}

}  // namespace adapters::binance
