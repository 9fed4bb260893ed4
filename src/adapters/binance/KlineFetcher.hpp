#pragma once

#include <cstddef>
#include <string>

#include <boost/json/value.hpp>

#include "common/Log.hpp"
#include "domain/Kline.hpp"
#include "infra/http/TlsHttpClient.hpp"

namespace adapters::binance {

struct FetcherOptions {
    std::string host = "data-api.binance.vision";
    std::string path = "/api/v3/klines";
    infra::http::Timeouts timeouts{};
};

// One-shot client for the klines endpoint: validates the request, performs a single GET and
// normalizes the payload. No retries and no rate limiting.
class KlineFetcher {
public:
    static constexpr long long kMaxLimit = 1000;

    // Throws vambex::InvalidArgument for a blank symbol, an unsupported interval or limit < 1.
    // A limit above kMaxLimit is clamped with a warning.
    KlineFetcher(const std::string& symbol,
                 const std::string& interval,
                 long long limit,
                 infra::http::HttpClient& client,
                 vambex::log::Logger logger,
                 FetcherOptions options = {});

    const std::string& symbol() const noexcept { return symbol_; }
    const std::string& interval() const noexcept { return interval_; }
    long long limit() const noexcept { return limit_; }
    const FetcherOptions& options() const noexcept { return options_; }

    std::string request_target() const;

    // Throws vambex::TransportError or vambex::RemoteError.
    boost::json::value fetch_raw();

    // Strict normalization; see domain::normalize.
    domain::KlineTable normalize(const boost::json::value& payload) const;

    domain::KlineTable fetch_and_normalize();

private:
    std::string symbol_;
    std::string interval_;
    long long limit_ = kMaxLimit;
    infra::http::HttpClient& client_;
    vambex::log::Logger logger_;
    FetcherOptions options_;
};

}  // namespace adapters::binance
