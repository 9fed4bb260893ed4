#pragma once

#include <chrono>
#include <string>
#include <utility>
#include <vector>

namespace infra::http {

struct HttpResponse {
    unsigned status = 0U;
    std::string body;
    std::string final_host;
    std::string final_target;
};

struct Timeouts {
    // Applies to TCP connect and the TLS handshake.
    std::chrono::milliseconds connect{3000};
    // Applies to writing the request and reading the full response.
    std::chrono::milliseconds read{10000};
};

using QueryParams = std::vector<std::pair<std::string, std::string>>;

// "/path?k1=v1&k2=v2" with percent-encoded keys and values.
std::string build_target(const std::string& path, const QueryParams& params);

class HttpClient {
public:
    virtual ~HttpClient() = default;

    // `host` is "name" or "name:port" (default 443). Returns whatever status the server answered
    // with. Throws vambex::TransportError when no response could be obtained (DNS, connect, TLS,
    // IO, timeout, redirect loop).
    virtual HttpResponse get(const std::string& host, const std::string& target, const Timeouts& timeouts) = 0;
};

class TlsHttpClient : public HttpClient {
public:
    TlsHttpClient() = default;
    explicit TlsHttpClient(bool verifyPeer) : verifyPeer_(verifyPeer) {}

    HttpResponse get(const std::string& host, const std::string& target, const Timeouts& timeouts) override;

private:
    bool verifyPeer_ = true;
};

}  // namespace infra::http
