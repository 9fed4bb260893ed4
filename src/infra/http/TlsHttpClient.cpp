#include "infra/http/TlsHttpClient.hpp"

#include <algorithm>
#include <cctype>
#include <cstddef>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>

#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl/context.hpp>
#include <boost/asio/ssl/error.hpp>
#include <boost/asio/ssl/rfc2818_verification.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/version.hpp>

#include <openssl/err.h>

#include "common/Errors.hpp"

namespace infra::http {
namespace {

namespace beast = boost::beast;
namespace bhttp = beast::http;
namespace net = boost::asio;
namespace ssl = boost::asio::ssl;

constexpr int kMaxRedirects = 5;
constexpr const char* kUserAgent = "vambex/1.0";

vambex::TransportError makeError(const std::string& host, const std::string& target, const std::string& message) {
    std::ostringstream oss;
    oss << "HTTPS GET request to https://" << host << target << " failed: " << message;
    return vambex::TransportError(oss.str());
}

struct ParsedLocation {
    std::string host;
    std::string target;
};

ParsedLocation parseRedirectLocation(const std::string& location, const std::string& currentHost) {
    if (location.empty()) {
        throw std::runtime_error("Redirect response missing Location header");
    }

    ParsedLocation result{};

    if (location.rfind("https://", 0) == 0) {
        const std::string withoutScheme = location.substr(std::string{"https://"}.size());
        const auto slashPos = withoutScheme.find('/');
        std::string hostPart = slashPos == std::string::npos ? withoutScheme : withoutScheme.substr(0, slashPos);
        if (hostPart.empty()) {
            throw std::runtime_error("Redirect URL missing host");
        }
        const auto colonPos = hostPart.find(':');
        if (colonPos != std::string::npos) {
            const std::string portPart = hostPart.substr(colonPos + 1);
            if (portPart != "443") {
                throw std::runtime_error("Redirect to unsupported HTTPS port: " + portPart);
            }
            hostPart = hostPart.substr(0, colonPos);
        }
        result.host = hostPart;
        result.target = slashPos == std::string::npos ? std::string{"/"} : withoutScheme.substr(slashPos);
    } else if (location.rfind("http://", 0) == 0) {
        throw std::runtime_error("Insecure redirect to HTTP is not supported");
    } else {
        result.host = currentHost;
        result.target = location.front() == '/' ? location : "/" + location;
    }

    return result;
}

struct HostPort {
    std::string name;
    std::string port;
};

// "host" or "host:port"; the port defaults to 443.
HostPort splitHostPort(const std::string& host) {
    const auto colonPos = host.rfind(':');
    if (colonPos == std::string::npos) {
        return HostPort{host, "443"};
    }
    HostPort result{host.substr(0, colonPos), host.substr(colonPos + 1)};
    const bool numericPort =
        !result.port.empty() &&
        std::all_of(result.port.begin(), result.port.end(), [](unsigned char ch) { return std::isdigit(ch) != 0; });
    if (result.name.empty() || !numericPort) {
        throw vambex::InvalidArgument("HTTPS GET host must be 'name' or 'name:port', got '" + host + "'");
    }
    return result;
}

std::string describeStep(const beast::error_code& ec, const char* step) {
    if (ec == beast::error::timeout) {
        return std::string{step} + " timed out";
    }
    return std::string{step} + " error: " + ec.message();
}

// Runs the pending asynchronous step to completion. The tcp_stream deadline only applies to
// asynchronous operations, so every network step goes through here.
void runStep(net::io_context& ioc) {
    ioc.restart();
    ioc.run();
}

bhttp::response<bhttp::string_body> performRequest(const std::string& host,
                                                   const std::string& target,
                                                   const Timeouts& timeouts,
                                                   bool verifyPeer) {
    if (timeouts.connect.count() <= 0 || timeouts.read.count() <= 0) {
        throw vambex::InvalidArgument("HTTPS GET timeouts must be positive");
    }
    const auto endpoint = splitHostPort(host);

    beast::error_code ec;
    net::io_context ioc;
    ssl::context sslContext(ssl::context::tls_client);
    if (verifyPeer) {
        sslContext.set_default_verify_paths(ec);
        if (ec) {
            throw makeError(host, target, "Cannot load default CA certificates: " + ec.message());
        }
        sslContext.set_verify_mode(ssl::verify_peer);
    } else {
        sslContext.set_verify_mode(ssl::verify_none);
    }

    ssl::stream<beast::tcp_stream> stream(ioc, sslContext);

    if (!SSL_set_tlsext_host_name(stream.native_handle(), endpoint.name.c_str())) {
        const unsigned long err = ::ERR_get_error();
        const char* reason = err != 0 ? ::ERR_reason_error_string(err) : nullptr;
        std::ostringstream oss;
        oss << "Failed to set SNI hostname to '" << endpoint.name << "'";
        if (reason != nullptr) {
            oss << ": " << reason;
        }
        throw makeError(host, target, oss.str());
    }
    if (verifyPeer) {
        stream.set_verify_callback(ssl::rfc2818_verification(endpoint.name));
    }

    auto resolver = net::ip::tcp::resolver(ioc);
    auto const results = resolver.resolve(endpoint.name, endpoint.port, ec);
    if (ec) {
        throw makeError(host, target, "DNS resolution error: " + ec.message());
    }

    auto& lowestLayer = beast::get_lowest_layer(stream);
    lowestLayer.expires_after(timeouts.connect);
    lowestLayer.async_connect(results, [&ec](const beast::error_code& stepEc, const net::ip::tcp::endpoint&) {
        ec = stepEc;
    });
    runStep(ioc);
    if (ec) {
        throw makeError(host, target, describeStep(ec, "Connection"));
    }

    lowestLayer.expires_after(timeouts.connect);
    stream.async_handshake(ssl::stream_base::client, [&ec](const beast::error_code& stepEc) { ec = stepEc; });
    runStep(ioc);
    if (ec) {
        throw makeError(host, target, describeStep(ec, "TLS handshake"));
    }

    bhttp::request<bhttp::empty_body> req{bhttp::verb::get, target, 11};
    req.set(bhttp::field::host, host);
    req.set(bhttp::field::user_agent, kUserAgent);
    req.set(bhttp::field::accept, "application/json");
    req.set(bhttp::field::connection, "close");

    lowestLayer.expires_after(timeouts.read);
    bhttp::async_write(stream, req, [&ec](const beast::error_code& stepEc, std::size_t) { ec = stepEc; });
    runStep(ioc);
    if (ec) {
        throw makeError(host, target, describeStep(ec, "Write"));
    }

    beast::flat_buffer buffer;
    bhttp::response<bhttp::string_body> response;
    lowestLayer.expires_after(timeouts.read);
    bhttp::async_read(stream, buffer, response, [&ec](const beast::error_code& stepEc, std::size_t) {
        ec = stepEc;
    });
    runStep(ioc);
    if (ec) {
        throw makeError(host, target, describeStep(ec, "Read"));
    }

    // The body is complete at this point; a failed close_notify does not invalidate it.
    lowestLayer.expires_after(timeouts.connect);
    stream.async_shutdown([](const beast::error_code&) {});
    runStep(ioc);

    return response;
}

bool isUnreserved(unsigned char ch) {
    return std::isalnum(ch) != 0 || ch == '-' || ch == '_' || ch == '.' || ch == '~';
}

std::string encodeComponent(const std::string& value) {
    static constexpr char kHex[] = "0123456789ABCDEF";
    std::string encoded;
    encoded.reserve(value.size());
    for (unsigned char ch : value) {
        if (isUnreserved(ch)) {
            encoded.push_back(static_cast<char>(ch));
        } else {
            encoded.push_back('%');
            encoded.push_back(kHex[ch >> 4]);
            encoded.push_back(kHex[ch & 0x0F]);
        }
    }
    return encoded;
}

}  // namespace

std::string build_target(const std::string& path, const QueryParams& params) {
    std::string target = path.empty() ? std::string{"/"} : path;
    if (target.front() != '/') {
        target.insert(target.begin(), '/');
    }
    char separator = '?';
    for (const auto& [key, value] : params) {
        target.push_back(separator);
        target.append(encodeComponent(key));
        target.push_back('=');
        target.append(encodeComponent(value));
        separator = '&';
    }
    return target;
}

HttpResponse TlsHttpClient::get(const std::string& host, const std::string& target, const Timeouts& timeouts) {
    if (host.empty()) {
        throw vambex::InvalidArgument("HTTPS GET requires a non-empty host");
    }

    std::string currentHost = host;
    std::string currentTarget = target.empty() ? std::string{"/"} : target;
    if (currentTarget.front() != '/') {
        currentTarget.insert(currentTarget.begin(), '/');
    }

    for (int redirectCount = 0; redirectCount <= kMaxRedirects; ++redirectCount) {
        auto response = performRequest(currentHost, currentTarget, timeouts, verifyPeer_);
        const auto status = static_cast<unsigned>(response.result_int());
        if (status == 301U || status == 302U || status == 307U || status == 308U) {
            try {
                const auto locationHeader = response.base()[bhttp::field::location];
                const auto parsed = parseRedirectLocation(std::string(locationHeader), currentHost);
                currentHost = parsed.host;
                currentTarget = parsed.target;
                continue;
            } catch (const std::runtime_error& redirectError) {
                throw makeError(currentHost, currentTarget, redirectError.what());
            }
        }

        HttpResponse result{};
        result.status = status;
        result.body = std::move(response.body());
        result.final_host = currentHost;
        result.final_target = currentTarget;
        return result;
    }

    throw makeError(currentHost, currentTarget, "Too many redirects");
}

}  // namespace infra::http
