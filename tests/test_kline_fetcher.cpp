#include <chrono>
#include <iostream>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "adapters/binance/IntervalMap.hpp"
#include "adapters/binance/KlineFetcher.hpp"
#include "common/Errors.hpp"
#include "common/Log.hpp"
#include "infra/http/TlsHttpClient.hpp"

namespace {

class FakeHttpClient : public infra::http::HttpClient {
public:
    infra::http::HttpResponse get(const std::string& host,
                                  const std::string& target,
                                  const infra::http::Timeouts& timeouts) override {
        ++calls;
        lastHost = host;
        lastTarget = target;
        lastTimeouts = timeouts;
        if (failTransport) {
            throw vambex::TransportError("connection refused");
        }
        infra::http::HttpResponse response;
        response.status = status;
        response.body = body;
        response.final_host = redirectHost.empty() ? host : redirectHost;
        response.final_target = target;
        return response;
    }

    unsigned status = 200U;
    std::string body = "[]";
    bool failTransport = false;
    std::string redirectHost;
    int calls = 0;
    std::string lastHost;
    std::string lastTarget;
    infra::http::Timeouts lastTimeouts{};
};

struct Harness {
    Harness() : memory(std::make_shared<vambex::log::MemorySink>()), logger("fetcher", vambex::log::Level::Debug, {memory}) {}

    std::shared_ptr<vambex::log::MemorySink> memory;
    vambex::log::Logger logger;
    FakeHttpClient client;
};

}  // namespace

int main() {
    using adapters::binance::KlineFetcher;

    // Construction normalizes the symbol and clamps the limit with one warning.
    {
        Harness h;
        KlineFetcher fetcher("  btcusdt ", "1h", 5000, h.client, h.logger);
        if (fetcher.symbol() != "BTCUSDT" || fetcher.limit() != 1000) {
            std::cerr << "Expected BTCUSDT with limit 1000 but got " << fetcher.symbol() << " / " << fetcher.limit()
                      << "\n";
            return 1;
        }
        if (h.memory->count(vambex::log::Level::Warn) != 1) {
            std::cerr << "Expected exactly one warning for the clamped limit\n";
            return 1;
        }
        if (h.memory->count(vambex::log::Level::Info) != 1) {
            std::cerr << "Expected an info record describing the fetcher\n";
            return 1;
        }
        if (h.client.calls != 0) {
            std::cerr << "Construction must not perform I/O\n";
            return 1;
        }
        if (fetcher.request_target() != "/api/v3/klines?symbol=BTCUSDT&interval=1h&limit=1000") {
            std::cerr << "Unexpected request target: " << fetcher.request_target() << "\n";
            return 1;
        }
    }

    // Precondition violations.
    {
        Harness h;
        struct BadCase {
            const char* symbol;
            const char* interval;
            long long limit;
        };
        const BadCase cases[] = {
            {"   ", "1h", 10}, {"BTCUSDT", "1H", 10}, {"BTCUSDT", "2d", 10}, {"BTCUSDT", "1m", 0},
            {"BTCUSDT", "1m", -3},
        };
        for (const auto& bad : cases) {
            try {
                KlineFetcher fetcher(bad.symbol, bad.interval, bad.limit, h.client, h.logger);
                std::cerr << "Expected InvalidArgument for " << bad.symbol << "/" << bad.interval << "/" << bad.limit
                          << "\n";
                return 1;
            } catch (const vambex::InvalidArgument& ex) {
                const std::string message = ex.what();
                if (std::string{bad.interval} != "1h" && std::string{bad.interval} != "1m" &&
                    message.find(adapters::binance::supported_intervals_list()) == std::string::npos) {
                    std::cerr << "Expected the supported intervals in: " << message << "\n";
                    return 1;
                }
            }
        }
        if (h.client.calls != 0) {
            std::cerr << "Rejected construction must not perform I/O\n";
            return 1;
        }
    }

    // Monthly and minute intervals are distinct and both accepted.
    {
        Harness h;
        KlineFetcher minute("ETHUSDT", "1m", 1, h.client, h.logger);
        KlineFetcher month("ETHUSDT", "1M", 1, h.client, h.logger);
        if (minute.interval() == month.interval()) {
            std::cerr << "Expected 1m and 1M to stay distinct\n";
            return 1;
        }
    }

    // Successful fetch and strict normalization.
    {
        Harness h;
        h.client.body = "[[60000,\"1\",\"2\",\"0.5\",\"1.5\",\"100\",119999,\"150\",10,\"50\",\"75\",\"0\"],"
                        "[0,\"1\",\"2\",\"0.5\",\"1.4\",\"100\",59999,\"150\",12,\"50\",\"75\",\"0\"]]";
        adapters::binance::FetcherOptions options;
        options.host = "example.test";
        options.timeouts.read = std::chrono::milliseconds(2500);
        KlineFetcher fetcher("ethusdt", "5m", 2, h.client, h.logger, options);
        auto table = fetcher.fetch_and_normalize();
        if (h.client.calls != 1 || h.client.lastHost != "example.test" ||
            h.client.lastTarget != "/api/v3/klines?symbol=ETHUSDT&interval=5m&limit=2" ||
            h.client.lastTimeouts.read != std::chrono::milliseconds(2500)) {
            std::cerr << "Unexpected request: " << h.client.lastHost << h.client.lastTarget << "\n";
            return 1;
        }
        if (table.size() != 2 || table[0].openTime != 0 || table[1].close != 1.5 || table[0].trades != 12) {
            std::cerr << "Unexpected normalized table\n";
            return 1;
        }
    }

    // The final URL is logged when the client followed a redirect.
    {
        Harness h;
        h.client.redirectHost = "mirror.example.test";
        KlineFetcher fetcher("BTCUSDT", "1d", 10, h.client, h.logger);
        (void)fetcher.fetch_raw();
        bool logged = false;
        for (const auto& record : h.memory->records()) {
            if (record.level == vambex::log::Level::Info &&
                record.message.find("redirected to https://mirror.example.test/api/v3/klines?symbol=BTCUSDT") !=
                    std::string::npos) {
                logged = true;
            }
        }
        if (!logged) {
            std::cerr << "Expected an info record naming the redirected URL\n";
            return 1;
        }
    }

    // Non-2xx keeps the status and at most 500 characters of the body.
    {
        Harness h;
        h.client.status = 429U;
        h.client.body = std::string(800, 'x');
        KlineFetcher fetcher("BTCUSDT", "1d", 10, h.client, h.logger);
        try {
            (void)fetcher.fetch_raw();
            std::cerr << "Expected RemoteError\n";
            return 1;
        } catch (const vambex::RemoteError& ex) {
            if (ex.status() != 429U || ex.bodyPreview().size() != vambex::RemoteError::kMaxBodyPreview) {
                std::cerr << "Unexpected RemoteError contents (status " << ex.status() << ", preview "
                          << ex.bodyPreview().size() << ")\n";
                return 1;
            }
        }
        if (h.memory->count(vambex::log::Level::Error) != 1) {
            std::cerr << "Expected an error record for the failed request\n";
            return 1;
        }
    }

    // A 2xx body that is not JSON is a remote failure as well.
    {
        Harness h;
        h.client.body = "<html>maintenance</html>";
        KlineFetcher fetcher("BTCUSDT", "1d", 10, h.client, h.logger);
        try {
            (void)fetcher.fetch_raw();
            std::cerr << "Expected RemoteError for an undecodable body\n";
            return 1;
        } catch (const vambex::RemoteError& ex) {
            if (ex.status() != 200U || ex.bodyPreview() != h.client.body) {
                std::cerr << "Unexpected RemoteError for undecodable body\n";
                return 1;
            }
        }
    }

    // Transport failures propagate unchanged.
    {
        Harness h;
        h.client.failTransport = true;
        KlineFetcher fetcher("BTCUSDT", "1d", 10, h.client, h.logger);
        try {
            (void)fetcher.fetch_and_normalize();
            std::cerr << "Expected TransportError\n";
            return 1;
        } catch (const vambex::TransportError& ex) {
            if (std::string{ex.what()} != "connection refused") {
                std::cerr << "Expected the original cause but got " << ex.what() << "\n";
                return 1;
            }
        }
        if (h.memory->count(vambex::log::Level::Error) != 1) {
            std::cerr << "Expected an error record for the transport failure\n";
            return 1;
        }
    }

    // Malformed numeric data reaches the caller as DataIntegrityError.
    {
        Harness h;
        h.client.body = "[[0,\"1\",\"2\",\"0.5\",\"oops\",\"100\",59999,\"150\",10,\"50\",\"75\",\"0\"]]";
        KlineFetcher fetcher("BTCUSDT", "1d", 10, h.client, h.logger);
        try {
            (void)fetcher.fetch_and_normalize();
            std::cerr << "Expected DataIntegrityError\n";
            return 1;
        } catch (const vambex::DataIntegrityError& ex) {
            if (ex.defects().size() != 1 || ex.defects().at("close") != 1U) {
                std::cerr << "Unexpected defects\n";
                return 1;
            }
        }
    }

    // Query values are percent-encoded.
    if (infra::http::build_target("/p", {{"a b", "x&y"}}) != "/p?a%20b=x%26y") {
        std::cerr << "Unexpected encoded target: " << infra::http::build_target("/p", {{"a b", "x&y"}}) << "\n";
        return 1;
    }

    return 0;
}
