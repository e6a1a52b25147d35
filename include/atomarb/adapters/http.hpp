// AtomArb - HTTP Adapters
// Snapshot providers and bundle relay speaking a neutral JSON shape over cpr

#pragma once

#include <atomarb/config.hpp>
#include <atomarb/providers.hpp>
#include <nlohmann/json.hpp>
#include <atomic>
#include <map>
#include <string>

namespace atomarb {

// Blocking JSON-over-HTTP client. Transport failures map to
// ProviderError{Connectivity} or {Timeout}; non-2xx statuses and bodies that
// are not JSON map to ProviderError{BadResponse}.
class HttpClient {
public:
    HttpClient(std::string base_url, int timeout_ms, std::map<std::string, std::string> headers = {});

    nlohmann::json get(const std::string& path) const;
    nlohmann::json post(const std::string& path, const nlohmann::json& body) const;

    [[nodiscard]] const std::string& base_url() const noexcept { return base_url_; }

private:
    std::string base_url_;
    int timeout_ms_;
    std::map<std::string, std::string> headers_;
};

// GET <base>/books/<market_id> -> {"bids": [[price, size], ...], "asks": [...], "timestamp": ms}
class HttpBookProvider : public BookProvider {
public:
    HttpBookProvider(std::string base_url, int timeout_ms);

    BookSnapshot fetch_book(const std::string& market_id) override;

private:
    HttpClient http_;
};

// GET <base>/pools/<pool_id> -> {"base_mint", "quote_mint", "base_reserve", "quote_reserve",
// "fee_bps", "curve", "virtual_base", "virtual_quote", "timestamp"}
class HttpPoolProvider : public PoolProvider {
public:
    HttpPoolProvider(std::string base_url, int timeout_ms);

    PoolSnapshot fetch_pool(const std::string& pool_id) override;

private:
    HttpClient http_;
};

// JSON-RPC relay: sendBundle, then getBundleStatuses until the bundle
// landed, failed or the deadline passed
class HttpBundleChannel : public SubmissionChannel {
public:
    HttpBundleChannel(const SubmissionConfig& config, int timeout_ms, uint64_t deadline_ms);

    SubmitResult submit(const Bundle& bundle) override;

private:
    nlohmann::json call(const std::string& method, const nlohmann::json& params);

    HttpClient http_;
    uint64_t poll_interval_ms_;
    uint64_t deadline_ms_;
    std::atomic<uint64_t> request_id_{0};
};

// Parse a book body; throws ProviderError{BadResponse} on a malformed shape
BookSnapshot parse_book(const nlohmann::json& body, const std::string& market_id);

// Parse a pool body; throws ProviderError{BadResponse} on a malformed shape
PoolSnapshot parse_pool(const nlohmann::json& body, const std::string& pool_id);

}  // namespace atomarb
