// AtomArb - HTTP Adapters Implementation

#include <atomarb/adapters/http.hpp>
#include <atomarb/log.hpp>
#include <atomarb/units.hpp>
#include <cpr/cpr.h>
#include <chrono>
#include <thread>

namespace atomarb {

using json = nlohmann::json;

namespace {

cpr::Header to_header(const std::map<std::string, std::string>& headers) {
    cpr::Header h;
    for (const auto& [key, value] : headers) {
        h[key] = value;
    }
    return h;
}

// `what` names the request in errors; never the full url, which may carry a token
json check(const cpr::Response& response, const std::string& what) {
    if (response.error.code == cpr::ErrorCode::OPERATION_TIMEDOUT) {
        throw ProviderError(ProviderError::Kind::Timeout, what + ": " + response.error.message);
    }
    if (response.error.code != cpr::ErrorCode::OK) {
        throw ProviderError(ProviderError::Kind::Connectivity, what + ": " + response.error.message);
    }
    if (response.status_code < 200 || response.status_code >= 300) {
        throw ProviderError(ProviderError::Kind::BadResponse,
                            what + ": HTTP " + std::to_string(response.status_code) + ": " + response.text);
    }

    try {
        return json::parse(response.text);
    } catch (const json::parse_error& e) {
        throw ProviderError(ProviderError::Kind::BadResponse, what + ": " + e.what());
    }
}

// Integers pass through; strings are read as integer atomic units
Amount to_amount(const json& value) {
    if (value.is_number_integer()) {
        return value.get<Amount>();
    }
    if (value.is_string()) {
        return units::parse(value.get<std::string>(), 0);
    }
    throw std::invalid_argument("expected an integer amount, got " + value.dump());
}

std::vector<Order> to_levels(const json& side) {
    std::vector<Order> levels;
    if (side.is_null()) return levels;
    levels.reserve(side.size());
    for (const auto& level : side) {
        if (level.is_array()) {
            levels.push_back(Order{to_amount(level.at(0)), to_amount(level.at(1))});
        } else {
            levels.push_back(Order{to_amount(level.at("price")), to_amount(level.at("size"))});
        }
    }
    return levels;
}

PoolCurve to_curve(const std::string& name) {
    if (name.empty() || name == "constant_product") return PoolCurve::ConstantProduct;
    if (name == "concentrated_range") return PoolCurve::ConcentratedRange;
    throw std::invalid_argument("unknown pool curve " + name);
}

}  // namespace

// =============================================================================
// HttpClient
// =============================================================================

HttpClient::HttpClient(std::string base_url, int timeout_ms, std::map<std::string, std::string> headers)
    : base_url_(std::move(base_url)), timeout_ms_(timeout_ms), headers_(std::move(headers)) {}

json HttpClient::get(const std::string& path) const {
    auto response = cpr::Get(
        cpr::Url{base_url_ + path},
        to_header(headers_),
        cpr::Timeout{timeout_ms_});
    return check(response, path.empty() ? base_url_ : path);
}

json HttpClient::post(const std::string& path, const json& body) const {
    cpr::Header headers = to_header(headers_);
    headers["Content-Type"] = "application/json";

    auto response = cpr::Post(
        cpr::Url{base_url_ + path},
        headers,
        cpr::Body{body.dump()},
        cpr::Timeout{timeout_ms_});
    return check(response, path.empty() ? base_url_ : path);
}

// =============================================================================
// Snapshot parsing
// =============================================================================

BookSnapshot parse_book(const json& body, const std::string& market_id) {
    try {
        auto book = OrderBook::from_levels(
            to_levels(body.at("bids")),
            to_levels(body.at("asks")),
            market_id,
            body.value("timestamp", now_ms()));
        return std::make_shared<const OrderBook>(std::move(book));
    } catch (const json::exception& e) {
        throw ProviderError(ProviderError::Kind::BadResponse, "book " + market_id + ": " + e.what());
    } catch (const std::invalid_argument& e) {
        throw ProviderError(ProviderError::Kind::BadResponse, "book " + market_id + ": " + e.what());
    }
}

PoolSnapshot parse_pool(const json& body, const std::string& pool_id) {
    try {
        PoolState pool;
        pool.pool_id = pool_id;
        pool.base_mint = body.at("base_mint").get<std::string>();
        pool.quote_mint = body.at("quote_mint").get<std::string>();
        pool.base_reserve = to_amount(body.at("base_reserve"));
        pool.quote_reserve = to_amount(body.at("quote_reserve"));
        pool.fee_bps = body.value("fee_bps", 0u);
        pool.curve = to_curve(body.value("curve", ""));
        if (pool.curve == PoolCurve::ConcentratedRange) {
            pool.virtual_base = to_amount(body.at("virtual_base"));
            pool.virtual_quote = to_amount(body.at("virtual_quote"));
        }
        pool.timestamp = body.value("timestamp", now_ms());
        return std::make_shared<const PoolState>(std::move(pool));
    } catch (const json::exception& e) {
        throw ProviderError(ProviderError::Kind::BadResponse, "pool " + pool_id + ": " + e.what());
    } catch (const std::invalid_argument& e) {
        throw ProviderError(ProviderError::Kind::BadResponse, "pool " + pool_id + ": " + e.what());
    }
}

// =============================================================================
// Providers
// =============================================================================

HttpBookProvider::HttpBookProvider(std::string base_url, int timeout_ms)
    : http_(std::move(base_url), timeout_ms) {}

BookSnapshot HttpBookProvider::fetch_book(const std::string& market_id) {
    return parse_book(http_.get("/books/" + market_id), market_id);
}

HttpPoolProvider::HttpPoolProvider(std::string base_url, int timeout_ms)
    : http_(std::move(base_url), timeout_ms) {}

PoolSnapshot HttpPoolProvider::fetch_pool(const std::string& pool_id) {
    return parse_pool(http_.get("/pools/" + pool_id), pool_id);
}

// =============================================================================
// HttpBundleChannel
// =============================================================================

namespace {

std::map<std::string, std::string> auth_headers(const SubmissionConfig& config) {
    std::map<std::string, std::string> headers;
    if (config.auth_key) {
        headers["Authorization"] = *config.auth_key;
    }
    return headers;
}

}  // namespace

HttpBundleChannel::HttpBundleChannel(const SubmissionConfig& config, int timeout_ms, uint64_t deadline_ms)
    : http_(config.url, timeout_ms, auth_headers(config)),
      poll_interval_ms_(config.poll_interval_ms),
      deadline_ms_(deadline_ms) {}

json HttpBundleChannel::call(const std::string& method, const json& params) {
    json request = {
        {"jsonrpc", "2.0"},
        {"id", request_id_.fetch_add(1) + 1},
        {"method", method},
        {"params", params}
    };
    return http_.post("", request);
}

SubmitResult HttpBundleChannel::submit(const Bundle& bundle) {
    json sent = call("sendBundle", json::array({bundle.to_json()}));
    if (sent.contains("error") && !sent["error"].is_null()) {
        const json& error = sent["error"];
        return SubmitResult::rejected(error.is_object() ? error.value("message", error.dump()) : error.dump());
    }
    if (!sent.contains("result") || !sent["result"].is_string()) {
        throw ProviderError(ProviderError::Kind::BadResponse, "sendBundle: missing bundle id");
    }
    std::string bundle_id = sent["result"].get<std::string>();
    ATOMARB_LOG_DEBUG("relay accepted " << bundle.opportunity_id() << " as " << bundle_id);

    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(deadline_ms_);
    while (std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(poll_interval_ms_));

        json status = call("getBundleStatuses", json::array({json::array({bundle_id})}));
        const json* entries = nullptr;
        if (status.contains("result") && status["result"].is_object() && status["result"].contains("value")) {
            entries = &status["result"]["value"];
        }
        if (!entries || !entries->is_array() || entries->empty() || (*entries)[0].is_null()) {
            continue;  // not seen yet
        }

        const json& entry = (*entries)[0];
        if (entry.contains("err") && !entry["err"].is_null() && entry["err"] != json::object({{"Ok", nullptr}})) {
            return SubmitResult::rejected("ledger error " + entry["err"].dump(), bundle_id);
        }
        std::string confirmation = entry.value("confirmation_status", "");
        if (confirmation == "confirmed" || confirmation == "finalized" || confirmation == "landed") {
            return SubmitResult::landed(bundle_id);
        }
        if (confirmation == "failed" || confirmation == "invalid" || confirmation == "dropped") {
            return SubmitResult::rejected(confirmation, bundle_id);
        }
    }

    return SubmitResult::timed_out("no confirmation within " + std::to_string(deadline_ms_) + "ms", bundle_id);
}

}  // namespace atomarb
