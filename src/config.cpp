// AtomArb - Configuration Implementation

#include <atomarb/config.hpp>
#include <nlohmann/json.hpp>
#include <algorithm>
#include <cstdlib>
#include <fstream>
#include <limits>
#include <sstream>

namespace atomarb {

// Simple TOML parser (handles basic cases)
namespace {

std::string trim(const std::string& s) {
    size_t start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    size_t end = s.find_last_not_of(" \t\r\n");
    return s.substr(start, end - start + 1);
}

std::string unquote(const std::string& s) {
    if (s.size() >= 2 && s[0] == '"' && s.back() == '"') {
        return s.substr(1, s.size() - 2);
    }
    return s;
}

// Drop a trailing comment outside of quotes
std::string strip_comment(const std::string& s) {
    bool quoted = false;
    for (size_t i = 0; i < s.size(); ++i) {
        if (s[i] == '"') quoted = !quoted;
        else if (s[i] == '#' && !quoted) return s.substr(0, i);
    }
    return s;
}

int64_t to_int(const std::string& key, const std::string& value) {
    try {
        size_t pos = 0;
        int64_t parsed = std::stoll(value, &pos);
        if (pos != value.size()) {
            throw ConfigError("Invalid integer for " + key + ": " + value);
        }
        return parsed;
    } catch (const std::invalid_argument&) {
        throw ConfigError("Invalid integer for " + key + ": " + value);
    } catch (const std::out_of_range&) {
        throw ConfigError("Integer out of range for " + key + ": " + value);
    }
}

uint64_t to_uint(const std::string& key, const std::string& value) {
    int64_t parsed = to_int(key, value);
    if (parsed < 0) {
        throw ConfigError(key + " must not be negative");
    }
    return static_cast<uint64_t>(parsed);
}

uint32_t to_u32(const std::string& key, const std::string& value,
               uint32_t max = std::numeric_limits<uint32_t>::max()) {
    uint64_t parsed = to_uint(key, value);
    if (parsed > max) {
        throw ConfigError("Integer out of range for " + key + ": " + value);
    }
    return static_cast<uint32_t>(parsed);
}

AssetPair& pair_named(std::vector<AssetPair>& pairs, const std::string& name) {
    auto it = std::find_if(pairs.begin(), pairs.end(),
                           [&](const AssetPair& p) { return p.name == name; });
    if (it != pairs.end()) return *it;
    AssetPair pair;
    pair.name = name;
    pairs.push_back(std::move(pair));
    return pairs.back();
}

const char* env(const char* name) {
    const char* value = std::getenv(name);
    return (value && *value) ? value : nullptr;
}

Asset asset_from_json(const nlohmann::json& j) {
    Asset asset;
    asset.symbol = j.value("symbol", "");
    asset.mint = j.at("mint").get<std::string>();
    asset.decimals = j.value("decimals", 0);
    return asset;
}

}  // namespace

Config Config::from_file(std::string_view path) {
    std::string path_str{path};
    std::ifstream file{path_str};
    if (!file.is_open()) {
        throw ConfigError("Cannot open config file: " + path_str);
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    Config config = from_toml(buffer.str());
    if (!config.pairs_file.empty()) {
        config.load_pairs_json(config.pairs_file);
    }
    return config;
}

Config Config::from_toml(std::string_view content) {
    Config config;
    std::string current_section;
    std::string current_subsection;

    std::string content_str{content};
    std::istringstream stream{content_str};
    std::string line;

    while (std::getline(stream, line)) {
        line = trim(strip_comment(line));

        // Skip empty lines and comments
        if (line.empty()) continue;

        // Section header
        if (line[0] == '[') {
            size_t end = line.find(']');
            if (end == std::string::npos) {
                throw ConfigError("Unterminated section header: " + line);
            }
            std::string section = line.substr(1, end - 1);

            // Check for subsection [section.name]
            auto dot = section.find('.');
            if (dot != std::string::npos) {
                current_section = section.substr(0, dot);
                current_subsection = unquote(section.substr(dot + 1));
            } else {
                current_section = section;
                current_subsection.clear();
            }
            continue;
        }

        // Key-value pair
        auto eq = line.find('=');
        if (eq == std::string::npos) continue;

        std::string key = trim(line.substr(0, eq));
        std::string value = unquote(trim(line.substr(eq + 1)));

        // Parse based on section
        if (current_section == "general") {
            if (key == "log_level") config.general.log_level = value;
            else if (key == "timeout_ms") {
                config.general.timeout_ms = static_cast<int>(to_u32(key, value, std::numeric_limits<int>::max()));
            }
            else if (key == "pairs_file") config.pairs_file = value;
        }
        else if (current_section == "engine") {
            auto& engine = config.engine;
            if (key == "probe_amount") engine.scanner.probe_amount = to_int(key, value);
            else if (key == "min_profit") engine.scanner.min_profit = to_int(key, value);
            else if (key == "min_profit_bps") engine.scanner.min_profit_bps = to_u32(key, value);
            else if (key == "book_slippage_bps") engine.scanner.book_slippage_bps = to_u32(key, value);
            else if (key == "taker_fee_bps") engine.scanner.taker_fee_bps = to_u32(key, value);
            else if (key == "scan_interval_ms") engine.scan_interval_ms = to_uint(key, value);
            else if (key == "batch_size") engine.batch_size = to_uint(key, value);
            else if (key == "fetch_timeout_ms") engine.fetch_timeout_ms = to_uint(key, value);
            else if (key == "submit_timeout_ms") engine.submit_timeout_ms = to_uint(key, value);
            else if (key == "max_inflight_cycles") engine.max_inflight_cycles = to_uint(key, value);
            else if (key == "health_warning_threshold") engine.health_warning_threshold = to_u32(key, value);
            else if (key == "leg_slippage_bps") engine.leg_slippage_bps = to_u32(key, value);
            else if (key == "tip") engine.tip = to_int(key, value);
            else if (key == "payer") engine.payer = value;
        }
        else if (current_section == "flash") {
            if (key == "program") config.flash.program = value;
            else if (key == "holding_account") config.flash.holding_account = value;
            else if (key == "fee_bps") config.engine.scanner.flash_fee_bps = to_u32(key, value);
        }
        else if (current_section == "programs") {
            if (key == "orderbook") config.programs.orderbook_program = value;
            else if (key == "pool") config.programs.pool_program = value;
        }
        else if (current_section == "submission") {
            if (key == "url") config.submission.url = value;
            else if (key == "auth_key") config.submission.auth_key = value;
            else if (key == "poll_interval_ms") config.submission.poll_interval_ms = to_uint(key, value);
        }
        else if (current_section == "providers") {
            if (key == "book_url") config.providers.book_url = value;
            else if (key == "pool_url") config.providers.pool_url = value;
        }
        else if (current_section == "notify") {
            if (key == "telegram_token") config.notify.telegram_token = value;
            else if (key == "telegram_chat_id") config.notify.telegram_chat_id = value;
            else if (key == "telegram_api") config.notify.telegram_api = value;
        }
        else if (current_section == "pairs" && !current_subsection.empty()) {
            auto& pair = pair_named(config.pairs, current_subsection);
            if (key == "base_symbol") pair.base.symbol = value;
            else if (key == "base_mint") pair.base.mint = value;
            else if (key == "base_decimals") pair.base.decimals = static_cast<int>(to_u32(key, value, 18));
            else if (key == "quote_symbol") pair.quote.symbol = value;
            else if (key == "quote_mint") pair.quote.mint = value;
            else if (key == "quote_decimals") pair.quote.decimals = static_cast<int>(to_u32(key, value, 18));
            else if (key == "market_id") pair.market_id = value;
            else if (key == "pool_id") pair.pool_id = value;
            else if (key == "taker_fee_bps") pair.taker_fee_bps = to_u32(key, value);
        }
    }

    return config;
}

void Config::load_pairs_json(std::string_view path) {
    std::string path_str{path};
    std::ifstream file{path_str};
    if (!file.is_open()) {
        throw ConfigError("Cannot open pairs file: " + path_str);
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    load_pairs_json_string(buffer.str());
}

void Config::load_pairs_json_string(std::string_view content) {
    nlohmann::json doc;
    try {
        doc = nlohmann::json::parse(content);
    } catch (const nlohmann::json::parse_error& e) {
        throw ConfigError(std::string("Malformed pairs file: ") + e.what());
    }

    if (!doc.is_array()) {
        throw ConfigError("Pairs file must hold a JSON array");
    }

    for (const auto& entry : doc) {
        try {
            AssetPair pair;
            pair.base = asset_from_json(entry.at("base"));
            pair.quote = asset_from_json(entry.at("quote"));
            pair.name = entry.value("name", pair.base.symbol + "-" + pair.quote.symbol);
            pair.market_id = entry.value("market_id", "");
            pair.pool_id = entry.value("pool_id", "");
            if (entry.contains("taker_fee_bps")) {
                auto bps = entry["taker_fee_bps"].get<int64_t>();
                if (bps < 0 || bps > std::numeric_limits<uint32_t>::max()) {
                    throw ConfigError("Pair " + pair.name + " taker_fee_bps out of range");
                }
                pair.taker_fee_bps = static_cast<uint32_t>(bps);
            }
            pair_named(pairs, pair.name) = std::move(pair);
        } catch (const nlohmann::json::exception& e) {
            throw ConfigError(std::string("Invalid pair entry: ") + e.what());
        }
    }
}

void Config::apply_env() {
    if (auto v = env("ATOMARB_LOG_LEVEL")) general.log_level = v;
    if (auto v = env("ATOMARB_MIN_PROFIT")) engine.scanner.min_profit = to_int("ATOMARB_MIN_PROFIT", v);
    if (auto v = env("ATOMARB_TIP")) engine.tip = to_int("ATOMARB_TIP", v);
    if (auto v = env("ATOMARB_SUBMISSION_URL")) submission.url = v;
    if (auto v = env("ATOMARB_SUBMISSION_AUTH")) submission.auth_key = std::string(v);
    if (auto v = env("ATOMARB_TG_TOKEN")) notify.telegram_token = std::string(v);
    if (auto v = env("ATOMARB_TG_CHAT_ID")) notify.telegram_chat_id = std::string(v);
}

void Config::validate() const {
    if (pairs.empty()) {
        throw ConfigError("No trading pairs configured");
    }
    for (const auto& pair : pairs) {
        if (pair.market_id.empty()) {
            throw ConfigError("Pair " + pair.to_string() + " has no market_id");
        }
        if (pair.pool_id.empty()) {
            throw ConfigError("Pair " + pair.to_string() + " has no pool_id");
        }
        if (pair.base.mint.empty() || pair.quote.mint.empty()) {
            throw ConfigError("Pair " + pair.to_string() + " is missing a mint");
        }
        if (pair.base.mint == pair.quote.mint) {
            throw ConfigError("Pair " + pair.to_string() + " has identical base and quote mints");
        }
        if (pair.taker_fee_bps && *pair.taker_fee_bps >= BPS_DENOMINATOR) {
            throw ConfigError("Pair " + pair.to_string() + " taker_fee_bps must be below 10000");
        }
    }

    const auto& scanner = engine.scanner;
    if (scanner.min_profit < 0) {
        throw ConfigError("min_profit must not be negative");
    }
    if (scanner.probe_amount <= 0) {
        throw ConfigError("probe_amount must be positive");
    }
    if (scanner.flash_fee_bps >= BPS_DENOMINATOR || scanner.taker_fee_bps >= BPS_DENOMINATOR ||
        scanner.book_slippage_bps >= BPS_DENOMINATOR || engine.leg_slippage_bps >= BPS_DENOMINATOR) {
        throw ConfigError("Basis-point settings must be below 10000");
    }
    if (engine.batch_size == 0) {
        throw ConfigError("batch_size must be positive");
    }
    if (engine.scan_interval_ms == 0 || engine.fetch_timeout_ms == 0 || engine.submit_timeout_ms == 0) {
        throw ConfigError("Intervals and timeouts must be positive");
    }
    if (engine.max_inflight_cycles == 0) {
        throw ConfigError("max_inflight_cycles must be positive");
    }
    if (engine.tip < 0) {
        throw ConfigError("tip must not be negative");
    }
}

const AssetPair* Config::find_pair(std::string_view name) const {
    for (const auto& pair : pairs) {
        if (pair.name == name) return &pair;
    }
    return nullptr;
}

}  // namespace atomarb
