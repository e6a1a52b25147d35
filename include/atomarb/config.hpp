// AtomArb - Configuration
// Builder pattern for fluent configuration, TOML file loading, env overrides

#pragma once

#include <atomarb/types.hpp>
#include <cstddef>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace atomarb {

// Invalid or incomplete configuration; fatal at startup
class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& msg) : std::runtime_error(msg) {}
};

// General settings
struct GeneralConfig {
    std::string log_level = "info";
    int timeout_ms = 10000;   // adapter-level HTTP timeout
};

// Opportunity scanner settings. Amounts are atomic units of the quote asset
// shared by the pair universe.
struct ScannerConfig {
    Amount probe_amount = 0;          // flash-borrowed per attempt
    Amount min_profit = 0;            // absolute floor, strict
    uint32_t min_profit_bps = 0;      // optional relative floor on the probe, 0 = off
    uint32_t flash_fee_bps = 0;       // facility fee on the principal
    uint32_t book_slippage_bps = 100; // book walk limit distance from the touch
    uint32_t taker_fee_bps = 0;       // pairs without their own taker fee
};

// Execution loop settings
struct EngineConfig {
    ScannerConfig scanner;
    uint64_t scan_interval_ms = 500;
    size_t batch_size = 8;
    uint64_t fetch_timeout_ms = 2000;
    uint64_t submit_timeout_ms = 15000;
    size_t max_inflight_cycles = 4;
    uint32_t health_warning_threshold = 10;
    uint32_t leg_slippage_bps = 50;   // min-out tolerance on each swap step
    Amount tip = 0;                   // priority tip, native atomic units
    std::string payer;
};

// Flash-liquidity facility
struct FlashConfig {
    std::string program;
    std::string holding_account;
};

// Programs the instruction descriptors target
struct ProgramConfig {
    std::string orderbook_program;
    std::string pool_program;
};

// Bundle submission relay
struct SubmissionConfig {
    std::string url;
    std::optional<std::string> auth_key;
    uint64_t poll_interval_ms = 500;
};

// Snapshot providers
struct ProviderConfig {
    std::string book_url;
    std::string pool_url;
};

// Notification sink
struct NotifyConfig {
    std::optional<std::string> telegram_token;
    std::optional<std::string> telegram_chat_id;
    std::string telegram_api = "https://api.telegram.org";
};

// Main configuration
class Config {
public:
    GeneralConfig general;
    EngineConfig engine;
    FlashConfig flash;
    ProgramConfig programs;
    SubmissionConfig submission;
    ProviderConfig providers;
    NotifyConfig notify;
    std::vector<AssetPair> pairs;
    std::string pairs_file;

    Config() = default;

    // Load from TOML file
    static Config from_file(std::string_view path);

    // Load from TOML string
    static Config from_toml(std::string_view content);

    // Append pairs from a JSON array file
    void load_pairs_json(std::string_view path);
    void load_pairs_json_string(std::string_view content);

    // ATOMARB_* environment overrides
    void apply_env();

    // Throws ConfigError describing the first problem found
    void validate() const;

    [[nodiscard]] const AssetPair* find_pair(std::string_view name) const;

    // Builder methods
    Config& with_pair(AssetPair pair) {
        pairs.push_back(std::move(pair));
        return *this;
    }

    Config& set_probe_amount(Amount amount) {
        engine.scanner.probe_amount = amount;
        return *this;
    }

    Config& set_min_profit(Amount amount) {
        engine.scanner.min_profit = amount;
        return *this;
    }

    Config& set_min_profit_bps(uint32_t bps) {
        engine.scanner.min_profit_bps = bps;
        return *this;
    }

    Config& set_batch_size(size_t size) {
        engine.batch_size = size;
        return *this;
    }

    Config& set_scan_interval(uint64_t ms) {
        engine.scan_interval_ms = ms;
        return *this;
    }

    Config& set_tip(Amount tip) {
        engine.tip = tip;
        return *this;
    }

    Config& set_payer(std::string_view payer) {
        engine.payer = std::string(payer);
        return *this;
    }

    Config& with_flash(std::string_view program, std::string_view holding_account, uint32_t fee_bps) {
        flash.program = std::string(program);
        flash.holding_account = std::string(holding_account);
        engine.scanner.flash_fee_bps = fee_bps;
        return *this;
    }

    Config& with_submission(std::string_view url) {
        submission.url = std::string(url);
        return *this;
    }

    Config& with_telegram(std::string_view token, std::string_view chat_id) {
        notify.telegram_token = std::string(token);
        notify.telegram_chat_id = std::string(chat_id);
        return *this;
    }
};

}  // namespace atomarb
