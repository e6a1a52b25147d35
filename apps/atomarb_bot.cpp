/**
 * AtomArb Bot
 *
 * Polls order-book and AMM snapshots for the configured pairs, prices the
 * round trip quote -> base -> quote across the two venues and submits every
 * round trip clearing the profit floor as one atomic bundle:
 *
 *   flash borrow -> leg 1 -> leg 2 -> repay
 *
 * If the estimate was stale the repay step fails and the ledger voids the
 * whole bundle, so only landed bundles ever move the PnL.
 *
 * Usage: atomarb_bot [--config <file>] [--once] [--status]
 */

#include <atomarb/adapters/http.hpp>
#include <atomarb/adapters/telegram.hpp>
#include <atomarb/bundle.hpp>
#include <atomarb/config.hpp>
#include <atomarb/engine.hpp>
#include <atomarb/log.hpp>
#include <atomarb/metrics.hpp>
#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <string>
#include <thread>

using namespace atomarb;

namespace {

std::atomic<bool> g_running{true};

void signal_handler(int) {
    g_running.store(false);
}

struct Options {
    std::string config_path = "atomarb.toml";
    bool once = false;
    bool status = false;
};

Options parse_args(int argc, char** argv) {
    Options options;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc) {
            options.config_path = argv[++i];
        } else if (arg == "--once") {
            options.once = true;
        } else if (arg == "--status") {
            options.status = true;
        } else {
            throw std::invalid_argument("unknown argument " + arg);
        }
    }
    return options;
}

// Settings without secrets
nlohmann::json summary(const Config& config) {
    nlohmann::json pairs = nlohmann::json::array();
    for (const auto& pair : config.pairs) {
        pairs.push_back({
            {"name", pair.to_string()},
            {"market_id", pair.market_id},
            {"pool_id", pair.pool_id}
        });
    }
    const auto& engine = config.engine;
    return {
        {"pairs", pairs},
        {"probe_amount", engine.scanner.probe_amount},
        {"min_profit", engine.scanner.min_profit},
        {"min_profit_bps", engine.scanner.min_profit_bps},
        {"flash_fee_bps", engine.scanner.flash_fee_bps},
        {"scan_interval_ms", engine.scan_interval_ms},
        {"batch_size", engine.batch_size},
        {"tip", engine.tip},
        {"submission_url", config.submission.url},
        {"telegram", config.notify.telegram_token.has_value()}
    };
}

std::shared_ptr<Notifier> make_notifier(const Config& config) {
    if (config.notify.telegram_token && config.notify.telegram_chat_id) {
        return std::make_shared<TelegramNotifier>(config.notify.telegram_api, *config.notify.telegram_token,
                                                  *config.notify.telegram_chat_id, config.general.timeout_ms);
    }
    return std::make_shared<LogNotifier>();
}

Collaborators wire(const Config& config) {
    auto facility = std::make_shared<DescriptorFlashFacility>(
        config.flash.program, config.flash.holding_account, config.engine.scanner.flash_fee_bps);

    BuilderOptions options{
        .holding_account = config.flash.holding_account,
        .tip = config.engine.tip,
        .leg_slippage_bps = config.engine.leg_slippage_bps
    };

    return Collaborators{
        .book_provider = std::make_shared<HttpBookProvider>(config.providers.book_url, config.general.timeout_ms),
        .pool_provider = std::make_shared<HttpPoolProvider>(config.providers.pool_url, config.general.timeout_ms),
        .builder = std::make_shared<BundleBuilder>(facility, make_descriptor_directory(config), options),
        .submission = std::make_shared<HttpBundleChannel>(config.submission, config.general.timeout_ms,
                                                          config.engine.submit_timeout_ms),
        .notifier = make_notifier(config)
    };
}

}  // namespace

int main(int argc, char** argv) {
    Options options;
    Config config;
    try {
        options = parse_args(argc, argv);
        config = Config::from_file(options.config_path);
        config.apply_env();
        log::set_level(log::parse_level(config.general.log_level));
        config.validate();
        if (config.submission.url.empty() || config.providers.book_url.empty() ||
            config.providers.pool_url.empty()) {
            throw ConfigError("submission url and provider urls are required");
        }
        if (config.flash.program.empty() || config.flash.holding_account.empty()) {
            throw ConfigError("flash program and holding account are required");
        }
    } catch (const ConfigError& e) {
        std::cerr << "Configuration error: " << e.what() << std::endl;
        return 2;
    } catch (const std::invalid_argument& e) {
        std::cerr << "Configuration error: " << e.what() << std::endl;
        return 2;
    }

    if (options.status) {
        std::cout << summary(config).dump(2) << std::endl;
        return 0;
    }

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    Metrics metrics;
    Collaborators collaborators;
    try {
        collaborators = wire(config);
    } catch (const ConfigError& e) {
        std::cerr << "Configuration error: " << e.what() << std::endl;
        return 2;
    }

    auto notifier = collaborators.notifier;
    ExecutionLoop loop(config.engine, config.pairs, std::move(collaborators), metrics);

    notifier->notify("atomarb started: " + std::to_string(config.pairs.size()) + " pairs, probe " +
                     std::to_string(config.engine.scanner.probe_amount));

    if (options.once) {
        CycleReport report = loop.run_cycle();
        ATOMARB_LOG_INFO("cycle " << report.cycle << ": " << report.opportunities.size()
                         << " opportunities, " << report.confirmed() << " landed");
    } else {
        loop.start();
        while (g_running.load()) {
            std::this_thread::sleep_for(std::chrono::milliseconds(200));
        }
        ATOMARB_LOG_INFO("shutting down");
        loop.stop();
    }

    std::cout << metrics.to_json().dump(2) << std::endl;
    return 0;
}
