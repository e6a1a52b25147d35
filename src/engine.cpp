// AtomArb - Execution Loop Implementation

#include <atomarb/engine.hpp>
#include <atomarb/log.hpp>
#include <atomarb/units.hpp>
#include <chrono>
#include <future>

namespace atomarb {

namespace {

EngineConfig checked(EngineConfig config) {
    if (config.batch_size == 0) {
        throw ConfigError("batch_size must be positive");
    }
    if (config.scanner.probe_amount <= 0) {
        throw ConfigError("probe_amount must be positive");
    }
    if (config.scanner.min_profit < 0) {
        throw ConfigError("min_profit must not be negative");
    }
    if (config.scan_interval_ms == 0 || config.fetch_timeout_ms == 0 || config.submit_timeout_ms == 0) {
        throw ConfigError("Intervals and timeouts must be positive");
    }
    if (config.max_inflight_cycles == 0) {
        throw ConfigError("max_inflight_cycles must be positive");
    }
    return config;
}

std::string signed_amount(Amount amount, int decimals) {
    std::string text = units::format(amount, decimals);
    return amount >= 0 ? "+" + text : text;
}

}  // namespace

ExecutionLoop::ExecutionLoop(EngineConfig config, std::vector<AssetPair> pairs,
                             Collaborators collaborators, Metrics& metrics)
    : config_(checked(std::move(config))),
      collaborators_(std::move(collaborators)),
      metrics_(metrics),
      scanner_(config_.scanner),
      rotation_(std::move(pairs), config_.batch_size) {
    if (!collaborators_.book_provider) throw ConfigError("ExecutionLoop requires a book provider");
    if (!collaborators_.pool_provider) throw ConfigError("ExecutionLoop requires a pool provider");
    if (!collaborators_.builder) throw ConfigError("ExecutionLoop requires a bundle builder");
    if (!collaborators_.submission) throw ConfigError("ExecutionLoop requires a submission channel");
    if (!collaborators_.notifier) throw ConfigError("ExecutionLoop requires a notifier");
    if (rotation_.size() == 0) throw ConfigError("ExecutionLoop requires at least one pair");
}

ExecutionLoop::~ExecutionLoop() {
    stop();
}

CycleReport ExecutionLoop::run_cycle() {
    CycleReport report;
    report.cycle = cycle_seq_.fetch_add(1) + 1;
    transition(report.cycle, LoopState::Idle, LoopState::Scanning);

    // Pairs are independent; each task fetches its own snapshots and scans them
    std::vector<AssetPair> batch = rotation_.next_batch();
    std::vector<std::future<PairScan>> scans;
    scans.reserve(batch.size());
    for (const auto& pair : batch) {
        scans.push_back(std::async(std::launch::async, [this, pair]() { return scan_pair(pair); }));
    }

    for (auto& f : scans) {
        PairScan scan = f.get();
        report.pairs_scanned++;
        report.provider_calls += scan.provider_calls;
        report.provider_failures += scan.provider_failures;
        if (scan.opportunity) {
            report.opportunities.push_back(std::move(*scan.opportunity));
        } else {
            ATOMARB_LOG_INFO("skip " << scan.outcome.pair << ": " << to_string(scan.outcome.reason)
                             << " (" << scan.outcome.detail << ")");
            metrics_.record_skip();
            report.skipped.push_back(std::move(scan.outcome));
        }
    }

    track_health(report);
    rank_opportunities(report.opportunities);
    metrics_.record_opportunities(report.opportunities.size());

    if (report.opportunities.empty()) {
        transition(report.cycle, LoopState::Scanning, LoopState::Idle);
        metrics_.record_cycle();
        return report;
    }

    transition(report.cycle, LoopState::Scanning, LoopState::Submitting);

    // Each bundle is awaited on its own; one slow relay call never holds up another
    std::vector<std::future<SubmissionOutcome>> submissions;
    submissions.reserve(report.opportunities.size());
    for (const auto& opp : report.opportunities) {
        ATOMARB_LOG_INFO("opportunity " << opp.id << " net " << opp.net_profit << " fees " << opp.fees_paid);
        submissions.push_back(std::async(std::launch::async, [this, opp]() { return submit_one(opp); }));
    }
    for (auto& f : submissions) {
        report.submissions.push_back(f.get());
    }

    transition(report.cycle, LoopState::Submitting, LoopState::Idle);
    metrics_.record_cycle();
    return report;
}

ExecutionLoop::PairScan ExecutionLoop::scan_pair(const AssetPair& pair) {
    PairScan scan;
    scan.outcome.pair = pair.to_string();

    auto timeout = std::chrono::milliseconds(config_.fetch_timeout_ms);
    BookSnapshot book;
    PoolSnapshot pool;
    std::string failures;

    scan.provider_calls++;
    try {
        auto provider = collaborators_.book_provider;
        book = with_timeout([provider, id = pair.market_id]() { return provider->fetch_book(id); },
                            timeout, "book " + pair.market_id);
    } catch (const std::exception& e) {
        scan.provider_failures++;
        metrics_.record_provider_error();
        failures = e.what();
    }

    scan.provider_calls++;
    try {
        auto provider = collaborators_.pool_provider;
        pool = with_timeout([provider, id = pair.pool_id]() { return provider->fetch_pool(id); },
                            timeout, "pool " + pair.pool_id);
    } catch (const std::exception& e) {
        scan.provider_failures++;
        metrics_.record_provider_error();
        failures += (failures.empty() ? "" : "; ") + std::string(e.what());
    }

    if (scan.provider_failures > 0) {
        scan.outcome.reason = SkipReason::ProviderFailure;
        scan.outcome.detail = failures;
        return scan;
    }

    try {
        ScanResult result = scanner_.evaluate(pair, book, pool);
        scan.outcome.reason = result.reason;
        scan.outcome.detail = std::move(result.detail);
        scan.opportunity = std::move(result.opportunity);
    } catch (const std::exception& e) {
        scan.outcome.reason = SkipReason::Unpriceable;
        scan.outcome.detail = e.what();
    }
    return scan;
}

SubmissionOutcome ExecutionLoop::submit_one(const ArbOpportunity& opportunity) {
    SubmissionOutcome outcome;
    outcome.opportunity_id = opportunity.id;
    outcome.pair = opportunity.pair.to_string();
    outcome.net_profit = opportunity.net_profit;

    try {
        Bundle bundle = collaborators_.builder->build(opportunity, config_.payer);
        auto channel = collaborators_.submission;
        outcome.result = with_timeout([channel, bundle]() { return channel->submit(bundle); },
                                      std::chrono::milliseconds(config_.submit_timeout_ms),
                                      "submission of " + opportunity.id);
    } catch (const ProviderError& e) {
        outcome.result = e.kind() == ProviderError::Kind::Timeout
            ? SubmitResult::timed_out(e.what())
            : SubmitResult::rejected(e.what());
    } catch (const std::exception& e) {
        outcome.result = SubmitResult::rejected(e.what());
    }

    const auto& quote = opportunity.pair.quote;
    if (outcome.result.confirmed()) {
        metrics_.record_confirmed(opportunity.net_profit);
        ATOMARB_LOG_INFO("bundle landed " << opportunity.id << " relay id " << outcome.result.bundle_id);
        notify("bundle landed " + opportunity.id + " " +
               signed_amount(opportunity.net_profit, quote.decimals) + " " + quote.symbol);
    } else {
        metrics_.record_failed();
        ATOMARB_LOG_WARN("bundle failed " << opportunity.id << " pair " << outcome.pair << ": "
                         << to_string(outcome.result.status) << " " << outcome.result.reason);
        notify("bundle failed " + opportunity.id + ": " + to_string(outcome.result.status) +
               (outcome.result.reason.empty() ? "" : " " + outcome.result.reason));
    }
    return outcome;
}

void ExecutionLoop::track_health(const CycleReport& report) {
    uint32_t streak;
    {
        std::unique_lock lock(health_mutex_);
        if (report.provider_outage()) {
            ++failed_streak_;
        } else if (report.provider_calls > report.provider_failures) {
            failed_streak_ = 0;
        }
        streak = failed_streak_;
    }

    uint32_t threshold = config_.health_warning_threshold;
    if (threshold > 0 && streak > 0 && streak % threshold == 0) {
        ATOMARB_LOG_ERROR("health: " << streak << " consecutive cycles without a successful provider call");
        notify("health warning: " + std::to_string(streak) +
               " consecutive cycles without a successful provider call");
    }
}

void ExecutionLoop::transition(uint64_t cycle, LoopState from, LoopState to) {
    if (from == LoopState::Scanning) scanning_.fetch_sub(1);
    if (from == LoopState::Submitting) submitting_.fetch_sub(1);
    if (to == LoopState::Scanning) scanning_.fetch_add(1);
    if (to == LoopState::Submitting) submitting_.fetch_add(1);

    ATOMARB_LOG_DEBUG("cycle " << cycle << " " << to_string(from) << " -> " << to_string(to));

    StateListener listener;
    {
        std::unique_lock lock(listener_mutex_);
        listener = listener_;
    }
    if (listener) {
        listener(cycle, to);
    }
}

void ExecutionLoop::notify(const std::string& message) {
    try {
        collaborators_.notifier->notify(message);
    } catch (const std::exception& e) {
        ATOMARB_LOG_WARN("notifier failed: " << e.what());
    }
}

LoopState ExecutionLoop::state() const noexcept {
    if (submitting_.load() > 0) return LoopState::Submitting;
    if (scanning_.load() > 0) return LoopState::Scanning;
    return LoopState::Idle;
}

size_t ExecutionLoop::inflight_cycles() const {
    std::unique_lock lock(mutex_);
    return inflight_;
}

uint32_t ExecutionLoop::failed_cycle_streak() const {
    std::unique_lock lock(health_mutex_);
    return failed_streak_;
}

void ExecutionLoop::on_state_change(StateListener listener) {
    std::unique_lock lock(listener_mutex_);
    listener_ = std::move(listener);
}

void ExecutionLoop::start() {
    if (running_.exchange(true)) {
        return;  // Already running
    }

    ATOMARB_LOG_INFO("execution loop started, interval " << config_.scan_interval_ms << "ms, batch "
                     << config_.batch_size << " of " << rotation_.size() << " pairs");
    timer_thread_ = std::make_unique<std::thread>(&ExecutionLoop::timer_loop, this);
}

void ExecutionLoop::stop() {
    {
        std::unique_lock lock(mutex_);
        running_.store(false);
    }
    cv_.notify_all();

    if (timer_thread_ && timer_thread_->joinable()) {
        timer_thread_->join();
    }
    timer_thread_.reset();

    std::unique_lock lock(mutex_);
    cv_.wait(lock, [this]() { return inflight_ == 0; });
}

void ExecutionLoop::timer_loop() {
    auto interval = std::chrono::milliseconds(config_.scan_interval_ms);
    std::unique_lock lock(mutex_);

    while (running_.load()) {
        if (inflight_ < config_.max_inflight_cycles) {
            ++inflight_;
            // Cycles overlap freely; each works on its own snapshots
            std::thread([this]() {
                try {
                    run_cycle();
                } catch (const std::exception& e) {
                    ATOMARB_LOG_ERROR("cycle aborted: " << e.what());
                }
                std::unique_lock done(mutex_);
                --inflight_;
                cv_.notify_all();
            }).detach();
        } else {
            ATOMARB_LOG_WARN("tick skipped, " << inflight_ << " cycles in flight");
        }

        cv_.wait_for(lock, interval, [this]() { return !running_.load(); });
    }
}

}  // namespace atomarb
