// AtomArb - Execution Loop
// Periodic scan -> build -> submit driver over immutable per-cycle snapshots

#pragma once

#include <atomarb/bundle.hpp>
#include <atomarb/config.hpp>
#include <atomarb/metrics.hpp>
#include <atomarb/opportunity.hpp>
#include <atomarb/providers.hpp>
#include <atomarb/scanner.hpp>
#include <atomic>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace atomarb {

enum class LoopState : uint8_t {
    Idle = 0,
    Scanning = 1,
    Submitting = 2
};

inline constexpr const char* to_string(LoopState s) noexcept {
    switch (s) {
        case LoopState::Idle: return "idle";
        case LoopState::Scanning: return "scanning";
        case LoopState::Submitting: return "submitting";
    }
    return "unknown";
}

struct Collaborators {
    std::shared_ptr<BookProvider> book_provider;
    std::shared_ptr<PoolProvider> pool_provider;
    std::shared_ptr<BundleBuilder> builder;
    std::shared_ptr<SubmissionChannel> submission;
    std::shared_ptr<Notifier> notifier;
};

struct PairOutcome {
    std::string pair;
    SkipReason reason = SkipReason::None;
    std::string detail;
};

struct SubmissionOutcome {
    std::string opportunity_id;
    std::string pair;
    Amount net_profit = 0;
    SubmitResult result;
};

// What one cycle saw and did
struct CycleReport {
    uint64_t cycle = 0;
    size_t pairs_scanned = 0;
    size_t provider_calls = 0;
    size_t provider_failures = 0;
    std::vector<ArbOpportunity> opportunities;   // ranked, most profitable first
    std::vector<PairOutcome> skipped;
    std::vector<SubmissionOutcome> submissions;

    [[nodiscard]] size_t confirmed() const noexcept {
        size_t n = 0;
        for (const auto& s : submissions) {
            if (s.result.confirmed()) ++n;
        }
        return n;
    }

    // Every provider call of the cycle failed
    [[nodiscard]] bool provider_outage() const noexcept {
        return provider_calls > 0 && provider_failures == provider_calls;
    }
};

class ExecutionLoop {
public:
    using StateListener = std::function<void(uint64_t cycle, LoopState state)>;

    // Throws ConfigError on a missing collaborator or unusable settings
    ExecutionLoop(EngineConfig config, std::vector<AssetPair> pairs, Collaborators collaborators,
                  Metrics& metrics);
    ~ExecutionLoop();

    ExecutionLoop(const ExecutionLoop&) = delete;
    ExecutionLoop& operator=(const ExecutionLoop&) = delete;

    // One full cycle on the calling thread. Never throws for per-pair or
    // per-bundle failures.
    CycleReport run_cycle();

    // Timer thread starting a cycle every scan interval
    void start();

    // Wake the timer and wait for in-flight cycles to finish
    void stop();

    [[nodiscard]] bool is_running() const noexcept { return running_.load(); }
    [[nodiscard]] LoopState state() const noexcept;
    [[nodiscard]] size_t inflight_cycles() const;
    [[nodiscard]] uint32_t failed_cycle_streak() const;

    // Called from cycle threads on every transition
    void on_state_change(StateListener listener);

private:
    struct PairScan {
        PairOutcome outcome;
        std::optional<ArbOpportunity> opportunity;
        size_t provider_calls = 0;
        size_t provider_failures = 0;
    };

    PairScan scan_pair(const AssetPair& pair);
    SubmissionOutcome submit_one(const ArbOpportunity& opportunity);
    void track_health(const CycleReport& report);
    void transition(uint64_t cycle, LoopState from, LoopState to);
    void notify(const std::string& message);
    void timer_loop();

    EngineConfig config_;
    Collaborators collaborators_;
    Metrics& metrics_;
    OpportunityScanner scanner_;
    PairRotation rotation_;

    std::atomic<uint64_t> cycle_seq_{0};
    std::atomic<size_t> scanning_{0};
    std::atomic<size_t> submitting_{0};

    mutable std::mutex listener_mutex_;
    StateListener listener_;

    mutable std::mutex health_mutex_;
    uint32_t failed_streak_ = 0;

    std::atomic<bool> running_{false};
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    size_t inflight_ = 0;
    std::unique_ptr<std::thread> timer_thread_;
};

}  // namespace atomarb
