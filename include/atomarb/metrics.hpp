// AtomArb - Metrics
// Process-lifetime counters owned by whoever runs the execution loop

#pragma once

#include <atomarb/types.hpp>
#include <nlohmann/json.hpp>
#include <atomic>
#include <cstdint>

namespace atomarb {

struct MetricsSnapshot {
    uint64_t bundles_sent = 0;
    Amount realized_pnl = 0;
    uint64_t cycles = 0;
    uint64_t opportunities = 0;
    uint64_t bundles_failed = 0;
    uint64_t pairs_skipped = 0;
    uint64_t provider_errors = 0;

    [[nodiscard]] nlohmann::json to_json() const;
};

class Metrics {
public:
    Metrics() = default;
    Metrics(const Metrics&) = delete;
    Metrics& operator=(const Metrics&) = delete;

    // Only confirmed bundles move bundles_sent and realized_pnl
    void record_confirmed(Amount profit) noexcept {
        bundles_sent_.fetch_add(1, std::memory_order_relaxed);
        realized_pnl_.fetch_add(profit, std::memory_order_relaxed);
    }

    void record_failed() noexcept { bundles_failed_.fetch_add(1, std::memory_order_relaxed); }
    void record_cycle() noexcept { cycles_.fetch_add(1, std::memory_order_relaxed); }
    void record_opportunities(uint64_t n) noexcept { opportunities_.fetch_add(n, std::memory_order_relaxed); }
    void record_skip() noexcept { pairs_skipped_.fetch_add(1, std::memory_order_relaxed); }
    void record_provider_error() noexcept { provider_errors_.fetch_add(1, std::memory_order_relaxed); }

    [[nodiscard]] uint64_t bundles_sent() const noexcept { return bundles_sent_.load(std::memory_order_relaxed); }
    [[nodiscard]] Amount realized_pnl() const noexcept { return realized_pnl_.load(std::memory_order_relaxed); }

    [[nodiscard]] MetricsSnapshot snapshot() const noexcept;
    [[nodiscard]] nlohmann::json to_json() const { return snapshot().to_json(); }

private:
    std::atomic<uint64_t> bundles_sent_{0};
    std::atomic<Amount> realized_pnl_{0};
    std::atomic<uint64_t> cycles_{0};
    std::atomic<uint64_t> opportunities_{0};
    std::atomic<uint64_t> bundles_failed_{0};
    std::atomic<uint64_t> pairs_skipped_{0};
    std::atomic<uint64_t> provider_errors_{0};
};

}  // namespace atomarb
