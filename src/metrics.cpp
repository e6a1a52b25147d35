// AtomArb - Metrics Implementation

#include <atomarb/metrics.hpp>

namespace atomarb {

nlohmann::json MetricsSnapshot::to_json() const {
    return {
        {"bundles_sent", bundles_sent},
        {"realized_pnl", realized_pnl},
        {"cycles", cycles},
        {"opportunities", opportunities},
        {"bundles_failed", bundles_failed},
        {"pairs_skipped", pairs_skipped},
        {"provider_errors", provider_errors}
    };
}

MetricsSnapshot Metrics::snapshot() const noexcept {
    MetricsSnapshot s;
    s.bundles_sent = bundles_sent_.load(std::memory_order_relaxed);
    s.realized_pnl = realized_pnl_.load(std::memory_order_relaxed);
    s.cycles = cycles_.load(std::memory_order_relaxed);
    s.opportunities = opportunities_.load(std::memory_order_relaxed);
    s.bundles_failed = bundles_failed_.load(std::memory_order_relaxed);
    s.pairs_skipped = pairs_skipped_.load(std::memory_order_relaxed);
    s.provider_errors = provider_errors_.load(std::memory_order_relaxed);
    return s;
}

}  // namespace atomarb
