// AtomArb - Opportunity Scanner
// Prices both round-trip orderings for a pair and keeps the profitable one

#pragma once

#include <atomarb/config.hpp>
#include <atomarb/opportunity.hpp>
#include <atomarb/orderbook.hpp>
#include <atomarb/pool.hpp>
#include <atomic>
#include <mutex>
#include <optional>
#include <vector>

namespace atomarb {

class OpportunityScanner {
public:
    explicit OpportunityScanner(ScannerConfig config);

    // Evaluate `pair` with the configured probe amount
    [[nodiscard]] ScanResult evaluate(const AssetPair& pair, const BookSnapshot& book,
                                      const PoolSnapshot& pool) const;

    [[nodiscard]] ScanResult evaluate(const AssetPair& pair, const BookSnapshot& book,
                                      const PoolSnapshot& pool, Amount probe) const;

    // Opportunity or nothing; see evaluate() for the reason
    [[nodiscard]] std::optional<ArbOpportunity> scan(const AssetPair& pair, const BookSnapshot& book,
                                                     const PoolSnapshot& pool, Amount probe) const;

    [[nodiscard]] const ScannerConfig& config() const noexcept { return config_; }

private:
    ScannerConfig config_;
    mutable std::atomic<uint64_t> sequence_{0};
};

// Most profitable first; equal profits keep their order
void rank_opportunities(std::vector<ArbOpportunity>& opportunities);

// Round-robin cursor over the pair universe. Each call hands out the next
// min(batch_size, n) pairs, wrapping around the end.
class PairRotation {
public:
    PairRotation(std::vector<AssetPair> pairs, size_t batch_size);

    [[nodiscard]] std::vector<AssetPair> next_batch();

    [[nodiscard]] size_t size() const noexcept { return pairs_.size(); }
    [[nodiscard]] size_t batch_size() const noexcept { return batch_size_; }

private:
    std::vector<AssetPair> pairs_;
    size_t batch_size_;
    size_t cursor_ = 0;
    std::mutex mutex_;
};

}  // namespace atomarb
