// AtomArb - Arbitrage Opportunity
// Priced round trip produced by the scanner and consumed once by the builder

#pragma once

#include <atomarb/types.hpp>
#include <atomarb/venue.hpp>
#include <optional>
#include <string>

namespace atomarb {

// Borrow quote, buy base on leg 1, sell base on leg 2, repay quote.
// All fee and profit figures are in quote atomic units.
struct ArbOpportunity {
    std::string id;
    AssetPair pair;
    LegQuote leg1;               // quote -> base
    LegQuote leg2;               // base -> quote
    Amount probe_amount = 0;
    Amount leg1_fee = 0;
    Amount leg2_fee = 0;         // converted at leg 2's execution rate
    Amount flash_fee = 0;
    Amount fees_paid = 0;        // leg1_fee + leg2_fee + flash_fee
    Amount net_profit = 0;       // leg2 out - probe - fees_paid
    int64_t created_at_ms = 0;

    [[nodiscard]] const std::string& leg1_venue() const noexcept { return leg1.venue_id; }
    [[nodiscard]] const std::string& leg2_venue() const noexcept { return leg2.venue_id; }
    [[nodiscard]] Amount leg1_in() const noexcept { return leg1.amount_in; }
    [[nodiscard]] Amount leg1_out() const noexcept { return leg1.amount_out; }
    [[nodiscard]] Amount leg2_out() const noexcept { return leg2.amount_out; }

    // Profit relative to the probe, in basis points
    [[nodiscard]] int64_t profit_bps() const noexcept {
        if (probe_amount <= 0) return 0;
        return static_cast<int64_t>(static_cast<I128>(net_profit) * BPS_DENOMINATOR / probe_amount);
    }
};

// Why a pair produced no opportunity
enum class SkipReason : uint8_t {
    None = 0,
    InsufficientDepth = 1,
    NonPositiveQuote = 2,
    BelowThreshold = 3,
    Unpriceable = 4,      // snapshot missing or inconsistent with the pair
    ProviderFailure = 5   // snapshot fetch failed or timed out
};

inline constexpr const char* to_string(SkipReason r) noexcept {
    switch (r) {
        case SkipReason::None: return "none";
        case SkipReason::InsufficientDepth: return "insufficient_depth";
        case SkipReason::NonPositiveQuote: return "non_positive_quote";
        case SkipReason::BelowThreshold: return "below_threshold";
        case SkipReason::Unpriceable: return "unpriceable";
        case SkipReason::ProviderFailure: return "provider_failure";
    }
    return "unknown";
}

// Outcome of evaluating one pair
struct ScanResult {
    std::optional<ArbOpportunity> opportunity;
    SkipReason reason = SkipReason::None;
    std::string detail;

    [[nodiscard]] bool found() const noexcept { return opportunity.has_value(); }
};

}  // namespace atomarb
