// AtomArb - Opportunity Scanner Implementation

#include <atomarb/scanner.hpp>
#include <algorithm>
#include <stdexcept>

namespace atomarb {

namespace {

ScanResult skip(SkipReason reason, std::string detail) {
    ScanResult result;
    result.reason = reason;
    result.detail = std::move(detail);
    return result;
}

SkipReason leg_failure(const LegQuote& leg) {
    return leg.insufficient ? SkipReason::InsufficientDepth : SkipReason::NonPositiveQuote;
}

std::string describe(const LegQuote& leg) {
    return std::string(to_string(leg.kind)) + " " + leg.venue_id + " " + to_string(leg.direction) +
           " in=" + std::to_string(leg.amount_in) + " out=" + std::to_string(leg.amount_out) +
           (leg.insufficient ? " (insufficient)" : "");
}

// Base-denominated fee expressed in quote at the leg's own rate
Amount base_fee_in_quote(const LegQuote& leg) {
    if (leg.amount_in <= 0 || leg.fee_paid <= 0) return 0;
    I128 converted = static_cast<I128>(leg.fee_paid) * leg.amount_out / leg.amount_in;
    return static_cast<Amount>(converted);
}

}  // namespace

OpportunityScanner::OpportunityScanner(ScannerConfig config)
    : config_(config) {}

ScanResult OpportunityScanner::evaluate(const AssetPair& pair, const BookSnapshot& book,
                                        const PoolSnapshot& pool) const {
    return evaluate(pair, book, pool, config_.probe_amount);
}

ScanResult OpportunityScanner::evaluate(const AssetPair& pair, const BookSnapshot& book,
                                        const PoolSnapshot& pool, Amount probe) const {
    if (probe <= 0) {
        throw std::invalid_argument("evaluate: probe must be positive");
    }

    Venue book_venue = OrderBookVenue{
        .market_id = pair.market_id,
        .book = book,
        .taker_fee_bps = pair.taker_fee_bps.value_or(config_.taker_fee_bps),
        .slippage_bps = config_.book_slippage_bps
    };
    Venue pool_venue = PoolVenue{
        .pool_id = pair.pool_id,
        .pool = pool,
        .base_mint = pair.base.mint,
        .quote_mint = pair.quote.mint
    };

    try {
        // Leg 1: same probe on both venues, larger base output wins, tie to the book
        LegQuote book_leg = quote_leg(book_venue, Direction::QuoteToBase, probe);
        LegQuote pool_leg = quote_leg(pool_venue, Direction::QuoteToBase, probe);

        bool book_ok = book_leg.usable();
        bool pool_ok = pool_leg.usable();
        if (!book_ok && !pool_ok) {
            SkipReason reason = (book_leg.insufficient || pool_leg.insufficient)
                ? SkipReason::InsufficientDepth
                : SkipReason::NonPositiveQuote;
            return skip(reason, "leg 1: " + describe(book_leg) + "; " + describe(pool_leg));
        }

        bool book_first = book_ok && (!pool_ok || book_leg.amount_out >= pool_leg.amount_out);
        LegQuote leg1 = book_first ? book_leg : pool_leg;
        const Venue& other = book_first ? pool_venue : book_venue;

        // Leg 2: sell everything leg 1 bought on the other venue
        LegQuote leg2 = quote_leg(other, Direction::BaseToQuote, leg1.amount_out);
        if (!leg2.usable()) {
            return skip(leg_failure(leg2), "leg 2: " + describe(leg2));
        }

        ArbOpportunity opp;
        opp.pair = pair;
        opp.probe_amount = probe;
        opp.leg1_fee = leg1.fee_paid;
        opp.leg2_fee = base_fee_in_quote(leg2);
        opp.flash_fee = bps_ceil(probe, config_.flash_fee_bps);
        opp.fees_paid = opp.leg1_fee + opp.leg2_fee + opp.flash_fee;
        opp.net_profit = leg2.amount_out - probe - opp.fees_paid;
        opp.leg1 = std::move(leg1);
        opp.leg2 = std::move(leg2);

        if (opp.net_profit <= config_.min_profit) {
            return skip(SkipReason::BelowThreshold,
                        "net " + std::to_string(opp.net_profit) + " <= min " + std::to_string(config_.min_profit));
        }
        if (config_.min_profit_bps > 0 && opp.profit_bps() < static_cast<int64_t>(config_.min_profit_bps)) {
            return skip(SkipReason::BelowThreshold,
                        "net " + std::to_string(opp.profit_bps()) + " bps < min " +
                        std::to_string(config_.min_profit_bps) + " bps");
        }

        opp.created_at_ms = now_ms();
        opp.id = pair.to_string() + "-" + opp.leg1.venue_id + "-" + opp.leg2.venue_id + "-" +
                 std::to_string(opp.created_at_ms) + "-" +
                 std::to_string(sequence_.fetch_add(1, std::memory_order_relaxed));

        ScanResult result;
        result.opportunity = std::move(opp);
        return result;
    } catch (const QuoteError& e) {
        return skip(SkipReason::Unpriceable, e.what());
    }
}

std::optional<ArbOpportunity> OpportunityScanner::scan(const AssetPair& pair, const BookSnapshot& book,
                                                       const PoolSnapshot& pool, Amount probe) const {
    return evaluate(pair, book, pool, probe).opportunity;
}

void rank_opportunities(std::vector<ArbOpportunity>& opportunities) {
    std::stable_sort(opportunities.begin(), opportunities.end(),
                     [](const ArbOpportunity& a, const ArbOpportunity& b) {
                         return a.net_profit > b.net_profit;
                     });
}

PairRotation::PairRotation(std::vector<AssetPair> pairs, size_t batch_size)
    : pairs_(std::move(pairs)), batch_size_(batch_size) {
    if (batch_size_ == 0) {
        throw std::invalid_argument("PairRotation: batch_size must be positive");
    }
}

std::vector<AssetPair> PairRotation::next_batch() {
    std::unique_lock lock(mutex_);
    std::vector<AssetPair> batch;
    if (pairs_.empty()) return batch;

    size_t count = std::min(batch_size_, pairs_.size());
    batch.reserve(count);
    for (size_t i = 0; i < count; ++i) {
        batch.push_back(pairs_[(cursor_ + i) % pairs_.size()]);
    }
    cursor_ = (cursor_ + count) % pairs_.size();
    return batch;
}

}  // namespace atomarb
