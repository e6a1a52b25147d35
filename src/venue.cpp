// AtomArb - Venue Quoting Implementation

#include <atomarb/venue.hpp>
#include <limits>

namespace atomarb {

namespace {

template <class... Ts>
struct overloaded : Ts... { using Ts::operator()...; };
template <class... Ts>
overloaded(Ts...) -> overloaded<Ts...>;

LegQuote quote_book(const OrderBookVenue& venue, Direction direction, Amount amount_in) {
    if (!venue.book) {
        throw QuoteError("No book snapshot for market " + venue.market_id);
    }

    LegQuote leg;
    leg.venue_id = venue.market_id;
    leg.kind = VenueKind::OrderBook;
    leg.direction = direction;
    leg.amount_in = amount_in;

    FeeSplit split = split_fee(amount_in, venue.taker_fee_bps);
    leg.fee_paid = split.fee;

    if (split.kept <= 0) {
        return leg;
    }

    if (direction == Direction::QuoteToBase) {
        auto limit = venue.book->limit_for(Side::Buy, venue.slippage_bps);
        if (!limit) {
            leg.insufficient = true;
            return leg;
        }
        leg.limit_price = *limit;

        NotionalFill fill = match_notional(*venue.book, split.kept, *limit);
        leg.amount_out = fill.filled;
        leg.insufficient = fill.exhausted;
        return leg;
    }

    auto limit = venue.book->limit_for(Side::Sell, venue.slippage_bps);
    if (!limit) {
        leg.insufficient = true;
        return leg;
    }
    leg.limit_price = *limit;

    FillResult fill = match(*venue.book, Side::Sell, split.kept, *limit);
    if (fill.quote_amount > std::numeric_limits<Amount>::max()) {
        // Proceeds no amount can carry
        leg.amount_out = std::numeric_limits<Amount>::max();
        leg.insufficient = true;
        return leg;
    }
    leg.amount_out = static_cast<Amount>(fill.quote_amount);
    leg.insufficient = !fill.complete();
    return leg;
}

LegQuote quote_pool(const PoolVenue& venue, Direction direction, Amount amount_in) {
    if (!venue.pool) {
        throw QuoteError("No pool snapshot for pool " + venue.pool_id);
    }

    const std::string& mint_in =
        (direction == Direction::QuoteToBase) ? venue.quote_mint : venue.base_mint;
    SwapQuote swap = quote(*venue.pool, amount_in, mint_in);

    LegQuote leg;
    leg.venue_id = venue.pool_id;
    leg.kind = VenueKind::Pool;
    leg.direction = direction;
    leg.amount_in = amount_in;
    leg.amount_out = swap.amount_out;
    leg.fee_paid = swap.fee_paid;
    leg.insufficient = swap.insufficient;
    return leg;
}

}  // namespace

VenueKind venue_kind(const Venue& venue) noexcept {
    return std::holds_alternative<OrderBookVenue>(venue) ? VenueKind::OrderBook : VenueKind::Pool;
}

const std::string& venue_id(const Venue& venue) noexcept {
    return std::visit(overloaded{
        [](const OrderBookVenue& v) -> const std::string& { return v.market_id; },
        [](const PoolVenue& v) -> const std::string& { return v.pool_id; }
    }, venue);
}

LegQuote quote_leg(const Venue& venue, Direction direction, Amount amount_in) {
    return std::visit(overloaded{
        [&](const OrderBookVenue& v) { return quote_book(v, direction, amount_in); },
        [&](const PoolVenue& v) { return quote_pool(v, direction, amount_in); }
    }, venue);
}

}  // namespace atomarb
