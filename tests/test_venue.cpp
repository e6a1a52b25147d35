// AtomArb - Venue Quoting Tests

#include <catch2/catch_test_macros.hpp>
#include <atomarb/venue.hpp>
#include <limits>
#include <memory>

using namespace atomarb;

namespace {

BookSnapshot small_book() {
    return std::make_shared<const OrderBook>(
        OrderBook::from_levels({{99, 3}, {98, 4}}, {{100, 5}, {101, 10}}, "MKT"));
}

}  // namespace

TEST_CASE("Order-book venue legs", "[venue]") {
    Venue venue = OrderBookVenue{
        .market_id = "MKT",
        .book = small_book(),
        .taker_fee_bps = 100,
        .slippage_bps = 100
    };

    REQUIRE(venue_kind(venue) == VenueKind::OrderBook);
    REQUIRE(venue_id(venue) == "MKT");

    SECTION("Quote to base deducts the taker fee then buys") {
        auto leg = quote_leg(venue, Direction::QuoteToBase, 1000);
        REQUIRE(leg.fee_paid == 10);
        REQUIRE(leg.amount_out == 9);
        REQUIRE(leg.limit_price == 101);
        REQUIRE(leg.usable());
    }

    SECTION("Base to quote sells into the bids") {
        Venue no_fee = OrderBookVenue{.market_id = "MKT", .book = small_book(), .taker_fee_bps = 0,
                                      .slippage_bps = 100};
        auto leg = quote_leg(no_fee, Direction::BaseToQuote, 5);
        REQUIRE(leg.amount_out == 99 * 3 + 98 * 2);
        REQUIRE(leg.limit_price == 98);
        REQUIRE_FALSE(leg.insufficient);
    }

    SECTION("Selling past the depth is insufficient") {
        auto leg = quote_leg(venue, Direction::BaseToQuote, 50);
        REQUIRE(leg.insufficient);
        REQUIRE_FALSE(leg.usable());
    }

    SECTION("Proceeds beyond the amount range are insufficient") {
        const Amount huge = std::numeric_limits<Amount>::max() / 2;
        Venue rich = OrderBookVenue{
            .market_id = "MKT",
            .book = std::make_shared<const OrderBook>(OrderBook::from_levels({{huge, 4}}, {{huge, 4}}, "MKT")),
            .taker_fee_bps = 0,
            .slippage_bps = 100
        };
        auto leg = quote_leg(rich, Direction::BaseToQuote, 4);
        REQUIRE(leg.insufficient);
        REQUIRE(leg.amount_out == std::numeric_limits<Amount>::max());
        REQUIRE_FALSE(leg.usable());
    }

    SECTION("Missing snapshot") {
        Venue empty = OrderBookVenue{.market_id = "MKT"};
        REQUIRE_THROWS_AS(quote_leg(empty, Direction::QuoteToBase, 1000), QuoteError);
    }
}

TEST_CASE("Pool venue legs", "[venue]") {
    PoolState state;
    state.pool_id = "POOL";
    state.base_mint = "SOL";
    state.quote_mint = "USDC";
    state.base_reserve = 10000;
    state.quote_reserve = 1100000;

    Venue venue = PoolVenue{
        .pool_id = "POOL",
        .pool = std::make_shared<const PoolState>(state),
        .base_mint = "SOL",
        .quote_mint = "USDC"
    };

    REQUIRE(venue_kind(venue) == VenueKind::Pool);
    REQUIRE(venue_id(venue) == "POOL");

    auto buy = quote_leg(venue, Direction::QuoteToBase, 1000);
    REQUIRE(buy.amount_out == 9);
    REQUIRE(buy.kind == VenueKind::Pool);

    auto sell = quote_leg(venue, Direction::BaseToQuote, 10);
    REQUIRE(sell.amount_out == 1098);
    REQUIRE(sell.usable());
}
