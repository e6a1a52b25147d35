// AtomArb - Order Book Matcher Tests

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <atomarb/orderbook.hpp>
#include <stdexcept>

using namespace atomarb;
using Catch::Approx;

namespace {

OrderBook two_level_asks() {
    return OrderBook::from_levels({}, {{100, 5}, {101, 10}}, "MKT");
}

}  // namespace

TEST_CASE("Book normalization", "[orderbook]") {
    SECTION("Sides are sorted, ties keep arrival order") {
        auto book = OrderBook::from_levels(
            {{98, 1}, {99, 2}, {99, 3}},
            {{101, 1}, {100, 2}, {100, 3}});

        REQUIRE(book.bids().size() == 3);
        REQUIRE(book.bids()[0].price == 99);
        REQUIRE(book.bids()[0].size == 2);
        REQUIRE(book.bids()[1].size == 3);
        REQUIRE(book.bids()[2].price == 98);

        REQUIRE(book.asks()[0].price == 100);
        REQUIRE(book.asks()[0].size == 2);
        REQUIRE(book.asks()[1].size == 3);
        REQUIRE(book.asks()[2].price == 101);
    }

    SECTION("Non-positive levels are dropped") {
        auto book = OrderBook::from_levels({{0, 5}, {99, 1}}, {{100, 0}, {-1, 3}, {101, 4}});
        REQUIRE(book.bids().size() == 1);
        REQUIRE(book.asks().size() == 1);
        REQUIRE(book.best_ask().value() == 101);
    }

    SECTION("Empty book has no touch") {
        OrderBook book;
        REQUIRE_FALSE(book.best_bid().has_value());
        REQUIRE_FALSE(book.best_ask().has_value());
        REQUIRE_FALSE(book.limit_for(Side::Buy, 100).has_value());
    }
}

TEST_CASE("Limit price from slippage", "[orderbook]") {
    auto book = OrderBook::from_levels({{99, 1}}, {{100, 1}});

    REQUIRE(book.limit_for(Side::Buy, 100).value() == 101);
    REQUIRE(book.limit_for(Side::Buy, 1).value() == 101);   // rounds up
    REQUIRE(book.limit_for(Side::Buy, 0).value() == 100);
    REQUIRE(book.limit_for(Side::Sell, 100).value() == 98); // rounds down
    REQUIRE(book.limit_for(Side::Sell, 0).value() == 99);
}

TEST_CASE("Buy walks asks under the limit", "[orderbook]") {
    auto book = two_level_asks();

    SECTION("Fill across two levels") {
        auto fill = match(book, Side::Buy, 12, 101);
        REQUIRE(fill.remaining == 0);
        REQUIRE(fill.filled == 12);
        REQUIRE(fill.quote_amount == 100 * 5 + 101 * 7);
        REQUIRE(fill.average_price() == Approx(100.58333).epsilon(1e-6));
        REQUIRE(fill.complete());
    }

    SECTION("Not enough depth at the limit") {
        auto fill = match(book, Side::Buy, 20, 101);
        REQUIRE(fill.remaining == 5);
        REQUIRE(fill.filled == 15);
        REQUIRE_FALSE(fill.complete());
    }

    SECTION("Level beyond the limit is never consumed") {
        auto fill = match(book, Side::Buy, 12, 100);
        REQUIRE(fill.filled == 5);
        REQUIRE(fill.remaining == 7);
        REQUIRE(fill.average_price() == Approx(100.0));
    }

    SECTION("Nothing fills below the touch") {
        auto fill = match(book, Side::Buy, 3, 99);
        REQUIRE(fill.filled == 0);
        REQUIRE(fill.remaining == 3);
        REQUIRE(fill.average_price() == 0.0);
    }
}

TEST_CASE("Sell walks bids above the limit", "[orderbook]") {
    auto book = OrderBook::from_levels({{99, 3}, {98, 4}, {90, 10}}, {});

    auto fill = match(book, Side::Sell, 10, 95);
    REQUIRE(fill.filled == 7);
    REQUIRE(fill.remaining == 3);
    REQUIRE(fill.quote_amount == 99 * 3 + 98 * 4);
    REQUIRE(fill.average_price() >= 95.0);
}

TEST_CASE("Matcher properties", "[orderbook][property]") {
    auto book = OrderBook::from_levels(
        {{99, 4}, {97, 6}, {95, 8}},
        {{100, 5}, {101, 10}, {103, 7}, {110, 20}});

    SECTION("Average price never violates the limit") {
        for (Amount limit : {100, 101, 103, 110}) {
            for (Amount size = 1; size <= 50; ++size) {
                auto fill = match(book, Side::Buy, size, limit);
                if (fill.filled > 0) {
                    REQUIRE(fill.average_price() <= static_cast<double>(limit));
                }
            }
        }
        for (Amount limit : {99, 97, 95}) {
            for (Amount size = 1; size <= 25; ++size) {
                auto fill = match(book, Side::Sell, size, limit);
                if (fill.filled > 0) {
                    REQUIRE(fill.average_price() >= static_cast<double>(limit));
                }
            }
        }
    }

    SECTION("Remaining is monotonic in the requested size") {
        Amount previous = 0;
        for (Amount size = 1; size <= 60; ++size) {
            auto fill = match(book, Side::Buy, size, 103);
            REQUIRE(fill.remaining >= previous);
            previous = fill.remaining;
        }
    }

    SECTION("Same inputs, same result") {
        auto a = match(book, Side::Buy, 17, 103);
        auto b = match(book, Side::Buy, 17, 103);
        REQUIRE(a.filled == b.filled);
        REQUIRE(a.quote_amount == b.quote_amount);
    }
}

TEST_CASE("Matcher rejects non-positive sizes", "[orderbook]") {
    auto book = two_level_asks();
    REQUIRE_THROWS_AS(match(book, Side::Buy, 0, 101), std::invalid_argument);
    REQUIRE_THROWS_AS(match(book, Side::Sell, -3, 90), std::invalid_argument);
}

TEST_CASE("Budget-driven buy", "[orderbook]") {
    auto book = two_level_asks();

    SECTION("Budget runs out inside the book") {
        auto fill = match_notional(book, 1000, 101);
        REQUIRE(fill.filled == 9);
        REQUIRE(fill.spent == 904);
        REQUIRE(fill.unspent == 96);
        REQUIRE_FALSE(fill.exhausted);
    }

    SECTION("Book runs out before the budget") {
        auto fill = match_notional(book, 3000, 101);
        REQUIRE(fill.filled == 15);
        REQUIRE(fill.exhausted);
    }

    SECTION("Limit stops the walk") {
        auto fill = match_notional(book, 3000, 100);
        REQUIRE(fill.filled == 5);
        REQUIRE(fill.spent == 500);
        REQUIRE(fill.exhausted);
    }

    SECTION("Budget below one lot is dust") {
        auto fill = match_notional(book, 50, 101);
        REQUIRE(fill.filled == 0);
        REQUIRE(fill.unspent == 50);
        REQUIRE_FALSE(fill.exhausted);
    }
}
