// AtomArb - Venues
// One quoting capability over two venue kinds, selected by a tagged variant

#pragma once

#include <atomarb/orderbook.hpp>
#include <atomarb/pool.hpp>
#include <atomarb/types.hpp>
#include <string>
#include <variant>

namespace atomarb {

enum class VenueKind : uint8_t {
    OrderBook = 0,
    Pool = 1
};

inline constexpr const char* to_string(VenueKind k) noexcept {
    return k == VenueKind::OrderBook ? "orderbook" : "pool";
}

// Which way a leg converts the pair
enum class Direction : uint8_t {
    QuoteToBase = 0,
    BaseToQuote = 1
};

inline constexpr const char* to_string(Direction d) noexcept {
    return d == Direction::QuoteToBase ? "quote_to_base" : "base_to_quote";
}

// Order-book market for a pair
struct OrderBookVenue {
    std::string market_id;
    BookSnapshot book;
    uint32_t taker_fee_bps = 0;
    uint32_t slippage_bps = 0;   // limit price distance from the touch
};

// AMM pool for a pair
struct PoolVenue {
    std::string pool_id;
    PoolSnapshot pool;
    std::string base_mint;
    std::string quote_mint;
};

using Venue = std::variant<OrderBookVenue, PoolVenue>;

// Priced conversion on one venue
struct LegQuote {
    std::string venue_id;
    VenueKind kind = VenueKind::OrderBook;
    Direction direction = Direction::QuoteToBase;
    Amount amount_in = 0;
    Amount amount_out = 0;
    Amount fee_paid = 0;         // input units
    Amount limit_price = 0;      // order-book legs only
    bool insufficient = false;

    [[nodiscard]] bool usable() const noexcept {
        return !insufficient && amount_out > 0;
    }
};

[[nodiscard]] VenueKind venue_kind(const Venue& venue) noexcept;
[[nodiscard]] const std::string& venue_id(const Venue& venue) noexcept;

// Quote `amount_in` through the venue. Order-book legs deduct the taker fee
// from the input and walk the book under the slippage limit; pool legs use
// the pool quoter. Throws QuoteError for snapshots that cannot be priced.
LegQuote quote_leg(const Venue& venue, Direction direction, Amount amount_in);

}  // namespace atomarb
