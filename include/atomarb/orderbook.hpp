// AtomArb - Order Book Snapshot and Matcher
// Prices a market order against an immutable two-sided book

#pragma once

#include <atomarb/types.hpp>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace atomarb {

// Standing order: price in quote lots per base lot, size in base lots
struct Order {
    Amount price = 0;
    Amount size = 0;
};

// Immutable book snapshot. Bids descending, asks ascending; equal prices keep
// the arrival order of the snapshot they were read from.
class OrderBook {
public:
    OrderBook() = default;

    // Normalize a raw snapshot. Levels with non-positive price or size are dropped.
    static OrderBook from_levels(std::vector<Order> bids, std::vector<Order> asks,
                                 std::string market_id = "", int64_t timestamp = 0);

    [[nodiscard]] const std::vector<Order>& bids() const noexcept { return bids_; }
    [[nodiscard]] const std::vector<Order>& asks() const noexcept { return asks_; }
    [[nodiscard]] const std::string& market_id() const noexcept { return market_id_; }
    [[nodiscard]] int64_t timestamp() const noexcept { return timestamp_; }

    [[nodiscard]] std::optional<Amount> best_bid() const noexcept {
        return bids_.empty() ? std::nullopt : std::optional<Amount>(bids_.front().price);
    }

    [[nodiscard]] std::optional<Amount> best_ask() const noexcept {
        return asks_.empty() ? std::nullopt : std::optional<Amount>(asks_.front().price);
    }

    // Worst acceptable price `slippage_bps` away from the touch on the side
    // a `side` order consumes. Buys round up, sells round down.
    [[nodiscard]] std::optional<Amount> limit_for(Side side, uint32_t slippage_bps) const noexcept;

private:
    std::vector<Order> bids_;
    std::vector<Order> asks_;
    std::string market_id_;
    int64_t timestamp_ = 0;
};

using BookSnapshot = std::shared_ptr<const OrderBook>;

// Result of a size-driven walk
struct FillResult {
    Amount filled = 0;       // base lots taken
    Amount remaining = 0;    // base lots left unfilled; > 0 means not enough depth
    I128 quote_amount = 0;   // sum of take * price, quote lots

    [[nodiscard]] bool complete() const noexcept { return remaining == 0; }

    // quote_amount / filled, 0 when nothing filled
    [[nodiscard]] double average_price() const noexcept {
        if (filled == 0) return 0.0;
        return static_cast<double>(quote_amount) / static_cast<double>(filled);
    }
};

// Result of a budget-driven buy walk
struct NotionalFill {
    Amount filled = 0;       // base lots bought
    Amount spent = 0;        // quote lots paid
    Amount unspent = 0;      // quote lots left
    bool exhausted = false;  // stopped at the limit or end of book with budget still usable

    [[nodiscard]] double average_price() const noexcept {
        if (filled == 0) return 0.0;
        return static_cast<double>(spent) / static_cast<double>(filled);
    }
};

// Walk the opposing side (buy -> asks, sell -> bids) in priority order, never
// consuming a level beyond `limit_price`. Throws std::invalid_argument if
// wanted_size <= 0.
FillResult match(const OrderBook& book, Side side, Amount wanted_size, Amount limit_price);

// Buy as many base lots as `quote_budget` affords, walking asks up to `limit_price`.
NotionalFill match_notional(const OrderBook& book, Amount quote_budget, Amount limit_price);

}  // namespace atomarb
