// AtomArb - Order Book Matcher Implementation

#include <atomarb/orderbook.hpp>
#include <algorithm>
#include <stdexcept>

namespace atomarb {

OrderBook OrderBook::from_levels(std::vector<Order> bids, std::vector<Order> asks,
                                 std::string market_id, int64_t timestamp) {
    auto invalid = [](const Order& o) { return o.price <= 0 || o.size <= 0; };
    bids.erase(std::remove_if(bids.begin(), bids.end(), invalid), bids.end());
    asks.erase(std::remove_if(asks.begin(), asks.end(), invalid), asks.end());

    // Stable: equal prices keep first-seen priority
    std::stable_sort(bids.begin(), bids.end(),
        [](const Order& a, const Order& b) { return a.price > b.price; });
    std::stable_sort(asks.begin(), asks.end(),
        [](const Order& a, const Order& b) { return a.price < b.price; });

    OrderBook book;
    book.bids_ = std::move(bids);
    book.asks_ = std::move(asks);
    book.market_id_ = std::move(market_id);
    book.timestamp_ = timestamp;
    return book;
}

std::optional<Amount> OrderBook::limit_for(Side side, uint32_t slippage_bps) const noexcept {
    if (side == Side::Buy) {
        auto ask = best_ask();
        if (!ask) return std::nullopt;
        I128 num = static_cast<I128>(*ask) * (BPS_DENOMINATOR + slippage_bps);
        return static_cast<Amount>((num + BPS_DENOMINATOR - 1) / BPS_DENOMINATOR);
    }
    auto bid = best_bid();
    if (!bid) return std::nullopt;
    if (slippage_bps >= BPS_DENOMINATOR) return Amount{0};
    I128 num = static_cast<I128>(*bid) * (BPS_DENOMINATOR - slippage_bps);
    return static_cast<Amount>(num / BPS_DENOMINATOR);
}

FillResult match(const OrderBook& book, Side side, Amount wanted_size, Amount limit_price) {
    if (wanted_size <= 0) {
        throw std::invalid_argument("match: wanted size must be positive");
    }

    const auto& levels = (side == Side::Buy) ? book.asks() : book.bids();

    FillResult result;
    Amount remaining = wanted_size;

    for (const auto& level : levels) {
        // Hard ceiling/floor: stop at the first level past the limit
        if (side == Side::Buy && level.price > limit_price) break;
        if (side == Side::Sell && level.price < limit_price) break;

        Amount take = std::min(remaining, level.size);
        result.quote_amount += static_cast<I128>(take) * level.price;
        remaining -= take;
        if (remaining == 0) break;
    }

    result.filled = wanted_size - remaining;
    result.remaining = remaining;
    return result;
}

NotionalFill match_notional(const OrderBook& book, Amount quote_budget, Amount limit_price) {
    NotionalFill result;
    Amount budget = quote_budget;
    bool stopped = false;

    for (const auto& level : book.asks()) {
        // Less than one lot affordable here: leftover is dust, not missing depth
        if (budget < level.price) {
            stopped = true;
            break;
        }
        if (level.price > limit_price) {
            result.exhausted = true;
            stopped = true;
            break;
        }

        Amount take = std::min(budget / level.price, level.size);
        budget -= take * level.price;
        result.filled += take;
    }

    if (!stopped) {
        // End of book: short if one more lot at the last price was affordable
        Amount last_price = book.asks().empty() ? 1 : book.asks().back().price;
        result.exhausted = budget >= last_price;
    }

    result.spent = quote_budget - budget;
    result.unspent = budget;
    return result;
}

}  // namespace atomarb
