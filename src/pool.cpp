// AtomArb - AMM Pool Quoter Implementation

#include <atomarb/pool.hpp>
#include <stdexcept>

namespace atomarb {

namespace {

// out = kept * reserve_out / (reserve_in + kept), floored
Amount constant_product_out(Amount reserve_in, Amount reserve_out, Amount kept) {
    I128 numerator = static_cast<I128>(kept) * reserve_out;
    I128 denominator = static_cast<I128>(reserve_in) + kept;
    if (denominator <= 0) return 0;
    return static_cast<Amount>(numerator / denominator);
}

}  // namespace

SwapQuote quote(const PoolState& pool, Amount amount_in, const std::string& mint_in) {
    if (amount_in <= 0) {
        throw std::invalid_argument("quote: amount_in must be positive");
    }

    bool base_in;
    if (mint_in == pool.base_mint) {
        base_in = true;
    } else if (mint_in == pool.quote_mint) {
        base_in = false;
    } else {
        throw QuoteError("Mint " + mint_in + " is not traded by pool " + pool.pool_id);
    }

    Amount real_in = base_in ? pool.base_reserve : pool.quote_reserve;
    Amount real_out = base_in ? pool.quote_reserve : pool.base_reserve;

    Amount curve_in = real_in;
    Amount curve_out = real_out;
    if (pool.curve == PoolCurve::ConcentratedRange) {
        curve_in = base_in ? pool.virtual_base : pool.virtual_quote;
        curve_out = base_in ? pool.virtual_quote : pool.virtual_base;
    }

    if (curve_in <= 0 || curve_out <= 0) {
        throw QuoteError("Pool " + pool.pool_id + " has no liquidity");
    }

    FeeSplit split = split_fee(amount_in, pool.fee_bps);

    SwapQuote result;
    result.amount_in = amount_in;
    result.fee_paid = split.fee;
    result.amount_out = constant_product_out(curve_in, curve_out, split.kept);

    // Range cannot pay out more than it holds
    if (result.amount_out >= real_out) {
        result.insufficient = true;
    }
    return result;
}

}  // namespace atomarb
