// AtomArb - AMM Pool Quoter
// Read-only swap estimates against a liquidity-pool snapshot

#pragma once

#include <atomarb/types.hpp>
#include <memory>
#include <stdexcept>
#include <string>

namespace atomarb {

// Quote cannot be produced for the given inputs (wrong mint, empty pool)
class QuoteError : public std::runtime_error {
public:
    explicit QuoteError(const std::string& msg) : std::runtime_error(msg) {}
};

enum class PoolCurve : uint8_t {
    // x * y = k over the real reserves (AMM v4)
    ConstantProduct = 0,
    // Single active range of a concentrated-liquidity pool. Inside the range
    // the curve is x * y = L^2 over the virtual reserves (L/sqrtP, L*sqrtP);
    // output is bounded by the real reserves held in the range.
    ConcentratedRange = 1
};

inline constexpr const char* to_string(PoolCurve c) noexcept {
    switch (c) {
        case PoolCurve::ConstantProduct: return "constant_product";
        case PoolCurve::ConcentratedRange: return "concentrated_range";
    }
    return "unknown";
}

// Pool snapshot as read from the ledger
struct PoolState {
    std::string pool_id;
    std::string base_mint;
    std::string quote_mint;
    Amount base_reserve = 0;
    Amount quote_reserve = 0;
    uint32_t fee_bps = 0;
    PoolCurve curve = PoolCurve::ConstantProduct;
    // ConcentratedRange only; ignored for ConstantProduct
    Amount virtual_base = 0;
    Amount virtual_quote = 0;
    int64_t timestamp = 0;
};

using PoolSnapshot = std::shared_ptr<const PoolState>;

// Estimated swap
struct SwapQuote {
    Amount amount_in = 0;
    Amount amount_out = 0;
    Amount fee_paid = 0;         // in units of the input mint
    bool insufficient = false;   // output exceeds what the pool can pay out
};

// Price `amount_in` of `mint_in` against the pool. The fee is taken from the
// input first (floor on the kept part) and the curve is applied to the rest.
// Never mutates the pool. Throws QuoteError if `mint_in` is neither side of
// the pool, std::invalid_argument if amount_in <= 0.
SwapQuote quote(const PoolState& pool, Amount amount_in, const std::string& mint_in);

}  // namespace atomarb
