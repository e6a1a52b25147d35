// AtomArb - Core Types
// Integer lot amounts, assets and trading pairs shared by every component

#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace atomarb {

// Atomic units of an asset: lamports, micro-USDC, base lots, quote lots.
// Every amount in the engine is one of these; only reporting converts to decimals.
using Amount = int64_t;

// 128-bit intermediates for products of two amounts
using I128 = __int128;
using U128 = unsigned __int128;

constexpr int64_t BPS_DENOMINATOR = 10000;

// Trading side
enum class Side : uint8_t {
    Buy = 0,
    Sell = 1
};

inline constexpr const char* to_string(Side s) noexcept {
    return s == Side::Buy ? "buy" : "sell";
}

// A tradable asset: display symbol, ledger mint and decimal places
struct Asset {
    std::string symbol;
    std::string mint;
    int decimals = 0;
};

// Candidate pair: base/quote assets plus the two venues that trade it
struct AssetPair {
    std::string name;
    Asset base;
    Asset quote;
    std::string market_id;        // order-book market
    std::string pool_id;          // AMM pool
    std::optional<uint32_t> taker_fee_bps;   // order-book taker fee, scanner default if unset

    [[nodiscard]] std::string to_string() const {
        return name.empty() ? base.symbol + "-" + quote.symbol : name;
    }
};

// Fee split, floor on the kept part: kept = in * (10000 - bps) / 10000
struct FeeSplit {
    Amount kept;
    Amount fee;
};

inline FeeSplit split_fee(Amount amount_in, uint32_t fee_bps) noexcept {
    I128 kept = static_cast<I128>(amount_in) * (BPS_DENOMINATOR - fee_bps) / BPS_DENOMINATOR;
    return FeeSplit{static_cast<Amount>(kept), amount_in - static_cast<Amount>(kept)};
}

// amount * bps / 10000 rounded up (charges owed to a third party)
inline Amount bps_ceil(Amount amount, uint32_t bps) noexcept {
    I128 num = static_cast<I128>(amount) * bps;
    return static_cast<Amount>((num + BPS_DENOMINATOR - 1) / BPS_DENOMINATOR);
}

// Timestamp utilities
inline int64_t now_ms() noexcept {
    using namespace std::chrono;
    return duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count();
}

inline int64_t now_ns() noexcept {
    using namespace std::chrono;
    return duration_cast<nanoseconds>(steady_clock::now().time_since_epoch()).count();
}

}  // namespace atomarb
