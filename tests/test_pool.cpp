// AtomArb - Pool Quoter Tests

#include <catch2/catch_test_macros.hpp>
#include <atomarb/pool.hpp>
#include <stdexcept>

using namespace atomarb;

namespace {

// 6-decimal units: 1000 SOL / 2000 USDC
PoolState sol_usdc(uint32_t fee_bps) {
    PoolState pool;
    pool.pool_id = "POOL";
    pool.base_mint = "SOL";
    pool.quote_mint = "USDC";
    pool.base_reserve = 1000'000000;
    pool.quote_reserve = 2000'000000;
    pool.fee_bps = fee_bps;
    return pool;
}

}  // namespace

TEST_CASE("Constant-product quote", "[pool]") {
    auto pool = sol_usdc(30);

    SECTION("Fee first, curve on the rest") {
        auto q = quote(pool, 100'000000, "SOL");
        REQUIRE(q.fee_paid == 300000);          // 0.3
        REQUIRE(q.amount_in == 100'000000);
        // 2000 * 99.7 / (1000 + 99.7), floored
        I128 expected = static_cast<I128>(99'700000) * 2000'000000 / (1000'000000 + 99'700000);
        REQUIRE(q.amount_out == static_cast<Amount>(expected));
        REQUIRE(q.amount_out == 181322178);
        REQUIRE_FALSE(q.insufficient);
    }

    SECTION("Direction follows the input mint") {
        auto q = quote(pool, 100'000000, "USDC");
        REQUIRE(q.fee_paid == 300000);
        REQUIRE(q.amount_out == 47482973);
    }

    SECTION("Quoting leaves the snapshot untouched") {
        auto first = quote(pool, 100'000000, "SOL");
        auto second = quote(pool, 100'000000, "SOL");
        REQUIRE(first.amount_out == second.amount_out);
        REQUIRE(first.fee_paid == second.fee_paid);
        REQUIRE(pool.base_reserve == 1000'000000);
        REQUIRE(pool.quote_reserve == 2000'000000);
    }
}

TEST_CASE("Higher fee, lower output", "[pool][property]") {
    Amount previous = quote(sol_usdc(0), 100'000000, "SOL").amount_out;
    REQUIRE(previous == 181818181);

    for (uint32_t fee : {1u, 10u, 30u, 100u, 250u, 1000u}) {
        Amount out = quote(sol_usdc(fee), 100'000000, "SOL").amount_out;
        REQUIRE(out < previous);
        previous = out;
    }
}

TEST_CASE("Quote errors", "[pool]") {
    auto pool = sol_usdc(30);

    SECTION("Mint the pool does not trade") {
        REQUIRE_THROWS_AS(quote(pool, 1000, "BONK"), QuoteError);
    }

    SECTION("Non-positive input") {
        REQUIRE_THROWS_AS(quote(pool, 0, "SOL"), std::invalid_argument);
        REQUIRE_THROWS_AS(quote(pool, -5, "SOL"), std::invalid_argument);
    }

    SECTION("Empty pool") {
        pool.quote_reserve = 0;
        REQUIRE_THROWS_AS(quote(pool, 1000, "SOL"), QuoteError);
    }
}

TEST_CASE("Concentrated range", "[pool]") {
    PoolState pool = sol_usdc(0);
    pool.curve = PoolCurve::ConcentratedRange;
    pool.virtual_base = 1000'000000;
    pool.virtual_quote = 2000'000000;

    SECTION("Curve uses the virtual reserves") {
        auto q = quote(pool, 100'000000, "SOL");
        REQUIRE(q.amount_out == 181818181);
        REQUIRE_FALSE(q.insufficient);
    }

    SECTION("Output capped by what the range holds") {
        pool.quote_reserve = 1'000000;
        auto q = quote(pool, 100'000000, "SOL");
        REQUIRE(q.amount_out == 181818181);
        REQUIRE(q.insufficient);
    }
}
