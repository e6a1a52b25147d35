// AtomArb - Opportunity Scanner Tests

#include <catch2/catch_test_macros.hpp>
#include <atomarb/scanner.hpp>
#include <memory>
#include <stdexcept>

using namespace atomarb;

namespace {

AssetPair sol_usdc() {
    AssetPair pair;
    pair.name = "SOL-USDC";
    pair.base = Asset{"SOL", "SOL_MINT", 9};
    pair.quote = Asset{"USDC", "USDC_MINT", 6};
    pair.market_id = "MKT";
    pair.pool_id = "POOL";
    return pair;
}

BookSnapshot book(std::vector<Order> bids, std::vector<Order> asks) {
    return std::make_shared<const OrderBook>(OrderBook::from_levels(std::move(bids), std::move(asks), "MKT"));
}

PoolSnapshot pool(Amount base_reserve, Amount quote_reserve, uint32_t fee_bps = 0) {
    PoolState state;
    state.pool_id = "POOL";
    state.base_mint = "SOL_MINT";
    state.quote_mint = "USDC_MINT";
    state.base_reserve = base_reserve;
    state.quote_reserve = quote_reserve;
    state.fee_bps = fee_bps;
    return std::make_shared<const PoolState>(state);
}

ScannerConfig config(Amount min_profit = 0) {
    ScannerConfig c;
    c.probe_amount = 1000;
    c.min_profit = min_profit;
    c.book_slippage_bps = 100;
    return c;
}

ArbOpportunity with_profit(Amount net) {
    ArbOpportunity opp;
    opp.id = "opp-" + std::to_string(net);
    opp.net_profit = net;
    return opp;
}

}  // namespace

TEST_CASE("Book cheaper than pool", "[scanner]") {
    OpportunityScanner scanner(config());
    auto result = scanner.evaluate(sol_usdc(), book({{99, 1000}}, {{100, 1000}}), pool(10000, 1100000));

    REQUIRE(result.found());
    REQUIRE(result.reason == SkipReason::None);

    const auto& opp = *result.opportunity;
    REQUIRE(opp.leg1_venue() == "MKT");
    REQUIRE(opp.leg2_venue() == "POOL");
    REQUIRE(opp.leg1.kind == VenueKind::OrderBook);
    REQUIRE(opp.leg1_in() == 1000);
    REQUIRE(opp.leg1_out() == 10);
    REQUIRE(opp.leg2.amount_in == 10);
    REQUIRE(opp.leg2_out() == 1098);
    REQUIRE(opp.fees_paid == 0);
    REQUIRE(opp.net_profit == 98);
    REQUIRE(opp.profit_bps() == 980);
    REQUIRE(opp.id.rfind("SOL-USDC-MKT-POOL-", 0) == 0);
    REQUIRE(opp.created_at_ms > 0);
}

TEST_CASE("Pool cheaper than book", "[scanner]") {
    ScannerConfig c = config();
    c.probe_amount = 10000;

    SECTION("No fees") {
        OpportunityScanner scanner(c);
        auto opp = scanner.scan(sol_usdc(), book({{120, 1000}}, {{125, 1000}}), pool(10000, 1000000), 10000);
        REQUIRE(opp.has_value());
        REQUIRE(opp->leg1_venue() == "POOL");
        REQUIRE(opp->leg2_venue() == "MKT");
        REQUIRE(opp->leg1_out() == 99);
        REQUIRE(opp->leg2_out() == 11880);
        REQUIRE(opp->net_profit == 1880);
    }

    SECTION("Every fee is charged in quote") {
        c.taker_fee_bps = 10;
        c.flash_fee_bps = 9;
        OpportunityScanner scanner(c);
        auto opp = scanner.scan(sol_usdc(), book({{120, 1000}}, {{125, 1000}}), pool(10000, 1000000, 30), 10000);
        REQUIRE(opp.has_value());
        REQUIRE(opp->leg1_out() == 98);
        REQUIRE(opp->leg2_out() == 11640);
        REQUIRE(opp->leg1_fee == 30);
        REQUIRE(opp->leg2_fee == 118);     // 1 base lot at 11640 / 98
        REQUIRE(opp->flash_fee == 9);
        REQUIRE(opp->fees_paid == 157);
        REQUIRE(opp->net_profit == 11640 - 10000 - 157);
    }

    SECTION("Pair taker fee overrides the default") {
        AssetPair pair = sol_usdc();
        pair.taker_fee_bps = 10;
        c.flash_fee_bps = 9;
        OpportunityScanner scanner(c);
        auto opp = scanner.scan(pair, book({{120, 1000}}, {{125, 1000}}), pool(10000, 1000000, 30), 10000);
        REQUIRE(opp.has_value());
        REQUIRE(opp->net_profit == 1483);
    }
}

TEST_CASE("Losing round trip is not emitted", "[scanner]") {
    // leg 2 returns 995 on a 1000 probe, 3 in flash fees: 995 - 1000 - 3 = -8
    ScannerConfig c = config();
    c.flash_fee_bps = 30;
    OpportunityScanner scanner(c);

    auto result = scanner.evaluate(sol_usdc(), book({{99, 1000}}, {{100, 1000}}), pool(9990, 995000));
    REQUIRE_FALSE(result.found());
    REQUIRE(result.reason == SkipReason::BelowThreshold);
}

TEST_CASE("Exact tie on leg 1 goes to the book", "[scanner]") {
    // Both venues turn the probe into 10 base
    ScannerConfig c = config(-1000);
    c.flash_fee_bps = 30;
    OpportunityScanner scanner(c);

    auto opp = scanner.scan(sol_usdc(), book({{99, 1000}}, {{100, 1000}}), pool(9990, 995000), 1000);
    REQUIRE(opp.has_value());
    REQUIRE(opp->leg1.kind == VenueKind::OrderBook);
    REQUIRE(opp->leg1_out() == 10);
    REQUIRE(opp->leg2_out() == 995);
    REQUIRE(opp->fees_paid == 3);
    REQUIRE(opp->net_profit == -8);
}

TEST_CASE("Profit thresholds", "[scanner]") {
    auto b = book({{99, 1000}}, {{100, 1000}});
    auto p = pool(10000, 1100000);

    SECTION("Absolute floor is strict") {
        REQUIRE_FALSE(OpportunityScanner(config(98)).scan(sol_usdc(), b, p, 1000).has_value());
        REQUIRE(OpportunityScanner(config(97)).scan(sol_usdc(), b, p, 1000).has_value());
    }

    SECTION("Relative floor is a secondary filter") {
        ScannerConfig c = config();
        c.min_profit_bps = 1000;
        auto result = OpportunityScanner(c).evaluate(sol_usdc(), b, p);
        REQUIRE_FALSE(result.found());
        REQUIRE(result.reason == SkipReason::BelowThreshold);

        c.min_profit_bps = 980;
        REQUIRE(OpportunityScanner(c).evaluate(sol_usdc(), b, p).found());
    }

    SECTION("Emitted profit always clears the floor") {
        const Amount floor = 50;
        OpportunityScanner scanner(config(floor));
        for (Amount quote_reserve = 900000; quote_reserve <= 1300000; quote_reserve += 10000) {
            for (uint32_t fee : {0u, 30u}) {
                auto result = scanner.evaluate(sol_usdc(), b, pool(10000, quote_reserve, fee));
                if (result.found()) {
                    const auto& opp = *result.opportunity;
                    REQUIRE(opp.net_profit > floor);
                    REQUIRE(opp.net_profit == opp.leg2_out() - opp.probe_amount - opp.fees_paid);
                }
            }
        }
    }
}

TEST_CASE("Pairs that cannot be priced are skipped", "[scanner]") {
    OpportunityScanner scanner(config());

    SECTION("Thin book on both legs") {
        auto result = scanner.evaluate(sol_usdc(), book({{99, 2}}, {{100, 5}}), pool(10000, 1000000));
        REQUIRE_FALSE(result.found());
        REQUIRE(result.reason == SkipReason::InsufficientDepth);
        REQUIRE_FALSE(result.detail.empty());
    }

    SECTION("Probe too small to buy anything") {
        auto result = scanner.evaluate(sol_usdc(), book({{99, 1000}}, {{100, 1000}}), pool(10000, 1000000), 50);
        REQUIRE(result.reason == SkipReason::NonPositiveQuote);
    }

    SECTION("Missing pool snapshot") {
        auto result = scanner.evaluate(sol_usdc(), book({{99, 1000}}, {{100, 1000}}), nullptr);
        REQUIRE(result.reason == SkipReason::Unpriceable);
    }

    SECTION("Pool for another pair") {
        PoolState other = *pool(10000, 1000000);
        other.base_mint = "BONK_MINT";
        auto result = scanner.evaluate(sol_usdc(), book({{99, 1000}}, {{100, 1000}}),
                                       std::make_shared<const PoolState>(other));
        REQUIRE(result.reason == SkipReason::Unpriceable);
    }

    SECTION("Non-positive probe") {
        REQUIRE_THROWS_AS(scanner.evaluate(sol_usdc(), book({}, {}), pool(1, 1), 0), std::invalid_argument);
    }
}

TEST_CASE("Opportunity ids are unique", "[scanner]") {
    OpportunityScanner scanner(config());
    auto b = book({{99, 1000}}, {{100, 1000}});
    auto p = pool(10000, 1100000);

    auto first = scanner.scan(sol_usdc(), b, p, 1000);
    auto second = scanner.scan(sol_usdc(), b, p, 1000);
    REQUIRE(first.has_value());
    REQUIRE(second.has_value());
    REQUIRE(first->id != second->id);
}

TEST_CASE("Ranking by net profit", "[scanner]") {
    std::vector<ArbOpportunity> opps{with_profit(5), with_profit(20), with_profit(10), with_profit(20)};
    opps[3].id = "second-20";

    rank_opportunities(opps);
    REQUIRE(opps[0].net_profit == 20);
    REQUIRE(opps[0].id == "opp-20");
    REQUIRE(opps[1].id == "second-20");
    REQUIRE(opps[2].net_profit == 10);
    REQUIRE(opps[3].net_profit == 5);
}

TEST_CASE("Pair rotation", "[scanner][rotation]") {
    std::vector<AssetPair> pairs;
    for (const char* name : {"A", "B", "C", "D", "E"}) {
        AssetPair pair;
        pair.name = name;
        pairs.push_back(pair);
    }

    SECTION("Batches wrap around the universe") {
        PairRotation rotation(pairs, 2);
        auto names = [](const std::vector<AssetPair>& batch) {
            std::string joined;
            for (const auto& p : batch) joined += p.name;
            return joined;
        };
        REQUIRE(names(rotation.next_batch()) == "AB");
        REQUIRE(names(rotation.next_batch()) == "CD");
        REQUIRE(names(rotation.next_batch()) == "EA");
        REQUIRE(names(rotation.next_batch()) == "BC");
    }

    SECTION("Batch larger than the universe") {
        PairRotation rotation(pairs, 10);
        REQUIRE(rotation.next_batch().size() == 5);
        REQUIRE(rotation.next_batch().size() == 5);
    }

    SECTION("Empty universe") {
        PairRotation rotation({}, 3);
        REQUIRE(rotation.next_batch().empty());
    }

    SECTION("Zero batch size") {
        REQUIRE_THROWS_AS(PairRotation(pairs, 0), std::invalid_argument);
    }
}
