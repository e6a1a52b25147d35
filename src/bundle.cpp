// AtomArb - Bundle Builder Implementation

#include <atomarb/bundle.hpp>
#include <atomarb/config.hpp>

namespace atomarb {

nlohmann::json Instruction::to_json() const {
    return {
        {"step", to_string(step)},
        {"program", program},
        {"venue_id", venue_id},
        {"mint_in", mint_in},
        {"mint_out", mint_out},
        {"amount_in", amount_in},
        {"min_amount_out", min_amount_out},
        {"accounts", accounts},
        {"params", params}
    };
}

nlohmann::json Bundle::to_json() const {
    nlohmann::json instructions = nlohmann::json::array();
    for (const auto& step : steps_) {
        instructions.push_back(step.to_json());
    }
    return {
        {"opportunity_id", opportunity_id_},
        {"payer", payer_},
        {"tip", tip_},
        {"instructions", instructions}
    };
}

Amount min_out_for(Amount expected, uint32_t slippage_bps) noexcept {
    I128 kept = static_cast<I128>(expected) * (BPS_DENOMINATOR - slippage_bps) / BPS_DENOMINATOR;
    return static_cast<Amount>(kept);
}

BundleBuilder::BundleBuilder(std::shared_ptr<FlashFacility> facility, VenueDirectory venues,
                             BuilderOptions options)
    : facility_(std::move(facility)), venues_(std::move(venues)), options_(std::move(options)) {
    if (!facility_) {
        throw ConfigError("BundleBuilder requires a flash-liquidity facility");
    }
}

Bundle BundleBuilder::build(const ArbOpportunity& opportunity, const std::string& payer) const {
    auto leg1_handle = venues_.find(opportunity.leg1_venue());
    if (!leg1_handle) {
        throw BundleError("No venue handle for " + opportunity.leg1_venue());
    }
    auto leg2_handle = venues_.find(opportunity.leg2_venue());
    if (!leg2_handle) {
        throw BundleError("No venue handle for " + opportunity.leg2_venue());
    }

    const std::string& quote_mint = opportunity.pair.quote.mint;
    const std::string& base_mint = opportunity.pair.base.mint;

    SwapLeg leg1{
        .step = Step::Leg1,
        .quote = opportunity.leg1,
        .mint_in = quote_mint,
        .mint_out = base_mint,
        .min_amount_out = min_out_for(opportunity.leg1_out(), options_.leg_slippage_bps)
    };
    SwapLeg leg2{
        .step = Step::Leg2,
        .quote = opportunity.leg2,
        .mint_in = base_mint,
        .mint_out = quote_mint,
        .min_amount_out = min_out_for(opportunity.leg2_out(), options_.leg_slippage_bps)
    };

    std::vector<Instruction> steps;
    steps.reserve(4);

    Instruction borrow = facility_->borrow(quote_mint, opportunity.probe_amount);
    borrow.step = Step::FlashBorrow;
    steps.push_back(std::move(borrow));

    Instruction first = leg1_handle->swap(leg1, options_.holding_account);
    first.step = Step::Leg1;
    steps.push_back(std::move(first));

    Instruction second = leg2_handle->swap(leg2, options_.holding_account);
    second.step = Step::Leg2;
    steps.push_back(std::move(second));

    // Principal plus the facility's fee; must stay the terminal step
    Instruction repay = facility_->repay(quote_mint);
    repay.step = Step::FlashRepay;
    repay.amount_in = opportunity.probe_amount + bps_ceil(opportunity.probe_amount, facility_->fee_bps());
    steps.push_back(std::move(repay));

    return Bundle(std::move(steps), options_.tip, payer, opportunity.id);
}

Instruction DescriptorFlashFacility::borrow(const std::string& mint, Amount amount) {
    Instruction ix;
    ix.step = Step::FlashBorrow;
    ix.program = program_;
    ix.mint_out = mint;
    ix.amount_in = amount;
    ix.accounts = {holding_account_};
    ix.params = {{"action", "borrow"}, {"fee_bps", fee_bps_}};
    return ix;
}

Instruction DescriptorFlashFacility::repay(const std::string& mint) {
    Instruction ix;
    ix.step = Step::FlashRepay;
    ix.program = program_;
    ix.mint_in = mint;
    ix.accounts = {holding_account_};
    ix.params = {{"action", "repay"}};
    return ix;
}

Instruction DescriptorVenueHandle::swap(const SwapLeg& leg, const std::string& holding_account) {
    Instruction ix;
    ix.step = leg.step;
    ix.program = program_;
    ix.venue_id = leg.quote.venue_id;
    ix.mint_in = leg.mint_in;
    ix.mint_out = leg.mint_out;
    ix.amount_in = leg.quote.amount_in;
    ix.min_amount_out = leg.min_amount_out;
    ix.accounts = {holding_account, leg.quote.venue_id};
    ix.params = {
        {"kind", to_string(kind_)},
        {"direction", to_string(leg.quote.direction)},
        {"expected_out", leg.quote.amount_out}
    };
    if (kind_ == VenueKind::OrderBook) {
        Side side = leg.quote.direction == Direction::QuoteToBase ? Side::Buy : Side::Sell;
        ix.params["side"] = to_string(side);
        ix.params["limit_price"] = leg.quote.limit_price;
    }
    return ix;
}

VenueDirectory make_descriptor_directory(const Config& config) {
    auto book_handle = std::make_shared<DescriptorVenueHandle>(config.programs.orderbook_program,
                                                               VenueKind::OrderBook);
    auto pool_handle = std::make_shared<DescriptorVenueHandle>(config.programs.pool_program,
                                                               VenueKind::Pool);
    VenueDirectory directory;
    for (const auto& pair : config.pairs) {
        directory.add(pair.market_id, book_handle);
        directory.add(pair.pool_id, pool_handle);
    }
    return directory;
}

}  // namespace atomarb
