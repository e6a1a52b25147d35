// AtomArb - Bundle Builder
// Turns an opportunity into the fixed borrow -> leg 1 -> leg 2 -> repay sequence

#pragma once

#include <atomarb/opportunity.hpp>
#include <atomarb/types.hpp>
#include <nlohmann/json.hpp>
#include <memory>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <vector>

namespace atomarb {

class Config;

// Bundle cannot be assembled (venue handle missing)
class BundleError : public std::runtime_error {
public:
    explicit BundleError(const std::string& msg) : std::runtime_error(msg) {}
};

enum class Step : uint8_t {
    FlashBorrow = 0,
    Leg1 = 1,
    Leg2 = 2,
    FlashRepay = 3
};

inline constexpr const char* to_string(Step s) noexcept {
    switch (s) {
        case Step::FlashBorrow: return "flash_borrow";
        case Step::Leg1: return "leg1";
        case Step::Leg2: return "leg2";
        case Step::FlashRepay: return "flash_repay";
    }
    return "unknown";
}

// Program-agnostic instruction descriptor
struct Instruction {
    Step step = Step::FlashBorrow;
    std::string program;
    std::string venue_id;
    std::string mint_in;
    std::string mint_out;
    Amount amount_in = 0;
    Amount min_amount_out = 0;
    std::vector<std::string> accounts;
    nlohmann::json params = nlohmann::json::object();

    [[nodiscard]] nlohmann::json to_json() const;
};

// One swap the bundle performs
struct SwapLeg {
    Step step = Step::Leg1;
    LegQuote quote;
    std::string mint_in;
    std::string mint_out;
    Amount min_amount_out = 0;
};

// Flash-liquidity facility. The ledger, not the engine, checks that the
// post-repay balance covers the loan.
class FlashFacility {
public:
    virtual ~FlashFacility() = default;

    virtual Instruction borrow(const std::string& mint, Amount amount) = 0;
    virtual Instruction repay(const std::string& mint) = 0;
    [[nodiscard]] virtual uint32_t fee_bps() const = 0;
};

// Executes swaps on one venue
class VenueHandle {
public:
    virtual ~VenueHandle() = default;

    virtual Instruction swap(const SwapLeg& leg, const std::string& holding_account) = 0;
};

// Venue handles by venue id
class VenueDirectory {
public:
    void add(const std::string& venue_id, std::shared_ptr<VenueHandle> handle) {
        handles_[venue_id] = std::move(handle);
    }

    [[nodiscard]] std::shared_ptr<VenueHandle> find(const std::string& venue_id) const {
        auto it = handles_.find(venue_id);
        return it == handles_.end() ? nullptr : it->second;
    }

    [[nodiscard]] size_t size() const noexcept { return handles_.size(); }

private:
    std::unordered_map<std::string, std::shared_ptr<VenueHandle>> handles_;
};

// Atomic, read-only instruction sequence
class Bundle {
public:
    [[nodiscard]] const std::vector<Instruction>& steps() const noexcept { return steps_; }
    [[nodiscard]] Amount tip() const noexcept { return tip_; }
    [[nodiscard]] const std::string& payer() const noexcept { return payer_; }
    [[nodiscard]] const std::string& opportunity_id() const noexcept { return opportunity_id_; }

    [[nodiscard]] nlohmann::json to_json() const;

private:
    friend class BundleBuilder;

    Bundle(std::vector<Instruction> steps, Amount tip, std::string payer, std::string opportunity_id)
        : steps_(std::move(steps)), tip_(tip), payer_(std::move(payer)),
          opportunity_id_(std::move(opportunity_id)) {}

    std::vector<Instruction> steps_;
    Amount tip_ = 0;
    std::string payer_;
    std::string opportunity_id_;
};

struct BuilderOptions {
    std::string holding_account;
    Amount tip = 0;
    uint32_t leg_slippage_bps = 0;
};

class BundleBuilder {
public:
    // Throws ConfigError if no facility is supplied
    BundleBuilder(std::shared_ptr<FlashFacility> facility, VenueDirectory venues, BuilderOptions options);

    // Pure transformation; throws BundleError if a leg's venue has no handle
    [[nodiscard]] Bundle build(const ArbOpportunity& opportunity, const std::string& payer) const;

    [[nodiscard]] const BuilderOptions& options() const noexcept { return options_; }

private:
    std::shared_ptr<FlashFacility> facility_;
    VenueDirectory venues_;
    BuilderOptions options_;
};

// expected * (10000 - slippage_bps) / 10000, floored
[[nodiscard]] Amount min_out_for(Amount expected, uint32_t slippage_bps) noexcept;

// Facility that emits a descriptor for the configured program
class DescriptorFlashFacility : public FlashFacility {
public:
    DescriptorFlashFacility(std::string program, std::string holding_account, uint32_t fee_bps)
        : program_(std::move(program)), holding_account_(std::move(holding_account)), fee_bps_(fee_bps) {}

    Instruction borrow(const std::string& mint, Amount amount) override;
    Instruction repay(const std::string& mint) override;
    [[nodiscard]] uint32_t fee_bps() const override { return fee_bps_; }

private:
    std::string program_;
    std::string holding_account_;
    uint32_t fee_bps_;
};

// Venue handle that emits a swap descriptor for the configured program
class DescriptorVenueHandle : public VenueHandle {
public:
    DescriptorVenueHandle(std::string program, VenueKind kind)
        : program_(std::move(program)), kind_(kind) {}

    Instruction swap(const SwapLeg& leg, const std::string& holding_account) override;

private:
    std::string program_;
    VenueKind kind_;
};

// Descriptor handles for every market and pool of the configured pairs
[[nodiscard]] VenueDirectory make_descriptor_directory(const Config& config);

}  // namespace atomarb
