#pragma once

#include "common/types.hpp"
#include "config/config.hpp"

namespace crossarb {

/**
 * Static per-venue cost parameters.
 *
 * effective = raw * (1 + fee_rate(venue) + slippage)
 */
class FeeModel {
public:
    explicit FeeModel(const FeeConfig& config) : config_(config) {}

    double fee_rate(Venue venue) const;
    double slippage() const { return config_.slippage_estimate; }

    // Fee rate plus slippage estimate
    double cost_rate(Venue venue) const { return fee_rate(venue) + slippage(); }

    Price effective_price(Venue venue, Price raw) const;

    // USD amounts for a leg of `quantity` payout units at raw price `raw`
    Usd fee_usd(Venue venue, Price raw, Quantity quantity) const;
    Usd slippage_usd(Price raw, Quantity quantity) const;

    const FeeConfig& config() const { return config_; }

private:
    FeeConfig config_;
};

} // namespace crossarb
