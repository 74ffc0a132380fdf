#pragma once

#include "common/types.hpp"
#include "config/config.hpp"
#include "arbitrage/opportunity.hpp"

namespace crossarb {

/**
 * Quantity and USD figures for an opportunity at configured size.
 */
struct Sizing {
    Quantity quantity{0.0};     // Whole payout units; each winning unit pays $1
    Usd cost_usd{0.0};
    Usd profit_usd{0.0};
    double roi_percent{0.0};
};

class PositionSizer {
public:
    explicit PositionSizer(const RiskConfig& config) : config_(config) {}

    Sizing size(const Opportunity& opp) const;

    double quality_multiplier(Quality quality) const;

private:
    RiskConfig config_;
};

} // namespace crossarb
