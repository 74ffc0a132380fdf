#include "risk/position_sizer.hpp"
#include <cmath>

namespace crossarb {

double PositionSizer::quality_multiplier(Quality quality) const {
    switch (quality) {
        case Quality::PERFECT: return 1.0;
        case Quality::NEAR: return config_.near_size_multiplier;
        case Quality::PARTIAL: return config_.partial_size_multiplier;
        case Quality::NONE: return 0.0;
    }
    return 0.0;
}

Sizing PositionSizer::size(const Opportunity& opp) const {
    Sizing s;

    s.quantity = config_.target_units * quality_multiplier(opp.quality);
    if (s.quantity > config_.liquidity_threshold_units) {
        s.quantity *= (1.0 - config_.liquidity_discount);
    }
    // Both venues fill whole contracts only
    s.quantity = std::floor(s.quantity + 1e-9);

    s.cost_usd = opp.total_effective_cost / 100.0 * s.quantity;
    s.profit_usd = opp.edge / 100.0 * s.quantity;
    s.roi_percent = s.cost_usd > 0 ? s.profit_usd / s.cost_usd * 100.0 : 0.0;
    return s;
}

} // namespace crossarb
