#include "arbitrage/fee_model.hpp"

namespace crossarb {

double FeeModel::fee_rate(Venue venue) const {
    switch (venue) {
        case Venue::POLYMARKET: return config_.polymarket_fee_rate;
        case Venue::KALSHI: return config_.kalshi_fee_rate;
    }
    return 0.0;
}

Price FeeModel::effective_price(Venue venue, Price raw) const {
    return raw * (1.0 + cost_rate(venue));
}

// Fee line covers everything above the raw price, slippage included
Usd FeeModel::fee_usd(Venue venue, Price raw, Quantity quantity) const {
    return (effective_price(venue, raw) - raw) * quantity / 100.0;
}

Usd FeeModel::slippage_usd(Price raw, Quantity quantity) const {
    return raw * slippage() * quantity / 100.0;
}

} // namespace crossarb
