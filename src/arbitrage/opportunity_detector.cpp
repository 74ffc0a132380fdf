#include "arbitrage/opportunity_detector.hpp"
#include <spdlog/spdlog.h>
#include <cmath>

namespace crossarb {

OpportunityDetector::OpportunityDetector(const FeeModel& fees)
    : fees_(fees)
{
    spdlog::info("OpportunityDetector initialized: polymarket_fee={:.1f}%, kalshi_fee={:.1f}%, slippage={:.2f}%",
                 fees_.fee_rate(Venue::POLYMARKET) * 100,
                 fees_.fee_rate(Venue::KALSHI) * 100,
                 fees_.slippage() * 100);
}

OpportunityLeg OpportunityDetector::best_leg(const OutcomePair& pair, bool away) const {
    const VenueQuote& a = pair.first;
    const VenueQuote& b = pair.second;

    Price a_eff = fees_.effective_price(a.venue, a.price_for(away));
    Price b_eff = fees_.effective_price(b.venue, b.price_for(away));

    // Ties go to the second quote
    bool first_wins = a_eff < b_eff;
    const VenueQuote& win = first_wins ? a : b;

    OpportunityLeg leg;
    leg.venue = win.venue;
    leg.away = away;
    leg.code = away ? pair.away.code : pair.home.code;
    leg.name = away ? pair.away.name : pair.home.name;
    leg.market_id = win.market_id_for(away);
    leg.url = win.url;
    leg.raw_price = win.price_for(away);
    leg.effective_price = first_wins ? a_eff : b_eff;
    leg.fee_rate = fees_.fee_rate(win.venue);
    leg.other_effective_price = first_wins ? b_eff : a_eff;
    return leg;
}

Quality OpportunityDetector::classify(Price total_effective_cost, const OutcomePair& pair) {
    if (total_effective_cost < 100.0) {
        return Quality::PERFECT;
    }
    if (total_effective_cost <= NEAR_COST_CEILING) {
        return Quality::NEAR;
    }

    double away_gap = std::abs(pair.first.away_price - pair.second.away_price);
    double home_gap = std::abs(pair.first.home_price - pair.second.home_price);
    if (away_gap > PARTIAL_DIVERGENCE || home_gap > PARTIAL_DIVERGENCE) {
        return Quality::PARTIAL;
    }
    return Quality::NONE;
}

DetectionResult OpportunityDetector::detect(const OutcomePair& pair) const {
    DetectionResult result;

    OpportunityLeg away_leg = best_leg(pair, true);
    OpportunityLeg home_leg = best_leg(pair, false);

    if (away_leg.raw_price <= 0.0 || home_leg.raw_price <= 0.0) {
        result.error = ErrorKind::INVALID_INPUT;
        result.reason = fmt::format("Non-positive price: {} {:.2f}, {} {:.2f}",
                                    away_leg.code, away_leg.raw_price,
                                    home_leg.code, home_leg.raw_price);
        return result;
    }

    if (away_leg.venue == home_leg.venue) {
        result.error = ErrorKind::INVALID_INPUT;
        result.reason = fmt::format("Both outcomes cheapest on {}, no cross-venue hedge",
                                    venue_to_string(away_leg.venue));
        return result;
    }

    Opportunity opp;
    opp.pair_id = pair.pair_id();
    opp.display_name = pair.display_name();
    opp.sport = pair.sport;
    opp.game_time = pair.game_time;
    opp.gross_cost = away_leg.raw_price + home_leg.raw_price;
    opp.total_effective_cost = away_leg.effective_price + home_leg.effective_price;
    opp.edge = 100.0 - opp.total_effective_cost;
    opp.quality = classify(opp.total_effective_cost, pair);
    opp.away_leg = std::move(away_leg);
    opp.home_leg = std::move(home_leg);

    spdlog::debug("{}: {} {}@{:.2f} ({:.3f}) + {} {}@{:.2f} ({:.3f}) = {:.3f} [{}]",
                  opp.pair_id,
                  opp.away_leg.code, venue_to_string(opp.away_leg.venue),
                  opp.away_leg.raw_price, opp.away_leg.effective_price,
                  opp.home_leg.code, venue_to_string(opp.home_leg.venue),
                  opp.home_leg.raw_price, opp.home_leg.effective_price,
                  opp.total_effective_cost, quality_to_string(opp.quality));

    if (opp.quality == Quality::NONE) {
        result.error = ErrorKind::NO_OPPORTUNITY;
        result.reason = fmt::format("Total effective cost {:.2f} too high", opp.total_effective_cost);
        return result;
    }

    result.opportunity = std::move(opp);
    return result;
}

} // namespace crossarb
