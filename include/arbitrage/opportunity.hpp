#pragma once

#include <string>
#include "common/types.hpp"

namespace crossarb {

// Quality class of a cross-venue pairing
enum class Quality {
    PERFECT,   // Total effective cost below 100
    NEAR,      // Total effective cost within [100, 105]
    PARTIAL,   // Costlier, but venues diverge by more than 3 points on an outcome
    NONE
};

inline std::string quality_to_string(Quality q) {
    switch (q) {
        case Quality::PERFECT: return "perfect";
        case Quality::NEAR: return "near";
        case Quality::PARTIAL: return "partial";
        case Quality::NONE: return "none";
    }
    return "none";
}

inline Quality quality_from_string(const std::string& s) {
    if (s == "perfect") return Quality::PERFECT;
    if (s == "near") return Quality::NEAR;
    if (s == "partial") return Quality::PARTIAL;
    return Quality::NONE;
}

/**
 * The cheaper venue for one outcome.
 */
struct OpportunityLeg {
    Venue venue{Venue::POLYMARKET};
    bool away{true};
    std::string code;
    std::string name;
    std::string market_id;
    std::string url;

    Price raw_price{0.0};
    Price effective_price{0.0};
    double fee_rate{0.0};

    // Effective price the losing venue quoted for the same outcome
    Price other_effective_price{0.0};

    // Native venue scale (0-1)
    double native_price() const { return raw_price / 100.0; }
};

/**
 * Derived, never persisted. Prices are per payout unit on the 0-100 scale.
 */
struct Opportunity {
    std::string pair_id;
    std::string display_name;
    std::string sport;
    std::string game_time;

    OpportunityLeg away_leg;
    OpportunityLeg home_leg;

    Price gross_cost{0.0};             // Sum of best raw prices
    Price total_effective_cost{0.0};   // Sum of best effective prices
    Price edge{0.0};                   // 100 - total_effective_cost
    Quality quality{Quality::NONE};

    bool is_cross_venue() const { return away_leg.venue != home_leg.venue; }
};

} // namespace crossarb
