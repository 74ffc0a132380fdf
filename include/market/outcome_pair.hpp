#pragma once

#include <string>
#include <vector>
#include <optional>
#include <nlohmann/json.hpp>
#include "common/types.hpp"
#include "market/probability_normalizer.hpp"

namespace crossarb {

/**
 * One side of a two-outcome event (e.g. the away team).
 */
struct OutcomeSide {
    std::string code;   // Normalized identifier, e.g. "LAL"
    std::string name;   // Display name, e.g. "Los Angeles Lakers"
};

/**
 * One venue's quote for both outcomes, raw prices on the 0-100 scale.
 */
struct VenueQuote {
    Venue venue{Venue::POLYMARKET};
    Price away_price{0.0};
    Price home_price{0.0};
    std::string away_market_id;
    std::string home_market_id;
    std::string url;

    // Display probabilities; absent for three-way markets
    std::optional<NormalizedPair> normalized;

    Price price_for(bool away) const { return away ? away_price : home_price; }
    const std::string& market_id_for(bool away) const { return away ? away_market_id : home_market_id; }
};

/**
 * Immutable per-poll snapshot of the same binary event quoted on two venues.
 * Built only through parse_outcome_pair(), which validates every field once.
 */
struct OutcomePair {
    OutcomeSide away;
    OutcomeSide home;
    VenueQuote first;
    VenueQuote second;

    std::string sport;
    std::string game_time;
    bool three_way{false};

    // Deterministic dedup key, e.g. "LAL@GSW"
    std::string pair_id() const { return away.code + "@" + home.code; }
    std::string display_name() const;
};

struct OutcomePairParseResult {
    std::optional<OutcomePair> pair;
    std::string error;

    bool ok() const { return pair.has_value(); }
};

/**
 * Parse and validate one feed record:
 *
 *   {"away": {"code": "LAL", "name": "Lakers"}, "home": {...},
 *    "sport": "nba", "game_time": "...", "three_way": false,
 *    "quotes": [{"venue": "Polymarket", "away_price": 45, "home_price": 55,
 *                "away_market_id": "...", "home_market_id": "...", "url": "..."},
 *               {...second venue...}]}
 */
OutcomePairParseResult parse_outcome_pair(const nlohmann::json& j);

/**
 * Load a feed snapshot file (JSON array of records). Invalid records are
 * logged and skipped. Throws std::runtime_error if the file is unreadable.
 */
std::vector<OutcomePair> load_outcome_pairs(const std::string& path);

} // namespace crossarb
