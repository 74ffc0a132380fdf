#pragma once

#include <optional>
#include <string>
#include "arbitrage/fee_model.hpp"
#include "arbitrage/opportunity.hpp"
#include "market/outcome_pair.hpp"

namespace crossarb {

struct DetectionResult {
    std::optional<Opportunity> opportunity;
    ErrorKind error{ErrorKind::NONE};
    std::string reason;

    bool found() const { return opportunity.has_value(); }
};

/**
 * Finds the cheapest cross-venue hedge for an outcome pair.
 *
 * Each outcome is compared across venues independently, so the two legs may
 * land on different venues. A pairing where both legs land on the same venue
 * is not a hedge and is rejected.
 */
class OpportunityDetector {
public:
    static constexpr double NEAR_COST_CEILING = 105.0;
    static constexpr double PARTIAL_DIVERGENCE = 3.0;

    explicit OpportunityDetector(const FeeModel& fees);

    DetectionResult detect(const OutcomePair& pair) const;

    static Quality classify(Price total_effective_cost, const OutcomePair& pair);

private:
    FeeModel fees_;

    OpportunityLeg best_leg(const OutcomePair& pair, bool away) const;
};

} // namespace crossarb
