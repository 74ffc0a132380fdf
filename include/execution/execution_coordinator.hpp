#pragma once

#include <optional>
#include <string>
#include "common/types.hpp"
#include "config/config.hpp"
#include "arbitrage/fee_model.hpp"
#include "arbitrage/opportunity.hpp"
#include "persistence/ledger.hpp"
#include "persistence/ledger_store.hpp"
#include "risk/position_sizer.hpp"
#include "venue/venue_client.hpp"

namespace crossarb {

/**
 * Placement state of a two-leg execution attempt.
 */
enum class PlacementState {
    CREATED,        // Validated, nothing sent
    REJECTED,       // Failed validation, nothing sent
    LEG1_FAILED,    // First leg refused (safe - no exposure)
    UNWOUND,        // First leg canceled after second leg failed
    ORPHANED,       // First leg cancel failed (manual reconciliation needed)
    PLACED          // Both legs live, trade recorded
};

inline std::string placement_state_to_string(PlacementState s) {
    switch (s) {
        case PlacementState::CREATED: return "CREATED";
        case PlacementState::REJECTED: return "REJECTED";
        case PlacementState::LEG1_FAILED: return "LEG1_FAILED";
        case PlacementState::UNWOUND: return "UNWOUND";
        case PlacementState::ORPHANED: return "ORPHANED";
        case PlacementState::PLACED: return "PLACED";
    }
    return "UNKNOWN";
}

struct ExecutionResult {
    bool success{false};               // Both legs placed and trade recorded
    PlacementState final_state{PlacementState::CREATED};
    ErrorKind error{ErrorKind::NONE};
    std::string reason;

    std::optional<Trade> trade;
    bool persisted{false};

    bool compensation_attempted{false};
    bool compensation_succeeded{false};
};

/**
 * Places both legs of an approved opportunity and records the Trade.
 *
 * PROTOCOL:
 * - Validate quantity and native leg prices; reject with no side effect
 * - Place leg 1; on failure abort
 * - Place leg 2; on failure cancel leg 1 once (best effort) and abort
 * - On success append the Trade, debit the balance, count the daily trade
 *   and persist, retrying before escalating
 *
 * Cross-venue atomicity is not achievable: a failed compensating cancel
 * leaves a live orphaned leg that is logged for manual reconciliation.
 *
 * Not synchronized; callers hold the engine lock.
 */
class ExecutionCoordinator {
public:
    ExecutionCoordinator(VenueRegistry& venues,
                         LedgerStore& store,
                         const FeeModel& fees,
                         const ExecutionConfig& config,
                         Usd bet_amount);

    ExecutionResult execute(const Opportunity& opp, const Sizing& sizing,
                            Ledger& ledger, WallClock now);

    // Saves the ledger, retrying with backoff. Escalates on final failure.
    bool persist(Ledger& ledger, const std::string& trade_id, WallClock now);

private:
    VenueRegistry& venues_;
    LedgerStore& store_;
    FeeModel fees_;
    ExecutionConfig config_;
    Usd bet_amount_;

    static std::optional<std::string> validate(const Opportunity& opp, const Sizing& sizing);
    PlaceOrderResponse place_leg(const OpportunityLeg& leg, Quantity quantity);
    Leg make_leg(const OpportunityLeg& leg, Quantity quantity, const PlaceOrderResponse& placed) const;
    Trade make_trade(const Opportunity& opp, const Sizing& sizing,
                     const PlaceOrderResponse& first, const PlaceOrderResponse& second,
                     WallClock now) const;
    void fail(ExecutionResult& result, Ledger& ledger, const std::string& trade_id,
              PlacementState state, ErrorKind error, const std::string& reason, WallClock now);
};

} // namespace crossarb
