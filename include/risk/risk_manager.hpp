#pragma once

#include <string>
#include "common/types.hpp"
#include "config/config.hpp"
#include "arbitrage/opportunity.hpp"
#include "persistence/ledger.hpp"
#include "risk/position_sizer.hpp"

namespace crossarb {

enum class RiskRejection {
    NONE,
    DUPLICATE_TRADE,
    DAILY_LOSS_LIMIT,
    DAILY_TRADE_LIMIT,
    ROI_TOO_LOW,
    POSITION_TOO_LARGE,
    INSUFFICIENT_BALANCE,
    INVALID_SIZE
};

inline std::string risk_rejection_to_string(RiskRejection r) {
    switch (r) {
        case RiskRejection::NONE: return "NONE";
        case RiskRejection::DUPLICATE_TRADE: return "DUPLICATE_TRADE";
        case RiskRejection::DAILY_LOSS_LIMIT: return "DAILY_LOSS_LIMIT";
        case RiskRejection::DAILY_TRADE_LIMIT: return "DAILY_TRADE_LIMIT";
        case RiskRejection::ROI_TOO_LOW: return "ROI_TOO_LOW";
        case RiskRejection::POSITION_TOO_LARGE: return "POSITION_TOO_LARGE";
        case RiskRejection::INSUFFICIENT_BALANCE: return "INSUFFICIENT_BALANCE";
        case RiskRejection::INVALID_SIZE: return "INVALID_SIZE";
    }
    return "UNKNOWN";
}

/**
 * Approved sizing or a rejection, never both.
 */
struct SizingDecision {
    bool approved{false};
    Sizing sizing;
    RiskRejection rejection{RiskRejection::NONE};
    std::string reason;
};

/**
 * Risk manager sizes an opportunity and enforces per-trade and daily limits
 * against the current ledger. Checks always use the exact post-sizing cost.
 *
 * Not synchronized; callers hold the engine lock.
 */
class RiskManager {
public:
    explicit RiskManager(const RiskConfig& config);

    struct CheckResult {
        bool allowed{false};
        RiskRejection rejection{RiskRejection::NONE};
        std::string reason;
    };

    // Rolls the ledger's daily counters if `now` is on a new UTC day
    SizingDecision evaluate(const Opportunity& opp, Ledger& ledger, WallClock now) const;

    CheckResult check_duplicate(const std::string& trade_id, const Ledger& ledger) const;
    CheckResult check_daily_limits(const Ledger& ledger) const;
    CheckResult check_trade(const Sizing& sizing, const Ledger& ledger) const;

    const RiskConfig& config() const { return config_; }

private:
    RiskConfig config_;
    PositionSizer sizer_;

    static CheckResult reject(RiskRejection why, std::string reason);
};

} // namespace crossarb
