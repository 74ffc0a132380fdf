#include "risk/risk_manager.hpp"
#include <spdlog/spdlog.h>

namespace crossarb {

RiskManager::RiskManager(const RiskConfig& config)
    : config_(config)
    , sizer_(config)
{
    spdlog::info("RiskManager initialized: units={:.0f}, min_roi={:.2f}%, max_position=${:.2f}, "
                 "daily_loss_limit=${:.2f}, max_daily_trades={}",
                 config.target_units, config.min_roi_percent, config.max_position_size,
                 config.daily_loss_limit, config.max_daily_trades);
}

RiskManager::CheckResult RiskManager::reject(RiskRejection why, std::string reason) {
    CheckResult result;
    result.rejection = why;
    result.reason = std::move(reason);
    return result;
}

SizingDecision RiskManager::evaluate(const Opportunity& opp, Ledger& ledger, WallClock now) const {
    SizingDecision decision;

    ledger.roll_daily_counters(now);

    auto apply = [&decision](const CheckResult& check) {
        decision.rejection = check.rejection;
        decision.reason = check.reason;
        return check.allowed;
    };

    if (!apply(check_duplicate(opp.pair_id, ledger))) {
        return decision;
    }
    if (!apply(check_daily_limits(ledger))) {
        return decision;
    }

    Sizing sizing = sizer_.size(opp);
    if (!apply(check_trade(sizing, ledger))) {
        return decision;
    }

    decision.approved = true;
    decision.sizing = sizing;
    spdlog::debug("{}: approved {:.2f} units, cost=${:.2f}, profit=${:.2f}, roi={:.2f}%",
                  opp.pair_id, sizing.quantity, sizing.cost_usd,
                  sizing.profit_usd, sizing.roi_percent);
    return decision;
}

RiskManager::CheckResult RiskManager::check_duplicate(const std::string& trade_id,
                                                      const Ledger& ledger) const {
    if (ledger.has_open_trade(trade_id)) {
        return reject(RiskRejection::DUPLICATE_TRADE,
                      fmt::format("Unresolved trade already exists for {}", trade_id));
    }

    CheckResult result;
    result.allowed = true;
    return result;
}

RiskManager::CheckResult RiskManager::check_daily_limits(const Ledger& ledger) const {
    if (ledger.daily.daily_loss >= config_.daily_loss_limit) {
        return reject(RiskRejection::DAILY_LOSS_LIMIT,
                      fmt::format("Daily loss limit reached: ${:.2f} >= ${:.2f}",
                                  ledger.daily.daily_loss, config_.daily_loss_limit));
    }

    if (static_cast<int>(ledger.daily_trade_count()) >= config_.max_daily_trades) {
        return reject(RiskRejection::DAILY_TRADE_LIMIT,
                      fmt::format("Max daily trades reached: {}", config_.max_daily_trades));
    }

    CheckResult result;
    result.allowed = true;
    return result;
}

RiskManager::CheckResult RiskManager::check_trade(const Sizing& sizing, const Ledger& ledger) const {
    if (sizing.quantity <= 0 || sizing.cost_usd <= 0) {
        return reject(RiskRejection::INVALID_SIZE,
                      fmt::format("Non-positive size: {:.2f} units, ${:.2f}",
                                  sizing.quantity, sizing.cost_usd));
    }

    if (sizing.roi_percent <= config_.min_roi_percent) {
        return reject(RiskRejection::ROI_TOO_LOW,
                      fmt::format("ROI {:.2f}% at or below minimum {:.2f}%",
                                  sizing.roi_percent, config_.min_roi_percent));
    }

    if (sizing.cost_usd > config_.max_position_size) {
        return reject(RiskRejection::POSITION_TOO_LARGE,
                      fmt::format("Cost ${:.2f} exceeds max position ${:.2f}",
                                  sizing.cost_usd, config_.max_position_size));
    }

    if (sizing.cost_usd > ledger.balance) {
        return reject(RiskRejection::INSUFFICIENT_BALANCE,
                      fmt::format("Insufficient balance: need ${:.2f}, have ${:.2f}",
                                  sizing.cost_usd, ledger.balance));
    }

    CheckResult result;
    result.allowed = true;
    return result;
}

} // namespace crossarb
